#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "Beast.h"

// 소환 가능한 비스트 템플릿 목록. 생성 시 검증되고 이후에는 바뀌지 않는다.
class BeastCatalog {
public:
    // 세 목록은 같은 길이여야 하며 i번째 원소끼리 한 템플릿을 이룬다.
    BeastCatalog(const std::vector<std::uint32_t>& templateIds,
        const std::vector<std::uint32_t>& elementCodes,
        const std::vector<std::string>& images);

    // {"templateIds": [...], "elements": [...], "images": [...]}
    // elements 항목은 코드(1~4)나 이름("Fire")을 받는다.
    static BeastCatalog fromJson(const nlohmann::json& data);
    static BeastCatalog defaultCatalog();

    std::size_t size() const;
    const BeastTemplate& atIndex(std::size_t index) const;
    const BeastTemplate* find(TemplateId templateId) const;
    const std::vector<TemplateId>& templateIds() const;

private:
    std::vector<TemplateId> order_;
    std::unordered_map<TemplateId, BeastTemplate> templates_;
};
