#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using UserId = std::string;
using ItemId = std::uint64_t;
using TemplateId = std::uint16_t;

// 코드 0은 "속성 없음"으로 예약되어 있어 열거자로 두지 않는다.
enum class Element : std::uint8_t {
    Fire = 1,
    Ice = 2,
    Nature = 3,
    Thunder = 4
};

constexpr std::uint32_t kMaxElementCode = 4;

enum class Rarity : std::uint8_t {
    Common = 1,
    Rare = 2,
    Unique = 3,
    Legendary = 4
};

struct BeastTemplate {
    TemplateId templateId{};
    Element element{Element::Fire};
    std::string image;
};

// 한 번의 롤이 확정한 속성. 엔진은 레지스트리에 넘긴 뒤 보관하지 않는다.
struct MintedAttributes {
    TemplateId templateId{};
    Rarity rarity{Rarity::Common};
    std::uint32_t hp{0};
    std::uint32_t attack{0};
    std::uint32_t defense{0};
    Element element{Element::Fire};
};

struct MintedBeast {
    ItemId id{0};
    UserId owner;
    MintedAttributes attributes;
    std::string image;

    nlohmann::json toJson() const;
    static MintedBeast fromJson(const nlohmann::json& data);
};

std::optional<Element> elementFromCode(std::uint32_t code);
std::optional<Element> elementFromString(const std::string& name);
std::string elementToString(Element element);

std::optional<Rarity> rarityFromString(const std::string& name);
std::string rarityName(Rarity rarity);
std::string rarityToString(Rarity rarity);
