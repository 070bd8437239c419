#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "BeastCatalog.h"
#include "Logger.h"
#include "NFTRegistry.h"

class BeastCollection : public NFTRegistry {
public:
    using MintHook = std::function<void(const MintedBeast&)>;

    BeastCollection(UserId minter, std::shared_ptr<const BeastCatalog> catalog, std::shared_ptr<Logger> logger = nullptr);

    ItemId mint(const UserId& caller, const UserId& to, const MintedAttributes& attributes) override;

    std::optional<MintedBeast> find(ItemId id) const;
    std::optional<UserId> ownerOf(ItemId id) const;
    std::optional<TemplateId> templateOf(ItemId id) const;
    std::vector<MintedBeast> beastsOf(const UserId& owner) const;
    std::vector<MintedBeast> all() const;
    std::size_t balanceOf(const UserId& owner) const;
    std::size_t totalMinted() const;

    nlohmann::json metadata(ItemId id) const;

    // 저장 파일에서 읽은 기록으로 교체하고 다음 id를 맞춘다.
    void replaceAll(const std::vector<MintedBeast>& beasts);

    // mint가 기록을 남긴 직후, 락을 푼 상태에서 호출된다. 훅이 던진 예외는 로그만 남긴다.
    void setMintHook(MintHook hook);

    const UserId& minter() const;

private:
    UserId minter_;
    std::shared_ptr<const BeastCatalog> catalog_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::vector<MintedBeast> beasts_;
    ItemId nextId_{1};
    MintHook mintHook_;

    const MintedBeast* findLocked(ItemId id) const;
};
