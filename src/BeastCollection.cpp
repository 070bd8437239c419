#include "BeastCollection.h"

#include <algorithm>
#include <exception>

#include "GachaError.h"

BeastCollection::BeastCollection(UserId minter, std::shared_ptr<const BeastCatalog> catalog, std::shared_ptr<Logger> logger)
    : minter_(std::move(minter)), catalog_(std::move(catalog)), logger_(std::move(logger)) {
    if (!catalog_) {
        throw GachaError(GachaErrorCode::InvalidConfig, "collection needs a catalog");
    }
}

ItemId BeastCollection::mint(const UserId& caller, const UserId& to, const MintedAttributes& attributes) {
    if (caller != minter_) {
        throw GachaError(GachaErrorCode::Unauthorized, caller + " may not mint");
    }
    if (to.empty()) {
        throw GachaError(GachaErrorCode::ZeroValue, "cannot mint to an empty owner");
    }
    const BeastTemplate* tmpl = catalog_->find(attributes.templateId);
    if (!tmpl) {
        throw GachaError(GachaErrorCode::OutOfBound, "template " + std::to_string(attributes.templateId) + " is not in the catalog");
    }

    MintedBeast beast;
    MintHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        beast.id = nextId_++;
        beast.owner = to;
        beast.attributes = attributes;
        beast.image = tmpl->image;
        beasts_.push_back(beast);
        hook = mintHook_;
    }

    logTo(logger_, LogLevel::Info, "비스트 발행: #" + std::to_string(beast.id) + " -> " + to + " ("
        + elementToString(attributes.element) + ", " + rarityName(attributes.rarity) + ")");
    if (hook) {
        // 발행은 이미 확정됐으므로 훅 실패가 mint 결과를 바꾸지 않는다
        try {
            hook(beast);
        } catch (const std::exception& ex) {
            logTo(logger_, LogLevel::Error, "발행 훅 실패(#" + std::to_string(beast.id) + "): " + ex.what());
        }
    }
    return beast.id;
}

const MintedBeast* BeastCollection::findLocked(ItemId id) const {
    auto it = std::find_if(beasts_.cbegin(), beasts_.cend(), [id](const MintedBeast& b) { return b.id == id; });
    if (it == beasts_.cend()) {
        return nullptr;
    }
    return &(*it);
}

std::optional<MintedBeast> BeastCollection::find(ItemId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const MintedBeast* beast = findLocked(id)) {
        return *beast;
    }
    return std::nullopt;
}

std::optional<UserId> BeastCollection::ownerOf(ItemId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const MintedBeast* beast = findLocked(id)) {
        return beast->owner;
    }
    return std::nullopt;
}

std::optional<TemplateId> BeastCollection::templateOf(ItemId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const MintedBeast* beast = findLocked(id)) {
        return beast->attributes.templateId;
    }
    return std::nullopt;
}

std::vector<MintedBeast> BeastCollection::beastsOf(const UserId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MintedBeast> result;
    for (const auto& beast : beasts_) {
        if (beast.owner == owner) {
            result.push_back(beast);
        }
    }
    return result;
}

std::vector<MintedBeast> BeastCollection::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return beasts_;
}

std::size_t BeastCollection::balanceOf(const UserId& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(beasts_.cbegin(), beasts_.cend(),
        [&owner](const MintedBeast& b) { return b.owner == owner; }));
}

std::size_t BeastCollection::totalMinted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return beasts_.size();
}

nlohmann::json BeastCollection::metadata(ItemId id) const {
    std::optional<MintedBeast> beast = find(id);
    if (!beast) {
        throw GachaError(GachaErrorCode::OutOfBound, "beast #" + std::to_string(id) + " does not exist");
    }
    nlohmann::json data = beast->toJson();
    data["name"] = "EtherBeast #" + std::to_string(id);
    data["stars"] = rarityToString(beast->attributes.rarity);
    return data;
}

void BeastCollection::replaceAll(const std::vector<MintedBeast>& beasts) {
    std::lock_guard<std::mutex> lock(mutex_);
    beasts_ = beasts;
    ItemId maxId = 0;
    for (const auto& beast : beasts_) {
        maxId = std::max(maxId, beast.id);
    }
    nextId_ = std::max(nextId_, maxId + 1);
}

void BeastCollection::setMintHook(MintHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    mintHook_ = std::move(hook);
}

const UserId& BeastCollection::minter() const {
    return minter_;
}
