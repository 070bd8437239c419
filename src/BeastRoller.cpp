#include "BeastRoller.h"

#include <stdexcept>

#include "GachaError.h"
#include "Sha256.h"

const char* const BeastRoller::kBeastIndexTag = "BEAST_INDEX";
const char* const BeastRoller::kHpTag = "HP";
const char* const BeastRoller::kAttackTag = "ATTACK";
const char* const BeastRoller::kDefenseTag = "DEFENSE";
const char* const BeastRoller::kRarityTag = "RARITY";

BeastRoller::BeastRoller(std::shared_ptr<const BeastCatalog> catalog)
    : catalog_(std::move(catalog)) {
    if (!catalog_ || catalog_->size() == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "roller needs a non-empty catalog");
    }
}

Bytes32 BeastRoller::baseSeed(const Word256& randomWord, RequestId requestId) {
    Sha256 hasher;
    hasher.update(toBigEndian(randomWord));
    hasher.update(toBigEndian(static_cast<std::uint64_t>(requestId)));
    return hasher.finish();
}

std::uint32_t BeastRoller::deriveInRange(const Bytes32& seed, const std::string& tag,
    std::uint32_t min, std::uint32_t max) {
    if (max < min) {
        throw std::invalid_argument("deriveInRange: max < min");
    }
    Sha256 hasher;
    hasher.update(seed);
    hasher.update(tag);
    Word256 value = fromBigEndian(hasher.finish());
    Word256 span = Word256(max) - Word256(min) + 1;
    return min + static_cast<std::uint32_t>(value % span);
}

Rarity BeastRoller::rarityForRoll(std::uint32_t roll) {
    if (roll < kRarityRollMin || roll > kRarityRollMax) {
        throw GachaError(GachaErrorCode::OutOfBound, "rarity roll " + std::to_string(roll) + " outside [1, 100]");
    }
    if (roll <= 50) {
        return Rarity::Common;
    }
    if (roll <= 80) {
        return Rarity::Rare;
    }
    if (roll <= 95) {
        return Rarity::Unique;
    }
    return Rarity::Legendary;
}

RollOutcome BeastRoller::roll(const Word256& randomWord, RequestId requestId) const {
    // requestId를 섞어서 같은 워드가 두 번 와도 결과가 서로 독립이 되게 한다
    Bytes32 seed = baseSeed(randomWord, requestId);

    RollOutcome outcome;
    outcome.beastIndex = deriveInRange(seed, kBeastIndexTag, 0, static_cast<std::uint32_t>(catalog_->size() - 1));
    outcome.rarityRoll = deriveInRange(seed, kRarityTag, kRarityRollMin, kRarityRollMax);

    const BeastTemplate& tmpl = catalog_->atIndex(outcome.beastIndex);
    outcome.attributes.templateId = tmpl.templateId;
    outcome.attributes.element = tmpl.element;
    outcome.attributes.rarity = rarityForRoll(outcome.rarityRoll);
    outcome.attributes.hp = deriveInRange(seed, kHpTag, kHpMin, kHpMax);
    outcome.attributes.attack = deriveInRange(seed, kAttackTag, kAttackMin, kAttackMax);
    outcome.attributes.defense = deriveInRange(seed, kDefenseTag, kDefenseMin, kDefenseMax);
    return outcome;
}

const BeastCatalog& BeastRoller::catalog() const {
    return *catalog_;
}
