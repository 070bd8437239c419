#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "Amount.h"
#include "Beast.h"
#include "BeastCatalog.h"
#include "RandomnessProvider.h"

constexpr std::uint32_t kHpMin = 15000;
constexpr std::uint32_t kHpMax = 65535;
constexpr std::uint32_t kAttackMin = 1500;
constexpr std::uint32_t kAttackMax = 4500;
constexpr std::uint32_t kDefenseMin = 1500;
constexpr std::uint32_t kDefenseMax = 4500;
constexpr std::uint32_t kRarityRollMin = 1;
constexpr std::uint32_t kRarityRollMax = 100;

struct RollOutcome {
    std::size_t beastIndex{0};
    std::uint32_t rarityRoll{0};
    MintedAttributes attributes;
};

// 난수 워드 하나를 필드별 태그로 도메인 분리해 비스트 속성으로 펼친다.
class BeastRoller {
public:
    static const char* const kBeastIndexTag;
    static const char* const kHpTag;
    static const char* const kAttackTag;
    static const char* const kDefenseTag;
    static const char* const kRarityTag;

    explicit BeastRoller(std::shared_ptr<const BeastCatalog> catalog);

    RollOutcome roll(const Word256& randomWord, RequestId requestId) const;

    // sha256(word || requestId), 둘 다 32바이트 빅엔디언
    static Bytes32 baseSeed(const Word256& randomWord, RequestId requestId);

    // sha256(seed || tag) mod (max - min + 1) + min
    static std::uint32_t deriveInRange(const Bytes32& seed, const std::string& tag,
        std::uint32_t min, std::uint32_t max);

    static Rarity rarityForRoll(std::uint32_t roll);

    const BeastCatalog& catalog() const;

private:
    std::shared_ptr<const BeastCatalog> catalog_;
};
