#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "Amount.h"
#include "BeastCatalog.h"
#include "Logger.h"
#include "PriceFeed.h"
#include "RandomnessProvider.h"

enum class PriceFeedMode {
    Static,
    Http
};

struct PriceFeedConfig {
    PriceFeedMode mode{PriceFeedMode::Static};
    std::int64_t answer{200000000000LL};
    std::uint8_t decimals{8};
    std::string url;
    std::int64_t maxAgeSeconds{0};
};

struct GachaConfig {
    Amount rollPrice{pow10(kTokenDecimals) * 10};
    PriceFeedConfig priceFeed;
    nlohmann::json catalogSeed;
    RandomnessRequest randomness;
    std::uint32_t deliveryDelayMs{0};
    std::string logPath{".etherbeast/etherbeast.log"};
    std::string savePath{".etherbeast/beasts.json"};
    bool verbose{false};

    static GachaConfig fromJson(const nlohmann::json& data);

    // 파일이 없으면 기본값을 돌려준다.
    static GachaConfig loadFromFile(const std::string& path);

    // ETHERBEAST_CONFIG 파일을 읽고 환경 변수 덮어쓰기를 적용한다.
    static GachaConfig fromEnvironment();
    void applyEnvironment();

    std::shared_ptr<const BeastCatalog> buildCatalog() const;
    std::shared_ptr<PriceFeed> buildPriceFeed(std::shared_ptr<Logger> logger) const;
};
