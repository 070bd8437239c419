#include "GachaConfig.h"

#include <cstdlib>
#include <fstream>

#include "GachaError.h"
#include "Utils.h"

namespace {
Amount readTokenAmount(const nlohmann::json& node) {
    if (node.is_string()) {
        return parseUnits(node.get<std::string>(), kTokenDecimals);
    }
    if (node.is_number_unsigned() || node.is_number_integer()) {
        std::int64_t whole = node.get<std::int64_t>();
        if (whole < 0) {
            throw GachaError(GachaErrorCode::InvalidConfig, "token amounts cannot be negative");
        }
        return Amount(static_cast<std::uint64_t>(whole)) * tokenUnit();
    }
    throw GachaError(GachaErrorCode::InvalidConfig, "token amount must be a string or an integer");
}

PriceFeedMode parseFeedMode(const std::string& value) {
    std::string mode = toLower(value);
    if (mode == "static") {
        return PriceFeedMode::Static;
    }
    if (mode == "http") {
        return PriceFeedMode::Http;
    }
    throw GachaError(GachaErrorCode::InvalidConfig, "unknown price feed mode '" + value + "'");
}
} // 익명 네임스페이스 종료

GachaConfig GachaConfig::fromJson(const nlohmann::json& data) {
    GachaConfig config;
    try {
        if (data.contains("rollPrice")) {
            config.rollPrice = readTokenAmount(data["rollPrice"]);
        }

        if (data.contains("priceFeed")) {
            const auto& feed = data["priceFeed"];
            config.priceFeed.mode = parseFeedMode(feed.value<std::string>("mode", "static"));
            config.priceFeed.answer = feed.value<std::int64_t>("answer", config.priceFeed.answer);
            int decimals = feed.value<int>("decimals", 8);
            if (decimals < 0 || decimals > kMaxFeedDecimals) {
                throw GachaError(GachaErrorCode::InvalidConfig,
                    "priceFeed.decimals must be within [0, " + std::to_string(kMaxFeedDecimals) + "]");
            }
            config.priceFeed.decimals = static_cast<std::uint8_t>(decimals);
            config.priceFeed.url = feed.value<std::string>("url", "");
            config.priceFeed.maxAgeSeconds = feed.value<std::int64_t>("maxAgeSeconds", 0);
        }

        if (data.contains("catalog")) {
            config.catalogSeed = data["catalog"];
        }

        if (data.contains("randomness")) {
            const auto& vrf = data["randomness"];
            config.randomness.keyHash = vrf.value<std::string>("keyHash", "");
            config.randomness.subscriptionId = vrf.value<std::uint64_t>("subscriptionId", 0);
            config.randomness.requestConfirmations = vrf.value<std::uint16_t>("requestConfirmations", 3);
            config.randomness.callbackGasLimit = vrf.value<std::uint32_t>("callbackGasLimit", 200000);
            config.randomness.numWords = vrf.value<std::uint32_t>("numWords", 1);
            config.deliveryDelayMs = vrf.value<std::uint32_t>("deliveryDelayMs", 0);
        }

        config.logPath = data.value<std::string>("logPath", config.logPath);
        config.savePath = data.value<std::string>("savePath", config.savePath);
        config.verbose = data.value<bool>("verbose", false);
    } catch (const nlohmann::json::exception& ex) {
        throw GachaError(GachaErrorCode::InvalidConfig, ex.what());
    }

    if (config.rollPrice == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "rollPrice must be positive");
    }
    if (config.randomness.numWords == 0) {
        throw GachaError(GachaErrorCode::InvalidConfig, "randomness.numWords must be at least 1");
    }
    if (config.priceFeed.mode == PriceFeedMode::Http && config.priceFeed.url.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "http price feed needs a url");
    }
    return config;
}

GachaConfig GachaConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return GachaConfig{};
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& ex) {
        throw GachaError(GachaErrorCode::InvalidConfig, path + ": " + ex.what());
    }
    return fromJson(data);
}

GachaConfig GachaConfig::fromEnvironment() {
    std::string path = "etherbeast.json";
    if (const char* configEnv = std::getenv("ETHERBEAST_CONFIG")) {
        path = configEnv;
    }
    GachaConfig config = loadFromFile(path);
    config.applyEnvironment();
    return config;
}

void GachaConfig::applyEnvironment() {
    if (const char* url = std::getenv("ETHERBEAST_PRICE_FEED_URL")) {
        if (*url != '\0') {
            priceFeed.mode = PriceFeedMode::Http;
            priceFeed.url = url;
        }
    }
    if (const char* logEnv = std::getenv("ETHERBEAST_LOG")) {
        logPath = logEnv;
    }
    if (const char* saveEnv = std::getenv("ETHERBEAST_SAVE")) {
        savePath = saveEnv;
    }
}

std::shared_ptr<const BeastCatalog> GachaConfig::buildCatalog() const {
    if (catalogSeed.is_null()) {
        return std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    }
    return std::make_shared<const BeastCatalog>(BeastCatalog::fromJson(catalogSeed));
}

std::shared_ptr<PriceFeed> GachaConfig::buildPriceFeed(std::shared_ptr<Logger> logger) const {
    if (priceFeed.mode == PriceFeedMode::Http) {
        return std::make_shared<HttpPriceFeed>(priceFeed.url, std::move(logger));
    }
    return std::make_shared<StaticPriceFeed>(priceFeed.answer, priceFeed.decimals);
}
