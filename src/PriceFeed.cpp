#include "PriceFeed.h"

#include <nlohmann/json.hpp>

#include "GachaError.h"
#include "HttpClient.h"
#include "Utils.h"

namespace {
std::int64_t readInteger(const nlohmann::json& node, const char* key) {
    const auto& value = node.at(key);
    if (value.is_string()) {
        return std::stoll(value.get<std::string>());
    }
    return value.get<std::int64_t>();
}
} // 익명 네임스페이스 종료

StaticPriceFeed::StaticPriceFeed(std::int64_t answer, std::uint8_t decimals) {
    round_.roundId = 1;
    round_.answer = answer;
    round_.updatedAt = unixNow();
    round_.decimals = decimals;
}

PriceRound StaticPriceFeed::latestRound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return round_;
}

void StaticPriceFeed::setAnswer(std::int64_t answer) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++round_.roundId;
    round_.answer = answer;
    round_.updatedAt = unixNow();
}

void StaticPriceFeed::setUpdatedAt(std::int64_t updatedAt) {
    std::lock_guard<std::mutex> lock(mutex_);
    round_.updatedAt = updatedAt;
}

HttpPriceFeed::HttpPriceFeed(std::string url, std::shared_ptr<Logger> logger)
    : url_(std::move(url)), logger_(std::move(logger)) {}

PriceRound HttpPriceFeed::latestRound() const {
    nlohmann::json payload = nlohmann::json::object();
    payload["method"] = "latestRoundData";

    HttpResponse httpResponse;
    std::string errorMessage;
    if (!postJson(url_, payload.dump(), httpResponse, errorMessage)) {
        logTo(logger_, LogLevel::Error, "가격 피드 호출 실패: " + errorMessage);
        throw GachaError(GachaErrorCode::OracleUnavailable, "price feed request failed: " + errorMessage);
    }
    if (httpResponse.status != 200) {
        std::string statusMsg = "가격 피드 응답 코드: " + std::to_string(httpResponse.status);
        logTo(logger_, LogLevel::Error, statusMsg);
        throw GachaError(GachaErrorCode::OracleUnavailable, "price feed answered HTTP " + std::to_string(httpResponse.status));
    }
    return parseRound(httpResponse.body);
}

PriceRound HttpPriceFeed::parseRound(const std::string& body) {
    PriceRound round;
    try {
        auto json = nlohmann::json::parse(body);
        // JSON-RPC 스타일 응답이면 result 아래에 라운드가 들어 있다
        const nlohmann::json& node = json.contains("result") ? json["result"] : json;
        round.answer = readInteger(node, "answer");
        round.updatedAt = node.contains("updatedAt") ? readInteger(node, "updatedAt") : 0;
        round.roundId = node.contains("roundId") ? static_cast<std::uint64_t>(readInteger(node, "roundId")) : 0;
        int decimals = node.value<int>("decimals", 8);
        if (decimals < 0 || decimals > kMaxFeedDecimals) {
            throw GachaError(GachaErrorCode::OracleUnavailable,
                "price feed reported " + std::to_string(decimals) + " decimals");
        }
        round.decimals = static_cast<std::uint8_t>(decimals);
    } catch (const nlohmann::json::exception& ex) {
        throw GachaError(GachaErrorCode::OracleUnavailable, std::string("malformed price feed response: ") + ex.what());
    } catch (const std::logic_error& ex) {
        throw GachaError(GachaErrorCode::OracleUnavailable, std::string("malformed price feed number: ") + ex.what());
    }
    return round;
}
