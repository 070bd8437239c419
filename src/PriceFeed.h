#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "Logger.h"

// 10^18 * 10^decimals가 256비트 안에 들어가는 상한
constexpr int kMaxFeedDecimals = 36;

// 외부 가격 피드의 최신 라운드. answer는 결제 자산 1개당 USD 가격(decimals 자리 고정소수점).
struct PriceRound {
    std::uint64_t roundId{0};
    std::int64_t answer{0};
    std::int64_t updatedAt{0};
    std::uint8_t decimals{8};
};

class PriceFeed {
public:
    virtual ~PriceFeed() = default;
    virtual PriceRound latestRound() const = 0;
};

// 설정값이나 테스트에서 직접 지정하는 피드
class StaticPriceFeed : public PriceFeed {
public:
    explicit StaticPriceFeed(std::int64_t answer, std::uint8_t decimals = 8);

    PriceRound latestRound() const override;

    // 새 라운드를 연다. updatedAt은 현재 시각으로 갱신된다.
    void setAnswer(std::int64_t answer);
    void setUpdatedAt(std::int64_t updatedAt);

private:
    mutable std::mutex mutex_;
    PriceRound round_;
};

// {"method": "latestRoundData"}를 POST하고 JSON 응답에서 라운드를 읽는다.
class HttpPriceFeed : public PriceFeed {
public:
    HttpPriceFeed(std::string url, std::shared_ptr<Logger> logger = nullptr);

    PriceRound latestRound() const override;

    static PriceRound parseRound(const std::string& body);

private:
    std::string url_;
    std::shared_ptr<Logger> logger_;
};
