#pragma once

#include <cstdint>
#include <memory>

#include "Amount.h"
#include "PriceFeed.h"

// 소환 토큰 수량(18자리)을 결제 자산 기본 단위로 환산한다. 토큰 1개 = 1 USD.
// 상태를 바꾸지 않으며 호출할 때마다 피드를 새로 읽는다.
class PricingOracleAdapter {
public:
    // maxPriceAgeSeconds가 0이면 라운드 신선도를 검사하지 않는다.
    explicit PricingOracleAdapter(std::shared_ptr<const PriceFeed> feed, std::int64_t maxPriceAgeSeconds = 0);

    Amount quote(const Amount& amount) const;

    // 토큰 한 개(10^18 단위)에 해당하는 결제 자산 기본 단위
    Amount assetPerToken() const;

private:
    std::shared_ptr<const PriceFeed> feed_;
    std::int64_t maxPriceAgeSeconds_{0};
};
