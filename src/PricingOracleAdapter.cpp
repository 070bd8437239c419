#include "PricingOracleAdapter.h"

#include <stdexcept>

#include "GachaError.h"
#include "Utils.h"

PricingOracleAdapter::PricingOracleAdapter(std::shared_ptr<const PriceFeed> feed, std::int64_t maxPriceAgeSeconds)
    : feed_(std::move(feed)), maxPriceAgeSeconds_(maxPriceAgeSeconds) {
    if (!feed_) {
        throw GachaError(GachaErrorCode::InvalidConfig, "pricing adapter needs a price feed");
    }
}

Amount PricingOracleAdapter::assetPerToken() const {
    PriceRound round = feed_->latestRound();
    if (round.answer <= 0) {
        throw GachaError(GachaErrorCode::InvalidPrice, "price feed answered " + std::to_string(round.answer));
    }
    if (round.decimals > kMaxFeedDecimals) {
        throw GachaError(GachaErrorCode::OracleUnavailable, "price feed reported " + std::to_string(round.decimals) + " decimals");
    }
    if (maxPriceAgeSeconds_ > 0 && unixNow() - round.updatedAt > maxPriceAgeSeconds_) {
        throw GachaError(GachaErrorCode::StalePrice, "price round " + std::to_string(round.roundId) + " is older than "
            + std::to_string(maxPriceAgeSeconds_) + "s");
    }
    // USD/자산 가격을 뒤집어 1 USD에 해당하는 자산 양을 18자리로 구한다
    return tokenUnit() * pow10(round.decimals) / Amount(static_cast<std::uint64_t>(round.answer));
}

Amount PricingOracleAdapter::quote(const Amount& amount) const {
    if (amount == 0) {
        throw GachaError(GachaErrorCode::ZeroAmount, "amount must be positive");
    }
    if (amount < tokenUnit()) {
        throw GachaError(GachaErrorCode::BelowMinimum, "fractional tokens are not sold");
    }
    Amount rate = assetPerToken();
    try {
        // 곱셈을 먼저 해야 절삭 손실이 없다
        return rate * amount / tokenUnit();
    } catch (const std::overflow_error&) {
        throw GachaError(GachaErrorCode::OutOfBound, "quote overflows for amount " + amount.str());
    }
}
