#include "SummonTokenLedger.h"

#include <exception>
#include <limits>

#include "GachaError.h"

SummonTokenLedger::SummonTokenLedger(UserId owner, UserId custodyAccount,
    std::shared_ptr<const PricingOracleAdapter> pricing,
    std::shared_ptr<Logger> logger)
    : owner_(std::move(owner)),
      custody_(std::move(custodyAccount)),
      pricing_(std::move(pricing)),
      logger_(std::move(logger)) {
    if (!pricing_) {
        throw GachaError(GachaErrorCode::InvalidConfig, "ledger needs a pricing adapter");
    }
    if (owner_.empty() || custody_.empty()) {
        throw GachaError(GachaErrorCode::InvalidConfig, "ledger owner and custody account must be named");
    }
}

PurchaseReceipt SummonTokenLedger::purchase(const UserId& buyer, const Amount& payment, const Amount& amount,
    RefundChannel& refunds) {
    Amount required = pricing_->quote(amount);
    if (payment < required) {
        logTo(logger_, LogLevel::Warning, "구매 거부(지불 부족): " + buyer + " 지불=" + payment.str() + " 필요=" + required.str());
        throw GachaError(GachaErrorCode::Underpaid, "payment " + payment.str() + " is below the quote " + required.str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (amount > std::numeric_limits<Amount>::max() - totalSupply_) {
            throw GachaError(GachaErrorCode::OutOfBound, "token supply would overflow");
        }
    }

    PurchaseReceipt receipt;
    receipt.buyer = buyer;
    receipt.tokens = amount;
    receipt.paid = required;
    receipt.refunded = payment - required;

    // 아직 아무것도 반영하지 않았으므로 환불이 실패하면 그대로 중단하면 된다
    if (receipt.refunded > 0 && !refunds.sendRefund(buyer, receipt.refunded)) {
        logTo(logger_, LogLevel::Error, "환불 실패로 구매를 취소합니다: " + buyer + " 환불액=" + receipt.refunded.str());
        throw GachaError(GachaErrorCode::RefundFailed, "could not return " + receipt.refunded.str() + " to " + buyer);
    }

    std::vector<GachaEventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_[buyer] += amount;
        totalSupply_ += amount;
        treasury_ += required;
        listeners = listeners_;
    }

    logTo(logger_, LogLevel::Info, "토큰 구매: " + buyer + " 수량=" + formatUnits(amount, kTokenDecimals)
        + " 지불=" + required.str() + " 환불=" + receipt.refunded.str());

    GachaEvent event;
    event.type = GachaEventType::TokenPurchased;
    event.user = buyer;
    event.amount = amount;
    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& ex) {
            logTo(logger_, LogLevel::Error, std::string("구매 이벤트 리스너 실패: ") + ex.what());
        }
    }
    return receipt;
}

void SummonTokenLedger::receivePayment(const UserId& from, const Amount& payment) {
    logTo(logger_, LogLevel::Warning, "직접 송금 거부: " + from + " 금액=" + payment.str());
    throw GachaError(GachaErrorCode::DirectPaymentRejected, "direct payments are not accepted; use purchase");
}

void SummonTokenLedger::transfer(const UserId& from, const UserId& to, const Amount& amount) {
    if (amount == 0) {
        throw GachaError(GachaErrorCode::ZeroAmount, "transfer amount must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (balanceLocked(from) < amount) {
        throw GachaError(GachaErrorCode::InsufficientFunds, from + " holds less than " + amount.str());
    }
    balances_[from] -= amount;
    balances_[to] += amount;
}

Amount SummonTokenLedger::withdrawTreasury(const UserId& caller, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (caller != owner_) {
        throw GachaError(GachaErrorCode::Unauthorized, caller + " is not the ledger owner");
    }
    if (amount == 0) {
        throw GachaError(GachaErrorCode::ZeroAmount, "withdrawal amount must be positive");
    }
    if (amount > treasury_) {
        throw GachaError(GachaErrorCode::InsufficientFunds, "treasury holds " + treasury_.str());
    }
    treasury_ -= amount;
    logTo(logger_, LogLevel::Info, "트레저리 인출: " + amount.str());
    return amount;
}

Amount SummonTokenLedger::balanceOf(const UserId& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balanceLocked(user);
}

bool SummonTokenLedger::pull(const UserId& user, const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0 || balanceLocked(user) < amount) {
        return false;
    }
    balances_[user] -= amount;
    balances_[custody_] += amount;
    return true;
}

void SummonTokenLedger::burn(const Amount& amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (balanceLocked(custody_) < amount) {
        throw GachaError(GachaErrorCode::InsufficientFunds, "custody holds less than the burn amount");
    }
    balances_[custody_] -= amount;
    totalSupply_ -= amount;
    totalBurned_ += amount;
}

void SummonTokenLedger::restore(const UserId& user, const Amount& pulled, const Amount& burned) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (burned > 0) {
        balances_[custody_] += burned;
        totalSupply_ += burned;
        totalBurned_ -= burned;
    }
    if (pulled > 0) {
        balances_[custody_] -= pulled;
        balances_[user] += pulled;
    }
    logTo(logger_, LogLevel::Warning, "차감 복구: " + user + " pull=" + pulled.str() + " burn=" + burned.str());
}

Amount SummonTokenLedger::totalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

Amount SummonTokenLedger::totalBurned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalBurned_;
}

Amount SummonTokenLedger::treasury() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return treasury_;
}

const UserId& SummonTokenLedger::owner() const {
    return owner_;
}

const UserId& SummonTokenLedger::custodyAccount() const {
    return custody_;
}

void SummonTokenLedger::subscribe(GachaEventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

Amount SummonTokenLedger::balanceLocked(const UserId& user) const {
    auto it = balances_.find(user);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}
