#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "GachaEvents.h"
#include "Logger.h"
#include "PricingOracleAdapter.h"
#include "TokenLedger.h"

// 구매자에게 초과 지불분을 돌려주는 외부 경로
class RefundChannel {
public:
    virtual ~RefundChannel() = default;
    virtual bool sendRefund(const UserId& to, const Amount& amount) = 0;
};

struct PurchaseReceipt {
    UserId buyer;
    Amount tokens{0};
    Amount paid{0};
    Amount refunded{0};
};

class SummonTokenLedger : public TokenLedger {
public:
    SummonTokenLedger(UserId owner, UserId custodyAccount,
        std::shared_ptr<const PricingOracleAdapter> pricing,
        std::shared_ptr<Logger> logger = nullptr);

    // payment는 호출자가 이미 건넨 결제 자산이다. 실패하면 아무것도 반영되지 않는다.
    PurchaseReceipt purchase(const UserId& buyer, const Amount& payment, const Amount& amount, RefundChannel& refunds);

    // purchase를 거치지 않은 송금은 항상 거부한다.
    void receivePayment(const UserId& from, const Amount& payment);

    void transfer(const UserId& from, const UserId& to, const Amount& amount);
    Amount withdrawTreasury(const UserId& caller, const Amount& amount);

    Amount balanceOf(const UserId& user) const override;
    bool pull(const UserId& user, const Amount& amount) override;
    void burn(const Amount& amount) override;
    void restore(const UserId& user, const Amount& pulled, const Amount& burned) override;

    Amount totalSupply() const;
    Amount totalBurned() const;
    Amount treasury() const;
    const UserId& owner() const;
    const UserId& custodyAccount() const;

    void subscribe(GachaEventListener listener);

private:
    UserId owner_;
    UserId custody_;
    std::shared_ptr<const PricingOracleAdapter> pricing_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<UserId, Amount> balances_;
    Amount totalSupply_{0};
    Amount totalBurned_{0};
    Amount treasury_{0};
    std::vector<GachaEventListener> listeners_;

    Amount balanceLocked(const UserId& user) const;
};
