#pragma once

#include "Amount.h"
#include "Beast.h"

// 엔진이 보는 소환 토큰 장부
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual Amount balanceOf(const UserId& user) const = 0;

    // user 잔액에서 엔진 보관 계정으로 옮긴다. 잔액이 모자라면 false.
    virtual bool pull(const UserId& user, const Amount& amount) = 0;

    // 엔진 보관 계정에서 소각한다.
    virtual void burn(const Amount& amount) = 0;

    // 같은 작업 안에서 끝까지 가지 못한 pull/burn을 되돌린다.
    virtual void restore(const UserId& user, const Amount& pulled, const Amount& burned) = 0;
};
