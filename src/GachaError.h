#pragma once

#include <stdexcept>
#include <string>

// 호출 측에서 재시도 여부를 판단할 때 쓰는 상위 분류
enum class GachaErrorCategory {
    Validation,
    StateConflict,
    InsufficientFunds,
    ExternalTransferFailure,
    OracleError,
    ProtocolViolation
};

enum class GachaErrorCode {
    ZeroAmount,
    BelowMinimum,
    Underpaid,
    LengthMismatch,
    ZeroValue,
    OutOfBound,
    DuplicateValue,
    DirectPaymentRejected,
    InvalidConfig,
    Unauthorized,
    RollNotIdle,
    InsufficientFunds,
    TransferFailed,
    RefundFailed,
    InvalidPrice,
    StalePrice,
    OracleUnavailable,
    UnknownRequest,
    DuplicateRequest,
    EmptyRandomness,
    RandomnessUnavailable
};

GachaErrorCategory categoryOf(GachaErrorCode code);
const char* gachaErrorCodeName(GachaErrorCode code);
const char* gachaErrorCategoryName(GachaErrorCategory category);

class GachaError : public std::runtime_error {
public:
    GachaError(GachaErrorCode code, const std::string& message);

    GachaErrorCode code() const;
    GachaErrorCategory category() const;

private:
    GachaErrorCode code_;
};
