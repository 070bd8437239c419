#include "GachaError.h"

GachaErrorCategory categoryOf(GachaErrorCode code) {
    switch (code) {
    case GachaErrorCode::RollNotIdle:
        return GachaErrorCategory::StateConflict;
    case GachaErrorCode::InsufficientFunds:
        return GachaErrorCategory::InsufficientFunds;
    case GachaErrorCode::TransferFailed:
    case GachaErrorCode::RefundFailed:
        return GachaErrorCategory::ExternalTransferFailure;
    case GachaErrorCode::InvalidPrice:
    case GachaErrorCode::StalePrice:
    case GachaErrorCode::OracleUnavailable:
        return GachaErrorCategory::OracleError;
    case GachaErrorCode::UnknownRequest:
    case GachaErrorCode::DuplicateRequest:
    case GachaErrorCode::EmptyRandomness:
    case GachaErrorCode::RandomnessUnavailable:
        return GachaErrorCategory::ProtocolViolation;
    default:
        return GachaErrorCategory::Validation;
    }
}

const char* gachaErrorCodeName(GachaErrorCode code) {
    switch (code) {
    case GachaErrorCode::ZeroAmount: return "ZeroAmount";
    case GachaErrorCode::BelowMinimum: return "BelowMinimum";
    case GachaErrorCode::Underpaid: return "Underpaid";
    case GachaErrorCode::LengthMismatch: return "LengthMismatch";
    case GachaErrorCode::ZeroValue: return "ZeroValue";
    case GachaErrorCode::OutOfBound: return "OutOfBound";
    case GachaErrorCode::DuplicateValue: return "DuplicateValue";
    case GachaErrorCode::DirectPaymentRejected: return "DirectPaymentRejected";
    case GachaErrorCode::InvalidConfig: return "InvalidConfig";
    case GachaErrorCode::Unauthorized: return "Unauthorized";
    case GachaErrorCode::RollNotIdle: return "RollNotIdle";
    case GachaErrorCode::InsufficientFunds: return "InsufficientFunds";
    case GachaErrorCode::TransferFailed: return "TransferFailed";
    case GachaErrorCode::RefundFailed: return "RefundFailed";
    case GachaErrorCode::InvalidPrice: return "InvalidPrice";
    case GachaErrorCode::StalePrice: return "StalePrice";
    case GachaErrorCode::OracleUnavailable: return "OracleUnavailable";
    case GachaErrorCode::UnknownRequest: return "UnknownRequest";
    case GachaErrorCode::DuplicateRequest: return "DuplicateRequest";
    case GachaErrorCode::EmptyRandomness: return "EmptyRandomness";
    case GachaErrorCode::RandomnessUnavailable: return "RandomnessUnavailable";
    }
    return "Unknown";
}

const char* gachaErrorCategoryName(GachaErrorCategory category) {
    switch (category) {
    case GachaErrorCategory::Validation: return "ValidationError";
    case GachaErrorCategory::StateConflict: return "StateConflict";
    case GachaErrorCategory::InsufficientFunds: return "InsufficientFunds";
    case GachaErrorCategory::ExternalTransferFailure: return "ExternalTransferFailure";
    case GachaErrorCategory::OracleError: return "OracleError";
    case GachaErrorCategory::ProtocolViolation: return "ProtocolViolation";
    }
    return "Unknown";
}

GachaError::GachaError(GachaErrorCode code, const std::string& message)
    : std::runtime_error(std::string(gachaErrorCodeName(code)) + ": " + message), code_(code) {}

GachaErrorCode GachaError::code() const {
    return code_;
}

GachaErrorCategory GachaError::category() const {
    return categoryOf(code_);
}
