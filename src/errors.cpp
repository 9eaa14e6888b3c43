// =============================================================================
// errors.cpp - Error Names and RevertError
// =============================================================================

#include "flashx/errors.hpp"

namespace flashx {

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "Ok";
        case errors::UNAUTHORIZED_CALLBACK: return "UnauthorizedCallback";
        case errors::UNTRUSTED_INITIATOR: return "UntrustedInitiator";
        case errors::NOT_OWNER: return "NotOwner";
        case errors::NOT_OPERATOR: return "NotOperator";
        case errors::MALFORMED_PLAN: return "MalformedPlan";
        case errors::INVALID_PATH: return "InvalidPath";
        case errors::DEADLINE_EXPIRED: return "DeadlineExpired";
        case errors::VENUE_NOT_APPROVED: return "VenueNotApproved";
        case errors::INVALID_AMOUNT: return "InvalidAmount";
        case errors::UNKNOWN_VENUE: return "UnknownVenue";
        case errors::INSUFFICIENT_PROFIT: return "InsufficientProfit";
        case errors::SWAP_FAILED: return "SwapFailed";
        case errors::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case errors::INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case errors::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        case errors::ARITHMETIC_UNDERFLOW: return "ArithmeticUnderflow";
        case errors::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
        case errors::CALLBACK_FAILED: return "CallbackFailed";
        case errors::UNSUPPORTED_ASSET: return "UnsupportedAsset";
        case errors::INSUFFICIENT_OUTPUT_AMOUNT: return "InsufficientOutputAmount";
        case errors::EXPIRED: return "Expired";
        case errors::PAIR_NOT_FOUND: return "PairNotFound";
        case errors::INSUFFICIENT_RESERVES: return "InsufficientReserves";
        case errors::REENTRANT_CALL: return "ReentrantCall";
    }
    return "Unknown";
}

RevertError::RevertError(int32_t code, const std::string& reason)
    : std::runtime_error(reason)
    , code_(code)
    , reason_(reason) {
    refresh_message();
}

RevertError& RevertError::at_step(size_t index) {
    step_index_ = index;
    refresh_message();
    return *this;
}

RevertError& RevertError::caused_by(int32_t cause) {
    cause_ = cause;
    refresh_message();
    return *this;
}

RevertError& RevertError::with_shortfall(Amount shortfall) {
    shortfall_ = shortfall;
    refresh_message();
    return *this;
}

void RevertError::refresh_message() {
    message_ = std::string(error_name(code_));
    if (step_index_) {
        message_ += " at step " + std::to_string(*step_index_);
    }
    if (cause_ != errors::OK) {
        message_ += " (" + std::string(error_name(cause_)) + ")";
    }
    if (!reason_.empty()) {
        message_ += ": " + reason_;
    }
    if (shortfall_ > 0) {
        message_ += " (shortfall " + to_string(shortfall_) + ")";
    }
}

} // namespace flashx
