#ifndef FLASHX_ERRORS_HPP
#define FLASHX_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace flashx {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Authorization
constexpr int32_t UNAUTHORIZED_CALLBACK = -1;
constexpr int32_t UNTRUSTED_INITIATOR = -2;
constexpr int32_t NOT_OWNER = -3;
constexpr int32_t NOT_OPERATOR = -4;

// Plan / step validation
constexpr int32_t MALFORMED_PLAN = -10;
constexpr int32_t INVALID_PATH = -11;
constexpr int32_t DEADLINE_EXPIRED = -12;
constexpr int32_t VENUE_NOT_APPROVED = -13;
constexpr int32_t INVALID_AMOUNT = -14;
constexpr int32_t UNKNOWN_VENUE = -15;

// Economic
constexpr int32_t INSUFFICIENT_PROFIT = -20;
constexpr int32_t SWAP_FAILED = -21;

// Token / runtime
constexpr int32_t INSUFFICIENT_BALANCE = -30;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -31;
constexpr int32_t ARITHMETIC_OVERFLOW = -32;
constexpr int32_t ARITHMETIC_UNDERFLOW = -33;

// Lender
constexpr int32_t INSUFFICIENT_LIQUIDITY = -40;
constexpr int32_t CALLBACK_FAILED = -41;
constexpr int32_t UNSUPPORTED_ASSET = -42;

// Venue
constexpr int32_t INSUFFICIENT_OUTPUT_AMOUNT = -50;
constexpr int32_t EXPIRED = -51;
constexpr int32_t PAIR_NOT_FOUND = -52;
constexpr int32_t INSUFFICIENT_RESERVES = -53;

// Security
constexpr int32_t REENTRANT_CALL = -60;
} // namespace errors

// Symbolic name of an error code ("InsufficientProfit", ...)
const char* error_name(int32_t code);

// =============================================================================
// RevertError - aborts the enclosing Runtime transaction
// =============================================================================

class RevertError : public std::runtime_error {
public:
    RevertError(int32_t code, const std::string& reason);

    int32_t code() const noexcept { return code_; }
    const std::string& reason() const noexcept { return reason_; }

    // Index of the swap step that failed, when the failure happened inside
    // the pipeline
    const std::optional<size_t>& step_index() const noexcept { return step_index_; }
    RevertError& at_step(size_t index);

    // Code of the underlying failure for SWAP_FAILED
    int32_t cause() const noexcept { return cause_; }
    RevertError& caused_by(int32_t cause);

    // Missing amount for INSUFFICIENT_PROFIT
    Amount shortfall() const noexcept { return shortfall_; }
    RevertError& with_shortfall(Amount shortfall);

private:
    void refresh_message();

    int32_t code_;
    std::string reason_;
    std::optional<size_t> step_index_;
    int32_t cause_{errors::OK};
    Amount shortfall_{0};
    std::string message_;

public:
    const char* what() const noexcept override { return message_.c_str(); }
};

// Invalid configuration or tool input
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace flashx

#endif // FLASHX_ERRORS_HPP
