#ifndef FLASHX_PLAN_HPP
#define FLASHX_PLAN_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace flashx {

// =============================================================================
// Swap Step (one exchange leg)
// =============================================================================

struct SwapStep {
    Address venue;
    std::vector<Address> path;  // path[0] sold, path.back() bought
    Amount amount_in;
    Amount min_amount_out;
    Timestamp deadline;

    const Address& token_in() const { return path.front(); }
    const Address& token_out() const { return path.back(); }

    bool operator==(const SwapStep&) const = default;
};

// =============================================================================
// Arbitrage Plan (decoded operation payload)
// =============================================================================

struct ArbitragePlan {
    std::vector<SwapStep> swaps;
    Amount min_profit;
    Address profit_token;

    bool operator==(const ArbitragePlan&) const = default;
};

// =============================================================================
// Plan Codec
//
// Ethereum ABI encoding of
//   ((address,address[],uint256,uint256,uint256)[],uint256,address)
// as produced by abi.encode(plan). Decoding validates every offset, length
// and padding byte and throws RevertError(MALFORMED_PLAN) on any violation.
// =============================================================================

namespace codec {

constexpr size_t WORD = 32;
constexpr size_t MAX_SWAPS = 16;
constexpr size_t MAX_PATH_LENGTH = 8;

std::vector<uint8_t> encode_plan(const ArbitragePlan& plan);
ArbitragePlan decode_plan(const std::vector<uint8_t>& payload);

std::string to_hex(const std::vector<uint8_t>& data);       // 0x-prefixed
std::vector<uint8_t> from_hex(const std::string& hex);      // throws std::invalid_argument

} // namespace codec

// =============================================================================
// Plan Builder
// =============================================================================

class PlanBuilder {
public:
    // Steps added without an explicit deadline expire deadline_secs after now
    explicit PlanBuilder(Timestamp now = 0, Timestamp deadline_secs = 120)
        : now_(now), deadline_secs_(deadline_secs) {}

    PlanBuilder& swap(const Address& venue, std::vector<Address> path,
                      Amount amount_in, Amount min_amount_out, Timestamp deadline) {
        plan_.swaps.push_back(SwapStep{venue, std::move(path), amount_in, min_amount_out, deadline});
        return *this;
    }

    PlanBuilder& swap(const Address& venue, std::vector<Address> path,
                      Amount amount_in, Amount min_amount_out) {
        return swap(venue, std::move(path), amount_in, min_amount_out, now_ + deadline_secs_);
    }

    PlanBuilder& min_profit(Amount amount) {
        plan_.min_profit = amount;
        return *this;
    }

    PlanBuilder& profit_token(const Address& token) {
        plan_.profit_token = token;
        return *this;
    }

    ArbitragePlan build() const { return plan_; }
    std::vector<uint8_t> encode() const { return codec::encode_plan(plan_); }

private:
    Timestamp now_;
    Timestamp deadline_secs_;
    ArbitragePlan plan_{{}, 0, {}};
};

} // namespace flashx

#endif // FLASHX_PLAN_HPP
