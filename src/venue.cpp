// =============================================================================
// venue.cpp - Constant-Product Venue
// =============================================================================

#include "flashx/venue.hpp"
#include "flashx/errors.hpp"
#include "flashx/runtime.hpp"

namespace flashx {

ConstantProductVenue::ConstantProductVenue(Runtime& runtime, const Address& router,
                                           uint32_t fee_bps)
    : runtime_(runtime)
    , router_(router)
    , fee_bps_(fee_bps) {
    if (fee_bps >= BPS_DENOMINATOR) {
        throw ConfigError("venue fee must be below 10000 bps");
    }
}

// =============================================================================
// Pair Management
// =============================================================================

std::pair<Address, Address> ConstantProductVenue::sort_tokens(const Address& a, const Address& b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

void ConstantProductVenue::create_pair(const Address& token_a, const Address& token_b,
                                       const Address& pair) {
    if (token_a == token_b) {
        throw ConfigError("pair tokens must differ");
    }
    pairs_[sort_tokens(token_a, token_b)] = pair;
}

std::optional<Address> ConstantProductVenue::pair_for(const Address& token_a,
                                                      const Address& token_b) const {
    auto it = pairs_.find(sort_tokens(token_a, token_b));
    if (it == pairs_.end()) return std::nullopt;
    return it->second;
}

Address ConstantProductVenue::require_pair(const Address& token_a, const Address& token_b) const {
    auto pair = pair_for(token_a, token_b);
    if (!pair) {
        throw RevertError(errors::PAIR_NOT_FOUND,
                          "no pair for " + addresses::to_hex(token_a) + "/" +
                          addresses::to_hex(token_b));
    }
    return *pair;
}

void ConstantProductVenue::add_liquidity(const Address& token_a, Amount amount_a,
                                         const Address& token_b, Amount amount_b) {
    Address pair = require_pair(token_a, token_b);
    runtime_.atomic([&]() {
        runtime_.mint(token_a, pair, amount_a);
        runtime_.mint(token_b, pair, amount_b);
    });
}

std::pair<Amount, Amount> ConstantProductVenue::reserves(const Address& token_a,
                                                         const Address& token_b) const {
    Address pair = require_pair(token_a, token_b);
    return {runtime_.balance_of(token_a, pair), runtime_.balance_of(token_b, pair)};
}

// =============================================================================
// Swap Math
// =============================================================================

Amount ConstantProductVenue::amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out,
                                        uint32_t fee_bps) {
    if (amount_in == 0) {
        throw RevertError(errors::INVALID_AMOUNT, "zero input amount");
    }
    if (reserve_in == 0 || reserve_out == 0) {
        throw RevertError(errors::INSUFFICIENT_RESERVES, "empty pair");
    }
    Amount in_with_fee = checked_mul(amount_in, BPS_DENOMINATOR - fee_bps);
    Amount denominator = checked_add(checked_mul(reserve_in, BPS_DENOMINATOR), in_with_fee);
    return mul_div(in_with_fee, reserve_out, denominator);
}

std::vector<Amount> ConstantProductVenue::quote(Amount amount_in,
                                                const std::vector<Address>& path) const {
    if (path.size() < 2) {
        throw RevertError(errors::INVALID_PATH, "path needs at least two tokens");
    }
    std::vector<Amount> amounts;
    amounts.reserve(path.size());
    amounts.push_back(amount_in);
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        auto [reserve_in, reserve_out] = reserves(path[i], path[i + 1]);
        amounts.push_back(amount_out(amounts.back(), reserve_in, reserve_out, fee_bps_));
    }
    return amounts;
}

// =============================================================================
// Exchange
// =============================================================================

std::vector<Amount> ConstantProductVenue::exchange(const Address& caller,
                                                   Amount amount_in,
                                                   Amount min_amount_out,
                                                   const std::vector<Address>& path,
                                                   const Address& recipient,
                                                   Timestamp deadline) {
    return runtime_.atomic([&]() {
        if (runtime_.now() > deadline) {
            throw RevertError(errors::EXPIRED, "router deadline passed");
        }

        std::vector<Amount> amounts = quote(amount_in, path);
        if (amounts.back() < min_amount_out) {
            throw RevertError(errors::INSUFFICIENT_OUTPUT_AMOUNT,
                              "output " + to_string(amounts.back()) + " below minimum " +
                              to_string(min_amount_out));
        }

        Address first_pair = require_pair(path[0], path[1]);
        runtime_.transfer_from(path[0], router_, caller, first_pair, amounts[0]);

        for (size_t i = 0; i + 1 < path.size(); ++i) {
            Address pair = require_pair(path[i], path[i + 1]);
            Address to = (i + 2 < path.size()) ? require_pair(path[i + 1], path[i + 2]) : recipient;
            runtime_.transfer(path[i + 1], pair, to, amounts[i + 1]);
        }
        return amounts;
    });
}

} // namespace flashx
