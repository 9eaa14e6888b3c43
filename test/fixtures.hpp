#ifndef FLASHX_TEST_FIXTURES_HPP
#define FLASHX_TEST_FIXTURES_HPP

#include <functional>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

#include <catch2/catch_tostring.hpp>

#include "flashx/flashx.hpp"

// Readable assertion output for 128-bit amounts
namespace Catch {
template <>
struct StringMaker<flashx::Amount> {
    static std::string convert(flashx::Amount v) { return flashx::to_string(v); }
};
template <>
struct StringMaker<flashx::I128> {
    static std::string convert(flashx::I128 v) { return flashx::to_string_signed(v); }
};
} // namespace Catch

namespace flashx::test {

// =============================================================================
// Well-known addresses
// =============================================================================

inline constexpr Address TOKEN_A = addresses::from_u64(0xA);
inline constexpr Address TOKEN_B = addresses::from_u64(0xB);
inline constexpr Address TOKEN_C = addresses::from_u64(0xC);

inline constexpr Address OWNER = addresses::from_u64(0x01);
inline constexpr Address OPERATOR = addresses::from_u64(0x02);
inline constexpr Address ATTACKER = addresses::from_u64(0x666);

inline constexpr Address ENGINE = addresses::from_u64(0xF1A5);
inline constexpr Address LENDER = addresses::from_u64(0x1E4D);
inline constexpr Address VENUE_1 = addresses::from_u64(0xA1);
inline constexpr Address VENUE_2 = addresses::from_u64(0xA2);
inline constexpr Address VENUE_3 = addresses::from_u64(0xA3);

inline constexpr Timestamp START_TIME = 1000;

// =============================================================================
// FixedRateVenue - swaps at a configured rate out of its own inventory
// =============================================================================

class FixedRateVenue : public IVenue {
public:
    FixedRateVenue(Runtime& runtime, const Address& address)
        : runtime_(runtime), address_(address) {}

    const Address& address() const override { return address_; }

    // amount_out = amount_in * numerator / denominator for token_in -> token_out
    FixedRateVenue& set_rate(const Address& token_in, const Address& token_out,
                             Amount numerator, Amount denominator) {
        rates_[{token_in, token_out}] = {numerator, denominator};
        return *this;
    }

    FixedRateVenue& fund(const Address& token, Amount amount) {
        runtime_.mint(token, address_, amount);
        return *this;
    }

    // Draw this much more than amount_in from the caller
    void set_overdraw(Amount extra) { overdraw_ = extra; }

    std::vector<Amount> quote(Amount amount_in, const std::vector<Address>& path) const override {
        if (path.size() < 2) {
            throw RevertError(errors::INVALID_PATH, "path needs at least two tokens");
        }
        std::vector<Amount> amounts{amount_in};
        for (size_t i = 0; i + 1 < path.size(); ++i) {
            auto it = rates_.find({path[i], path[i + 1]});
            if (it == rates_.end()) {
                throw RevertError(errors::PAIR_NOT_FOUND, "no rate");
            }
            amounts.push_back(mul_div(amounts.back(), it->second.first, it->second.second));
        }
        return amounts;
    }

    std::vector<Amount> exchange(const Address& caller, Amount amount_in, Amount min_amount_out,
                                 const std::vector<Address>& path, const Address& recipient,
                                 Timestamp deadline) override {
        return runtime_.atomic([&]() {
            before_exchange();
            if (runtime_.now() > deadline) {
                throw RevertError(errors::EXPIRED, "router deadline passed");
            }
            std::vector<Amount> amounts = quote(amount_in, path);
            if (amounts.back() < min_amount_out) {
                throw RevertError(errors::INSUFFICIENT_OUTPUT_AMOUNT, "slippage");
            }
            runtime_.transfer_from(path.front(), address_, caller, address_,
                                   checked_add(amount_in, overdraw_));
            runtime_.transfer(path.back(), address_, recipient, delivered(amounts.back()));
            ++calls_;
            return reported(amounts);
        });
    }

    int calls() const { return calls_; }

protected:
    virtual void before_exchange() {}
    virtual Amount delivered(Amount quoted) const { return quoted; }
    virtual std::vector<Amount> reported(std::vector<Amount> amounts) const { return amounts; }

    Runtime& runtime_;

private:
    Address address_;
    std::map<std::pair<Address, Address>, std::pair<Amount, Amount>> rates_;
    Amount overdraw_{0};
    int calls_{0};
};

// Runs a hook (typically a call back into the orchestrator) before swapping
class ReentrantVenue : public FixedRateVenue {
public:
    using FixedRateVenue::FixedRateVenue;

    std::function<void()> hook;

protected:
    void before_exchange() override {
        if (hook) hook();
    }
};

// Delivers `shortfall` less than it quotes but reports the full quote
class MisreportingVenue : public FixedRateVenue {
public:
    MisreportingVenue(Runtime& runtime, const Address& address, Amount shortfall)
        : FixedRateVenue(runtime, address), shortfall_(shortfall) {}

protected:
    Amount delivered(Amount quoted) const override { return quoted - shortfall_; }

private:
    Amount shortfall_;
};

// =============================================================================
// ArbitrageFixture
//
//   borrow 100 A (fee 0.05 A at 5 bps)
//   VENUE_1: 100 A -> 98 B
//   VENUE_2: 98 B -> 101 A
//   profit = 101 - 100.05 = 0.95 A
// =============================================================================

inline EngineConfig engine_config() {
    EngineConfig cfg;
    cfg.address = ENGINE;
    cfg.owner = OWNER;
    cfg.operator_address = OPERATOR;
    cfg.referral_code = 0;
    cfg.deadline_secs = 120;
    return cfg;
}

struct ArbitrageFixture {
    Runtime runtime{START_TIME};
    FlashLender lender{runtime, LENDER, 5};
    ReentrantVenue venue1{runtime, VENUE_1};
    FixedRateVenue venue2{runtime, VENUE_2};
    FlashX engine{runtime, lender, engine_config(), {VENUE_1, VENUE_2}};

    const Amount BORROW = x18::from_int(100);

    ArbitrageFixture() {
        lender.list_asset(TOKEN_A, x18::from_int(1000));
        venue1.set_rate(TOKEN_A, TOKEN_B, 98, 100).fund(TOKEN_B, x18::from_int(1000));
        venue2.set_rate(TOKEN_B, TOKEN_A, 101, 98).fund(TOKEN_A, x18::from_int(1000));
        engine.register_venue(venue1);
        engine.register_venue(venue2);
    }

    std::vector<uint8_t> payload(Amount min_profit = 0) const {
        return engine.plan()
            .swap(VENUE_1, {TOKEN_A, TOKEN_B}, x18::from_int(100), x18::from_int(98))
            .swap(VENUE_2, {TOKEN_B, TOKEN_A}, x18::from_int(98), x18::from_int(101))
            .min_profit(min_profit)
            .profit_token(TOKEN_A)
            .encode();
    }

    void run(Amount min_profit = 0) {
        engine.initiate(OPERATOR, TOKEN_A, BORROW, payload(min_profit));
    }
};

// Runs fn and returns the RevertError it throws; fails the test otherwise
template <typename Fn>
RevertError capture_revert(Fn&& fn) {
    try {
        fn();
    } catch (const RevertError& e) {
        return e;
    }
    throw std::logic_error("expected a RevertError");
}

} // namespace flashx::test

#endif // FLASHX_TEST_FIXTURES_HPP
