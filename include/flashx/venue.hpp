#ifndef FLASHX_VENUE_HPP
#define FLASHX_VENUE_HPP

#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace flashx {

class Runtime;

// =============================================================================
// Venue Interface
// =============================================================================

class IVenue {
public:
    virtual ~IVenue() = default;

    virtual const Address& address() const = 0;

    // Swap exactly amount_in of path[0] (drawn from caller through its token
    // allowance) for at least min_amount_out of path.back(), delivered to
    // recipient. Throws RevertError on any failure. The returned per-hop
    // amounts are informational only.
    virtual std::vector<Amount> exchange(const Address& caller,
                                         Amount amount_in,
                                         Amount min_amount_out,
                                         const std::vector<Address>& path,
                                         const Address& recipient,
                                         Timestamp deadline) = 0;

    // Read-only estimate of per-hop amounts for amount_in along path
    virtual std::vector<Amount> quote(Amount amount_in, const std::vector<Address>& path) const = 0;
};

// =============================================================================
// ConstantProductVenue - Uniswap v2-style router over x*y=k pairs
//
// Every pair is its own holder in the Runtime; reserves are the pair's token
// balances, so pair state rolls back with the enclosing transaction.
// =============================================================================

class ConstantProductVenue : public IVenue {
public:
    ConstantProductVenue(Runtime& runtime, const Address& router, uint32_t fee_bps = 30);

    // Non-copyable
    ConstantProductVenue(const ConstantProductVenue&) = delete;
    ConstantProductVenue& operator=(const ConstantProductVenue&) = delete;

    const Address& address() const override { return router_; }
    uint32_t fee_bps() const { return fee_bps_; }

    // =========================================================================
    // Pair Management
    // =========================================================================

    void create_pair(const Address& token_a, const Address& token_b, const Address& pair);
    std::optional<Address> pair_for(const Address& token_a, const Address& token_b) const;

    // Mints reserves straight into the pair (fixture / scenario setup)
    void add_liquidity(const Address& token_a, Amount amount_a,
                       const Address& token_b, Amount amount_b);

    // (reserve of token_a, reserve of token_b)
    std::pair<Amount, Amount> reserves(const Address& token_a, const Address& token_b) const;

    // =========================================================================
    // IVenue
    // =========================================================================

    std::vector<Amount> exchange(const Address& caller,
                                 Amount amount_in,
                                 Amount min_amount_out,
                                 const std::vector<Address>& path,
                                 const Address& recipient,
                                 Timestamp deadline) override;

    std::vector<Amount> quote(Amount amount_in, const std::vector<Address>& path) const override;

    // amount_in * (1 - fee) * reserve_out / (reserve_in + amount_in * (1 - fee))
    static Amount amount_out(Amount amount_in, Amount reserve_in, Amount reserve_out,
                             uint32_t fee_bps);

private:
    static std::pair<Address, Address> sort_tokens(const Address& a, const Address& b);
    Address require_pair(const Address& token_a, const Address& token_b) const;

    Runtime& runtime_;
    Address router_;
    uint32_t fee_bps_;
    std::map<std::pair<Address, Address>, Address> pairs_;  // sorted tokens -> pair holder
};

} // namespace flashx

#endif // FLASHX_VENUE_HPP
