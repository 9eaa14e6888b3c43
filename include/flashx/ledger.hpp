#ifndef FLASHX_LEDGER_HPP
#define FLASHX_LEDGER_HPP

#include <map>
#include <shared_mutex>

#include "types.hpp"

namespace flashx {

class Runtime;

// =============================================================================
// Ledger - running totals over successful operations
//
// Monotone: there is no decrement path. Updates are journaled in the open
// Runtime transaction so a later failure in the same operation undoes them.
// =============================================================================

class Ledger {
public:
    explicit Ledger(Runtime& runtime);

    // Non-copyable
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    void record(const Address& asset, Amount profit);

    struct Stats {
        uint64_t operations;
        Amount total_profit;
        bool operator==(const Stats&) const = default;
    };
    Stats stats() const;

    Amount profit_for(const Address& asset) const;
    std::map<Address, Amount> profit_by_asset() const;

private:
    Runtime& runtime_;

    uint64_t operations_{0};
    Amount total_profit_{0};
    std::map<Address, Amount> per_asset_;
    mutable std::shared_mutex mutex_;
};

} // namespace flashx

#endif // FLASHX_LEDGER_HPP
