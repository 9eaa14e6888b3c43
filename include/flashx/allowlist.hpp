#ifndef FLASHX_ALLOWLIST_HPP
#define FLASHX_ALLOWLIST_HPP

#include <functional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace flashx {

class Runtime;

// =============================================================================
// RouterAllowlist - venues permitted to receive funds for exchange
// =============================================================================

class RouterAllowlist {
public:
    // `emitter` is the address RouterApprovalChanged events are attributed to
    RouterAllowlist(Runtime& runtime, const Address& owner, const Address& emitter,
                    const std::vector<Address>& seed = {});

    // Non-copyable
    RouterAllowlist(const RouterAllowlist&) = delete;
    RouterAllowlist& operator=(const RouterAllowlist&) = delete;

    // Owner-only; no-op when the value is unchanged. Rejected with
    // REENTRANT_CALL while the busy check reports an operation in flight.
    void set_approval(const Address& caller, const Address& venue, bool approved);

    void set_busy_check(std::function<bool()> busy) { busy_ = std::move(busy); }

    bool is_approved(const Address& venue) const;
    std::vector<Address> approved_venues() const;

    const Address& owner() const { return owner_; }

private:
    Runtime& runtime_;
    Address owner_;
    Address emitter_;
    std::function<bool()> busy_;

    std::unordered_map<Address, bool, AddressHash> approved_;
    mutable std::shared_mutex mutex_;
};

} // namespace flashx

#endif // FLASHX_ALLOWLIST_HPP
