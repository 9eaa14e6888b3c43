#ifndef FLASHX_ADMIN_HPP
#define FLASHX_ADMIN_HPP

#include "types.hpp"

namespace flashx {

class Runtime;
class RouterAllowlist;
class LoanOrchestrator;

// =============================================================================
// AdminSurface - owner-only maintenance of the orchestrator
//
// Every call is rejected while an operation is in progress so that funds
// mid-trade can never be swept out from under the pipeline.
// =============================================================================

class AdminSurface {
public:
    AdminSurface(Runtime& runtime, RouterAllowlist& allowlist, LoanOrchestrator& orchestrator);

    // Non-copyable
    AdminSurface(const AdminSurface&) = delete;
    AdminSurface& operator=(const AdminSurface&) = delete;

    void set_router_approval(const Address& caller, const Address& venue, bool approved);

    // Move the orchestrator's full balance to the owner; returns the amount
    Amount sweep_token(const Address& caller, const Address& token);
    Amount sweep_native(const Address& caller);

    void set_operator(const Address& caller, const Address& new_operator);

private:
    void require_owner(const Address& caller) const;
    void require_idle() const;

    Runtime& runtime_;
    RouterAllowlist& allowlist_;
    LoanOrchestrator& orchestrator_;
};

} // namespace flashx

#endif // FLASHX_ADMIN_HPP
