// =============================================================================
// admin.cpp - AdminSurface
// =============================================================================

#include "flashx/admin.hpp"
#include "flashx/allowlist.hpp"
#include "flashx/errors.hpp"
#include "flashx/logger.hpp"
#include "flashx/orchestrator.hpp"
#include "flashx/runtime.hpp"

namespace flashx {

AdminSurface::AdminSurface(Runtime& runtime, RouterAllowlist& allowlist,
                           LoanOrchestrator& orchestrator)
    : runtime_(runtime)
    , allowlist_(allowlist)
    , orchestrator_(orchestrator) {}

void AdminSurface::require_owner(const Address& caller) const {
    if (caller != orchestrator_.owner()) {
        throw RevertError(errors::NOT_OWNER, addresses::to_hex(caller));
    }
}

void AdminSurface::require_idle() const {
    if (orchestrator_.busy()) {
        throw RevertError(errors::REENTRANT_CALL, "operation in progress");
    }
}

// =============================================================================
// Allowlist / Operator
// =============================================================================

void AdminSurface::set_router_approval(const Address& caller, const Address& venue,
                                       bool approved) {
    runtime_.atomic([&]() {
        require_owner(caller);
        require_idle();
        allowlist_.set_approval(caller, venue, approved);
    });
}

void AdminSurface::set_operator(const Address& caller, const Address& new_operator) {
    orchestrator_.set_operator(caller, new_operator);
}

// =============================================================================
// Sweeps
// =============================================================================

Amount AdminSurface::sweep_token(const Address& caller, const Address& token) {
    return runtime_.atomic([&]() {
        require_owner(caller);
        require_idle();

        const Address& self = orchestrator_.address();
        const Address& owner = orchestrator_.owner();
        Amount balance = runtime_.balance_of(token, self);
        if (balance == 0) return Amount{0};

        runtime_.transfer(token, self, owner, balance);
        runtime_.emit(self, Swept{token, owner, balance, false});
        runtime_.on_commit([balance, token, owner]() {
            Logger::Info("swept " + to_string(balance) + " of " + addresses::to_hex(token) +
                         " to " + addresses::to_hex(owner));
        });
        return balance;
    });
}

Amount AdminSurface::sweep_native(const Address& caller) {
    return runtime_.atomic([&]() {
        require_owner(caller);
        require_idle();

        const Address& self = orchestrator_.address();
        const Address& owner = orchestrator_.owner();
        Amount balance = runtime_.native_balance(self);
        if (balance == 0) return Amount{0};

        runtime_.transfer_native(self, owner, balance);
        runtime_.emit(self, Swept{addresses::ZERO, owner, balance, true});
        runtime_.on_commit([balance, owner]() {
            Logger::Info("swept " + to_string(balance) + " native to " + addresses::to_hex(owner));
        });
        return balance;
    });
}

} // namespace flashx
