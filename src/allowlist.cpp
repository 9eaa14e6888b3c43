// =============================================================================
// allowlist.cpp - RouterAllowlist
// =============================================================================

#include "flashx/allowlist.hpp"
#include "flashx/errors.hpp"
#include "flashx/logger.hpp"
#include "flashx/runtime.hpp"

#include <algorithm>
#include <mutex>

namespace flashx {

RouterAllowlist::RouterAllowlist(Runtime& runtime, const Address& owner, const Address& emitter,
                                 const std::vector<Address>& seed)
    : runtime_(runtime)
    , owner_(owner)
    , emitter_(emitter) {
    for (const auto& venue : seed) approved_[venue] = true;
}

void RouterAllowlist::set_approval(const Address& caller, const Address& venue, bool approved) {
    runtime_.atomic([&]() {
        if (caller != owner_) {
            throw RevertError(errors::NOT_OWNER, addresses::to_hex(caller) + " cannot edit routers");
        }
        if (busy_ && busy_()) {
            throw RevertError(errors::REENTRANT_CALL, "router edit during an operation");
        }

        {
            std::unique_lock lock(mutex_);
            auto it = approved_.find(venue);
            bool current = it != approved_.end() && it->second;
            if (current == approved) return;

            if (approved) {
                approved_[venue] = true;
            } else {
                approved_.erase(venue);
            }
        }

        runtime_.journal([this, venue, approved]() {
            std::unique_lock lock(mutex_);
            if (approved) {
                approved_.erase(venue);
            } else {
                approved_[venue] = true;
            }
        });
        runtime_.emit(emitter_, RouterApprovalChanged{venue, approved});
        runtime_.on_commit([venue, approved]() {
            Logger::Info("router " + addresses::to_hex(venue) + (approved ? " approved" : " revoked"));
        });
    });
}

bool RouterAllowlist::is_approved(const Address& venue) const {
    std::shared_lock lock(mutex_);
    auto it = approved_.find(venue);
    return it != approved_.end() && it->second;
}

std::vector<Address> RouterAllowlist::approved_venues() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> out;
    for (const auto& [venue, ok] : approved_) {
        if (ok) out.push_back(venue);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace flashx
