// =============================================================================
// swap_pipeline.cpp - Ordered Swap Execution
// =============================================================================

#include "flashx/swap_pipeline.hpp"
#include "flashx/allowlist.hpp"
#include "flashx/errors.hpp"
#include "flashx/logger.hpp"
#include "flashx/runtime.hpp"
#include "flashx/venue.hpp"

#include <mutex>

namespace flashx {

SwapPipeline::SwapPipeline(Runtime& runtime, const RouterAllowlist& allowlist,
                           const Address& holder)
    : runtime_(runtime)
    , allowlist_(allowlist)
    , holder_(holder) {}

// =============================================================================
// Venue Directory
// =============================================================================

void SwapPipeline::register_venue(IVenue& venue) {
    std::unique_lock lock(venues_mutex_);
    venues_[venue.address()] = &venue;
}

void SwapPipeline::unregister_venue(const Address& venue) {
    std::unique_lock lock(venues_mutex_);
    venues_.erase(venue);
}

IVenue* SwapPipeline::find_venue(const Address& venue) const {
    std::shared_lock lock(venues_mutex_);
    auto it = venues_.find(venue);
    return it == venues_.end() ? nullptr : it->second;
}

// =============================================================================
// Execution
// =============================================================================

void SwapPipeline::validate(const SwapStep& step) const {
    if (!allowlist_.is_approved(step.venue)) {
        throw RevertError(errors::VENUE_NOT_APPROVED, addresses::to_hex(step.venue));
    }
    if (step.path.size() < 2) {
        throw RevertError(errors::INVALID_PATH,
                          "path has " + std::to_string(step.path.size()) + " tokens");
    }
    if (runtime_.now() > step.deadline) {
        throw RevertError(errors::DEADLINE_EXPIRED,
                          "deadline " + std::to_string(step.deadline) + " passed at " +
                          std::to_string(runtime_.now()));
    }
}

Amount SwapPipeline::execute(const SwapStep& step) {
    return runtime_.atomic([&]() {
        validate(step);

        IVenue* venue = find_venue(step.venue);
        if (venue == nullptr) {
            throw RevertError(errors::UNKNOWN_VENUE, addresses::to_hex(step.venue));
        }

        const Address& token_in = step.token_in();
        const Address& token_out = step.token_out();

        Amount before = runtime_.balance_of(token_out, holder_);

        // Scoped approval: exactly amount_in for this call, cleared afterwards
        runtime_.approve(token_in, holder_, step.venue, step.amount_in);
        try {
            venue->exchange(holder_, step.amount_in, step.min_amount_out, step.path,
                            holder_, step.deadline);
        } catch (const RevertError& e) {
            if (e.code() == errors::REENTRANT_CALL) throw;
            throw RevertError(errors::SWAP_FAILED, e.reason()).caused_by(e.code());
        } catch (const std::exception& e) {
            throw RevertError(errors::SWAP_FAILED, e.what());
        }
        runtime_.approve(token_in, holder_, step.venue, 0);

        // The venue's return value is advisory; the balance delta is the output
        Amount after = runtime_.balance_of(token_out, holder_);
        Amount amount_out = checked_sub(after, before);

        runtime_.emit(holder_, SwapExecuted{step.venue, token_in, token_out,
                                            step.amount_in, amount_out});

        Logger::Debug("swap " + addresses::to_hex(token_in) + " -> " +
                      addresses::to_hex(token_out) + " via " + addresses::to_hex(step.venue) +
                      ": in " + to_string(step.amount_in) + ", out " + to_string(amount_out));
        return amount_out;
    });
}

std::vector<Amount> SwapPipeline::execute_all(const std::vector<SwapStep>& steps) {
    return runtime_.atomic([&]() {
        std::vector<Amount> outputs;
        outputs.reserve(steps.size());
        for (size_t i = 0; i < steps.size(); ++i) {
            try {
                outputs.push_back(execute(steps[i]));
            } catch (RevertError& e) {
                e.at_step(i);
                throw;
            }
        }
        return outputs;
    });
}

} // namespace flashx
