#ifndef FLASHX_SWAP_PIPELINE_HPP
#define FLASHX_SWAP_PIPELINE_HPP

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "plan.hpp"
#include "types.hpp"

namespace flashx {

class IVenue;
class Runtime;
class RouterAllowlist;

// =============================================================================
// SwapPipeline - ordered execution of swap steps on behalf of one holder
// =============================================================================

class SwapPipeline {
public:
    // `holder` owns the traded funds and receives every step's output
    SwapPipeline(Runtime& runtime, const RouterAllowlist& allowlist, const Address& holder);

    // Non-copyable
    SwapPipeline(const SwapPipeline&) = delete;
    SwapPipeline& operator=(const SwapPipeline&) = delete;

    // =========================================================================
    // Venue Directory
    // =========================================================================

    // Resolves venue addresses to callable venues. Registration does not
    // approve a venue; the allowlist still gates every step.
    void register_venue(IVenue& venue);
    void unregister_venue(const Address& venue);
    IVenue* find_venue(const Address& venue) const;

    const RouterAllowlist& allowlist() const { return allowlist_; }
    const Address& holder() const { return holder_; }

    // =========================================================================
    // Execution
    // =========================================================================

    // Runs one step and returns the realized output, measured as the change
    // in the holder's balance of path.back()
    Amount execute(const SwapStep& step);

    // Runs every step strictly in order; a failure carries its step index
    std::vector<Amount> execute_all(const std::vector<SwapStep>& steps);

private:
    void validate(const SwapStep& step) const;

    Runtime& runtime_;
    const RouterAllowlist& allowlist_;
    Address holder_;

    std::unordered_map<Address, IVenue*, AddressHash> venues_;
    mutable std::shared_mutex venues_mutex_;
};

} // namespace flashx

#endif // FLASHX_SWAP_PIPELINE_HPP
