#ifndef FLASHX_FLASHX_HPP
#define FLASHX_FLASHX_HPP

// =============================================================================
// flashx - Flash-Loan Arbitrage Orchestrator
//
// Components:
//   Runtime           token ledger, clock, events, atomic transactions
//   RouterAllowlist   venues permitted to receive funds
//   SwapPipeline      ordered, validated execution of swap steps
//   ProfitGuard       repayment and minimum-profit check
//   Ledger            monotone operation and profit totals
//   LoanOrchestrator  borrow, trade, repay as one indivisible operation
//   AdminSurface      owner-only maintenance
// =============================================================================

#include <memory>
#include <vector>

#include "admin.hpp"
#include "allowlist.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "ledger.hpp"
#include "lender.hpp"
#include "logger.hpp"
#include "orchestrator.hpp"
#include "plan.hpp"
#include "profit_guard.hpp"
#include "runtime.hpp"
#include "swap_pipeline.hpp"
#include "types.hpp"
#include "venue.hpp"

namespace flashx {

// =============================================================================
// FlashX - Unified Controller
//
// Wires one orchestrator to a runtime and a lender. The runtime, the lender
// and every registered venue must outlive the controller.
// =============================================================================

class FlashX {
public:
    FlashX(Runtime& runtime, ILender& lender, const EngineConfig& engine,
           const std::vector<Address>& approved_venues = {});
    ~FlashX();

    // Non-copyable
    FlashX(const FlashX&) = delete;
    FlashX& operator=(const FlashX&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    Runtime& runtime() { return runtime_; }
    const Runtime& runtime() const { return runtime_; }

    // Edits go through admin()
    const RouterAllowlist& allowlist() const { return *allowlist_; }

    Ledger& ledger() { return *ledger_; }
    const Ledger& ledger() const { return *ledger_; }

    SwapPipeline& pipeline() { return *pipeline_; }
    const SwapPipeline& pipeline() const { return *pipeline_; }

    LoanOrchestrator& orchestrator() { return *orchestrator_; }
    const LoanOrchestrator& orchestrator() const { return *orchestrator_; }

    AdminSurface& admin() { return *admin_; }

    const Address& address() const { return orchestrator_->address(); }

    // =========================================================================
    // Convenience
    // =========================================================================

    void register_venue(IVenue& venue) { pipeline_->register_venue(venue); }

    // Builder whose default deadlines follow engine.deadline_secs
    PlanBuilder plan() const { return PlanBuilder(runtime_.now(), deadline_secs_); }

    void initiate(const Address& caller, const Address& asset, Amount amount,
                  const std::vector<uint8_t>& payload) {
        orchestrator_->initiate(caller, asset, amount, payload);
    }

    SimulationResult simulate(const Address& asset, Amount amount,
                              const std::vector<uint8_t>& payload) const {
        return orchestrator_->simulate(asset, amount, payload);
    }

    Ledger::Stats stats() const { return ledger_->stats(); }

private:
    Runtime& runtime_;
    Timestamp deadline_secs_;

    std::unique_ptr<RouterAllowlist> allowlist_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<SwapPipeline> pipeline_;
    std::unique_ptr<LoanOrchestrator> orchestrator_;
    std::unique_ptr<AdminSurface> admin_;
};

} // namespace flashx

#endif // FLASHX_FLASHX_HPP
