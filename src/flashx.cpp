// =============================================================================
// flashx.cpp - Unified Controller
// =============================================================================

#include "flashx/flashx.hpp"

namespace flashx {

FlashX::FlashX(Runtime& runtime, ILender& lender, const EngineConfig& engine,
               const std::vector<Address>& approved_venues)
    : runtime_(runtime)
    , deadline_secs_(engine.deadline_secs)
    , allowlist_(std::make_unique<RouterAllowlist>(runtime, engine.owner, engine.address,
                                                   approved_venues))
    , ledger_(std::make_unique<Ledger>(runtime))
    , pipeline_(std::make_unique<SwapPipeline>(runtime, *allowlist_, engine.address))
    , orchestrator_(std::make_unique<LoanOrchestrator>(
          runtime, lender, *pipeline_, *ledger_,
          LoanOrchestrator::Params{engine.address, engine.owner, engine.operator_address,
                                   engine.referral_code}))
    , admin_(std::make_unique<AdminSurface>(runtime, *allowlist_, *orchestrator_)) {
    allowlist_->set_busy_check([orchestrator = orchestrator_.get()]() {
        return orchestrator->busy();
    });
    Logger::Info("flashx orchestrator " + addresses::to_hex(engine.address) + " ready: owner " +
                 addresses::to_hex(engine.owner) + ", operator " +
                 addresses::to_hex(engine.operator_address) + ", lender " +
                 addresses::to_hex(lender.address()) + ", " +
                 std::to_string(approved_venues.size()) + " approved venues");
}

FlashX::~FlashX() = default;

} // namespace flashx
