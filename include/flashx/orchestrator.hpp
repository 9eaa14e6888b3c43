#ifndef FLASHX_ORCHESTRATOR_HPP
#define FLASHX_ORCHESTRATOR_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "lender.hpp"
#include "types.hpp"

namespace flashx {

class Runtime;
class SwapPipeline;
class Ledger;

// =============================================================================
// Operation Phase (reentrancy state)
// =============================================================================

enum class Phase : uint8_t {
    IDLE = 0,               // no operation in progress
    AWAITING_CALLBACK = 1,  // initiate() has asked the lender for funds
    EXECUTING = 2           // the lender callback is running the plan
};

// =============================================================================
// Simulation Result (best-effort estimate, not authoritative)
// =============================================================================

struct SimulationResult {
    bool feasible;
    Amount expected_end;      // simulated balance of the borrowed asset
    Amount owed;              // amount + lender fee
    I128 expected_profit;     // expected_end - (prior holding + owed), may be negative
    bool meets_min_profit;
    std::string reason;       // why the plan is infeasible, if it is
};

// =============================================================================
// LoanOrchestrator - atomic borrow, trade, repay
//
// initiate() opens one Runtime transaction and asks the lender for a flash
// loan; the lender calls back into on_loan_received(), which runs the plan,
// checks profitability, approves repayment and settles the surplus. Any
// failure reverts the whole transaction, loan transfer included.
// =============================================================================

class LoanOrchestrator : public IFlashLoanReceiver {
public:
    struct Params {
        Address self;
        Address owner;              // beneficiary of every surplus
        Address operator_address;   // only principal allowed to initiate
        uint16_t referral_code = 0;
    };

    LoanOrchestrator(Runtime& runtime, ILender& lender, SwapPipeline& pipeline,
                     Ledger& ledger, const Params& params);

    // Non-copyable
    LoanOrchestrator(const LoanOrchestrator&) = delete;
    LoanOrchestrator& operator=(const LoanOrchestrator&) = delete;

    // =========================================================================
    // Operations
    // =========================================================================

    // Operator-only entry point
    void initiate(const Address& caller, const Address& asset, Amount amount,
                  const std::vector<uint8_t>& payload);

    // Lender callback
    bool on_loan_received(const Address& caller,
                          const Address& asset,
                          Amount amount,
                          Amount fee,
                          const Address& initiator,
                          const std::vector<uint8_t>& payload) override;

    // Quotes every step against current venue state without moving funds
    SimulationResult simulate(const Address& asset, Amount amount,
                              const std::vector<uint8_t>& payload) const;

    // Owner-only operator rotation
    void set_operator(const Address& caller, const Address& new_operator);

    // =========================================================================
    // Accessors
    // =========================================================================

    const Address& address() const override { return self_; }
    const Address& owner() const { return owner_; }
    const Address& lender() const { return lender_.address(); }
    Address operator_address() const;
    uint16_t referral_code() const { return referral_code_; }

    Phase phase() const { return phase_.load(std::memory_order_acquire); }
    bool busy() const { return phase() != Phase::IDLE; }

private:
    Runtime& runtime_;
    ILender& lender_;
    SwapPipeline& pipeline_;
    Ledger& ledger_;

    Address self_;
    Address owner_;
    Address operator_;
    uint16_t referral_code_;
    mutable std::mutex operator_mutex_;

    std::atomic<Phase> phase_{Phase::IDLE};
};

} // namespace flashx

#endif // FLASHX_ORCHESTRATOR_HPP
