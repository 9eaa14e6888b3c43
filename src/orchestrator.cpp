// =============================================================================
// orchestrator.cpp - LoanOrchestrator
// =============================================================================

#include "flashx/orchestrator.hpp"
#include "flashx/allowlist.hpp"
#include "flashx/errors.hpp"
#include "flashx/ledger.hpp"
#include "flashx/logger.hpp"
#include "flashx/plan.hpp"
#include "flashx/profit_guard.hpp"
#include "flashx/runtime.hpp"
#include "flashx/swap_pipeline.hpp"
#include "flashx/venue.hpp"

#include <map>

namespace flashx {

namespace {

// Sets the phase for the lifetime of the scope and restores the previous one
// on every exit path
class PhaseGuard {
public:
    PhaseGuard(std::atomic<Phase>& phase, Phase next)
        : phase_(phase)
        , previous_(phase.exchange(next, std::memory_order_acq_rel)) {}

    ~PhaseGuard() { phase_.store(previous_, std::memory_order_release); }

    PhaseGuard(const PhaseGuard&) = delete;
    PhaseGuard& operator=(const PhaseGuard&) = delete;

private:
    std::atomic<Phase>& phase_;
    Phase previous_;
};

} // namespace

LoanOrchestrator::LoanOrchestrator(Runtime& runtime, ILender& lender, SwapPipeline& pipeline,
                                   Ledger& ledger, const Params& params)
    : runtime_(runtime)
    , lender_(lender)
    , pipeline_(pipeline)
    , ledger_(ledger)
    , self_(params.self)
    , owner_(params.owner)
    , operator_(params.operator_address)
    , referral_code_(params.referral_code) {}

Address LoanOrchestrator::operator_address() const {
    std::lock_guard<std::mutex> lock(operator_mutex_);
    return operator_;
}

// =============================================================================
// Initiate
// =============================================================================

void LoanOrchestrator::initiate(const Address& caller, const Address& asset, Amount amount,
                                const std::vector<uint8_t>& payload) {
    try {
        runtime_.atomic([&]() {
            if (busy()) {
                throw RevertError(errors::REENTRANT_CALL, "operation already in progress");
            }
            if (caller != operator_address()) {
                throw RevertError(errors::NOT_OPERATOR, addresses::to_hex(caller));
            }
            if (amount == 0) {
                throw RevertError(errors::INVALID_AMOUNT, "loan amount must be positive");
            }

            PhaseGuard guard(phase_, Phase::AWAITING_CALLBACK);
            lender_.flash_loan(self_, *this, asset, amount, payload, referral_code_);
        });
    } catch (const RevertError& e) {
        Logger::Warning("operation reverted: " + std::string(e.what()));
        throw;
    }
}

// =============================================================================
// Lender Callback
// =============================================================================

bool LoanOrchestrator::on_loan_received(const Address& caller,
                                        const Address& asset,
                                        Amount amount,
                                        Amount fee,
                                        const Address& initiator,
                                        const std::vector<uint8_t>& payload) {
    if (caller != lender_.address()) {
        throw RevertError(errors::UNAUTHORIZED_CALLBACK,
                          "callback from " + addresses::to_hex(caller));
    }
    if (phase() == Phase::EXECUTING) {
        throw RevertError(errors::REENTRANT_CALL, "callback while a plan is executing");
    }
    if (initiator != self_ || phase() != Phase::AWAITING_CALLBACK) {
        throw RevertError(errors::UNTRUSTED_INITIATOR,
                          "loan initiated by " + addresses::to_hex(initiator));
    }

    PhaseGuard guard(phase_, Phase::EXECUTING);

    return runtime_.atomic([&]() {
        ArbitragePlan plan = codec::decode_plan(payload);
        if (!addresses::is_zero(plan.profit_token) && plan.profit_token != asset) {
            throw RevertError(errors::MALFORMED_PLAN, "profit token differs from borrowed asset");
        }

        // Holding before the loan arrived; parked funds stay parked
        Amount start_balance = checked_sub(runtime_.balance_of(asset, self_), amount);
        pipeline_.execute_all(plan.swaps);
        Amount end_balance = runtime_.balance_of(asset, self_);

        Amount owed = checked_add(amount, fee);
        ProfitGuard::Result result =
            ProfitGuard::validate(start_balance, end_balance, owed, plan.min_profit);

        runtime_.approve(asset, self_, lender_.address(), owed);

        ledger_.record(asset, result.profit);

        if (result.profit > 0) {
            runtime_.transfer(asset, self_, owner_, result.profit);
        }

        uint64_t operation = ledger_.stats().operations;
        runtime_.emit(self_, ArbitrageExecuted{asset, amount, fee, result.profit, operation});

        runtime_.on_commit([operation, asset, amount, fee, profit = result.profit,
                            swaps = plan.swaps.size()]() {
            Logger::Info("operation " + std::to_string(operation) + " settled: borrowed " +
                         to_string(amount) + " of " + addresses::to_hex(asset) + ", fee " +
                         to_string(fee) + ", profit " + to_string(profit) + " over " +
                         std::to_string(swaps) + " swaps");
        });
        return true;
    });
}

// =============================================================================
// Simulation
// =============================================================================

SimulationResult LoanOrchestrator::simulate(const Address& asset, Amount amount,
                                            const std::vector<uint8_t>& payload) const {
    SimulationResult sim{false, 0, 0, 0, false, ""};

    try {
        sim.owed = checked_add(amount, apply_bps(amount, lender_.premium_bps()));
        ArbitragePlan plan = codec::decode_plan(payload);

        Amount start_balance = runtime_.balance_of(asset, self_);
        std::map<Address, Amount> balances;
        balances[asset] = checked_add(start_balance, amount);

        for (size_t i = 0; i < plan.swaps.size(); ++i) {
            const SwapStep& step = plan.swaps[i];
            std::string at = "step " + std::to_string(i) + ": ";

            if (!pipeline_.allowlist().is_approved(step.venue)) {
                sim.reason = at + "venue " + addresses::to_hex(step.venue) + " not approved";
                return sim;
            }
            if (step.path.size() < 2) {
                sim.reason = at + "path has fewer than two tokens";
                return sim;
            }
            if (runtime_.now() > step.deadline) {
                sim.reason = at + "deadline already passed";
                return sim;
            }
            IVenue* venue = pipeline_.find_venue(step.venue);
            if (venue == nullptr) {
                sim.reason = at + "unknown venue " + addresses::to_hex(step.venue);
                return sim;
            }

            Amount& have = balances[step.token_in()];
            if (have < step.amount_in) {
                sim.reason = at + "needs " + to_string(step.amount_in) + " of " +
                             addresses::to_hex(step.token_in()) + ", would hold " +
                             to_string(have);
                return sim;
            }

            Amount out = venue->quote(step.amount_in, step.path).back();
            if (out < step.min_amount_out) {
                sim.reason = at + "quoted output " + to_string(out) + " below minimum " +
                             to_string(step.min_amount_out);
                return sim;
            }
            have -= step.amount_in;
            balances[step.token_out()] = checked_add(balances[step.token_out()], out);
        }

        Amount break_even = checked_add(start_balance, sim.owed);
        sim.expected_end = balances[asset];
        sim.expected_profit = signed_diff(sim.expected_end, break_even);
        sim.meets_min_profit = sim.expected_end >= checked_add(break_even, plan.min_profit);
        sim.feasible = true;
    } catch (const RevertError& e) {
        sim.feasible = false;
        sim.reason = e.what();
    }
    return sim;
}

// =============================================================================
// Operator Rotation
// =============================================================================

void LoanOrchestrator::set_operator(const Address& caller, const Address& new_operator) {
    runtime_.atomic([&]() {
        if (caller != owner_) {
            throw RevertError(errors::NOT_OWNER, addresses::to_hex(caller) +
                              " cannot rotate the operator");
        }
        if (busy()) {
            throw RevertError(errors::REENTRANT_CALL, "operation in progress");
        }

        Address previous;
        {
            std::lock_guard<std::mutex> lock(operator_mutex_);
            previous = operator_;
            if (previous == new_operator) return;
            operator_ = new_operator;
        }
        runtime_.journal([this, previous]() {
            std::lock_guard<std::mutex> lock(operator_mutex_);
            operator_ = previous;
        });
        runtime_.emit(self_, OperatorChanged{previous, new_operator});
        runtime_.on_commit([new_operator]() {
            Logger::Info("operator rotated to " + addresses::to_hex(new_operator));
        });
    });
}

} // namespace flashx
