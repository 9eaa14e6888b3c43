// =============================================================================
// profit_guard.cpp - ProfitGuard
// =============================================================================

#include "flashx/profit_guard.hpp"
#include "flashx/errors.hpp"

namespace flashx {

ProfitGuard::Result ProfitGuard::validate(Amount start_balance, Amount end_balance,
                                          Amount amount_owed, Amount min_profit) {
    Amount break_even = checked_add(start_balance, amount_owed);
    Amount required = checked_add(break_even, min_profit);
    if (end_balance < required) {
        throw RevertError(errors::INSUFFICIENT_PROFIT,
                          "ending balance " + to_string(end_balance) + " below required " +
                          to_string(required))
            .with_shortfall(required - end_balance);
    }

    Result result;
    result.profit = end_balance - break_even;
    return result;
}

} // namespace flashx
