#ifndef FLASHX_PROFIT_GUARD_HPP
#define FLASHX_PROFIT_GUARD_HPP

#include "types.hpp"

namespace flashx {

// =============================================================================
// ProfitGuard - final solvency and profitability check
// =============================================================================

class ProfitGuard {
public:
    struct Result {
        Amount profit;  // end - start - owed, surplus the operation may release
    };

    // `start_balance` is the holding of the asset before the loan arrived, so
    // funds already parked in the engine never count as profit.
    //
    // Accepts iff end >= start + owed + min_profit. Throws RevertError
    // INSUFFICIENT_PROFIT carrying the shortfall otherwise; overflow of the
    // requirement reverts as ARITHMETIC_OVERFLOW.
    static Result validate(Amount start_balance, Amount end_balance,
                           Amount amount_owed, Amount min_profit);
};

} // namespace flashx

#endif // FLASHX_PROFIT_GUARD_HPP
