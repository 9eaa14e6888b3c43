// =============================================================================
// lender.cpp - FlashLender
// =============================================================================

#include "flashx/lender.hpp"
#include "flashx/errors.hpp"
#include "flashx/runtime.hpp"

namespace flashx {

FlashLender::FlashLender(Runtime& runtime, const Address& address, uint32_t premium_bps)
    : runtime_(runtime)
    , address_(address)
    , premium_bps_(premium_bps) {
    if (premium_bps >= BPS_DENOMINATOR) {
        throw ConfigError("lender premium must be below 10000 bps");
    }
}

void FlashLender::list_asset(const Address& asset, Amount reserve) {
    listed_.insert(asset);
    if (reserve > 0) {
        runtime_.mint(asset, address_, reserve);
    }
}

bool FlashLender::is_listed(const Address& asset) const {
    return listed_.count(asset) > 0;
}

Amount FlashLender::available_liquidity(const Address& asset) const {
    return runtime_.balance_of(asset, address_);
}

Amount FlashLender::fee_for(Amount amount) const {
    return apply_bps(amount, premium_bps_);
}

LoanQuote FlashLender::quote(const Address& asset, Amount amount) const {
    LoanQuote q{false, amount, 0, premium_bps_, 0, ""};
    if (!is_listed(asset)) {
        q.reason = "asset " + addresses::to_hex(asset) + " not supported for flash loans";
        return q;
    }
    q.available_liquidity = available_liquidity(asset);
    if (q.available_liquidity < amount) {
        q.reason = "insufficient liquidity: " + to_string(q.available_liquidity) + " < " +
                   to_string(amount);
        return q;
    }
    q.fee = fee_for(amount);
    q.available = true;
    return q;
}

// =============================================================================
// Flash Loan
// =============================================================================

void FlashLender::flash_loan(const Address& caller,
                             IFlashLoanReceiver& receiver,
                             const Address& asset,
                             Amount amount,
                             const std::vector<uint8_t>& payload,
                             uint16_t referral_code) {
    runtime_.atomic([&]() {
        if (amount == 0) {
            throw RevertError(errors::INVALID_AMOUNT, "zero loan amount");
        }
        if (!is_listed(asset)) {
            throw RevertError(errors::UNSUPPORTED_ASSET, addresses::to_hex(asset));
        }
        Amount liquidity = available_liquidity(asset);
        if (liquidity < amount) {
            throw RevertError(errors::INSUFFICIENT_LIQUIDITY,
                              to_string(liquidity) + " available, " + to_string(amount) +
                              " requested");
        }

        Amount fee = fee_for(amount);
        const Address& receiver_address = receiver.address();

        runtime_.transfer(asset, address_, receiver_address, amount);

        if (!receiver.on_loan_received(address_, asset, amount, fee, caller, payload)) {
            throw RevertError(errors::CALLBACK_FAILED, "receiver rejected the loan");
        }

        runtime_.transfer_from(asset, address_, receiver_address, address_,
                               checked_add(amount, fee));

        runtime_.emit(address_, FlashLoan{receiver_address, caller, asset, amount, fee,
                                          referral_code});
    });
}

} // namespace flashx
