#ifndef FLASHX_LENDER_HPP
#define FLASHX_LENDER_HPP

#include <set>
#include <string>
#include <vector>

#include "types.hpp"

namespace flashx {

class Runtime;

// =============================================================================
// Flash Loan Receiver (callback contract)
// =============================================================================

class IFlashLoanReceiver {
public:
    virtual ~IFlashLoanReceiver() = default;

    virtual const Address& address() const = 0;

    // Invoked by the lender after `amount` of `asset` has been transferred to
    // the receiver. Returning true promises that the lender may now draw
    // amount + fee through its token allowance.
    virtual bool on_loan_received(const Address& caller,
                                  const Address& asset,
                                  Amount amount,
                                  Amount fee,
                                  const Address& initiator,
                                  const std::vector<uint8_t>& payload) = 0;
};

// =============================================================================
// Lender Interface
// =============================================================================

class ILender {
public:
    virtual ~ILender() = default;

    virtual const Address& address() const = 0;
    virtual uint32_t premium_bps() const = 0;

    // Transfer, callback and reclaim as one indivisible step
    virtual void flash_loan(const Address& caller,
                            IFlashLoanReceiver& receiver,
                            const Address& asset,
                            Amount amount,
                            const std::vector<uint8_t>& payload,
                            uint16_t referral_code) = 0;
};

// =============================================================================
// FlashLender - single-asset flash loans out of the lender's own reserves
// =============================================================================

struct LoanQuote {
    bool available;
    Amount amount;
    Amount fee;
    uint32_t premium_bps;
    Amount available_liquidity;
    std::string reason;
};

class FlashLender : public ILender {
public:
    // Default premium: 5 bps (0.05%)
    FlashLender(Runtime& runtime, const Address& address, uint32_t premium_bps = 5);

    // Non-copyable
    FlashLender(const FlashLender&) = delete;
    FlashLender& operator=(const FlashLender&) = delete;

    const Address& address() const override { return address_; }
    uint32_t premium_bps() const override { return premium_bps_; }

    // Enable an asset and mint `reserve` of it into the lender
    void list_asset(const Address& asset, Amount reserve = 0);
    bool is_listed(const Address& asset) const;

    Amount available_liquidity(const Address& asset) const;
    Amount fee_for(Amount amount) const;
    LoanQuote quote(const Address& asset, Amount amount) const;

    void flash_loan(const Address& caller,
                    IFlashLoanReceiver& receiver,
                    const Address& asset,
                    Amount amount,
                    const std::vector<uint8_t>& payload,
                    uint16_t referral_code) override;

private:
    Runtime& runtime_;
    Address address_;
    uint32_t premium_bps_;
    std::set<Address> listed_;
};

} // namespace flashx

#endif // FLASHX_LENDER_HPP
