#ifndef PUMP_FEES_HPP
#define PUMP_FEES_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "vault.hpp"

namespace pump {

// Fee taken from one trade and how it is divided.
// treasury_cut + referrer_cut == fee, net + fee == gross.
struct FeeSplit {
    Amount gross = 0;
    Amount fee = 0;
    Amount net = 0;
    Amount treasury_cut = 0;
    Amount referrer_cut = 0;
    std::optional<Address> referrer;  // set only when referrer_cut is payable
};

namespace fees {

// A referrer equal to the trader is treated as no referrer.
FeeSplit split(Amount gross, uint32_t fee_bps, uint32_t referral_share_bps,
               const std::optional<Address>& referrer, const Address& trader);

// Transfers paying the fee from `payer`. Zero legs are omitted.
std::vector<Transfer> payouts(const FeeSplit& split, const Address& payer,
                              const Address& treasury);

} // namespace fees
} // namespace pump

#endif // PUMP_FEES_HPP
