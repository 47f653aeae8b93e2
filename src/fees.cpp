// =============================================================================
// fees.cpp - Trade Fee Split
// =============================================================================

#include "pump/fees.hpp"
#include "pump/math.hpp"

namespace pump {
namespace fees {

FeeSplit split(Amount gross, uint32_t fee_bps, uint32_t referral_share_bps,
               const std::optional<Address>& referrer, const Address& trader) {
    FeeSplit s;
    s.gross = gross;
    s.fee = math::apply_bps(gross, fee_bps);
    s.net = gross - s.fee;

    bool has_referrer = referrer.has_value() && !addresses::is_zero(*referrer) &&
                        *referrer != trader;
    if (has_referrer) {
        s.referrer_cut = math::apply_bps(s.fee, referral_share_bps);
        if (s.referrer_cut > 0) {
            s.referrer = referrer;
        }
    }
    s.treasury_cut = s.fee - s.referrer_cut;
    return s;
}

std::vector<Transfer> payouts(const FeeSplit& split, const Address& payer,
                              const Address& treasury) {
    std::vector<Transfer> legs;
    legs.reserve(2);
    if (split.treasury_cut > 0) {
        legs.push_back(Transfer{payer, treasury, split.treasury_cut});
    }
    if (split.referrer_cut > 0 && split.referrer) {
        legs.push_back(Transfer{payer, *split.referrer, split.referrer_cut});
    }
    return legs;
}

} // namespace fees
} // namespace pump
