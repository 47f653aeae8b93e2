#ifndef PUMP_GRADUATION_HPP
#define PUMP_GRADUATION_HPP

#include <optional>
#include <vector>

#include "types.hpp"
#include "curve.hpp"
#include "admin.hpp"
#include "vault.hpp"
#include "venue.hpp"

namespace pump {

// Allocation of the graduation threshold, computed on the post-trade record
struct GraduationPlan {
    TokenId token = 0;
    Amount burn_base = 0;         // escrow -> burn sink
    Amount liquidity_base = 0;    // escrow -> venue account
    Amount creator_reward = 0;    // escrow -> creator
    Amount liquidity_tokens = 0;  // minted to the venue account

    Amount total_base() const { return burn_base + liquidity_base + creator_reward; }
    bool needs_venue() const { return liquidity_base > 0 && liquidity_tokens > 0; }
};

namespace graduation {

// Nothing to do when the token is already graduated or below threshold.
std::optional<GraduationPlan> plan(const TokenRecord& t, const FeeSchedule& schedule);

// Base-currency legs of the plan, all paid from the curve escrow
std::vector<Transfer> transfers(const GraduationPlan& plan, const Address& creator,
                                const Address& venue_account);

// Calls the venue with exact minimums and a deadline of
// now + liquidity_deadline_secs. A missing venue, a venue error or a venue
// exception all yield ExternalTransferFailed. Value is the pool reference.
Result<uint64_t> add_liquidity(const GraduationPlan& plan, ILiquidityVenue* venue,
                               const FeeSchedule& schedule, uint64_t now);

// Terminal transition; the only place status becomes Graduated
void finalize(TokenRecord& t, const GraduationPlan& plan, uint64_t pool_ref, uint64_t now);

} // namespace graduation
} // namespace pump

#endif // PUMP_GRADUATION_HPP
