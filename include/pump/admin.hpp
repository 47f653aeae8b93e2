#ifndef PUMP_ADMIN_HPP
#define PUMP_ADMIN_HPP

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <unordered_set>

#include "types.hpp"
#include "config.hpp"
#include "venue.hpp"

namespace pump {

// Consistent snapshot of every tunable a trade or graduation reads
struct FeeSchedule {
    uint32_t buy_fee_bps;
    uint32_t sell_fee_bps;
    uint32_t max_fee_bps;
    uint32_t referral_share_bps;
    Amount creation_fee;

    uint32_t burn_bps;
    uint32_t liquidity_bps;
    uint32_t creator_bps;

    Address treasury;
    Address lp_recipient;
    uint64_t liquidity_deadline_secs;
};

// =============================================================================
// AdminControls - Owner-gated parameters
//
// Every setter returns Unauthorized unless ctx.caller is the owner.
// =============================================================================

class AdminControls {
public:
    explicit AdminControls(const LaunchpadConfig& config);

    // Non-copyable
    AdminControls(const AdminControls&) = delete;
    AdminControls& operator=(const AdminControls&) = delete;

    // =========================================================================
    // Setters
    // =========================================================================

    // Trade fees must not exceed max_fee_bps; the three graduation
    // allocations must not sum above 10000.
    ErrorCode set_fees(const CallContext& ctx, uint32_t buy_fee_bps, uint32_t sell_fee_bps,
                       uint32_t creator_bps, uint32_t burn_bps, uint32_t liquidity_bps);

    ErrorCode set_paused(const CallContext& ctx, bool paused);
    ErrorCode set_liquidity_venue(const CallContext& ctx, std::shared_ptr<ILiquidityVenue> venue);
    ErrorCode set_treasury(const CallContext& ctx, const Address& treasury);
    ErrorCode set_creation_fee(const CallContext& ctx, Amount fee);
    ErrorCode set_referral_share(const CallContext& ctx, uint32_t share_bps);
    ErrorCode set_fee_exempt(const CallContext& ctx, const Address& account, bool exempt);
    ErrorCode set_lp_recipient(const CallContext& ctx, const Address& recipient);
    ErrorCode transfer_ownership(const CallContext& ctx, const Address& new_owner);

    // =========================================================================
    // Reads
    // =========================================================================

    FeeSchedule schedule() const;
    bool paused() const { return paused_.load(std::memory_order_acquire); }
    std::shared_ptr<ILiquidityVenue> venue() const;
    bool is_fee_exempt(const Address& account) const;
    Address owner() const;

private:
    FeeSchedule schedule_;
    Address owner_;
    std::shared_ptr<ILiquidityVenue> venue_;
    std::unordered_set<Address, AddressHash> fee_exempt_;
    mutable std::shared_mutex mutex_;

    std::atomic<bool> paused_{false};

    bool is_owner(const CallContext& ctx) const;
};

} // namespace pump

#endif // PUMP_ADMIN_HPP
