// =============================================================================
// admin.cpp - Owner-gated launchpad parameters
// =============================================================================

#include "pump/admin.hpp"
#include "pump/log.hpp"

namespace pump {

AdminControls::AdminControls(const LaunchpadConfig& config)
    : schedule_{config.fees.buy_fee_bps,
                config.fees.sell_fee_bps,
                config.fees.max_fee_bps,
                config.fees.referral_share_bps,
                config.fees.creation_fee,
                config.graduation.burn_bps,
                config.graduation.liquidity_bps,
                config.graduation.creator_bps,
                config.accounts.treasury,
                config.graduation.lp_recipient,
                config.graduation.liquidity_deadline_secs},
      owner_(config.accounts.owner) {}

// Caller holds mutex_ (shared or unique)
bool AdminControls::is_owner(const CallContext& ctx) const {
    return ctx.caller == owner_;
}

// =============================================================================
// Setters
// =============================================================================

ErrorCode AdminControls::set_fees(const CallContext& ctx, uint32_t buy_fee_bps,
                                  uint32_t sell_fee_bps, uint32_t creator_bps,
                                  uint32_t burn_bps, uint32_t liquidity_bps) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;

    if (buy_fee_bps > schedule_.max_fee_bps || sell_fee_bps > schedule_.max_fee_bps) {
        return ErrorCode::InvalidParameter;
    }
    uint64_t allocation = static_cast<uint64_t>(creator_bps) + burn_bps + liquidity_bps;
    if (allocation > BPS_DENOMINATOR) {
        return ErrorCode::InvalidParameter;
    }

    schedule_.buy_fee_bps = buy_fee_bps;
    schedule_.sell_fee_bps = sell_fee_bps;
    schedule_.creator_bps = creator_bps;
    schedule_.burn_bps = burn_bps;
    schedule_.liquidity_bps = liquidity_bps;

    log::info("fees updated: buy=" + std::to_string(buy_fee_bps) +
              " sell=" + std::to_string(sell_fee_bps) +
              " creator=" + std::to_string(creator_bps) +
              " burn=" + std::to_string(burn_bps) +
              " liquidity=" + std::to_string(liquidity_bps));
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_paused(const CallContext& ctx, bool paused) {
    {
        std::shared_lock lock(mutex_);
        if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    }
    paused_.store(paused, std::memory_order_release);
    log::info(paused ? "launchpad paused" : "launchpad unpaused");
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_liquidity_venue(const CallContext& ctx,
                                             std::shared_ptr<ILiquidityVenue> venue) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    if (!venue) return ErrorCode::InvalidParameter;

    venue_ = std::move(venue);
    log::info("liquidity venue set: " + to_hex(venue_->account()));
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_treasury(const CallContext& ctx, const Address& treasury) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    if (addresses::is_zero(treasury)) return ErrorCode::InvalidParameter;

    schedule_.treasury = treasury;
    log::info("treasury set: " + to_hex(treasury));
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_creation_fee(const CallContext& ctx, Amount fee) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;

    schedule_.creation_fee = fee;
    log::info("creation fee set: " + to_string(fee));
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_referral_share(const CallContext& ctx, uint32_t share_bps) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    if (share_bps > BPS_DENOMINATOR) return ErrorCode::InvalidParameter;

    schedule_.referral_share_bps = share_bps;
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_fee_exempt(const CallContext& ctx, const Address& account,
                                        bool exempt) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;

    if (exempt) {
        fee_exempt_.insert(account);
    } else {
        fee_exempt_.erase(account);
    }
    return ErrorCode::Ok;
}

ErrorCode AdminControls::set_lp_recipient(const CallContext& ctx, const Address& recipient) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    if (addresses::is_zero(recipient)) return ErrorCode::InvalidParameter;

    schedule_.lp_recipient = recipient;
    return ErrorCode::Ok;
}

ErrorCode AdminControls::transfer_ownership(const CallContext& ctx, const Address& new_owner) {
    std::unique_lock lock(mutex_);
    if (!is_owner(ctx)) return ErrorCode::Unauthorized;
    if (addresses::is_zero(new_owner)) return ErrorCode::InvalidParameter;

    log::info("ownership transferred: " + to_hex(owner_) + " -> " + to_hex(new_owner));
    owner_ = new_owner;
    return ErrorCode::Ok;
}

// =============================================================================
// Reads
// =============================================================================

FeeSchedule AdminControls::schedule() const {
    std::shared_lock lock(mutex_);
    return schedule_;
}

std::shared_ptr<ILiquidityVenue> AdminControls::venue() const {
    std::shared_lock lock(mutex_);
    return venue_;
}

bool AdminControls::is_fee_exempt(const Address& account) const {
    std::shared_lock lock(mutex_);
    return fee_exempt_.count(account) != 0;
}

Address AdminControls::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

} // namespace pump
