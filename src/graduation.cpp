// =============================================================================
// graduation.cpp - Curve retirement and liquidity hand-off
// =============================================================================

#include "pump/graduation.hpp"
#include "pump/log.hpp"
#include "pump/math.hpp"

#include <exception>

namespace pump {
namespace graduation {

std::optional<GraduationPlan> plan(const TokenRecord& t, const FeeSchedule& schedule) {
    if (!t.is_active() || t.real_reserve < t.graduation_threshold) {
        return std::nullopt;
    }

    GraduationPlan p;
    p.token = t.id;
    p.burn_base = math::apply_bps(t.graduation_threshold, schedule.burn_bps);
    p.liquidity_base = math::apply_bps(t.graduation_threshold, schedule.liquidity_bps);
    p.creator_reward = math::apply_bps(t.graduation_threshold, schedule.creator_bps);

    // Seed the pool at the price the curve ended on
    Amount tokens = math::mul_div(p.liquidity_base, curve::effective_tokens(t),
                                  curve::effective_base(t));
    Amount reserved = t.total_supply > t.bonding_supply ? t.total_supply - t.bonding_supply : 0;
    p.liquidity_tokens = tokens < reserved ? tokens : reserved;

    // No pool without both sides; the base share stays in escrow
    if (p.liquidity_tokens == 0) {
        p.liquidity_base = 0;
    }
    return p;
}

std::vector<Transfer> transfers(const GraduationPlan& plan, const Address& creator,
                                const Address& venue_account) {
    std::vector<Transfer> legs;
    legs.reserve(3);
    if (plan.burn_base > 0) {
        legs.push_back(Transfer{addresses::CURVE_ESCROW, addresses::BURN_SINK, plan.burn_base});
    }
    if (plan.needs_venue()) {
        legs.push_back(Transfer{addresses::CURVE_ESCROW, venue_account, plan.liquidity_base});
    }
    if (plan.creator_reward > 0) {
        legs.push_back(Transfer{addresses::CURVE_ESCROW, creator, plan.creator_reward});
    }
    return legs;
}

Result<uint64_t> add_liquidity(const GraduationPlan& plan, ILiquidityVenue* venue,
                               const FeeSchedule& schedule, uint64_t now) {
    if (!plan.needs_venue()) {
        return Result<uint64_t>::success(0);
    }
    if (!venue) {
        log::warn("graduation of token " + std::to_string(plan.token) +
                  " aborted: no liquidity venue configured");
        return Result<uint64_t>::failure(ErrorCode::ExternalTransferFailed);
    }

    VenueResult result;
    try {
        result = venue->add_liquidity(plan.token, plan.liquidity_tokens, plan.liquidity_base,
                                      plan.liquidity_tokens, plan.liquidity_base,
                                      schedule.lp_recipient,
                                      now + schedule.liquidity_deadline_secs);
    } catch (const std::exception& e) {
        log::warn("graduation of token " + std::to_string(plan.token) +
                  " aborted: venue threw: " + e.what());
        return Result<uint64_t>::failure(ErrorCode::ExternalTransferFailed);
    }

    if (!result.ok()) {
        log::warn("graduation of token " + std::to_string(plan.token) +
                  " aborted: venue code " + std::to_string(result.code));
        return Result<uint64_t>::failure(ErrorCode::ExternalTransferFailed);
    }
    return Result<uint64_t>::success(result.pool_ref);
}

void finalize(TokenRecord& t, const GraduationPlan& plan, uint64_t pool_ref, uint64_t now) {
    t.real_reserve -= plan.total_base();
    if (plan.needs_venue()) {
        t.graduation_minted += plan.liquidity_tokens;
    }
    t.status = TokenStatus::Graduated;
    t.graduated_at = now;
    t.pool_ref = pool_ref;
}

} // namespace graduation
} // namespace pump
