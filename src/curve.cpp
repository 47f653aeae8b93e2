// =============================================================================
// curve.cpp - Bonding Curve Pricing
// =============================================================================

#include "pump/curve.hpp"

#include <algorithm>

namespace pump {
namespace curve {

Result<Amount> quote_buy(const TokenRecord& t, Amount net_base_in) {
    if (net_base_in == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }

    Amount eb = effective_base(t);
    Amount et = effective_tokens(t);
    if (net_base_in > AMOUNT_MAX - eb) {
        return Result<Amount>::failure(ErrorCode::InsufficientLiquidity);
    }

    Amount new_et = math::mul_div(eb, et, eb + net_base_in);
    Amount tokens_out = et - new_et;

    if (tokens_out == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }
    if (tokens_out > t.bonding_supply - t.tokens_sold) {
        return Result<Amount>::failure(ErrorCode::InsufficientLiquidity);
    }
    return Result<Amount>::success(tokens_out);
}

Result<Amount> quote_sell(const TokenRecord& t, Amount tokens_in) {
    if (tokens_in == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }
    if (tokens_in > t.tokens_sold) {
        return Result<Amount>::failure(ErrorCode::InsufficientLiquidity);
    }

    Amount eb = effective_base(t);
    Amount et = effective_tokens(t);

    // Remaining effective base rounds up so the seller never gets extra
    Amount new_eb = math::mul_div_up(eb, et, et + tokens_in);
    Amount base_out = eb - new_eb;

    if (base_out > t.real_reserve) {
        return Result<Amount>::failure(ErrorCode::InsufficientLiquidity);
    }
    if (base_out == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }
    return Result<Amount>::success(base_out);
}

Result<Amount> quote_burn(const TokenRecord& t, Amount tokens_in) {
    if (tokens_in == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }
    if (t.tokens_sold == 0 || tokens_in > t.tokens_sold) {
        return Result<Amount>::failure(ErrorCode::InsufficientLiquidity);
    }
    return Result<Amount>::success(math::mul_div(tokens_in, t.real_reserve, t.tokens_sold));
}

void apply_buy(TokenRecord& t, Amount net_base_in, Amount tokens_out, Amount gross_base_in) {
    t.real_reserve += net_base_in;
    t.tokens_sold += tokens_out;
    t.trade_volume += gross_base_in;
    ++t.trade_count;
}

void apply_sell(TokenRecord& t, Amount tokens_in, Amount gross_base_out) {
    t.real_reserve -= gross_base_out;
    t.tokens_sold -= tokens_in;
    t.trade_volume += gross_base_out;
    ++t.trade_count;
}

void apply_burn(TokenRecord& t, Amount tokens_in, Amount base_out) {
    t.real_reserve -= base_out;
    t.total_burned += tokens_in;
}

Amount price(const TokenRecord& t) {
    return math::mul_div(effective_base(t), WAD, effective_tokens(t));
}

Progress progress(const TokenRecord& t) {
    Progress p{};
    p.raised = t.real_reserve;
    p.target = t.graduation_threshold;
    p.tokens_sold = t.tokens_sold;

    if (t.graduation_threshold == 0) {
        p.progress_bps = BPS_DENOMINATOR;
        return p;
    }
    Amount bps = math::mul_div(t.real_reserve, BPS_DENOMINATOR, t.graduation_threshold);
    p.progress_bps = static_cast<uint32_t>(std::min<Amount>(bps, BPS_DENOMINATOR));
    return p;
}

} // namespace curve
} // namespace pump
