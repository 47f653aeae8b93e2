#ifndef PUMP_CURVE_HPP
#define PUMP_CURVE_HPP

#include <string>

#include "types.hpp"
#include "math.hpp"

namespace pump {

// =============================================================================
// TokenRecord - Curve state of one launched token
// =============================================================================

struct TokenRecord {
    TokenId id = 0;
    Address creator{};
    std::string name;
    std::string symbol;
    std::string description;
    std::string metadata_uri;

    // Parameterization, fixed at creation
    Amount virtual_base_reserve = 0;
    Amount virtual_token_reserve = 0;
    Amount total_supply = 0;
    Amount bonding_supply = 0;
    Amount graduation_threshold = 0;

    // Mutable curve state
    Amount real_reserve = 0;       // base currency held in escrow for this token
    Amount tokens_sold = 0;        // net tokens issued by the curve
    Amount total_burned = 0;       // redeemed through burn()
    Amount graduation_minted = 0;  // minted to the venue at graduation

    Amount trade_volume = 0;       // gross base currency traded
    uint64_t trade_count = 0;

    TokenStatus status = TokenStatus::Active;
    uint64_t created_at = 0;
    uint64_t graduated_at = 0;
    uint64_t pool_ref = 0;

    bool is_active() const { return status == TokenStatus::Active; }

    // Tokens that should exist in the ledger right now
    Amount circulating() const {
        return tokens_sold - total_burned + graduation_minted;
    }
};

// =============================================================================
// Bonding Curve (constant product over virtual + real reserves)
//
//   eb = virtual_base_reserve + real_reserve
//   et = virtual_token_reserve - tokens_sold
//   price = eb / et
//
// Every product goes through a 256-bit intermediate. Reserves the protocol
// keeps round up; amounts paid out round down.
// =============================================================================

namespace curve {

inline Amount effective_base(const TokenRecord& t) {
    return t.virtual_base_reserve + t.real_reserve;
}

inline Amount effective_tokens(const TokenRecord& t) {
    return t.virtual_token_reserve - t.tokens_sold;
}

// eb * et as a 256-bit value
inline math::U256 invariant(const TokenRecord& t) {
    return math::mul_u128(effective_base(t), effective_tokens(t));
}

// Tokens issued for `net_base_in` after fees.
// ZeroAmount on zero input or zero output, InsufficientLiquidity when the
// bonding supply would be exceeded.
Result<Amount> quote_buy(const TokenRecord& t, Amount net_base_in);

// Gross base currency released for `tokens_in` before fees.
// InsufficientLiquidity if more tokens than sold, or if the output would
// exceed the real reserve.
Result<Amount> quote_sell(const TokenRecord& t, Amount tokens_in);

// Pro-rata redemption: tokens_in * real_reserve / tokens_sold, no fee.
Result<Amount> quote_burn(const TokenRecord& t, Amount tokens_in);

void apply_buy(TokenRecord& t, Amount net_base_in, Amount tokens_out, Amount gross_base_in);
void apply_sell(TokenRecord& t, Amount tokens_in, Amount gross_base_out);
void apply_burn(TokenRecord& t, Amount tokens_in, Amount base_out);

// Spot price, WAD-scaled base per token
Amount price(const TokenRecord& t);

struct Progress {
    Amount raised;
    Amount target;
    uint32_t progress_bps;  // capped at 10000
    Amount tokens_sold;
};

Progress progress(const TokenRecord& t);

} // namespace curve
} // namespace pump

#endif // PUMP_CURVE_HPP
