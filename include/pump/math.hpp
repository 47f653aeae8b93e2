#ifndef PUMP_MATH_HPP
#define PUMP_MATH_HPP

#include "types.hpp"

namespace pump {
namespace math {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 128x128 -> 256 product
U256 mul_u128(U128 a, U128 b);

struct DivResult {
    U128 quotient;
    U128 remainder;
    bool overflow;  // quotient does not fit in 128 bits
};

// 256 / 128 long division
DivResult div_u256_u128(const U256& num, U128 denom);

// =============================================================================
// mul_div with 256-bit intermediate
// =============================================================================

// floor(a * b / denom). Saturates at AMOUNT_MAX if the quotient overflows;
// denom must be non-zero.
Amount mul_div(Amount a, Amount b, Amount denom);

// ceil(a * b / denom). Same preconditions as mul_div.
Amount mul_div_up(Amount a, Amount b, Amount denom);

// amount * bps / 10000, floored
inline Amount apply_bps(Amount amount, uint32_t bps) {
    return mul_div(amount, static_cast<Amount>(bps), BPS_DENOMINATOR);
}

// Absolute difference, used for rounding tolerances
inline Amount abs_diff(Amount a, Amount b) {
    return a > b ? a - b : b - a;
}

} // namespace math
} // namespace pump

#endif // PUMP_MATH_HPP
