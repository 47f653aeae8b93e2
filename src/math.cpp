// =============================================================================
// math.cpp - 256-bit intermediate arithmetic for curve pricing
// =============================================================================

#include "pump/math.hpp"

namespace pump {
namespace math {

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

DivResult div_u256_u128(const U256& num, U128 denom) {
    DivResult out{0, 0, false};
    if (denom == 0) {
        out.overflow = true;
        return out;
    }
    if (num.hi == 0) {
        out.quotient = num.lo / denom;
        out.remainder = num.lo % denom;
        return out;
    }
    if (num.hi >= denom) {
        out.overflow = true;
        return out;
    }

    // Restoring shift-subtract division. The high limb is already reduced
    // below denom, so only the 128 low bits need to be shifted in.
    U128 rem = num.hi;
    U128 quot = 0;
    for (int i = 127; i >= 0; --i) {
        bool top = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        // When the shifted-out bit was set the true remainder is >= 2^128 > denom;
        // the wrapped subtraction still yields the correct value below denom.
        if (top || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    out.quotient = quot;
    out.remainder = rem;
    return out;
}

Amount mul_div(Amount a, Amount b, Amount denom) {
    DivResult r = div_u256_u128(mul_u128(a, b), denom);
    if (r.overflow) return AMOUNT_MAX;
    return r.quotient;
}

Amount mul_div_up(Amount a, Amount b, Amount denom) {
    DivResult r = div_u256_u128(mul_u128(a, b), denom);
    if (r.overflow) return AMOUNT_MAX;
    if (r.remainder != 0) {
        if (r.quotient == AMOUNT_MAX) return AMOUNT_MAX;
        return r.quotient + 1;
    }
    return r.quotient;
}

} // namespace math
} // namespace pump
