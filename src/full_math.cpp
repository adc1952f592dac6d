// =============================================================================
// full_math.cpp - 512-bit multiply-divide without intermediate overflow
// =============================================================================

#include "clamm/full_math.hpp"
#include "clamm/errors.hpp"

namespace clamm {
namespace full_math {

namespace {

// Remainder of a 512-bit value by a non-zero 256-bit divisor
U256 mod_wide(const U512& p, const U256& d) {
    U256 r;
    bool started = false;

    for (int half = 1; half >= 0; --half) {
        const U256& word = half == 1 ? p.hi : p.lo;
        for (int i = 255; i >= 0; --i) {
            bool bit = word.bit(static_cast<unsigned>(i));
            if (!started) {
                if (!bit) continue;
                started = true;
            }
            // 2r + bit < 2d, so one conditional subtraction keeps r < d
            bool carry = r.bit(255);
            r <<= 1;
            if (bit) r |= U256(1);
            if (carry || r >= d) r -= d;
        }
    }
    return r;
}

U256 mul_div_impl(const U256& a, const U256& b, const U256& denominator, U256& remainder) {
    if (denominator.is_zero()) {
        throw MathError(MathErrorCode::DivisionByZero, "mul_div");
    }

    U512 product = mul_wide(a, b);
    U256 prod0 = product.lo;
    U256 prod1 = product.hi;

    // Product fits in 256 bits: plain division
    if (prod1.is_zero()) {
        U256 quot;
        divmod(prod0, denominator, quot, remainder);
        return quot;
    }

    // Result must be < 2^256
    if (denominator <= prod1) {
        throw MathError(MathErrorCode::Overflow, "mul_div result exceeds 256 bits");
    }

    // Make the division exact by subtracting the remainder from [prod1 prod0]
    remainder = mod_wide(product, denominator);
    if (remainder > prod0) prod1 -= U256(1);
    prod0 -= remainder;

    // Factor powers of two out of the denominator and the numerator
    U256 d = denominator;
    unsigned twos = 0;
    while (!d.bit(twos)) ++twos;
    if (twos > 0) {
        d >>= twos;
        prod0 = (prod0 >> twos) | (prod1 << (256 - twos));
    }

    // Inverse of odd d mod 2^256: seed correct to 4 bits, each Newton step doubles it
    U256 inv = (U256(3) * d) ^ U256(2);
    for (int i = 0; i < 6; ++i) {
        inv *= U256(2) - d * inv;
    }

    return prod0 * inv;
}

} // namespace

U256 mul_div(const U256& a, const U256& b, const U256& denominator) {
    U256 remainder;
    return mul_div_impl(a, b, denominator, remainder);
}

U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator) {
    U256 remainder;
    U256 result = mul_div_impl(a, b, denominator, remainder);
    if (!remainder.is_zero()) {
        if (result == U256::max()) {
            throw MathError(MathErrorCode::Overflow, "mul_div_rounding_up");
        }
        result += U256(1);
    }
    return result;
}

U256 mul_mod(const U256& a, const U256& b, const U256& denominator) {
    if (denominator.is_zero()) {
        throw MathError(MathErrorCode::DivisionByZero, "mul_mod");
    }
    return mod_wide(mul_wide(a, b), denominator);
}

U256 div_rounding_up(const U256& x, const U256& y) {
    U256 quot, rem;
    divmod(x, y, quot, rem);
    if (!rem.is_zero()) quot += U256(1);
    return quot;
}

} // namespace full_math
} // namespace clamm
