#ifndef CLAMM_FIXED_POINT_HPP
#define CLAMM_FIXED_POINT_HPP

#include "errors.hpp"
#include "full_math.hpp"
#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Q64.96 Fixed Point (sqrt prices)
// =============================================================================

namespace fixed_point96 {

constexpr unsigned RESOLUTION = 96;
constexpr U256 Q96 = U256(U128(1) << 96);

// a * b where both are Q64.96
inline U256 mul(const U256& a, const U256& b) {
    return full_math::mul_div(a, b, Q96);
}

// a / b where both are Q64.96
inline U256 div(const U256& a, const U256& b) {
    return full_math::mul_div(a, Q96, b);
}

// Plain integer to Q64.96; throws MathError(Overflow) past 160 bits
inline U256 from_integer(const U256& v) {
    if (v.bit_length() > 256 - RESOLUTION) {
        throw MathError(MathErrorCode::Overflow, "fixed_point96::from_integer");
    }
    return v << RESOLUTION;
}

// Q64.96 to plain integer, truncating the fraction
inline U256 to_integer(const U256& x) {
    return x >> RESOLUTION;
}

} // namespace fixed_point96

// =============================================================================
// Q128.128 (fee growth accumulators)
// =============================================================================

namespace fixed_point128 {

constexpr unsigned RESOLUTION = 128;
constexpr U256 Q128 = U256(0, 1);

} // namespace fixed_point128

} // namespace clamm

#endif // CLAMM_FIXED_POINT_HPP
