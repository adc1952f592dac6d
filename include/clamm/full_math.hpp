#ifndef CLAMM_FULL_MATH_HPP
#define CLAMM_FULL_MATH_HPP

#include "uint256.hpp"

namespace clamm {
namespace full_math {

// floor(a * b / denominator) with a 512-bit intermediate.
// Throws MathError(DivisionByZero) when denominator == 0 and
// MathError(Overflow) when the quotient does not fit in 256 bits.
U256 mul_div(const U256& a, const U256& b, const U256& denominator);

// ceil(a * b / denominator), same failure modes
U256 mul_div_rounding_up(const U256& a, const U256& b, const U256& denominator);

// (a * b) mod denominator over the full 512-bit product
U256 mul_mod(const U256& a, const U256& b, const U256& denominator);

// ceil(x / y)
U256 div_rounding_up(const U256& x, const U256& y);

} // namespace full_math
} // namespace clamm

#endif // CLAMM_FULL_MATH_HPP
