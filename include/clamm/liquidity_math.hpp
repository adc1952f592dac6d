#ifndef CLAMM_LIQUIDITY_MATH_HPP
#define CLAMM_LIQUIDITY_MATH_HPP

#include <utility>

#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Liquidity Math
// =============================================================================

namespace liquidity_math {

// x + y; throws MathError(Overflow) on overflow or underflow
U128 add_delta(U128 x, I128 y);

// Liquidity obtainable from amount0 over [a, b] (order independent)
U128 get_liquidity_for_amount0(U256 sqrt_price_a, U256 sqrt_price_b, const U256& amount0);

// Liquidity obtainable from amount1 over [a, b] (order independent)
U128 get_liquidity_for_amount1(U256 sqrt_price_a, U256 sqrt_price_b, const U256& amount1);

// Largest liquidity both amounts can back at the current price
U128 get_liquidity_for_amounts(const U256& sqrt_price, U256 sqrt_price_a, U256 sqrt_price_b,
                               const U256& amount0, const U256& amount1);

// Token amounts represented by `liquidity` at the current price (rounded down)
std::pair<U256, U256> get_amounts_for_liquidity(const U256& sqrt_price, U256 sqrt_price_a,
                                                U256 sqrt_price_b, U128 liquidity);

} // namespace liquidity_math

} // namespace clamm

#endif // CLAMM_LIQUIDITY_MATH_HPP
