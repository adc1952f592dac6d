#ifndef CLAMM_SQRT_PRICE_MATH_HPP
#define CLAMM_SQRT_PRICE_MATH_HPP

#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Sqrt Price Math: amounts <-> price movement for a given liquidity
// =============================================================================

namespace sqrt_price_math {

// Price after adding/removing `amount` of token0, rounded up.
// Throws PriceOverflow when removal exceeds the virtual reserve,
// Overflow when the result leaves 160 bits.
U256 get_next_sqrt_price_from_amount0_rounding_up(
    const U256& sqrt_price, U128 liquidity, const U256& amount, bool add);

// Price after adding/removing `amount` of token1, rounded down.
// Throws NotEnoughLiquidity when removal would reach a zero price.
U256 get_next_sqrt_price_from_amount1_rounding_down(
    const U256& sqrt_price, U128 liquidity, const U256& amount, bool add);

// Input of token0 (zero_for_one) or token1 moves the price down / up.
// Throws InvalidPrice on zero price, InvalidLiquidity on zero liquidity.
U256 get_next_sqrt_price_from_input(
    const U256& sqrt_price, U128 liquidity, const U256& amount_in, bool zero_for_one);

U256 get_next_sqrt_price_from_output(
    const U256& sqrt_price, U128 liquidity, const U256& amount_out, bool zero_for_one);

// liquidity * (sqrt(upper) - sqrt(lower)) / (sqrt(upper) * sqrt(lower)).
// Order independent; throws InvalidPrice when the lower price is zero.
U256 get_amount0_delta(U256 sqrt_price_a, U256 sqrt_price_b, U128 liquidity, bool round_up);

// liquidity * (sqrt(upper) - sqrt(lower)). Order independent.
U256 get_amount1_delta(U256 sqrt_price_a, U256 sqrt_price_b, U128 liquidity, bool round_up);

// Signed variants for liquidity changes, caller's perspective:
// adding liquidity (> 0) returns a negative amount rounded up in magnitude,
// removing returns a positive amount rounded down.
I128 get_amount0_delta(const U256& sqrt_price_a, const U256& sqrt_price_b, I128 liquidity);
I128 get_amount1_delta(const U256& sqrt_price_a, const U256& sqrt_price_b, I128 liquidity);

} // namespace sqrt_price_math

} // namespace clamm

#endif // CLAMM_SQRT_PRICE_MATH_HPP
