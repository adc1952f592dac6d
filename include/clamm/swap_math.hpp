#ifndef CLAMM_SWAP_MATH_HPP
#define CLAMM_SWAP_MATH_HPP

#include <cstdint>

#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Swap Math: one step of a swap within a single liquidity range
// =============================================================================

namespace swap_math {

// Fee denominator, 1e6 pips = 100%
constexpr uint32_t MAX_SWAP_FEE = 1000000;

struct SwapStep {
    U256 sqrt_price_next;
    U256 amount_in;     // Excludes fee
    U256 amount_out;
    U256 fee_amount;
};

// Price to step toward: the next tick price, clamped by the caller's limit
U256 get_sqrt_price_target(bool zero_for_one, const U256& sqrt_price_next_tick,
                           const U256& sqrt_price_limit);

// Direction is current >= target (token0 in). amount_remaining < 0 is exact input,
// >= 0 is exact output. Throws MathError(InvalidPrice) when fee_pips > MAX_SWAP_FEE,
// MathError(NotEnoughLiquidity) when liquidity is zero.
SwapStep compute_swap_step(const U256& sqrt_price_current, const U256& sqrt_price_target,
                           U128 liquidity, I128 amount_remaining, uint32_t fee_pips);

} // namespace swap_math

} // namespace clamm

#endif // CLAMM_SWAP_MATH_HPP
