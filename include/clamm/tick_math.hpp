#ifndef CLAMM_TICK_MATH_HPP
#define CLAMM_TICK_MATH_HPP

#include <cstdint>

#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Tick Math: price = 1.0001^tick, sqrt price in Q64.96
// =============================================================================

namespace tick_math {

constexpr int32_t MIN_TICK = -887272;
constexpr int32_t MAX_TICK = 887272;

// get_sqrt_price_at_tick(MIN_TICK) and get_sqrt_price_at_tick(MAX_TICK)
constexpr U256 MIN_SQRT_PRICE = U256(4295128739ULL);
constexpr U256 MAX_SQRT_PRICE = U256(u128(0xefd1fc6a50648849ULL, 0x5d951d5263988d26ULL), 0xfffd8963ULL);

// sqrt(1.0001^tick) * 2^96, rounded up.
// Throws MathError(InvalidTick) outside [MIN_TICK, MAX_TICK].
U256 get_sqrt_price_at_tick(int32_t tick);

// Greatest tick whose sqrt price is <= sqrt_price.
// Throws MathError(InvalidPrice) outside [MIN_SQRT_PRICE, MAX_SQRT_PRICE].
int32_t get_tick_at_sqrt_price(const U256& sqrt_price);

constexpr int32_t min_usable_tick(int32_t tick_spacing) {
    return (MIN_TICK / tick_spacing) * tick_spacing;
}

constexpr int32_t max_usable_tick(int32_t tick_spacing) {
    return (MAX_TICK / tick_spacing) * tick_spacing;
}

// Per-tick gross liquidity cap so the sum over all usable ticks fits in U128
U128 tick_spacing_to_max_liquidity_per_tick(int32_t tick_spacing);

} // namespace tick_math

} // namespace clamm

#endif // CLAMM_TICK_MATH_HPP
