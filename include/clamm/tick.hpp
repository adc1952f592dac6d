#ifndef CLAMM_TICK_HPP
#define CLAMM_TICK_HPP

#include <map>
#include <unordered_map>
#include <optional>
#include <utility>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    U128 liquidity_gross = 0;    // Total liquidity referencing the tick
    I128 liquidity_net = 0;      // Net liquidity change when crossed left to right
    U256 fee_growth_outside0_x128;
    U256 fee_growth_outside1_x128;
};

struct TickUpdate {
    bool flipped;                // Initialized state changed
    U128 liquidity_gross_after;
};

struct NextTick {
    int32_t tick;
    bool initialized;            // false = word boundary, keep searching
};

struct FeeGrowthInside {
    U256 fee_growth_inside0_x128;
    U256 fee_growth_inside1_x128;
};

// =============================================================================
// TickManager - tick registry and bitmap index, always mutated together
// =============================================================================

class TickManager {
public:
    TickManager() = default;

    // Apply a liquidity delta to a position boundary. Creates the tick (seeding
    // outside growth with the globals when tick <= slot0.tick) or removes it when
    // gross liquidity returns to zero, flipping its bitmap bit in both cases.
    // Throws StateError(TickLiquidityOverflow) / StateError(TickMisaligned).
    TickUpdate update_tick(int32_t tick,
                           I128 liquidity_delta,
                           const U256& fee_growth_global0_x128,
                           const U256& fee_growth_global1_x128,
                           bool upper,
                           const Slot0& slot0,
                           int32_t tick_spacing,
                           U128 max_liquidity = U128_MAX);

    // Gross liquidity update_tick would produce; same validation, no mutation
    U128 liquidity_gross_after(int32_t tick, I128 liquidity_delta, U128 max_liquidity = U128_MAX) const;

    // Transition across an initialized tick during a swap; returns liquidity_net
    I128 cross(int32_t tick, const U256& fee_growth_global0_x128, const U256& fee_growth_global1_x128);

    // Next initialized tick in the same 256-bit word, at or left of `tick`
    // when lte, strictly right otherwise
    NextTick next_initialized_tick_within_one_word(int32_t tick, int32_t tick_spacing, bool lte) const;

    FeeGrowthInside get_fee_growth_inside(int32_t tick_lower,
                                          int32_t tick_upper,
                                          int32_t tick_current,
                                          const U256& fee_growth_global0_x128,
                                          const U256& fee_growth_global1_x128) const;

    // Queries
    std::optional<TickInfo> get(int32_t tick) const;
    bool is_initialized(int32_t tick) const { return ticks_.count(tick) != 0; }
    I128 liquidity_net(int32_t tick) const;
    U256 bitmap_word(int16_t word_pos) const;
    size_t size() const { return ticks_.size(); }

    // Floor division of tick by spacing
    static int32_t compress(int32_t tick, int32_t tick_spacing);
    // (word index, bit index) of a compressed tick
    static std::pair<int16_t, uint8_t> position(int32_t compressed);

private:
    void flip_tick(int32_t tick, int32_t tick_spacing);

    std::map<int32_t, TickInfo> ticks_;
    std::unordered_map<int16_t, U256> bitmap_;  // word index -> 256 tick bits
};

} // namespace clamm

#endif // CLAMM_TICK_HPP
