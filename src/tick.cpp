// =============================================================================
// tick.cpp - Tick registry, tick bitmap and fee growth bookkeeping
// =============================================================================

#include "clamm/tick.hpp"
#include "clamm/bit_math.hpp"
#include "clamm/errors.hpp"
#include "clamm/liquidity_math.hpp"

namespace clamm {

// =============================================================================
// Bitmap Helpers
// =============================================================================

int32_t TickManager::compress(int32_t tick, int32_t tick_spacing) {
    int32_t compressed = tick / tick_spacing;
    if (tick < 0 && tick % tick_spacing != 0) --compressed;
    return compressed;
}

std::pair<int16_t, uint8_t> TickManager::position(int32_t compressed) {
    return {static_cast<int16_t>(compressed >> 8), static_cast<uint8_t>(compressed & 0xff)};
}

void TickManager::flip_tick(int32_t tick, int32_t tick_spacing) {
    auto [word_pos, bit_pos] = position(tick / tick_spacing);
    U256& word = bitmap_[word_pos];
    word = word ^ (U256(1) << bit_pos);
    if (word.is_zero()) bitmap_.erase(word_pos);
}

U256 TickManager::bitmap_word(int16_t word_pos) const {
    auto it = bitmap_.find(word_pos);
    return it == bitmap_.end() ? U256() : it->second;
}

// =============================================================================
// Liquidity Updates
// =============================================================================

U128 TickManager::liquidity_gross_after(int32_t tick, I128 liquidity_delta, U128 max_liquidity) const {
    auto it = ticks_.find(tick);
    U128 before = it == ticks_.end() ? 0 : it->second.liquidity_gross;

    U128 after;
    try {
        after = liquidity_math::add_delta(before, liquidity_delta);
    } catch (const MathError&) {
        throw StateError::for_tick(StateErrorCode::TickLiquidityOverflow, tick);
    }
    if (after > max_liquidity) {
        throw StateError::for_tick(StateErrorCode::TickLiquidityOverflow, tick);
    }
    return after;
}

TickUpdate TickManager::update_tick(int32_t tick,
                                    I128 liquidity_delta,
                                    const U256& fee_growth_global0_x128,
                                    const U256& fee_growth_global1_x128,
                                    bool upper,
                                    const Slot0& slot0,
                                    int32_t tick_spacing,
                                    U128 max_liquidity) {
    if (tick_spacing <= 0 || tick % tick_spacing != 0) {
        throw StateError::for_tick(StateErrorCode::TickMisaligned, tick);
    }

    U128 gross_after = liquidity_gross_after(tick, liquidity_delta, max_liquidity);

    auto it = ticks_.find(tick);
    TickInfo info = it == ticks_.end() ? TickInfo{} : it->second;
    U128 gross_before = info.liquidity_gross;

    // Upper boundaries subtract: crossing left to right leaves the range
    I128 net_after;
    bool net_overflow = upper
        ? __builtin_sub_overflow(info.liquidity_net, liquidity_delta, &net_after)
        : __builtin_add_overflow(info.liquidity_net, liquidity_delta, &net_after);
    if (net_overflow) {
        throw StateError::for_tick(StateErrorCode::TickLiquidityOverflow, tick);
    }

    bool flipped = (gross_after == 0) != (gross_before == 0);

    if (gross_before == 0 && tick <= slot0.tick) {
        // All growth so far happened below the tick
        info.fee_growth_outside0_x128 = fee_growth_global0_x128;
        info.fee_growth_outside1_x128 = fee_growth_global1_x128;
    }
    info.liquidity_gross = gross_after;
    info.liquidity_net = net_after;

    if (gross_after == 0) {
        ticks_.erase(tick);
    } else {
        ticks_[tick] = info;
    }
    if (flipped) flip_tick(tick, tick_spacing);

    return {flipped, gross_after};
}

// =============================================================================
// Swap Crossing
// =============================================================================

I128 TickManager::cross(int32_t tick, const U256& fee_growth_global0_x128, const U256& fee_growth_global1_x128) {
    auto it = ticks_.find(tick);
    if (it == ticks_.end()) return 0;

    TickInfo& info = it->second;
    info.fee_growth_outside0_x128 = fee_growth_global0_x128 - info.fee_growth_outside0_x128;
    info.fee_growth_outside1_x128 = fee_growth_global1_x128 - info.fee_growth_outside1_x128;
    return info.liquidity_net;
}

// =============================================================================
// Tick Search
// =============================================================================

NextTick TickManager::next_initialized_tick_within_one_word(int32_t tick, int32_t tick_spacing, bool lte) const {
    int32_t compressed = compress(tick, tick_spacing);

    if (lte) {
        auto [word_pos, bit_pos] = position(compressed);
        // Bits at or right of bit_pos
        U256 mask = U256::max() >> (255u - bit_pos);
        U256 masked = bitmap_word(word_pos) & mask;

        if (!masked.is_zero()) {
            int32_t msb = bit_math::most_significant_bit(masked);
            return {(compressed - (bit_pos - msb)) * tick_spacing, true};
        }
        return {(compressed - bit_pos) * tick_spacing, false};
    }

    // Start from the next compressed tick
    int32_t next = compressed + 1;
    auto [word_pos, bit_pos] = position(next);
    // Bits at or left of bit_pos
    U256 mask = ~((U256(1) << bit_pos) - U256(1));
    U256 masked = bitmap_word(word_pos) & mask;

    if (!masked.is_zero()) {
        int32_t lsb = bit_math::least_significant_bit(masked);
        return {(next + (lsb - bit_pos)) * tick_spacing, true};
    }
    return {(next + (255 - bit_pos)) * tick_spacing, false};
}

// =============================================================================
// Fee Growth
// =============================================================================

FeeGrowthInside TickManager::get_fee_growth_inside(int32_t tick_lower,
                                                   int32_t tick_upper,
                                                   int32_t tick_current,
                                                   const U256& fee_growth_global0_x128,
                                                   const U256& fee_growth_global1_x128) const {
    TickInfo lower = get(tick_lower).value_or(TickInfo{});
    TickInfo upper = get(tick_upper).value_or(TickInfo{});

    // All subtraction wraps mod 2^256
    FeeGrowthInside inside;
    if (tick_current < tick_lower) {
        inside.fee_growth_inside0_x128 = lower.fee_growth_outside0_x128 - upper.fee_growth_outside0_x128;
        inside.fee_growth_inside1_x128 = lower.fee_growth_outside1_x128 - upper.fee_growth_outside1_x128;
    } else if (tick_current >= tick_upper) {
        inside.fee_growth_inside0_x128 = upper.fee_growth_outside0_x128 - lower.fee_growth_outside0_x128;
        inside.fee_growth_inside1_x128 = upper.fee_growth_outside1_x128 - lower.fee_growth_outside1_x128;
    } else {
        inside.fee_growth_inside0_x128 =
            fee_growth_global0_x128 - lower.fee_growth_outside0_x128 - upper.fee_growth_outside0_x128;
        inside.fee_growth_inside1_x128 =
            fee_growth_global1_x128 - lower.fee_growth_outside1_x128 - upper.fee_growth_outside1_x128;
    }
    return inside;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<TickInfo> TickManager::get(int32_t tick) const {
    auto it = ticks_.find(tick);
    if (it == ticks_.end()) return std::nullopt;
    return it->second;
}

I128 TickManager::liquidity_net(int32_t tick) const {
    auto it = ticks_.find(tick);
    return it == ticks_.end() ? 0 : it->second.liquidity_net;
}

} // namespace clamm
