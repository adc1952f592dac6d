// =============================================================================
// pool.cpp - Concentrated liquidity pool (initialize / modify / swap / donate)
// =============================================================================

#include "clamm/pool.hpp"
#include "clamm/errors.hpp"
#include "clamm/fees.hpp"
#include "clamm/fixed_point.hpp"
#include "clamm/full_math.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/safe_cast.hpp"
#include "clamm/sqrt_price_math.hpp"
#include "clamm/swap_math.hpp"
#include "clamm/tick_math.hpp"

#include <vector>

namespace clamm {

namespace {

// Tick transition recorded during the swap loop, applied on commit
struct CrossedTick {
    int32_t tick;
    U256 fee_growth_global0_x128;
    U256 fee_growth_global1_x128;
};

// -(2^127) is representable, so negate through the magnitude
I128 negate_magnitude(U128 magnitude) {
    if (magnitude == 0) return 0;
    if (magnitude - 1 > static_cast<U128>(I128_MAX)) {
        throw MathError(MathErrorCode::Overflow, "amount exceeds int128");
    }
    return -static_cast<I128>(magnitude - 1) - 1;
}

} // namespace

// =============================================================================
// Validation
// =============================================================================

void Pool::check_initialized() const {
    if (!is_initialized()) {
        throw StateError(StateErrorCode::PoolNotInitialized);
    }
}

void Pool::check_ticks(int32_t tick_lower, int32_t tick_upper, int32_t tick_spacing) {
    if (tick_lower >= tick_upper) {
        throw StateError(StateErrorCode::TicksMisordered,
                         std::to_string(tick_lower) + " >= " + std::to_string(tick_upper));
    }
    if (tick_lower < tick_math::MIN_TICK) {
        throw StateError::for_tick(StateErrorCode::TickLowerOutOfBounds, tick_lower);
    }
    if (tick_upper > tick_math::MAX_TICK) {
        throw StateError::for_tick(StateErrorCode::TickUpperOutOfBounds, tick_upper);
    }
    if (tick_spacing <= 0 || tick_lower % tick_spacing != 0) {
        throw StateError::for_tick(StateErrorCode::TickMisaligned, tick_lower);
    }
    if (tick_upper % tick_spacing != 0) {
        throw StateError::for_tick(StateErrorCode::TickMisaligned, tick_upper);
    }
}

// =============================================================================
// Initialize
// =============================================================================

int32_t Pool::initialize(const U256& sqrt_price, uint32_t lp_fee) {
    if (is_initialized()) {
        throw StateError(StateErrorCode::PoolAlreadyInitialized);
    }
    if (!lp_fee::is_valid(lp_fee)) {
        throw StateError(StateErrorCode::LpFeeTooLarge, std::to_string(lp_fee));
    }

    int32_t tick;
    try {
        tick = tick_math::get_tick_at_sqrt_price(sqrt_price);
    } catch (const MathError& e) {
        throw StateError(StateErrorCode::InvalidPrice, e.what());
    }

    slot0_ = Slot0{sqrt_price, tick, 0, lp_fee};
    return tick;
}

// =============================================================================
// Fee Setters
// =============================================================================

void Pool::set_protocol_fee(uint32_t protocol_fee) {
    check_initialized();
    if (!protocol_fee::is_valid(protocol_fee)) {
        throw StateError(StateErrorCode::ProtocolFeeTooLarge, std::to_string(protocol_fee));
    }
    slot0_.protocol_fee = protocol_fee;
}

void Pool::set_lp_fee(uint32_t lp_fee) {
    check_initialized();
    if (!lp_fee::is_valid(lp_fee)) {
        throw StateError(StateErrorCode::LpFeeTooLarge, std::to_string(lp_fee));
    }
    slot0_.lp_fee = lp_fee;
}

// =============================================================================
// Modify Position
// =============================================================================

Pool::ModifyPositionResult Pool::modify_position(const ModifyPositionParams& params) {
    check_initialized();
    check_ticks(params.tick_lower, params.tick_upper, params.tick_spacing);

    const I128 delta = params.liquidity_delta;
    const int32_t tick = slot0_.tick;
    const PositionKey key{params.owner, params.tick_lower, params.tick_upper, params.salt};
    const U128 max_liquidity = tick_math::tick_spacing_to_max_liquidity_per_tick(params.tick_spacing);

    // Validate everything before the first write
    if (delta != 0) {
        ticks_.liquidity_gross_after(params.tick_lower, delta, max_liquidity);
        ticks_.liquidity_gross_after(params.tick_upper, delta, max_liquidity);
    }

    FeeGrowthInside inside_before = ticks_.get_fee_growth_inside(
        params.tick_lower, params.tick_upper, tick, fee_growth_global0_x128_, fee_growth_global1_x128_);
    positions_.preview(key, delta, inside_before.fee_growth_inside0_x128, inside_before.fee_growth_inside1_x128);

    U256 sqrt_price_lower = tick_math::get_sqrt_price_at_tick(params.tick_lower);
    U256 sqrt_price_upper = tick_math::get_sqrt_price_at_tick(params.tick_upper);

    BalanceDelta principal;
    U128 liquidity_after = liquidity_;
    if (tick < params.tick_lower) {
        // Range above the price: only token0
        principal.amount0 = sqrt_price_math::get_amount0_delta(sqrt_price_lower, sqrt_price_upper, delta);
    } else if (tick < params.tick_upper) {
        principal.amount0 = sqrt_price_math::get_amount0_delta(slot0_.sqrt_price, sqrt_price_upper, delta);
        principal.amount1 = sqrt_price_math::get_amount1_delta(sqrt_price_lower, slot0_.sqrt_price, delta);
        liquidity_after = liquidity_math::add_delta(liquidity_, delta);
    } else {
        // Range below the price: only token1
        principal.amount1 = sqrt_price_math::get_amount1_delta(sqrt_price_lower, sqrt_price_upper, delta);
    }

    // Commit
    if (delta != 0) {
        ticks_.update_tick(params.tick_lower, delta, fee_growth_global0_x128_, fee_growth_global1_x128_,
                           false, slot0_, params.tick_spacing, max_liquidity);
        ticks_.update_tick(params.tick_upper, delta, fee_growth_global0_x128_, fee_growth_global1_x128_,
                           true, slot0_, params.tick_spacing, max_liquidity);
    }

    // A new position checkpoints against freshly seeded ticks; an existing one
    // sees the same value as before since its ticks were already live
    FeeGrowthInside inside = delta > 0
        ? ticks_.get_fee_growth_inside(params.tick_lower, params.tick_upper, tick,
                                       fee_growth_global0_x128_, fee_growth_global1_x128_)
        : inside_before;

    BalanceDelta fees = positions_.update(key, delta, inside.fee_growth_inside0_x128, inside.fee_growth_inside1_x128);
    liquidity_ = liquidity_after;

    return {principal, fees};
}

// =============================================================================
// Swap
// =============================================================================

Pool::SwapResult Pool::swap(const SwapParams& params) {
    check_initialized();

    const Slot0 start = slot0_;
    const bool zero_for_one = params.zero_for_one;
    const bool exact_input = params.amount_specified < 0;

    uint32_t lp_fee = start.lp_fee;
    if (params.lp_fee_override) {
        if (!lp_fee::is_valid(*params.lp_fee_override)) {
            throw StateError(StateErrorCode::LpFeeTooLarge, std::to_string(*params.lp_fee_override));
        }
        lp_fee = *params.lp_fee_override;
    }

    const uint16_t protocol = protocol_fee::directional_fee(start.protocol_fee, zero_for_one);
    const uint32_t swap_fee = protocol == 0 ? lp_fee : protocol_fee::calculate_swap_fee(protocol, lp_fee);

    // The whole input would be fee, nothing left to buy the output
    if (swap_fee >= swap_math::MAX_SWAP_FEE && params.amount_specified > 0) {
        throw StateError(StateErrorCode::InvalidFeeForExactOut);
    }

    SwapResult result{};
    result.swap_fee = swap_fee;
    result.sqrt_price = start.sqrt_price;
    result.tick = start.tick;
    result.liquidity = liquidity_;

    if (params.amount_specified == 0) return result;

    if (zero_for_one) {
        if (params.sqrt_price_limit >= start.sqrt_price) {
            throw StateError(StateErrorCode::PriceLimitAlreadyExceeded, params.sqrt_price_limit.to_string());
        }
        if (params.sqrt_price_limit <= tick_math::MIN_SQRT_PRICE) {
            throw StateError(StateErrorCode::PriceLimitOutOfBounds, params.sqrt_price_limit.to_string());
        }
    } else {
        if (params.sqrt_price_limit <= start.sqrt_price) {
            throw StateError(StateErrorCode::PriceLimitAlreadyExceeded, params.sqrt_price_limit.to_string());
        }
        if (params.sqrt_price_limit >= tick_math::MAX_SQRT_PRICE) {
            throw StateError(StateErrorCode::PriceLimitOutOfBounds, params.sqrt_price_limit.to_string());
        }
    }

    // Staged state, committed after the loop
    const U256 specified(safe_cast::abs_u128(params.amount_specified));
    U256 remaining = specified;
    U256 calculated;
    U256 sqrt_price = start.sqrt_price;
    int32_t tick = start.tick;
    U128 liquidity = liquidity_;
    U256 fee_growth_global = zero_for_one ? fee_growth_global0_x128_ : fee_growth_global1_x128_;
    U256 amount_to_protocol;
    std::vector<CrossedTick> crossed;

    while (!remaining.is_zero() && sqrt_price != params.sqrt_price_limit) {
        const U256 step_start = sqrt_price;

        NextTick next = ticks_.next_initialized_tick_within_one_word(tick, params.tick_spacing, zero_for_one);

        // The bitmap does not know the global bounds
        if (next.tick < tick_math::MIN_TICK) next.tick = tick_math::MIN_TICK;
        if (next.tick > tick_math::MAX_TICK) next.tick = tick_math::MAX_TICK;

        const U256 sqrt_price_next = tick_math::get_sqrt_price_at_tick(next.tick);
        const U256 target = swap_math::get_sqrt_price_target(zero_for_one, sqrt_price_next, params.sqrt_price_limit);

        swap_math::SwapStep step;
        if (liquidity == 0) {
            // Empty range: the price moves for free
            step.sqrt_price_next = target;
        } else {
            I128 signed_remaining = exact_input ? negate_magnitude(remaining.lo())
                                                : static_cast<I128>(remaining.lo());
            step = swap_math::compute_swap_step(sqrt_price, target, liquidity, signed_remaining, swap_fee);
        }
        sqrt_price = step.sqrt_price_next;

        if (exact_input) {
            remaining -= step.amount_in + step.fee_amount;
            calculated += step.amount_out;
        } else {
            remaining -= step.amount_out;
            calculated += step.amount_in + step.fee_amount;
        }

        if (protocol > 0) {
            // Rounds down in favour of LPs
            U256 protocol_share = swap_fee == protocol
                ? step.fee_amount
                : (step.amount_in + step.fee_amount) * U256(protocol) / U256(protocol_fee::PIPS_DENOMINATOR);
            step.fee_amount -= protocol_share;
            amount_to_protocol += protocol_share;
        }

        if (liquidity > 0) {
            fee_growth_global += full_math::mul_div(step.fee_amount, fixed_point128::Q128, U256(liquidity));
        }

        if (sqrt_price == sqrt_price_next) {
            if (next.initialized) {
                CrossedTick crossing{next.tick,
                                     zero_for_one ? fee_growth_global : fee_growth_global0_x128_,
                                     zero_for_one ? fee_growth_global1_x128_ : fee_growth_global};
                crossed.push_back(crossing);

                // Moving left the net liquidity applies with the opposite sign
                I128 liquidity_net = ticks_.liquidity_net(next.tick);
                if (zero_for_one) liquidity_net = -liquidity_net;
                liquidity = liquidity_math::add_delta(liquidity, liquidity_net);
            }
            // A zero_for_one swap ending on the boundary sits just below it
            tick = zero_for_one ? next.tick - 1 : next.tick;
        } else if (sqrt_price != step_start) {
            tick = tick_math::get_tick_at_sqrt_price(sqrt_price);
        }
    }

    // Balance delta from the caller's side
    I128 specified_used = safe_cast::to_i128(specified - remaining);
    I128 calculated_amount = safe_cast::to_i128(calculated);
    I128 input = exact_input ? -specified_used : -calculated_amount;
    I128 output = exact_input ? calculated_amount : specified_used;

    BalanceDelta delta = zero_for_one ? BalanceDelta{input, output} : BalanceDelta{output, input};

    // Commit
    for (const auto& crossing : crossed) {
        ticks_.cross(crossing.tick, crossing.fee_growth_global0_x128, crossing.fee_growth_global1_x128);
    }
    slot0_.sqrt_price = sqrt_price;
    slot0_.tick = tick;
    liquidity_ = liquidity;
    if (zero_for_one) {
        fee_growth_global0_x128_ = fee_growth_global;
    } else {
        fee_growth_global1_x128_ = fee_growth_global;
    }

    result.delta = delta;
    result.amount_to_protocol = amount_to_protocol;
    result.sqrt_price = sqrt_price;
    result.tick = tick;
    result.liquidity = liquidity;
    return result;
}

// =============================================================================
// Donate
// =============================================================================

BalanceDelta Pool::donate(U128 amount0, U128 amount1) {
    check_initialized();
    if (liquidity_ == 0) {
        throw StateError(StateErrorCode::NoLiquidityToReceiveFees);
    }

    BalanceDelta delta{negate_magnitude(amount0), negate_magnitude(amount1)};

    if (amount0 > 0) {
        fee_growth_global0_x128_ += full_math::mul_div(U256(amount0), fixed_point128::Q128, U256(liquidity_));
    }
    if (amount1 > 0) {
        fee_growth_global1_x128_ += full_math::mul_div(U256(amount1), fixed_point128::Q128, U256(liquidity_));
    }
    return delta;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Position> Pool::get_position(const Address& owner, int32_t tick_lower,
                                           int32_t tick_upper, const Salt& salt) const {
    return positions_.get(PositionKey{owner, tick_lower, tick_upper, salt});
}

} // namespace clamm
