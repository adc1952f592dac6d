// =============================================================================
// swap_math.cpp - Single swap step (exact input and exact output)
// =============================================================================

#include "clamm/swap_math.hpp"
#include "clamm/errors.hpp"
#include "clamm/full_math.hpp"
#include "clamm/safe_cast.hpp"
#include "clamm/sqrt_price_math.hpp"

#include <string>

namespace clamm {
namespace swap_math {

U256 get_sqrt_price_target(bool zero_for_one, const U256& sqrt_price_next_tick,
                           const U256& sqrt_price_limit) {
    if (zero_for_one) {
        return sqrt_price_next_tick < sqrt_price_limit ? sqrt_price_limit : sqrt_price_next_tick;
    }
    return sqrt_price_next_tick > sqrt_price_limit ? sqrt_price_limit : sqrt_price_next_tick;
}

SwapStep compute_swap_step(const U256& sqrt_price_current, const U256& sqrt_price_target,
                           U128 liquidity, I128 amount_remaining, uint32_t fee_pips) {
    if (fee_pips > MAX_SWAP_FEE) {
        throw MathError(MathErrorCode::InvalidPrice, "fee " + std::to_string(fee_pips) + " exceeds 100%");
    }
    if (liquidity == 0) {
        throw MathError(MathErrorCode::NotEnoughLiquidity, "swap step without liquidity");
    }

    const bool zero_for_one = sqrt_price_current >= sqrt_price_target;
    const bool exact_in = amount_remaining < 0;
    const U256 remaining(safe_cast::abs_u128(amount_remaining));
    const U256 fee(fee_pips);
    const U256 fee_complement(MAX_SWAP_FEE - fee_pips);

    SwapStep step;

    if (exact_in) {
        U256 remaining_less_fee = full_math::mul_div(remaining, fee_complement, U256(MAX_SWAP_FEE));
        step.amount_in = zero_for_one
            ? sqrt_price_math::get_amount0_delta(sqrt_price_target, sqrt_price_current, liquidity, true)
            : sqrt_price_math::get_amount1_delta(sqrt_price_current, sqrt_price_target, liquidity, true);

        if (remaining_less_fee >= step.amount_in) {
            // Target reached with input to spare
            step.sqrt_price_next = sqrt_price_target;
            step.fee_amount = fee_pips == MAX_SWAP_FEE
                ? step.amount_in
                : full_math::mul_div_rounding_up(step.amount_in, fee, fee_complement);
        } else {
            // Whole remainder consumed before the target
            step.amount_in = remaining_less_fee;
            step.sqrt_price_next = sqrt_price_math::get_next_sqrt_price_from_input(
                sqrt_price_current, liquidity, remaining_less_fee, zero_for_one);
            step.fee_amount = remaining - step.amount_in;
        }

        step.amount_out = zero_for_one
            ? sqrt_price_math::get_amount1_delta(step.sqrt_price_next, sqrt_price_current, liquidity, false)
            : sqrt_price_math::get_amount0_delta(sqrt_price_current, step.sqrt_price_next, liquidity, false);
    } else {
        if (fee_pips == MAX_SWAP_FEE) {
            throw MathError(MathErrorCode::InvalidPrice, "exact output with 100% fee");
        }
        step.amount_out = zero_for_one
            ? sqrt_price_math::get_amount1_delta(sqrt_price_target, sqrt_price_current, liquidity, false)
            : sqrt_price_math::get_amount0_delta(sqrt_price_current, sqrt_price_target, liquidity, false);

        if (remaining >= step.amount_out) {
            step.sqrt_price_next = sqrt_price_target;
        } else {
            // Output capped at what is still owed
            step.amount_out = remaining;
            step.sqrt_price_next = sqrt_price_math::get_next_sqrt_price_from_output(
                sqrt_price_current, liquidity, remaining, zero_for_one);
        }

        step.amount_in = zero_for_one
            ? sqrt_price_math::get_amount0_delta(step.sqrt_price_next, sqrt_price_current, liquidity, true)
            : sqrt_price_math::get_amount1_delta(sqrt_price_current, step.sqrt_price_next, liquidity, true);

        step.fee_amount = full_math::mul_div_rounding_up(step.amount_in, fee, fee_complement);
    }

    return step;
}

} // namespace swap_math
} // namespace clamm
