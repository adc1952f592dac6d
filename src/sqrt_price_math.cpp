// =============================================================================
// sqrt_price_math.cpp - Closed-form amount and next-price computations
// =============================================================================

#include "clamm/sqrt_price_math.hpp"
#include "clamm/errors.hpp"
#include "clamm/fixed_point.hpp"
#include "clamm/full_math.hpp"
#include "clamm/safe_cast.hpp"

#include <utility>

namespace clamm {
namespace sqrt_price_math {

using full_math::div_rounding_up;
using full_math::mul_div;
using full_math::mul_div_rounding_up;

U256 get_next_sqrt_price_from_amount0_rounding_up(
    const U256& sqrt_price, U128 liquidity, const U256& amount, bool add) {
    // Short circuit: the fallback below would not return the input price
    if (amount.is_zero()) return sqrt_price;

    U256 numerator1 = U256(liquidity) << fixed_point96::RESOLUTION;
    U256 product = amount * sqrt_price;
    bool product_exact = product / amount == sqrt_price;

    if (add) {
        if (product_exact) {
            U256 denominator = numerator1 + product;
            if (denominator >= numerator1) {
                // L * P / (L + x * P), always fits in 160 bits
                return safe_cast::to_u160(mul_div_rounding_up(numerator1, sqrt_price, denominator));
            }
        }
        // L / (L / P + x)
        U256 quotient = numerator1 / sqrt_price;
        if (add_overflows(quotient, amount)) {
            throw MathError(MathErrorCode::Overflow, "next price from amount0");
        }
        return safe_cast::to_u160(div_rounding_up(numerator1, quotient + amount));
    }

    // Removing token0 requires x * P < L
    if (!product_exact || numerator1 <= product) {
        throw MathError(MathErrorCode::PriceOverflow, "next price from amount0");
    }
    U256 denominator = numerator1 - product;
    return safe_cast::to_u160(mul_div_rounding_up(numerator1, sqrt_price, denominator));
}

U256 get_next_sqrt_price_from_amount1_rounding_down(
    const U256& sqrt_price, U128 liquidity, const U256& amount, bool add) {
    const U256 liq(liquidity);

    if (add) {
        // Rounding down keeps the price from overshooting
        U256 quotient = amount.bit_length() <= 160
            ? (amount << fixed_point96::RESOLUTION) / liq
            : mul_div(amount, fixed_point96::Q96, liq);
        if (add_overflows(sqrt_price, quotient)) {
            throw MathError(MathErrorCode::Overflow, "next price from amount1");
        }
        return safe_cast::to_u160(sqrt_price + quotient);
    }

    // Rounding up keeps the price from overshooting on the way down
    U256 quotient = amount.bit_length() <= 160
        ? div_rounding_up(amount << fixed_point96::RESOLUTION, liq)
        : mul_div_rounding_up(amount, fixed_point96::Q96, liq);
    if (sqrt_price <= quotient) {
        throw MathError(MathErrorCode::NotEnoughLiquidity, "next price from amount1");
    }
    return sqrt_price - quotient;
}

U256 get_next_sqrt_price_from_input(
    const U256& sqrt_price, U128 liquidity, const U256& amount_in, bool zero_for_one) {
    if (sqrt_price.is_zero()) throw MathError(MathErrorCode::InvalidPrice, "zero sqrt price");
    if (liquidity == 0) throw MathError(MathErrorCode::InvalidLiquidity, "zero liquidity");

    return zero_for_one
        ? get_next_sqrt_price_from_amount0_rounding_up(sqrt_price, liquidity, amount_in, true)
        : get_next_sqrt_price_from_amount1_rounding_down(sqrt_price, liquidity, amount_in, true);
}

U256 get_next_sqrt_price_from_output(
    const U256& sqrt_price, U128 liquidity, const U256& amount_out, bool zero_for_one) {
    if (sqrt_price.is_zero()) throw MathError(MathErrorCode::InvalidPrice, "zero sqrt price");
    if (liquidity == 0) throw MathError(MathErrorCode::InvalidLiquidity, "zero liquidity");

    return zero_for_one
        ? get_next_sqrt_price_from_amount1_rounding_down(sqrt_price, liquidity, amount_out, false)
        : get_next_sqrt_price_from_amount0_rounding_up(sqrt_price, liquidity, amount_out, false);
}

U256 get_amount0_delta(U256 sqrt_price_a, U256 sqrt_price_b, U128 liquidity, bool round_up) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);
    if (sqrt_price_a.is_zero()) {
        throw MathError(MathErrorCode::InvalidPrice, "zero lower sqrt price");
    }

    U256 numerator1 = U256(liquidity) << fixed_point96::RESOLUTION;
    U256 numerator2 = sqrt_price_b - sqrt_price_a;

    if (round_up) {
        return div_rounding_up(mul_div_rounding_up(numerator1, numerator2, sqrt_price_b), sqrt_price_a);
    }
    return mul_div(numerator1, numerator2, sqrt_price_b) / sqrt_price_a;
}

U256 get_amount1_delta(U256 sqrt_price_a, U256 sqrt_price_b, U128 liquidity, bool round_up) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);

    U256 diff = sqrt_price_b - sqrt_price_a;
    return round_up ? mul_div_rounding_up(U256(liquidity), diff, fixed_point96::Q96)
                    : mul_div(U256(liquidity), diff, fixed_point96::Q96);
}

I128 get_amount0_delta(const U256& sqrt_price_a, const U256& sqrt_price_b, I128 liquidity) {
    if (liquidity < 0) {
        U128 removed = safe_cast::abs_u128(liquidity);
        return safe_cast::to_i128(get_amount0_delta(sqrt_price_a, sqrt_price_b, removed, false));
    }
    return -safe_cast::to_i128(
        get_amount0_delta(sqrt_price_a, sqrt_price_b, static_cast<U128>(liquidity), true));
}

I128 get_amount1_delta(const U256& sqrt_price_a, const U256& sqrt_price_b, I128 liquidity) {
    if (liquidity < 0) {
        U128 removed = safe_cast::abs_u128(liquidity);
        return safe_cast::to_i128(get_amount1_delta(sqrt_price_a, sqrt_price_b, removed, false));
    }
    return -safe_cast::to_i128(
        get_amount1_delta(sqrt_price_a, sqrt_price_b, static_cast<U128>(liquidity), true));
}

} // namespace sqrt_price_math
} // namespace clamm
