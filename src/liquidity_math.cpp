// =============================================================================
// liquidity_math.cpp - Checked liquidity deltas and amount/liquidity helpers
// =============================================================================

#include "clamm/liquidity_math.hpp"
#include "clamm/errors.hpp"
#include "clamm/fixed_point.hpp"
#include "clamm/full_math.hpp"
#include "clamm/safe_cast.hpp"
#include "clamm/sqrt_price_math.hpp"

namespace clamm {
namespace liquidity_math {

U128 add_delta(U128 x, I128 y) {
    if (y < 0) {
        U128 sub = safe_cast::abs_u128(y);
        if (sub > x) {
            throw MathError(MathErrorCode::Overflow, "liquidity underflow");
        }
        return x - sub;
    }
    U128 add = static_cast<U128>(y);
    if (add > U128_MAX - x) {
        throw MathError(MathErrorCode::Overflow, "liquidity overflow");
    }
    return x + add;
}

U128 get_liquidity_for_amount0(U256 sqrt_price_a, U256 sqrt_price_b, const U256& amount0) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);
    U256 intermediate = full_math::mul_div(sqrt_price_a, sqrt_price_b, fixed_point96::Q96);
    return safe_cast::to_u128(full_math::mul_div(amount0, intermediate, sqrt_price_b - sqrt_price_a));
}

U128 get_liquidity_for_amount1(U256 sqrt_price_a, U256 sqrt_price_b, const U256& amount1) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);
    return safe_cast::to_u128(
        full_math::mul_div(amount1, fixed_point96::Q96, sqrt_price_b - sqrt_price_a));
}

U128 get_liquidity_for_amounts(const U256& sqrt_price, U256 sqrt_price_a, U256 sqrt_price_b,
                               const U256& amount0, const U256& amount1) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);

    if (sqrt_price <= sqrt_price_a) {
        // Below range: all token0
        return get_liquidity_for_amount0(sqrt_price_a, sqrt_price_b, amount0);
    }
    if (sqrt_price < sqrt_price_b) {
        // In range: the scarcer side binds
        U128 liquidity0 = get_liquidity_for_amount0(sqrt_price, sqrt_price_b, amount0);
        U128 liquidity1 = get_liquidity_for_amount1(sqrt_price_a, sqrt_price, amount1);
        return liquidity0 < liquidity1 ? liquidity0 : liquidity1;
    }
    // Above range: all token1
    return get_liquidity_for_amount1(sqrt_price_a, sqrt_price_b, amount1);
}

std::pair<U256, U256> get_amounts_for_liquidity(const U256& sqrt_price, U256 sqrt_price_a,
                                                U256 sqrt_price_b, U128 liquidity) {
    if (sqrt_price_a > sqrt_price_b) std::swap(sqrt_price_a, sqrt_price_b);

    U256 amount0, amount1;
    if (sqrt_price <= sqrt_price_a) {
        amount0 = sqrt_price_math::get_amount0_delta(sqrt_price_a, sqrt_price_b, liquidity, false);
    } else if (sqrt_price < sqrt_price_b) {
        amount0 = sqrt_price_math::get_amount0_delta(sqrt_price, sqrt_price_b, liquidity, false);
        amount1 = sqrt_price_math::get_amount1_delta(sqrt_price_a, sqrt_price, liquidity, false);
    } else {
        amount1 = sqrt_price_math::get_amount1_delta(sqrt_price_a, sqrt_price_b, liquidity, false);
    }
    return {amount0, amount1};
}

} // namespace liquidity_math
} // namespace clamm
