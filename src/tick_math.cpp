// =============================================================================
// tick_math.cpp - Tick <-> sqrt price conversion (integer only)
// =============================================================================

#include "clamm/tick_math.hpp"
#include "clamm/bit_math.hpp"
#include "clamm/errors.hpp"

#include <array>
#include <string>

namespace clamm {
namespace tick_math {

namespace {

// sqrt(1.0001)^-(2^i) as Q128.128, one per bit of |tick|
constexpr std::array<U128, 20> TICK_RATIOS = {
    u128(0xfffcb933bd6fad37ULL, 0xaa2d162d1a594001ULL),  // 0x1
    u128(0xfff97272373d4132ULL, 0x59a46990580e213aULL),  // 0x2
    u128(0xfff2e50f5f656932ULL, 0xef12357cf3c7fdccULL),  // 0x4
    u128(0xffe5caca7e10e4e6ULL, 0x1c3624eaa0941cd0ULL),  // 0x8
    u128(0xffcb9843d60f6159ULL, 0xc9db58835c926644ULL),  // 0x10
    u128(0xff973b41fa98c081ULL, 0x472e6896dfb254c0ULL),  // 0x20
    u128(0xff2ea16466c96a38ULL, 0x43ec78b326b52861ULL),  // 0x40
    u128(0xfe5dee046a99a2a8ULL, 0x11c461f1969c3053ULL),  // 0x80
    u128(0xfcbe86c7900a88aeULL, 0xdcffc83b479aa3a4ULL),  // 0x100
    u128(0xf987a7253ac41317ULL, 0x6f2b074cf7815e54ULL),  // 0x200
    u128(0xf3392b0822b70005ULL, 0x940c7a398e4b70f3ULL),  // 0x400
    u128(0xe7159475a2c29b74ULL, 0x43b29c7fa6e889d9ULL),  // 0x800
    u128(0xd097f3bdfd2022b8ULL, 0x845ad8f792aa5825ULL),  // 0x1000
    u128(0xa9f746462d870fdfULL, 0x8a65dc1f90e061e5ULL),  // 0x2000
    u128(0x70d869a156d2a1b8ULL, 0x90bb3df62baf32f7ULL),  // 0x4000
    u128(0x31be135f97d08fd9ULL, 0x81231505542fcfa6ULL),  // 0x8000
    u128(0x09aa508b5b7a84e1ULL, 0xc677de54f3e99bc9ULL),  // 0x10000
    u128(0x005d6af8dedb8119ULL, 0x6699c329225ee604ULL),  // 0x20000
    u128(0x00002216e584f5faULL, 0x1ea926041bedfe98ULL),  // 0x40000
    u128(0x00000000048a1703ULL, 0x91f7dc42444e8fa2ULL),  // 0x80000
};

// log_sqrt(1.0001)(2) as Q64 scaling: log2 -> log_sqrt10001
constexpr U128 LOG_SQRT10001_FACTOR = u128(0x3627ULL, 0xa301d71055774c85ULL);

// Error bounds of the log approximation, Q128.128
constexpr U128 TICK_LOW_ERROR = u128(0x028f6481ab7f045aULL, 0x5af012a19d003aaaULL);
constexpr U128 TICK_HIGH_ERROR = u128(0xdb2df09e81959a81ULL, 0x455e260799a0632fULL);

// Arithmetic shift right by 128 of a two's complement int256, as a tick
int32_t high_half_as_tick(const U256& v) {
    return static_cast<int32_t>(static_cast<I128>(v.hi()));
}

} // namespace

U256 get_sqrt_price_at_tick(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw MathError(MathErrorCode::InvalidTick, "tick " + std::to_string(tick));
    }

    uint32_t abs_tick = tick < 0 ? static_cast<uint32_t>(-static_cast<int64_t>(tick))
                                 : static_cast<uint32_t>(tick);

    U256 ratio = (abs_tick & 0x1) != 0 ? U256(TICK_RATIOS[0]) : U256(0, 1);
    for (size_t i = 1; i < TICK_RATIOS.size(); ++i) {
        if ((abs_tick & (1u << i)) != 0) {
            ratio = (ratio * U256(TICK_RATIOS[i])) >> 128;
        }
    }

    if (tick > 0) {
        ratio = U256::max() / ratio;
    }

    // Q128.128 -> Q64.96, rounding up so get_tick_at_sqrt_price stays consistent
    bool round = !(ratio & U256(0xffffffffULL)).is_zero();
    return (ratio >> 32) + U256(round ? 1 : 0);
}

int32_t get_tick_at_sqrt_price(const U256& sqrt_price) {
    if (sqrt_price < MIN_SQRT_PRICE || sqrt_price > MAX_SQRT_PRICE) {
        throw MathError(MathErrorCode::InvalidPrice, sqrt_price.to_string());
    }

    U256 ratio = sqrt_price << 32;
    unsigned msb = bit_math::most_significant_bit(ratio);

    // Normalize to a 128-bit mantissa in [2^127, 2^128)
    U256 r = msb >= 128 ? ratio >> (msb - 127) : ratio << (127 - msb);

    I128 log_2 = (static_cast<I128>(msb) - 128) * (static_cast<I128>(1) << 64);

    // 14 fractional bits by repeated squaring
    for (int i = 63; i >= 50; --i) {
        r = (r * r) >> 127;
        unsigned f = r.bit(128) ? 1 : 0;
        log_2 += static_cast<I128>(f) << i;
        r >>= f;
    }

    // Two's complement int256 product log_2 * log_sqrt10001(2)
    U256 log_2_word = log_2 >= 0 ? U256(static_cast<U128>(log_2))
                                 : -U256(static_cast<U128>(-log_2));
    U256 log_sqrt10001 = log_2_word * U256(LOG_SQRT10001_FACTOR);

    int32_t tick_low = high_half_as_tick(log_sqrt10001 - U256(TICK_LOW_ERROR));
    int32_t tick_high = high_half_as_tick(log_sqrt10001 + U256(TICK_HIGH_ERROR));

    if (tick_low == tick_high) return tick_low;
    if (tick_high > MAX_TICK) return tick_low;
    return get_sqrt_price_at_tick(tick_high) <= sqrt_price ? tick_high : tick_low;
}

U128 tick_spacing_to_max_liquidity_per_tick(int32_t tick_spacing) {
    if (tick_spacing <= 0) {
        throw MathError(MathErrorCode::DivisionByZero, "tick spacing must be positive");
    }
    int32_t min_tick = min_usable_tick(tick_spacing);
    int32_t max_tick = max_usable_tick(tick_spacing);
    auto num_ticks = static_cast<uint32_t>((max_tick - min_tick) / tick_spacing) + 1;
    return U128_MAX / num_ticks;
}

} // namespace tick_math
} // namespace clamm
