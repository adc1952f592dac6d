#ifndef CLAMM_TYPES_HPP
#define CLAMM_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>

#include "uint256.hpp"

namespace clamm {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Salt = std::array<uint8_t, 32>;

namespace addresses {

constexpr Address ZERO = {};

// Address whose low four bytes hold n (test fixtures, deterministic ids)
constexpr Address from_u32(uint32_t n) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((n >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((n >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

std::string to_hex(const Address& addr);

} // namespace addresses

// Salt whose last eight bytes hold n
constexpr Salt salt_from_u64(uint64_t n) {
    Salt s = {};
    for (size_t i = 0; i < 8; ++i) {
        s[31 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return s;
}

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    constexpr Currency() : addr{} {}
    constexpr explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const { return addresses::is_zero(addr); }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

struct CurrencyHash {
    size_t operator()(const Currency& c) const {
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : c.addr) h = (h ^ b) * 1099511628211ULL;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // LP fee in hundredths of a bip, or DYNAMIC_FEE_FLAG
    int32_t tick_spacing;    // Tick spacing for concentrated liquidity
    Address hooks;           // Hook address (0 = no hooks)

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }

    std::string to_string() const;
};

struct PoolKeyHash {
    size_t operator()(const PoolKey& key) const {
        uint64_t h = 1469598103934665603ULL;
        auto mix = [&h](uint8_t b) { h = (h ^ b) * 1099511628211ULL; };
        for (auto b : key.currency0.addr) mix(b);
        for (auto b : key.currency1.addr) mix(b);
        for (int i = 0; i < 4; ++i) mix(static_cast<uint8_t>(key.fee >> (8 * i)));
        for (int i = 0; i < 4; ++i) mix(static_cast<uint8_t>(static_cast<uint32_t>(key.tick_spacing) >> (8 * i)));
        for (auto b : key.hooks) mix(b);
        return static_cast<size_t>(h);
    }
};

// Standard fee tiers (in hundredths of a bip)
namespace fee_tiers {
constexpr uint32_t FEE_001 = 100;     // 0.01%
constexpr uint32_t FEE_005 = 500;     // 0.05%
constexpr uint32_t FEE_030 = 3000;    // 0.30%
constexpr uint32_t FEE_100 = 10000;   // 1.00%
}

// Standard tick spacings
namespace tick_spacings {
constexpr int32_t TICK_SPACING_001 = 1;
constexpr int32_t TICK_SPACING_005 = 10;
constexpr int32_t TICK_SPACING_030 = 60;
constexpr int32_t TICK_SPACING_100 = 200;

constexpr int32_t MIN_TICK_SPACING = 1;
constexpr int32_t MAX_TICK_SPACING = 16384;
}

// =============================================================================
// Balance Delta (Signed Token Amounts, caller's perspective)
// negative = caller pays the pool, positive = pool pays the caller
// =============================================================================

struct BalanceDelta {
    I128 amount0 = 0;
    I128 amount1 = 0;

    BalanceDelta operator+(const BalanceDelta& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    BalanceDelta operator-(const BalanceDelta& other) const {
        return {amount0 - other.amount0, amount1 - other.amount1};
    }

    BalanceDelta operator-() const {
        return {-amount0, -amount1};
    }

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
    bool operator!=(const BalanceDelta& other) const { return !(*this == other); }

    bool is_zero() const { return amount0 == 0 && amount1 == 0; }
};

// =============================================================================
// Pool Slot0 State
// =============================================================================

struct Slot0 {
    U256 sqrt_price;            // Current sqrt(price) as Q64.96, 0 = uninitialized
    int32_t tick = 0;           // Current tick
    uint32_t protocol_fee = 0;  // Packed directional protocol fees
    uint32_t lp_fee = 0;        // LP fee (hundredths of a bip)
};

// =============================================================================
// Manager-level Parameters
// =============================================================================

struct SwapParams {
    bool zero_for_one;       // true = sell token0 for token1
    I128 amount_specified;   // negative = exact input, positive = exact output
    U256 sqrt_price_limit;   // Q64.96 price the swap may not cross
};

struct ModifyLiquidityParams {
    Address owner;
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;    // positive = add, negative = remove
    Salt salt{};             // Distinguishes positions on the same range
};

std::string to_string(I128 v);

} // namespace clamm

#endif // CLAMM_TYPES_HPP
