#ifndef CLAMM_FEES_HPP
#define CLAMM_FEES_HPP

#include <cstdint>

namespace clamm {

// =============================================================================
// LP Fee (hundredths of a bip, 1e6 = 100%)
// =============================================================================

namespace lp_fee {

constexpr uint32_t MAX_LP_FEE = 1000000;

// PoolKey.fee value marking a pool whose LP fee is set by its hook
constexpr uint32_t DYNAMIC_FEE_FLAG = 0x800000;

inline bool is_dynamic_fee(uint32_t fee) { return fee == DYNAMIC_FEE_FLAG; }

inline bool is_valid(uint32_t fee) { return fee <= MAX_LP_FEE; }

// Dynamic pools start at zero until the hook sets a fee
inline uint32_t initial_lp_fee(uint32_t fee) { return is_dynamic_fee(fee) ? 0 : fee; }

} // namespace lp_fee

// =============================================================================
// Protocol Fee (two 12-bit directional fees packed in 24 bits)
// bits 0..11: zero_for_one, bits 12..23: one_for_zero
// =============================================================================

namespace protocol_fee {

constexpr uint16_t MAX_PROTOCOL_FEE = 1000;        // 0.1%
constexpr uint32_t PIPS_DENOMINATOR = 1000000;

constexpr uint32_t pack(uint16_t zero_for_one, uint16_t one_for_zero) {
    return (static_cast<uint32_t>(one_for_zero) << 12) | zero_for_one;
}

constexpr uint16_t zero_for_one_fee(uint32_t fee) { return static_cast<uint16_t>(fee & 0xfff); }
constexpr uint16_t one_for_zero_fee(uint32_t fee) { return static_cast<uint16_t>((fee >> 12) & 0xfff); }

constexpr uint16_t directional_fee(uint32_t fee, bool zero_for_one) {
    return zero_for_one ? zero_for_one_fee(fee) : one_for_zero_fee(fee);
}

inline bool is_valid(uint32_t fee) {
    if ((fee >> 24) != 0) return false;
    return zero_for_one_fee(fee) <= MAX_PROTOCOL_FEE && one_for_zero_fee(fee) <= MAX_PROTOCOL_FEE;
}

// Protocol fee is taken first, the LP fee applies to the remainder:
// p + lp - p * lp / 1e6
inline uint32_t calculate_swap_fee(uint16_t protocol, uint32_t lp) {
    uint64_t p = protocol;
    uint64_t product = p * lp;
    return static_cast<uint32_t>(p + lp - product / PIPS_DENOMINATOR);
}

} // namespace protocol_fee

} // namespace clamm

#endif // CLAMM_FEES_HPP
