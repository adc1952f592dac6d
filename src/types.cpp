// =============================================================================
// types.cpp - Text helpers for addresses, keys and signed amounts
// =============================================================================

#include "clamm/types.hpp"

namespace clamm {

namespace addresses {

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0xF]);
    }
    return out;
}

} // namespace addresses

std::string PoolKey::to_string() const {
    return addresses::to_hex(currency0.addr) + "/" + addresses::to_hex(currency1.addr) +
           " fee=" + std::to_string(fee) +
           " spacing=" + std::to_string(tick_spacing) +
           " hooks=" + addresses::to_hex(hooks);
}

std::string to_string(I128 v) {
    if (v >= 0) return U256(static_cast<U128>(v)).to_string();
    // Magnitude of I128_MIN does not fit in I128; go through U128
    U128 mag = static_cast<U128>(-(v + 1)) + 1;
    return "-" + U256(mag).to_string();
}

} // namespace clamm
