// =============================================================================
// bit_math.cpp - Most/least significant bit by binary search
// =============================================================================

#include "clamm/bit_math.hpp"

#include <stdexcept>

namespace clamm {
namespace bit_math {

uint8_t most_significant_bit(U256 x) {
    if (x.is_zero()) {
        throw std::invalid_argument("most_significant_bit: zero");
    }

    uint8_t r = 0;
    for (unsigned step = 128; step > 0; step >>= 1) {
        if (x >= (U256(1) << step)) {
            x >>= step;
            r = static_cast<uint8_t>(r + step);
        }
    }
    return r;
}

uint8_t least_significant_bit(U256 x) {
    if (x.is_zero()) {
        throw std::invalid_argument("least_significant_bit: zero");
    }

    uint8_t r = 255;
    for (unsigned step = 128; step > 0; step >>= 1) {
        U256 mask = (U256(1) << step) - U256(1);
        if (!(x & mask).is_zero()) {
            r = static_cast<uint8_t>(r - step);
        } else {
            x >>= step;
        }
    }
    return r;
}

} // namespace bit_math
} // namespace clamm
