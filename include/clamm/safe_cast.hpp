#ifndef CLAMM_SAFE_CAST_HPP
#define CLAMM_SAFE_CAST_HPP

#include "errors.hpp"
#include "uint256.hpp"

namespace clamm {
namespace safe_cast {

inline U128 to_u128(const U256& v) {
    if (!v.fits_u128()) {
        throw MathError(MathErrorCode::Overflow, "value exceeds 128 bits");
    }
    return v.lo();
}

inline I128 to_i128(U128 v) {
    if (v > static_cast<U128>(I128_MAX)) {
        throw MathError(MathErrorCode::Overflow, "value exceeds int128");
    }
    return static_cast<I128>(v);
}

inline I128 to_i128(const U256& v) {
    return to_i128(to_u128(v));
}

// Sqrt prices are 160-bit quantities
inline U256 to_u160(const U256& v) {
    if (v.bit_length() > 160) {
        throw MathError(MathErrorCode::Overflow, "value exceeds 160 bits");
    }
    return v;
}

// Magnitude of a signed 128-bit value
inline U128 abs_u128(I128 v) {
    return v < 0 ? static_cast<U128>(-(v + 1)) + 1 : static_cast<U128>(v);
}

} // namespace safe_cast
} // namespace clamm

#endif // CLAMM_SAFE_CAST_HPP
