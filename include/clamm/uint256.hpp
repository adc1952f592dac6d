#ifndef CLAMM_UINT256_HPP
#define CLAMM_UINT256_HPP

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace clamm {

using I128 = __int128;
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

// Build a 128-bit constant from two 64-bit halves
constexpr U128 u128(uint64_t hi, uint64_t lo) {
    return (static_cast<U128>(hi) << 64) | lo;
}

// =============================================================================
// U256 - 256-bit unsigned integer (two U128 limbs)
// Arithmetic wraps modulo 2^256; division by zero throws MathError.
// =============================================================================

class U256 {
public:
    constexpr U256() : lo_(0), hi_(0) {}
    constexpr U256(U128 lo) : lo_(lo), hi_(0) {}
    constexpr U256(U128 lo, U128 hi) : lo_(lo), hi_(hi) {}

    static constexpr U256 max() { return U256(U128_MAX, U128_MAX); }

    // Parse decimal or 0x-prefixed hex; throws std::invalid_argument / std::out_of_range
    static U256 from_string(std::string_view text);

    constexpr U128 lo() const { return lo_; }
    constexpr U128 hi() const { return hi_; }

    constexpr bool is_zero() const { return lo_ == 0 && hi_ == 0; }
    constexpr bool fits_u128() const { return hi_ == 0; }
    constexpr bool bit(unsigned n) const {
        return n < 128 ? ((lo_ >> n) & 1) != 0 : n < 256 && ((hi_ >> (n - 128)) & 1) != 0;
    }

    // Number of significant bits (0 for zero)
    unsigned bit_length() const;

    std::string to_string() const;
    std::string to_hex() const;

    // Comparison
    constexpr bool operator==(const U256& o) const { return lo_ == o.lo_ && hi_ == o.hi_; }
    constexpr bool operator!=(const U256& o) const { return !(*this == o); }
    constexpr bool operator<(const U256& o) const {
        return hi_ < o.hi_ || (hi_ == o.hi_ && lo_ < o.lo_);
    }
    constexpr bool operator>(const U256& o) const { return o < *this; }
    constexpr bool operator<=(const U256& o) const { return !(o < *this); }
    constexpr bool operator>=(const U256& o) const { return !(*this < o); }

    // Wrapping arithmetic
    constexpr U256 operator+(const U256& o) const {
        U128 lo = lo_ + o.lo_;
        U128 carry = lo < lo_ ? 1 : 0;
        return U256(lo, hi_ + o.hi_ + carry);
    }
    constexpr U256 operator-(const U256& o) const {
        U128 borrow = lo_ < o.lo_ ? 1 : 0;
        return U256(lo_ - o.lo_, hi_ - o.hi_ - borrow);
    }
    constexpr U256 operator-() const { return U256() - *this; }
    U256 operator*(const U256& o) const;
    U256 operator/(const U256& o) const;
    U256 operator%(const U256& o) const;

    // Bitwise
    constexpr U256 operator&(const U256& o) const { return U256(lo_ & o.lo_, hi_ & o.hi_); }
    constexpr U256 operator|(const U256& o) const { return U256(lo_ | o.lo_, hi_ | o.hi_); }
    constexpr U256 operator^(const U256& o) const { return U256(lo_ ^ o.lo_, hi_ ^ o.hi_); }
    constexpr U256 operator~() const { return U256(~lo_, ~hi_); }

    constexpr U256 operator<<(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 256) return U256();
        if (n >= 128) return U256(0, lo_ << (n - 128));
        return U256(lo_ << n, (hi_ << n) | (lo_ >> (128 - n)));
    }
    constexpr U256 operator>>(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 256) return U256();
        if (n >= 128) return U256(hi_ >> (n - 128), 0);
        return U256((lo_ >> n) | (hi_ << (128 - n)), hi_ >> n);
    }

    U256& operator+=(const U256& o) { return *this = *this + o; }
    U256& operator-=(const U256& o) { return *this = *this - o; }
    U256& operator*=(const U256& o) { return *this = *this * o; }
    U256& operator/=(const U256& o) { return *this = *this / o; }
    U256& operator%=(const U256& o) { return *this = *this % o; }
    U256& operator&=(const U256& o) { return *this = *this & o; }
    U256& operator|=(const U256& o) { return *this = *this | o; }
    U256& operator<<=(unsigned n) { return *this = *this << n; }
    U256& operator>>=(unsigned n) { return *this = *this >> n; }

private:
    U128 lo_;  // Low 128 bits
    U128 hi_;  // High 128 bits
};

// =============================================================================
// Double-width helpers
// =============================================================================

struct U512 {
    U256 lo;
    U256 hi;
};

// Full 512-bit product
U512 mul_wide(const U256& a, const U256& b);

// Quotient and remainder in one pass; throws MathError(DivisionByZero)
void divmod(const U256& num, const U256& den, U256& quot, U256& rem);

// Whether a + b wraps past 2^256
inline bool add_overflows(const U256& a, const U256& b) {
    return (a + b) < a;
}

std::ostream& operator<<(std::ostream& os, const U256& v);

} // namespace clamm

#endif // CLAMM_UINT256_HPP
