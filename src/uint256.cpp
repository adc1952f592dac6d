// =============================================================================
// uint256.cpp - 256-bit unsigned integer arithmetic
// =============================================================================

#include "clamm/uint256.hpp"
#include "clamm/errors.hpp"

#include <algorithm>
#include <array>
#include <ostream>
#include <stdexcept>

namespace clamm {

namespace {

using Limbs = std::array<uint64_t, 4>;

Limbs to_limbs(const U256& v) {
    return {static_cast<uint64_t>(v.lo()), static_cast<uint64_t>(v.lo() >> 64),
            static_cast<uint64_t>(v.hi()), static_cast<uint64_t>(v.hi() >> 64)};
}

U256 from_limbs(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3) {
    return U256(u128(l1, l0), u128(l3, l2));
}

unsigned bit_length128(U128 x) {
    uint64_t hi = static_cast<uint64_t>(x >> 64);
    if (hi != 0) return 128 - static_cast<unsigned>(__builtin_clzll(hi));
    uint64_t lo = static_cast<uint64_t>(x);
    if (lo != 0) return 64 - static_cast<unsigned>(__builtin_clzll(lo));
    return 0;
}

constexpr uint64_t DEC_CHUNK = 10000000000000000000ULL;  // 1e19
constexpr int DEC_CHUNK_DIGITS = 19;

} // namespace

// =============================================================================
// Multiplication
// =============================================================================

U512 mul_wide(const U256& a, const U256& b) {
    Limbs x = to_limbs(a);
    Limbs y = to_limbs(b);
    std::array<uint64_t, 8> r{};

    // Schoolbook over 64-bit limbs; each partial fits in U128
    for (size_t i = 0; i < 4; ++i) {
        U128 carry = 0;
        for (size_t j = 0; j < 4; ++j) {
            U128 t = static_cast<U128>(x[i]) * y[j] + r[i + j] + carry;
            r[i + j] = static_cast<uint64_t>(t);
            carry = t >> 64;
        }
        r[i + 4] = static_cast<uint64_t>(carry);
    }

    return U512{from_limbs(r[0], r[1], r[2], r[3]), from_limbs(r[4], r[5], r[6], r[7])};
}

U256 U256::operator*(const U256& o) const {
    Limbs x = to_limbs(*this);
    Limbs y = to_limbs(o);
    std::array<uint64_t, 4> r{};

    // Low half only (wrapping)
    for (size_t i = 0; i < 4; ++i) {
        U128 carry = 0;
        for (size_t j = 0; i + j < 4; ++j) {
            U128 t = static_cast<U128>(x[i]) * y[j] + r[i + j] + carry;
            r[i + j] = static_cast<uint64_t>(t);
            carry = t >> 64;
        }
    }

    return from_limbs(r[0], r[1], r[2], r[3]);
}

// =============================================================================
// Division
// =============================================================================

void divmod(const U256& num, const U256& den, U256& quot, U256& rem) {
    if (den.is_zero()) {
        throw MathError(MathErrorCode::DivisionByZero);
    }

    if (num < den) {
        quot = U256();
        rem = num;
        return;
    }

    if (num.fits_u128()) {
        quot = U256(num.lo() / den.lo());
        rem = U256(num.lo() % den.lo());
        return;
    }

    // Shift-subtract long division aligned on the leading bits
    unsigned shift = num.bit_length() - den.bit_length();
    U256 d = den << shift;
    U256 r = num;
    U256 q;

    for (unsigned i = 0; i <= shift; ++i) {
        q <<= 1;
        if (r >= d) {
            r -= d;
            q |= U256(1);
        }
        d >>= 1;
    }

    quot = q;
    rem = r;
}

U256 U256::operator/(const U256& o) const {
    U256 q, r;
    divmod(*this, o, q, r);
    return q;
}

U256 U256::operator%(const U256& o) const {
    U256 q, r;
    divmod(*this, o, q, r);
    return r;
}

unsigned U256::bit_length() const {
    if (hi_ != 0) return 128 + bit_length128(hi_);
    return bit_length128(lo_);
}

// =============================================================================
// Text Conversion
// =============================================================================

std::string U256::to_string() const {
    if (is_zero()) return "0";

    std::string out;
    U256 v = *this;
    const U256 chunk(DEC_CHUNK);

    while (!v.is_zero()) {
        U256 q, r;
        divmod(v, chunk, q, r);
        std::string part = std::to_string(static_cast<uint64_t>(r.lo()));
        if (!q.is_zero()) {
            part.insert(0, DEC_CHUNK_DIGITS - part.size(), '0');
        }
        out.insert(0, part);
        v = q;
    }
    return out;
}

std::string U256::to_hex() const {
    static constexpr char digits[] = "0123456789abcdef";
    if (is_zero()) return "0x0";

    std::string out;
    U256 v = *this;
    while (!v.is_zero()) {
        out.push_back(digits[static_cast<unsigned>(v.lo() & 0xf)]);
        v >>= 4;
    }
    out.append("x0");
    std::reverse(out.begin(), out.end());
    return out;
}

U256 U256::from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("U256: empty string");
    }

    U256 result;
    bool hex = text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');

    if (hex) {
        for (char c : text.substr(2)) {
            unsigned digit;
            if (c >= '0' && c <= '9') digit = static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') digit = static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') digit = static_cast<unsigned>(c - 'A' + 10);
            else throw std::invalid_argument("U256: invalid hex digit in '" + std::string(text) + "'");

            if (result.bit_length() > 252) {
                throw std::out_of_range("U256: value exceeds 256 bits");
            }
            result = (result << 4) | U256(digit);
        }
        return result;
    }

    const U256 ten(10);
    const U256 limit = U256::max() / ten;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("U256: invalid decimal digit in '" + std::string(text) + "'");
        }
        U256 digit(static_cast<unsigned>(c - '0'));
        if (result > limit || add_overflows(result * ten, digit)) {
            throw std::out_of_range("U256: value exceeds 256 bits");
        }
        result = result * ten + digit;
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const U256& v) {
    return os << v.to_string();
}

} // namespace clamm
