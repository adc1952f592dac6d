// clamm tests - shared fixtures

#pragma once

#include <clamm/uint256.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <random>
#include <string>

namespace clamm::test {

using BigInt = boost::multiprecision::cpp_int;

inline U256 u256(const char* text) { return U256::from_string(text); }

inline BigInt to_big(const U256& v) { return BigInt(v.to_string()); }

inline U256 from_big(const BigInt& v) { return U256::from_string(v.str()); }

// Random value of a random bit width so small and large operands both show up
inline U256 random_u256(std::mt19937_64& rng, unsigned max_bits = 256) {
    U256 v(u128(rng(), rng()), u128(rng(), rng()));
    unsigned bits = static_cast<unsigned>(rng() % (max_bits + 1));
    return bits == 0 ? U256() : (v >> (256 - bits));
}

} // namespace clamm::test
