#ifndef CLAMM_BIT_MATH_HPP
#define CLAMM_BIT_MATH_HPP

#include "uint256.hpp"

namespace clamm {
namespace bit_math {

// Index of the most significant set bit (0..255); throws std::invalid_argument on zero
uint8_t most_significant_bit(U256 x);

// Index of the least significant set bit (0..255); throws std::invalid_argument on zero
uint8_t least_significant_bit(U256 x);

} // namespace bit_math
} // namespace clamm

#endif // CLAMM_BIT_MATH_HPP
