// clamm - FullMath Tests

#include <catch2/catch_test_macros.hpp>
#include <clamm/errors.hpp>
#include <clamm/fixed_point.hpp>
#include <clamm/full_math.hpp>

#include "test_helpers.hpp"

using namespace clamm;
using namespace clamm::test;

namespace {

const U256 Q128 = fixed_point128::Q128;

} // namespace

TEST_CASE("mul_div edge cases", "[full_math]") {
    SECTION("Zero denominator") {
        REQUIRE_THROWS_AS(full_math::mul_div(Q128, U256(5), U256()), MathError);
        REQUIRE_THROWS_AS(full_math::mul_div(U256(), U256(), U256()), MathError);
    }

    SECTION("Result overflows 256 bits") {
        REQUIRE_THROWS_AS(full_math::mul_div(Q128, Q128, U256(1)), MathError);
        REQUIRE_THROWS_AS(full_math::mul_div(U256::max(), U256::max(), U256::max() - U256(1)), MathError);
    }

    SECTION("All max inputs") {
        REQUIRE(full_math::mul_div(U256::max(), U256::max(), U256::max()) == U256::max());
    }

    SECTION("Accurate without phantom overflow") {
        REQUIRE(full_math::mul_div(Q128, U256(50) * Q128 / U256(100), U256(150) * Q128 / U256(100)) ==
                Q128 / U256(3));
        REQUIRE(full_math::mul_div(Q128, U256(35) * Q128, U256(8) * Q128) == U256(4375) * Q128 / U256(1000));
    }

    SECTION("Phantom overflow repeating decimal") {
        REQUIRE(full_math::mul_div(Q128, U256(1000) * Q128, U256(3000) * Q128) == Q128 / U256(3));
    }
}

TEST_CASE("mul_div_rounding_up edge cases", "[full_math]") {
    REQUIRE_THROWS_AS(full_math::mul_div_rounding_up(Q128, U256(5), U256()), MathError);
    REQUIRE_THROWS_AS(full_math::mul_div_rounding_up(Q128, Q128, U256(1)), MathError);

    // Exact result of max, no rounding needed
    REQUIRE(full_math::mul_div_rounding_up(U256::max(), U256::max(), U256::max()) == U256::max());

    // Floor is max but a remainder forces the +1 past 2^256
    U256 a = u256("535006138814359");
    U256 b = u256("432862656469423142931042426214547535783388063929571229938474969");
    REQUIRE_THROWS_AS(full_math::mul_div_rounding_up(a, b, U256(2)), MathError);

    REQUIRE(full_math::mul_div_rounding_up(Q128, U256(1000) * Q128, U256(3000) * Q128) ==
            Q128 / U256(3) + U256(1));
}

TEST_CASE("mul_div matches arbitrary precision", "[full_math]") {
    std::mt19937_64 rng(0x5eed0003);
    const BigInt limit = (BigInt(1) << 256) - 1;
    int checked = 0;

    for (int i = 0; i < 3000; ++i) {
        U256 a = random_u256(rng);
        U256 b = random_u256(rng);
        U256 d = random_u256(rng);
        if (d.is_zero()) continue;

        BigInt product = to_big(a) * to_big(b);
        BigInt expected = product / to_big(d);
        bool exact = product % to_big(d) == 0;

        if (expected > limit) {
            REQUIRE_THROWS_AS(full_math::mul_div(a, b, d), MathError);
            continue;
        }

        U256 down = full_math::mul_div(a, b, d);
        REQUIRE(to_big(down) == expected);

        if (exact) {
            REQUIRE(full_math::mul_div_rounding_up(a, b, d) == down);
        } else if (expected == limit) {
            REQUIRE_THROWS_AS(full_math::mul_div_rounding_up(a, b, d), MathError);
        } else {
            REQUIRE(full_math::mul_div_rounding_up(a, b, d) == down + U256(1));
        }
        ++checked;
    }

    REQUIRE(checked > 500);
}

TEST_CASE("mul_mod and div_rounding_up", "[full_math]") {
    SECTION("mul_mod") {
        REQUIRE_THROWS_AS(full_math::mul_mod(U256(1), U256(1), U256()), MathError);
        REQUIRE(full_math::mul_mod(U256::max(), U256::max(), U256(7)) ==
                from_big((to_big(U256::max()) * to_big(U256::max())) % 7));
        REQUIRE(full_math::mul_mod(U256(10), U256(10), U256(7)) == U256(2));
    }

    SECTION("div_rounding_up") {
        REQUIRE_THROWS_AS(full_math::div_rounding_up(U256(1), U256()), MathError);
        REQUIRE(full_math::div_rounding_up(U256(10), U256(5)) == U256(2));
        REQUIRE(full_math::div_rounding_up(U256(11), U256(5)) == U256(3));
        REQUIRE(full_math::div_rounding_up(U256(), U256(5)) == U256());
        REQUIRE(full_math::div_rounding_up(U256::max(), U256(2)) == (U256(1) << 255));
    }
}
