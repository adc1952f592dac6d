// clamm - U256 Tests

#include <catch2/catch_test_macros.hpp>
#include <clamm/errors.hpp>
#include <clamm/uint256.hpp>

#include "test_helpers.hpp"

using namespace clamm;
using namespace clamm::test;

TEST_CASE("U256 text conversion", "[uint256]") {
    SECTION("Decimal") {
        REQUIRE(U256().to_string() == "0");
        REQUIRE(U256(12345).to_string() == "12345");
        REQUIRE(U256::max().to_string() ==
                "115792089237316195423570985008687907853269984665640564039457584007913129639935");
        REQUIRE(u256("79228162514264337593543950336") == (U256(1) << 96));
    }

    SECTION("Hex") {
        REQUIRE(U256().to_hex() == "0x0");
        REQUIRE(U256(255).to_hex() == "0xff");
        REQUIRE(u256("0x1000000000000000000000000") == (U256(1) << 96));
        REQUIRE(u256("0xFFFD8963EFD1FC6A506488495D951D5263988D26") ==
                u256("1461446703485210103287273052203988822378723970342"));
    }

    SECTION("Invalid input") {
        REQUIRE_THROWS_AS(U256::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(U256::from_string("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(U256::from_string("0xzz"), std::invalid_argument);
        REQUIRE_THROWS_AS(
            U256::from_string("115792089237316195423570985008687907853269984665640564039457584007913129639936"),
            std::out_of_range);
    }
}

TEST_CASE("U256 arithmetic wraps modulo 2^256", "[uint256]") {
    REQUIRE(U256::max() + U256(1) == U256());
    REQUIRE(U256() - U256(1) == U256::max());
    REQUIRE(-U256(1) == U256::max());
    REQUIRE(add_overflows(U256::max(), U256(1)));
    REQUIRE_FALSE(add_overflows(U256::max(), U256()));

    // Carry across the limb boundary
    U256 a(U128_MAX);
    REQUIRE(a + U256(1) == U256(0, 1));
    REQUIRE(U256(0, 1) - U256(1) == a);
}

TEST_CASE("U256 shifts and bits", "[uint256]") {
    U256 one(1);
    REQUIRE((one << 255).bit(255));
    REQUIRE((one << 256).is_zero());
    REQUIRE(((one << 200) >> 200) == one);
    REQUIRE((one << 128) == U256(0, 1));
    REQUIRE(U256().bit_length() == 0);
    REQUIRE(U256::max().bit_length() == 256);
    REQUIRE((one << 96).bit_length() == 97);
}

TEST_CASE("U256 division", "[uint256]") {
    SECTION("Division by zero throws") {
        REQUIRE_THROWS_AS(U256(1) / U256(), MathError);
        REQUIRE_THROWS_AS(U256(1) % U256(), MathError);
    }

    SECTION("Matches arbitrary precision") {
        std::mt19937_64 rng(0x5eed0001);
        for (int i = 0; i < 2000; ++i) {
            U256 a = random_u256(rng);
            U256 b = random_u256(rng);
            if (b.is_zero()) continue;

            U256 q, r;
            divmod(a, b, q, r);
            BigInt expected_q = to_big(a) / to_big(b);
            BigInt expected_r = to_big(a) % to_big(b);
            REQUIRE(to_big(q) == expected_q);
            REQUIRE(to_big(r) == expected_r);
        }
    }
}

TEST_CASE("U256 multiplication", "[uint256]") {
    std::mt19937_64 rng(0x5eed0002);
    const BigInt modulus = BigInt(1) << 256;

    for (int i = 0; i < 2000; ++i) {
        U256 a = random_u256(rng);
        U256 b = random_u256(rng);
        BigInt product = to_big(a) * to_big(b);
        BigInt low = product % modulus;
        BigInt high = product / modulus;

        REQUIRE(to_big(a * b) == low);

        U512 wide = mul_wide(a, b);
        REQUIRE(to_big(wide.lo) == low);
        REQUIRE(to_big(wide.hi) == high);
    }
}
