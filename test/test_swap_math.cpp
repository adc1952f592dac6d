// clamm - SwapMath Tests

#include <catch2/catch_test_macros.hpp>
#include <clamm/errors.hpp>
#include <clamm/fixed_point.hpp>
#include <clamm/sqrt_price_math.hpp>
#include <clamm/swap_math.hpp>

#include "test_helpers.hpp"

using namespace clamm;
using namespace clamm::test;
using namespace clamm::swap_math;

namespace {

const U256 PRICE_ONE = fixed_point96::Q96;
const U256 PRICE_101 = u256("79623317895830914510639640423");    // sqrt(1.01)
const U256 PRICE_10 = u256("250541448375047931186413801569");    // sqrt(10)
const U256 PRICE_0_01 = u256("7922816251426433759354395033");    // sqrt(0.01)
const I128 E18 = 1000000000000000000LL;

} // namespace

TEST_CASE("Swap step capped at the target", "[swap_math]") {
    SECTION("Exact input, one for zero") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, -E18, 600);
        REQUIRE(step.sqrt_price_next == PRICE_101);
        REQUIRE(step.amount_in == U256(9975124224178055ULL));
        REQUIRE(step.amount_out == U256(9925619580021728ULL));
        REQUIRE(step.fee_amount == U256(5988667735148ULL));
        REQUIRE(step.amount_in + step.fee_amount < U256(static_cast<U128>(E18)));
    }

    SECTION("Exact output, one for zero") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, E18, 600);
        REQUIRE(step.sqrt_price_next == PRICE_101);
        REQUIRE(step.amount_in == U256(9975124224178055ULL));
        REQUIRE(step.amount_out == U256(9925619580021728ULL));
        REQUIRE(step.fee_amount == U256(5988667735148ULL));
        REQUIRE(step.amount_out < U256(static_cast<U128>(E18)));
    }

    SECTION("Zero fee") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, -E18, 0);
        REQUIRE(step.sqrt_price_next == PRICE_101);
        REQUIRE(step.amount_in == U256(9975124224178055ULL));
        REQUIRE(step.fee_amount.is_zero());
    }
}

TEST_CASE("Swap step consuming the whole amount", "[swap_math]") {
    SECTION("Exact input, one for zero") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_10, 2 * E18, -E18, 600);
        REQUIRE(step.sqrt_price_next == u256("118818475322642227089037862318"));
        REQUIRE(step.amount_in == U256(999400000000000000ULL));
        REQUIRE(step.amount_out == U256(666399946655997866ULL));
        REQUIRE(step.fee_amount == U256(600000000000000ULL));
        REQUIRE(step.sqrt_price_next < PRICE_10);
    }

    SECTION("Exact input, zero for one") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_0_01, 2 * E18, -E18, 600);
        REQUIRE(step.sqrt_price_next == u256("52829340877685095414778922676"));
        REQUIRE(step.amount_in == U256(999400000000000000ULL));
        REQUIRE(step.amount_out == U256(666399946655997866ULL));
        REQUIRE(step.fee_amount == U256(600000000000000ULL));
    }

    SECTION("Exact output, one for zero") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_10, 2 * E18, E18, 600);
        REQUIRE(step.sqrt_price_next == (U256(2) << 96));
        REQUIRE(step.amount_in == U256(2000000000000000000ULL));
        REQUIRE(step.amount_out == U256(1000000000000000000ULL));
        REQUIRE(step.fee_amount == U256(1200720432259356ULL));
    }

    SECTION("Remainder below one unit goes to fees") {
        SwapStep step = compute_swap_step(U256(2413), u256("79887613182836312"),
                                          u256("1985041575832132834610021537970").lo(), -10, 1872);
        REQUIRE(step.sqrt_price_next == U256(2413));
        REQUIRE(step.amount_in == U256(9));
        REQUIRE(step.amount_out.is_zero());
        REQUIRE(step.fee_amount == U256(1));
    }
}

TEST_CASE("Swap step with small liquidity", "[swap_math]") {
    const U256 price = U256(256) << 96;

    SECTION("Exact output rounds the input up") {
        SwapStep step = compute_swap_step(price, price * U256(11) / U256(10), 1024, 4, 3000);
        REQUIRE(step.amount_in == U256(26215));
        REQUIRE(step.amount_out.is_zero());
        REQUIRE(step.fee_amount == U256(79));
        REQUIRE(step.sqrt_price_next == price * U256(11) / U256(10));
    }

    SECTION("Exact output reaching the target") {
        SwapStep step = compute_swap_step(price, price * U256(9) / U256(10), 1024, 263000, 3000);
        REQUIRE(step.amount_in == U256(1));
        REQUIRE(step.amount_out == U256(26214));
        REQUIRE(step.fee_amount == U256(1));
        REQUIRE(step.sqrt_price_next == price * U256(9) / U256(10));
    }
}

TEST_CASE("Swap step fee limits", "[swap_math]") {
    SECTION("Fee above 100% is rejected") {
        REQUIRE_THROWS_AS(compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, -E18, 1000001), MathError);
    }

    SECTION("Exact output with 100% fee is rejected") {
        REQUIRE_THROWS_AS(compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, E18, MAX_SWAP_FEE), MathError);
    }

    SECTION("Exact input with 100% fee only pays fees") {
        SwapStep step = compute_swap_step(PRICE_ONE, PRICE_101, 2 * E18, -1000, MAX_SWAP_FEE);
        REQUIRE(step.sqrt_price_next == PRICE_ONE);
        REQUIRE(step.amount_in.is_zero());
        REQUIRE(step.amount_out.is_zero());
        REQUIRE(step.fee_amount == U256(1000));
    }

    SECTION("Zero liquidity is rejected") {
        try {
            compute_swap_step(PRICE_ONE, PRICE_101, 0, -E18, 600);
            FAIL("expected NotEnoughLiquidity");
        } catch (const MathError& e) {
            REQUIRE(e.code() == MathErrorCode::NotEnoughLiquidity);
        }
    }
}

TEST_CASE("Swap step invariants", "[swap_math]") {
    std::mt19937_64 rng(0x5eed0006);

    for (int i = 0; i < 1000; ++i) {
        U256 current = random_u256(rng, 160);
        U256 target = random_u256(rng, 160);
        if (current < U256(4295128739ULL) || target < U256(4295128739ULL)) continue;

        U128 liquidity = random_u256(rng, 128).lo();
        if (liquidity == 0) continue;

        I128 amount = static_cast<I128>(random_u256(rng, 126).lo());
        if (amount == 0) continue;
        const bool exact_in = rng() % 2 == 0;
        if (exact_in) amount = -amount;
        uint32_t fee = static_cast<uint32_t>(rng() % 1000000);

        SwapStep step;
        try {
            step = compute_swap_step(current, target, liquidity, amount, fee);
        } catch (const MathError&) {
            // Extreme random inputs may leave the price range
            continue;
        }

        const U256 magnitude(static_cast<U128>(exact_in ? -amount : amount));
        if (exact_in) {
            REQUIRE(step.amount_in + step.fee_amount <= magnitude);
        } else {
            REQUIRE(step.amount_out <= magnitude);
        }

        // The price never passes the target
        const bool zero_for_one = current >= target;
        if (zero_for_one) {
            REQUIRE(step.sqrt_price_next >= target);
            REQUIRE(step.sqrt_price_next <= current);
        } else {
            REQUIRE(step.sqrt_price_next <= target);
            REQUIRE(step.sqrt_price_next >= current);
        }

        // Reaching the target short of the full amount only happens at the target
        if (step.sqrt_price_next != target) {
            if (exact_in) {
                REQUIRE(step.amount_in + step.fee_amount == magnitude);
            } else {
                REQUIRE(step.amount_out == magnitude);
            }
        }
    }
}

TEST_CASE("Sqrt price target", "[swap_math]") {
    REQUIRE(get_sqrt_price_target(true, U256(100), U256(200)) == U256(200));
    REQUIRE(get_sqrt_price_target(true, U256(300), U256(200)) == U256(300));
    REQUIRE(get_sqrt_price_target(false, U256(100), U256(200)) == U256(100));
    REQUIRE(get_sqrt_price_target(false, U256(300), U256(200)) == U256(200));
}
