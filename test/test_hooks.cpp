// clamm - Hooks Tests

#include <catch2/catch_test_macros.hpp>
#include <clamm/fixed_point.hpp>
#include <clamm/hooks.hpp>

#include <stdexcept>

using namespace clamm;

namespace {

const U256 PRICE_ONE = fixed_point96::Q96;

} // namespace

TEST_CASE("NoOpHooks requests nothing", "[hooks]") {
    NoOpHooks hooks;
    HookPermissions perms = hooks.permissions();
    REQUIRE_FALSE(perms.before_initialize);
    REQUIRE_FALSE(perms.before_swap);
    REQUIRE_FALSE(perms.after_swap);
    REQUIRE_FALSE(perms.before_swap_returns_delta);

    // Defaults accept every operation
    PoolKey key{};
    BeforeSwapResult result;
    REQUIRE(hooks.before_initialize(key, PRICE_ONE));
    REQUIRE(hooks.before_swap(key, SwapParams{true, -1, U256(1)}, Slot0{}, result));
    REQUIRE(result.specified_delta == 0);
    REQUIRE_FALSE(result.lp_fee_override.has_value());
    REQUIRE(hooks.after_swap(key, SwapParams{true, -1, U256(1)}, BalanceDelta{}) == 0);
}

TEST_CASE("VolatilityFeeHook construction", "[hooks]") {
    REQUIRE_THROWS_AS(VolatilityFeeHook(3000, 1000001, 100), std::invalid_argument);
    REQUIRE_THROWS_AS(VolatilityFeeHook(5000, 4000, 100), std::invalid_argument);

    VolatilityFeeHook hook(3000, 10000, 100);
    REQUIRE(hook.base_fee() == 3000);
    REQUIRE(hook.max_fee() == 10000);
    REQUIRE(hook.last_fee() == 3000);
    REQUIRE(hook.permissions().before_swap);
    REQUIRE_FALSE(hook.permissions().after_swap);
}

TEST_CASE("VolatilityFeeHook fee follows price movement", "[hooks]") {
    VolatilityFeeHook hook(3000, 10000, 100);

    SECTION("First swap pays the base fee") {
        REQUIRE(hook.calculate_fee(PRICE_ONE) == 3000);
    }

    SECTION("Fee grows with the move since the last swap") {
        hook.calculate_fee(PRICE_ONE * U256(100));
        REQUIRE(hook.calculate_fee(PRICE_ONE * U256(101)) == 3010);

        // Doubling is a 1000 permille move
        REQUIRE(hook.calculate_fee(PRICE_ONE * U256(202)) == 4000);
        REQUIRE(hook.last_fee() == 4000);

        // No movement falls back to the base fee
        REQUIRE(hook.calculate_fee(PRICE_ONE * U256(202)) == 3000);
    }

    SECTION("Downward moves count the same") {
        hook.calculate_fee(PRICE_ONE * U256(2));
        REQUIRE(hook.calculate_fee(PRICE_ONE) == 4000);
    }

    SECTION("Fee is capped") {
        VolatilityFeeHook steep(3000, 10000, 10000);
        steep.calculate_fee(PRICE_ONE);
        REQUIRE(steep.calculate_fee(PRICE_ONE * U256(2)) == 10000);
    }

    SECTION("before_swap sets the override") {
        BeforeSwapResult result;
        Slot0 slot0;
        slot0.sqrt_price = PRICE_ONE;
        REQUIRE(hook.before_swap(PoolKey{}, SwapParams{true, -1, U256(1)}, slot0, result));
        REQUIRE(result.lp_fee_override == std::optional<uint32_t>(3000));
        REQUIRE(result.specified_delta == 0);
        REQUIRE(result.unspecified_delta == 0);
    }
}
