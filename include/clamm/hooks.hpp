#ifndef CLAMM_HOOKS_HPP
#define CLAMM_HOOKS_HPP

#include <optional>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Hook Permissions
// The manager only invokes callbacks whose flag is set. Flags are read once,
// when the pool is initialized.
// =============================================================================

struct HookPermissions {
    bool before_initialize = false;
    bool after_initialize = false;
    bool before_add_liquidity = false;
    bool after_add_liquidity = false;
    bool before_remove_liquidity = false;
    bool after_remove_liquidity = false;
    bool before_swap = false;
    bool after_swap = false;
    bool before_donate = false;
    bool after_donate = false;
    bool before_swap_returns_delta = false;
    bool after_swap_returns_delta = false;
    bool after_add_liquidity_returns_delta = false;
    bool after_remove_liquidity_returns_delta = false;
};

// Deltas are from the hook's side: positive = the hook receives.
// specified_delta is in the currency of amount_specified.
struct BeforeSwapResult {
    I128 specified_delta = 0;
    I128 unspecified_delta = 0;
    std::optional<uint32_t> lp_fee_override;  // Dynamic-fee pools only
};

// =============================================================================
// Hook Interface
// =============================================================================

class IHooks {
public:
    virtual ~IHooks() = default;

    virtual HookPermissions permissions() const = 0;

    // before_* callbacks return false to reject the operation
    virtual bool before_initialize(const PoolKey& key, const U256& sqrt_price) { return true; }
    virtual void after_initialize(const PoolKey& key, const U256& sqrt_price, int32_t tick) {}

    virtual bool before_add_liquidity(const PoolKey& key, const ModifyLiquidityParams& params) { return true; }
    virtual BalanceDelta after_add_liquidity(const PoolKey& key, const ModifyLiquidityParams& params,
                                             const BalanceDelta& delta, const BalanceDelta& fees) {
        return {};
    }

    virtual bool before_remove_liquidity(const PoolKey& key, const ModifyLiquidityParams& params) { return true; }
    virtual BalanceDelta after_remove_liquidity(const PoolKey& key, const ModifyLiquidityParams& params,
                                                const BalanceDelta& delta, const BalanceDelta& fees) {
        return {};
    }

    virtual bool before_swap(const PoolKey& key, const SwapParams& params, const Slot0& slot0,
                             BeforeSwapResult& result) {
        return true;
    }
    // Returns the hook's delta in the unspecified currency
    virtual I128 after_swap(const PoolKey& key, const SwapParams& params, const BalanceDelta& delta) { return 0; }

    virtual bool before_donate(const PoolKey& key, U128 amount0, U128 amount1) { return true; }
    virtual void after_donate(const PoolKey& key, U128 amount0, U128 amount1) {}
};

// Null hooks (no-op)
class NoOpHooks : public IHooks {
public:
    HookPermissions permissions() const override { return {}; }
};

// =============================================================================
// VolatilityFeeHook - dynamic LP fee that tracks price movement
// fee = min(base_fee + change_permille * volatility_factor / 100, max_fee)
// where change_permille is the move of sqrt(price) since the previous swap.
// =============================================================================

class VolatilityFeeHook : public IHooks {
public:
    VolatilityFeeHook(uint32_t base_fee, uint32_t max_fee, uint32_t volatility_factor);

    HookPermissions permissions() const override;

    bool before_swap(const PoolKey& key, const SwapParams& params, const Slot0& slot0,
                     BeforeSwapResult& result) override;

    uint32_t base_fee() const { return base_fee_; }
    uint32_t max_fee() const { return max_fee_; }
    uint32_t last_fee() const { return last_fee_; }

    // Fee for a swap starting at sqrt_price; records the price
    uint32_t calculate_fee(const U256& sqrt_price);

private:
    uint32_t base_fee_;
    uint32_t max_fee_;
    uint32_t volatility_factor_;
    uint32_t last_fee_;
    std::optional<U256> last_sqrt_price_;
};

} // namespace clamm

#endif // CLAMM_HOOKS_HPP
