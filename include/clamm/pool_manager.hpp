#ifndef CLAMM_POOL_MANAGER_HPP
#define CLAMM_POOL_MANAGER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>

#include "config.hpp"
#include "hooks.hpp"
#include "pool.hpp"
#include "types.hpp"

namespace clamm {

// =============================================================================
// PoolManager - keyed pool registry with hooks, protocol fees and
// flash accounting. Single writer; callers serialize access.
// =============================================================================

class PoolManager {
public:
    struct ModifyLiquidityResult {
        BalanceDelta caller_delta;   // Principal + fees, minus any hook delta
        BalanceDelta fees_accrued;
    };

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
        uint64_t total_donations;
    };

    explicit PoolManager(ManagerConfig config = {});
    ~PoolManager() = default;

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Initialize a new pool; `hooks` is required iff key.hooks is non-zero.
    // Returns the initial tick.
    int32_t initialize(const PoolKey& key, const U256& sqrt_price, std::unique_ptr<IHooks> hooks = nullptr);

    ModifyLiquidityResult modify_liquidity(const PoolKey& key, const ModifyLiquidityParams& params);

    // Returns the caller's balance delta
    BalanceDelta swap(const PoolKey& key, const SwapParams& params);

    BalanceDelta donate(const PoolKey& key, U128 amount0, U128 amount1);

    // =========================================================================
    // Fee Management
    // =========================================================================

    // Dynamic-fee pools only
    void update_dynamic_lp_fee(const PoolKey& key, uint32_t new_fee);

    void set_protocol_fee(const PoolKey& key, uint32_t new_fee);

    U256 protocol_fees_accrued(const Currency& currency) const;

    // amount 0 collects everything; returns the amount collected
    U256 collect_protocol_fees(const Currency& currency, const U256& amount);

    // =========================================================================
    // Flash Accounting
    // =========================================================================

    // Opens a settlement session; every delta produced inside must net to
    // zero through take()/settle() before the callback returns.
    using UnlockCallback = std::function<void(PoolManager&)>;
    void unlock(const UnlockCallback& callback);

    // Pool pays out (caller's balance decreases)
    void take(const Currency& currency, U128 amount);

    // Caller pays in (caller's balance increases)
    void settle(const Currency& currency, U128 amount);

    bool is_unlocked() const { return unlocked_; }
    I128 currency_delta(const Currency& currency) const;

    // =========================================================================
    // Query Operations
    // =========================================================================

    bool pool_exists(const PoolKey& key) const;
    std::optional<Slot0> get_slot0(const PoolKey& key) const;
    std::optional<U128> get_liquidity(const PoolKey& key) const;
    std::optional<std::pair<U256, U256>> get_fee_growth_globals(const PoolKey& key) const;
    std::optional<Position> get_position(const PoolKey& key, const Address& owner, int32_t tick_lower,
                                         int32_t tick_upper, const Salt& salt = {}) const;
    std::optional<TickInfo> get_tick_info(const PoolKey& key, int32_t tick) const;

    // Throws PoolNotFound
    const Pool& get_pool(const PoolKey& key) const;

    Stats get_stats() const;
    const ManagerConfig& config() const { return config_; }

private:
    struct PoolEntry {
        Pool pool;
        std::unique_ptr<IHooks> hooks;
        HookPermissions permissions;
    };

    // Unlocks for its lifetime; re-locks and clears balances on every exit
    class UnlockGuard {
    public:
        explicit UnlockGuard(PoolManager& manager);
        ~UnlockGuard();

        UnlockGuard(const UnlockGuard&) = delete;
        UnlockGuard& operator=(const UnlockGuard&) = delete;

    private:
        PoolManager& manager_;
    };

    static void validate_key(const PoolKey& key);

    PoolEntry& get_entry(const PoolKey& key);
    const PoolEntry* find_entry(const PoolKey& key) const;
    IHooks& hooks_for(PoolEntry& entry);

    // Adds a delta to the session balances (no-op outside a session)
    void account(const PoolKey& key, const BalanceDelta& delta);
    void account(const Currency& currency, I128 amount);

    ManagerConfig config_;

    // Pool storage: key -> pool + hooks
    std::unordered_map<PoolKey, PoolEntry, PoolKeyHash> pools_;
    NoOpHooks no_op_hooks_;

    // Flash accounting state
    bool unlocked_ = false;
    std::unordered_map<Currency, I128, CurrencyHash> currency_deltas_;

    std::unordered_map<Currency, U256, CurrencyHash> protocol_fees_;

    // Statistics
    std::atomic<uint64_t> total_swaps_{0};
    std::atomic<uint64_t> total_liquidity_ops_{0};
    std::atomic<uint64_t> total_donations_{0};
};

} // namespace clamm

#endif // CLAMM_POOL_MANAGER_HPP
