// =============================================================================
// pool_manager.cpp - Pool registry, hooks dispatch, protocol fees and
// flash accounting
// =============================================================================

#include "clamm/pool_manager.hpp"
#include "clamm/errors.hpp"
#include "clamm/fees.hpp"
#include "clamm/safe_cast.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace clamm {

namespace {

I128 checked_add(I128 a, I128 b) {
    I128 out;
    if (__builtin_add_overflow(a, b, &out)) {
        throw MathError(MathErrorCode::Overflow, "delta exceeds int128");
    }
    return out;
}

BalanceDelta checked_sub(const BalanceDelta& a, const BalanceDelta& b) {
    BalanceDelta out;
    if (__builtin_sub_overflow(a.amount0, b.amount0, &out.amount0) ||
        __builtin_sub_overflow(a.amount1, b.amount1, &out.amount1)) {
        throw MathError(MathErrorCode::Overflow, "delta exceeds int128");
    }
    return out;
}

std::string describe(const BalanceDelta& delta) {
    return "(" + to_string(delta.amount0) + ", " + to_string(delta.amount1) + ")";
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

PoolManager::PoolManager(ManagerConfig config)
    : config_(std::move(config)) {
    if (!protocol_fee::is_valid(config_.default_protocol_fee)) {
        throw StateError(StateErrorCode::ProtocolFeeTooLarge, std::to_string(config_.default_protocol_fee));
    }
}

PoolManager::UnlockGuard::UnlockGuard(PoolManager& manager)
    : manager_(manager) {
    if (manager_.unlocked_) {
        throw ManagerError(ManagerErrorCode::AlreadyUnlocked);
    }
    manager_.unlocked_ = true;
    manager_.currency_deltas_.clear();
}

PoolManager::UnlockGuard::~UnlockGuard() {
    manager_.unlocked_ = false;
    manager_.currency_deltas_.clear();
}

// =============================================================================
// Internal Helpers
// =============================================================================

void PoolManager::validate_key(const PoolKey& key) {
    if (key.tick_spacing > tick_spacings::MAX_TICK_SPACING) {
        throw ManagerError(ManagerErrorCode::TickSpacingTooLarge, std::to_string(key.tick_spacing));
    }
    if (key.tick_spacing < tick_spacings::MIN_TICK_SPACING) {
        throw ManagerError(ManagerErrorCode::TickSpacingTooSmall, std::to_string(key.tick_spacing));
    }
    if (!(key.currency0 < key.currency1)) {
        throw ManagerError(ManagerErrorCode::CurrenciesOutOfOrderOrEqual, key.to_string());
    }
    if (!lp_fee::is_dynamic_fee(key.fee) && !lp_fee::is_valid(key.fee)) {
        throw StateError(StateErrorCode::LpFeeTooLarge, std::to_string(key.fee));
    }
}

PoolManager::PoolEntry& PoolManager::get_entry(const PoolKey& key) {
    auto it = pools_.find(key);
    if (it == pools_.end()) {
        throw ManagerError(ManagerErrorCode::PoolNotFound, key.to_string());
    }
    return it->second;
}

const PoolManager::PoolEntry* PoolManager::find_entry(const PoolKey& key) const {
    auto it = pools_.find(key);
    return it == pools_.end() ? nullptr : &it->second;
}

IHooks& PoolManager::hooks_for(PoolEntry& entry) {
    if (entry.hooks) return *entry.hooks;
    return no_op_hooks_;
}

void PoolManager::account(const Currency& currency, I128 amount) {
    if (!unlocked_ || amount == 0) return;

    auto it = currency_deltas_.find(currency);
    I128 current = it == currency_deltas_.end() ? 0 : it->second;
    I128 next = checked_add(current, amount);

    if (next == 0) {
        if (it != currency_deltas_.end()) currency_deltas_.erase(it);
    } else {
        currency_deltas_[currency] = next;
    }
}

void PoolManager::account(const PoolKey& key, const BalanceDelta& delta) {
    account(key.currency0, delta.amount0);
    account(key.currency1, delta.amount1);
}

// =============================================================================
// Initialize
// =============================================================================

int32_t PoolManager::initialize(const PoolKey& key, const U256& sqrt_price, std::unique_ptr<IHooks> hooks) {
    validate_key(key);

    if (addresses::is_zero(key.hooks) != (hooks == nullptr)) {
        throw ManagerError(ManagerErrorCode::HookAddressNotValid, addresses::to_hex(key.hooks));
    }
    if (pools_.count(key) != 0) {
        throw StateError(StateErrorCode::PoolAlreadyInitialized, key.to_string());
    }

    PoolEntry entry;
    entry.hooks = std::move(hooks);
    entry.permissions = hooks_for(entry).permissions();
    IHooks& h = hooks_for(entry);

    if (entry.permissions.before_initialize && !h.before_initialize(key, sqrt_price)) {
        throw ManagerError(ManagerErrorCode::HookRejected, "before_initialize");
    }

    int32_t tick = entry.pool.initialize(sqrt_price, lp_fee::initial_lp_fee(key.fee));
    if (config_.default_protocol_fee != 0) {
        entry.pool.set_protocol_fee(config_.default_protocol_fee);
    }

    auto it = pools_.emplace(key, std::move(entry)).first;

    if (it->second.permissions.after_initialize) {
        hooks_for(it->second).after_initialize(key, sqrt_price, tick);
    }

    spdlog::info("Initialized pool {} at tick {} (sqrt price {})", key.to_string(), tick, sqrt_price.to_string());
    return tick;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

PoolManager::ModifyLiquidityResult PoolManager::modify_liquidity(const PoolKey& key,
                                                                 const ModifyLiquidityParams& params) {
    PoolEntry& entry = get_entry(key);
    IHooks& h = hooks_for(entry);
    const HookPermissions& perms = entry.permissions;
    const bool adding = params.liquidity_delta > 0;

    if (adding && perms.before_add_liquidity && !h.before_add_liquidity(key, params)) {
        throw ManagerError(ManagerErrorCode::HookRejected, "before_add_liquidity");
    }
    if (!adding && perms.before_remove_liquidity && !h.before_remove_liquidity(key, params)) {
        throw ManagerError(ManagerErrorCode::HookRejected, "before_remove_liquidity");
    }

    Pool::ModifyPositionParams modify{params.owner, params.tick_lower, params.tick_upper,
                                      params.liquidity_delta, key.tick_spacing, params.salt};
    Pool::ModifyPositionResult result = entry.pool.modify_position(modify);

    BalanceDelta pool_delta = result.principal + result.fees;

    // Caller and hook together settle the pool's side; recorded before any
    // hook runs so a throwing hook cannot hide a committed change
    account(key, pool_delta);

    BalanceDelta hook_delta;

    if (adding && perms.after_add_liquidity) {
        BalanceDelta returned = h.after_add_liquidity(key, params, pool_delta, result.fees);
        if (perms.after_add_liquidity_returns_delta) hook_delta = returned;
    } else if (!adding && perms.after_remove_liquidity) {
        BalanceDelta returned = h.after_remove_liquidity(key, params, pool_delta, result.fees);
        if (perms.after_remove_liquidity_returns_delta) hook_delta = returned;
    }

    BalanceDelta caller_delta = checked_sub(pool_delta, hook_delta);
    ++total_liquidity_ops_;

    spdlog::debug("Modified liquidity on {} [{}, {}] by {}: delta {} fees {}",
                  key.to_string(), params.tick_lower, params.tick_upper,
                  to_string(params.liquidity_delta), describe(caller_delta), describe(result.fees));

    return {caller_delta, result.fees};
}

// =============================================================================
// Swap
// =============================================================================

BalanceDelta PoolManager::swap(const PoolKey& key, const SwapParams& params) {
    if (params.amount_specified == 0) {
        throw ManagerError(ManagerErrorCode::SwapAmountCannotBeZero);
    }

    PoolEntry& entry = get_entry(key);
    IHooks& h = hooks_for(entry);
    const HookPermissions& perms = entry.permissions;
    const bool exact_input = params.amount_specified < 0;

    I128 amount_to_swap = params.amount_specified;
    std::optional<uint32_t> fee_override;
    BeforeSwapResult before;

    if (perms.before_swap) {
        if (!h.before_swap(key, params, entry.pool.slot0(), before)) {
            throw ManagerError(ManagerErrorCode::HookRejected, "before_swap");
        }
        if (lp_fee::is_dynamic_fee(key.fee)) {
            fee_override = before.lp_fee_override;
        }
        if (perms.before_swap_returns_delta && before.specified_delta != 0) {
            amount_to_swap = checked_add(amount_to_swap, before.specified_delta);
            if (exact_input ? amount_to_swap > 0 : amount_to_swap < 0) {
                throw ManagerError(ManagerErrorCode::HookDeltaExceedsSwapAmount);
            }
        }
    }

    Pool::SwapResult result{};
    if (amount_to_swap != 0) {
        Pool::SwapParams swap_params{amount_to_swap, params.sqrt_price_limit, params.zero_for_one,
                                     key.tick_spacing, fee_override};
        result = entry.pool.swap(swap_params);
    }
    account(key, result.delta);

    if (!result.amount_to_protocol.is_zero()) {
        const Currency& input = params.zero_for_one ? key.currency0 : key.currency1;
        protocol_fees_[input] += result.amount_to_protocol;
    }

    // Hook deltas map onto currency0/currency1 by which side was specified
    const bool specified_is_zero = exact_input == params.zero_for_one;
    I128 hook_specified = perms.before_swap_returns_delta ? before.specified_delta : 0;
    I128 hook_unspecified = perms.before_swap_returns_delta ? before.unspecified_delta : 0;

    if (perms.after_swap) {
        I128 returned = h.after_swap(key, params, result.delta);
        if (perms.after_swap_returns_delta) {
            hook_unspecified = checked_add(hook_unspecified, returned);
        }
    }

    BalanceDelta hook_delta = specified_is_zero ? BalanceDelta{hook_specified, hook_unspecified}
                                                : BalanceDelta{hook_unspecified, hook_specified};
    BalanceDelta caller_delta = checked_sub(result.delta, hook_delta);
    ++total_swaps_;

    spdlog::debug("Swap on {} zero_for_one={} amount {}: delta {} fee {} tick {}",
                  key.to_string(), params.zero_for_one, to_string(params.amount_specified),
                  describe(caller_delta), result.swap_fee, entry.pool.slot0().tick);

    return caller_delta;
}

// =============================================================================
// Donate
// =============================================================================

BalanceDelta PoolManager::donate(const PoolKey& key, U128 amount0, U128 amount1) {
    PoolEntry& entry = get_entry(key);
    IHooks& h = hooks_for(entry);

    if (entry.permissions.before_donate && !h.before_donate(key, amount0, amount1)) {
        throw ManagerError(ManagerErrorCode::HookRejected, "before_donate");
    }

    BalanceDelta delta = entry.pool.donate(amount0, amount1);
    account(key, delta);

    if (entry.permissions.after_donate) {
        h.after_donate(key, amount0, amount1);
    }

    ++total_donations_;

    spdlog::debug("Donated {} to {}", describe(delta), key.to_string());
    return delta;
}

// =============================================================================
// Fee Management
// =============================================================================

void PoolManager::update_dynamic_lp_fee(const PoolKey& key, uint32_t new_fee) {
    if (!lp_fee::is_dynamic_fee(key.fee)) {
        throw ManagerError(ManagerErrorCode::UnauthorizedDynamicLpFeeUpdate, key.to_string());
    }
    get_entry(key).pool.set_lp_fee(new_fee);
    spdlog::debug("LP fee on {} set to {}", key.to_string(), new_fee);
}

void PoolManager::set_protocol_fee(const PoolKey& key, uint32_t new_fee) {
    get_entry(key).pool.set_protocol_fee(new_fee);
    spdlog::debug("Protocol fee on {} set to {:#x}", key.to_string(), new_fee);
}

U256 PoolManager::protocol_fees_accrued(const Currency& currency) const {
    auto it = protocol_fees_.find(currency);
    return it == protocol_fees_.end() ? U256() : it->second;
}

U256 PoolManager::collect_protocol_fees(const Currency& currency, const U256& amount) {
    auto it = protocol_fees_.find(currency);
    U256 available = it == protocol_fees_.end() ? U256() : it->second;
    U256 collected = amount.is_zero() ? available : amount;

    if (collected > available) {
        throw ManagerError(ManagerErrorCode::InsufficientProtocolFees,
                           collected.to_string() + " > " + available.to_string());
    }

    if (it != protocol_fees_.end()) {
        it->second -= collected;
        if (it->second.is_zero()) protocol_fees_.erase(it);
    }

    spdlog::info("Collected {} protocol fees in {}", collected.to_string(), addresses::to_hex(currency.addr));
    return collected;
}

// =============================================================================
// Flash Accounting
// =============================================================================

void PoolManager::unlock(const UnlockCallback& callback) {
    UnlockGuard guard(*this);

    callback(*this);

    // Verify all deltas settled to zero
    if (!currency_deltas_.empty()) {
        spdlog::warn("Unlock session ended with {} unsettled currencies", currency_deltas_.size());
        if (config_.require_settlement) {
            const auto& [currency, delta] = *currency_deltas_.begin();
            throw ManagerError(ManagerErrorCode::CurrencyNotSettled,
                               addresses::to_hex(currency.addr) + " delta " + to_string(delta));
        }
    }
}

void PoolManager::take(const Currency& currency, U128 amount) {
    if (!unlocked_) {
        throw ManagerError(ManagerErrorCode::ManagerLocked, "take");
    }
    account(currency, -safe_cast::to_i128(amount));
}

void PoolManager::settle(const Currency& currency, U128 amount) {
    if (!unlocked_) {
        throw ManagerError(ManagerErrorCode::ManagerLocked, "settle");
    }
    account(currency, safe_cast::to_i128(amount));
}

I128 PoolManager::currency_delta(const Currency& currency) const {
    auto it = currency_deltas_.find(currency);
    return it == currency_deltas_.end() ? 0 : it->second;
}

// =============================================================================
// Query Operations
// =============================================================================

bool PoolManager::pool_exists(const PoolKey& key) const {
    return pools_.count(key) != 0;
}

const Pool& PoolManager::get_pool(const PoolKey& key) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) {
        throw ManagerError(ManagerErrorCode::PoolNotFound, key.to_string());
    }
    return entry->pool;
}

std::optional<Slot0> PoolManager::get_slot0(const PoolKey& key) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) return std::nullopt;
    return entry->pool.slot0();
}

std::optional<U128> PoolManager::get_liquidity(const PoolKey& key) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) return std::nullopt;
    return entry->pool.liquidity();
}

std::optional<std::pair<U256, U256>> PoolManager::get_fee_growth_globals(const PoolKey& key) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) return std::nullopt;
    return std::make_pair(entry->pool.fee_growth_global0_x128(), entry->pool.fee_growth_global1_x128());
}

std::optional<Position> PoolManager::get_position(const PoolKey& key, const Address& owner, int32_t tick_lower,
                                                  int32_t tick_upper, const Salt& salt) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) return std::nullopt;
    return entry->pool.get_position(owner, tick_lower, tick_upper, salt);
}

std::optional<TickInfo> PoolManager::get_tick_info(const PoolKey& key, int32_t tick) const {
    const PoolEntry* entry = find_entry(key);
    if (!entry) return std::nullopt;
    return entry->pool.ticks().get(tick);
}

PoolManager::Stats PoolManager::get_stats() const {
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        total_swaps_.load(),
        total_liquidity_ops_.load(),
        total_donations_.load()
    };
}

} // namespace clamm
