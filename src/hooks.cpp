// =============================================================================
// hooks.cpp - Built-in hook implementations
// =============================================================================

#include "clamm/hooks.hpp"
#include "clamm/fees.hpp"

#include <stdexcept>
#include <string>

namespace clamm {

// =============================================================================
// VolatilityFeeHook
// =============================================================================

VolatilityFeeHook::VolatilityFeeHook(uint32_t base_fee, uint32_t max_fee, uint32_t volatility_factor)
    : base_fee_(base_fee)
    , max_fee_(max_fee)
    , volatility_factor_(volatility_factor)
    , last_fee_(base_fee) {
    if (max_fee > lp_fee::MAX_LP_FEE) {
        throw std::invalid_argument("VolatilityFeeHook: max fee " + std::to_string(max_fee) + " exceeds 100%");
    }
    if (base_fee > max_fee) {
        throw std::invalid_argument("VolatilityFeeHook: base fee above max fee");
    }
}

HookPermissions VolatilityFeeHook::permissions() const {
    HookPermissions perms;
    perms.before_swap = true;
    return perms;
}

bool VolatilityFeeHook::before_swap(const PoolKey& key, const SwapParams& params, const Slot0& slot0,
                                    BeforeSwapResult& result) {
    result.lp_fee_override = calculate_fee(slot0.sqrt_price);
    return true;
}

uint32_t VolatilityFeeHook::calculate_fee(const U256& sqrt_price) {
    if (!last_sqrt_price_ || last_sqrt_price_->is_zero() || sqrt_price.is_zero()) {
        last_sqrt_price_ = sqrt_price;
        last_fee_ = base_fee_;
        return last_fee_;
    }

    const U256& previous = *last_sqrt_price_;
    const U256& larger = sqrt_price > previous ? sqrt_price : previous;
    const U256& smaller = sqrt_price > previous ? previous : sqrt_price;

    // Relative move in permille
    const U256 permille(1000);
    U256 change = larger * permille / smaller - permille;
    U256 fee = U256(base_fee_) + change * U256(volatility_factor_) / U256(100);

    last_fee_ = fee > U256(max_fee_) ? max_fee_ : static_cast<uint32_t>(fee.lo());
    last_sqrt_price_ = sqrt_price;
    return last_fee_;
}

} // namespace clamm
