#ifndef CLAMM_POOL_HPP
#define CLAMM_POOL_HPP

#include <optional>

#include "types.hpp"
#include "tick.hpp"
#include "position.hpp"

namespace clamm {

// =============================================================================
// Pool - single concentrated-liquidity pool state machine
// Uninitialized -> Initialized. Single writer, no interior locking.
// Every operation either completes or throws with the state unchanged.
// =============================================================================

class Pool {
public:
    struct ModifyPositionParams {
        Address owner;
        int32_t tick_lower;
        int32_t tick_upper;
        I128 liquidity_delta;      // positive = add, negative = remove, 0 = collect fees
        int32_t tick_spacing;
        Salt salt{};
    };

    struct ModifyPositionResult {
        BalanceDelta principal;    // Negative when liquidity is added
        BalanceDelta fees;         // Fees paid out to the owner
    };

    struct SwapParams {
        I128 amount_specified;     // negative = exact input, positive = exact output
        U256 sqrt_price_limit;
        bool zero_for_one;
        int32_t tick_spacing;
        std::optional<uint32_t> lp_fee_override;  // Replaces slot0.lp_fee for this swap
    };

    struct SwapResult {
        BalanceDelta delta;
        U256 amount_to_protocol;   // Protocol share, in the input currency
        uint32_t swap_fee;         // Combined LP + protocol fee applied (pips)
        U256 sqrt_price;
        int32_t tick;
        U128 liquidity;
    };

    Pool() = default;
    ~Pool() = default;

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = default;
    Pool& operator=(Pool&&) = default;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Returns the initial tick
    int32_t initialize(const U256& sqrt_price, uint32_t lp_fee);

    ModifyPositionResult modify_position(const ModifyPositionParams& params);

    SwapResult swap(const SwapParams& params);

    // Distribute amounts to in-range liquidity; returns the caller's (negative) delta
    BalanceDelta donate(U128 amount0, U128 amount1);

    // =========================================================================
    // Fee Setters
    // =========================================================================

    void set_protocol_fee(uint32_t protocol_fee);
    void set_lp_fee(uint32_t lp_fee);

    // =========================================================================
    // Query Operations
    // =========================================================================

    bool is_initialized() const { return !slot0_.sqrt_price.is_zero(); }
    const Slot0& slot0() const { return slot0_; }
    U128 liquidity() const { return liquidity_; }
    const U256& fee_growth_global0_x128() const { return fee_growth_global0_x128_; }
    const U256& fee_growth_global1_x128() const { return fee_growth_global1_x128_; }
    const TickManager& ticks() const { return ticks_; }
    const PositionManager& positions() const { return positions_; }

    std::optional<Position> get_position(const Address& owner, int32_t tick_lower,
                                         int32_t tick_upper, const Salt& salt = {}) const;

private:
    void check_initialized() const;
    static void check_ticks(int32_t tick_lower, int32_t tick_upper, int32_t tick_spacing);

    Slot0 slot0_;
    U256 fee_growth_global0_x128_;
    U256 fee_growth_global1_x128_;
    U128 liquidity_ = 0;            // Active liquidity at the current tick
    TickManager ticks_;
    PositionManager positions_;
};

} // namespace clamm

#endif // CLAMM_POOL_HPP
