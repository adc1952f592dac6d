#ifndef CLAMM_ERRORS_HPP
#define CLAMM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace clamm {

// =============================================================================
// Math Errors (raised by pure functions, no side effects)
// =============================================================================

enum class MathErrorCode : uint8_t {
    Overflow = 0,
    DivisionByZero = 1,
    InvalidPrice = 2,
    InvalidTick = 3,
    InvalidLiquidity = 4,
    PriceOverflow = 5,
    NotEnoughLiquidity = 6
};

const char* to_string(MathErrorCode code);

class MathError : public std::runtime_error {
public:
    explicit MathError(MathErrorCode code, const std::string& detail = {});

    MathErrorCode code() const noexcept { return code_; }

private:
    MathErrorCode code_;
};

// =============================================================================
// State Errors (raised by Pool / TickManager / PositionManager)
// =============================================================================

enum class StateErrorCode : uint8_t {
    TicksMisordered = 0,
    TickLowerOutOfBounds = 1,
    TickUpperOutOfBounds = 2,
    TickLiquidityOverflow = 3,
    PoolAlreadyInitialized = 4,
    PoolNotInitialized = 5,
    PriceLimitAlreadyExceeded = 6,
    PriceLimitOutOfBounds = 7,
    NoLiquidityToReceiveFees = 8,
    InvalidFeeForExactOut = 9,
    InvalidPrice = 10,
    TickMisaligned = 11,
    CannotUpdateEmptyPosition = 12,
    LpFeeTooLarge = 13,
    ProtocolFeeTooLarge = 14
};

const char* to_string(StateErrorCode code);

class StateError : public std::runtime_error {
public:
    explicit StateError(StateErrorCode code, const std::string& detail = {});

    // TickLiquidityOverflow / TickMisaligned carry the offending tick
    static StateError for_tick(StateErrorCode code, int32_t tick);

    StateErrorCode code() const noexcept { return code_; }
    int32_t tick() const noexcept { return tick_; }

private:
    StateErrorCode code_;
    int32_t tick_ = 0;
};

// =============================================================================
// Manager Errors (orchestration layer: keys, hooks, settlement)
// =============================================================================

enum class ManagerErrorCode : uint8_t {
    CurrenciesOutOfOrderOrEqual = 0,
    TickSpacingTooLarge = 1,
    TickSpacingTooSmall = 2,
    PoolNotFound = 3,
    SwapAmountCannotBeZero = 4,
    HookAddressNotValid = 5,
    HookDeltaExceedsSwapAmount = 6,
    UnauthorizedDynamicLpFeeUpdate = 7,
    AlreadyUnlocked = 8,
    CurrencyNotSettled = 9,
    ManagerLocked = 10,
    InsufficientProtocolFees = 11,
    HookRejected = 12
};

const char* to_string(ManagerErrorCode code);

class ManagerError : public std::runtime_error {
public:
    explicit ManagerError(ManagerErrorCode code, const std::string& detail = {});

    ManagerErrorCode code() const noexcept { return code_; }

private:
    ManagerErrorCode code_;
};

} // namespace clamm

#endif // CLAMM_ERRORS_HPP
