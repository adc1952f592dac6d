// =============================================================================
// errors.cpp - Error taxonomy names and messages
// =============================================================================

#include "clamm/errors.hpp"

namespace clamm {

namespace {

std::string compose(const char* name, const std::string& detail) {
    if (detail.empty()) return name;
    return std::string(name) + ": " + detail;
}

} // namespace

const char* to_string(MathErrorCode code) {
    switch (code) {
        case MathErrorCode::Overflow:           return "Overflow";
        case MathErrorCode::DivisionByZero:     return "DivisionByZero";
        case MathErrorCode::InvalidPrice:       return "InvalidPrice";
        case MathErrorCode::InvalidTick:        return "InvalidTick";
        case MathErrorCode::InvalidLiquidity:   return "InvalidLiquidity";
        case MathErrorCode::PriceOverflow:      return "PriceOverflow";
        case MathErrorCode::NotEnoughLiquidity: return "NotEnoughLiquidity";
    }
    return "UnknownMathError";
}

const char* to_string(StateErrorCode code) {
    switch (code) {
        case StateErrorCode::TicksMisordered:           return "TicksMisordered";
        case StateErrorCode::TickLowerOutOfBounds:      return "TickLowerOutOfBounds";
        case StateErrorCode::TickUpperOutOfBounds:      return "TickUpperOutOfBounds";
        case StateErrorCode::TickLiquidityOverflow:     return "TickLiquidityOverflow";
        case StateErrorCode::PoolAlreadyInitialized:    return "PoolAlreadyInitialized";
        case StateErrorCode::PoolNotInitialized:        return "PoolNotInitialized";
        case StateErrorCode::PriceLimitAlreadyExceeded: return "PriceLimitAlreadyExceeded";
        case StateErrorCode::PriceLimitOutOfBounds:     return "PriceLimitOutOfBounds";
        case StateErrorCode::NoLiquidityToReceiveFees:  return "NoLiquidityToReceiveFees";
        case StateErrorCode::InvalidFeeForExactOut:     return "InvalidFeeForExactOut";
        case StateErrorCode::InvalidPrice:              return "InvalidPrice";
        case StateErrorCode::TickMisaligned:            return "TickMisaligned";
        case StateErrorCode::CannotUpdateEmptyPosition: return "CannotUpdateEmptyPosition";
        case StateErrorCode::LpFeeTooLarge:             return "LpFeeTooLarge";
        case StateErrorCode::ProtocolFeeTooLarge:       return "ProtocolFeeTooLarge";
    }
    return "UnknownStateError";
}

const char* to_string(ManagerErrorCode code) {
    switch (code) {
        case ManagerErrorCode::CurrenciesOutOfOrderOrEqual:    return "CurrenciesOutOfOrderOrEqual";
        case ManagerErrorCode::TickSpacingTooLarge:            return "TickSpacingTooLarge";
        case ManagerErrorCode::TickSpacingTooSmall:            return "TickSpacingTooSmall";
        case ManagerErrorCode::PoolNotFound:                   return "PoolNotFound";
        case ManagerErrorCode::SwapAmountCannotBeZero:         return "SwapAmountCannotBeZero";
        case ManagerErrorCode::HookAddressNotValid:            return "HookAddressNotValid";
        case ManagerErrorCode::HookDeltaExceedsSwapAmount:     return "HookDeltaExceedsSwapAmount";
        case ManagerErrorCode::UnauthorizedDynamicLpFeeUpdate: return "UnauthorizedDynamicLpFeeUpdate";
        case ManagerErrorCode::AlreadyUnlocked:                return "AlreadyUnlocked";
        case ManagerErrorCode::CurrencyNotSettled:             return "CurrencyNotSettled";
        case ManagerErrorCode::ManagerLocked:                  return "ManagerLocked";
        case ManagerErrorCode::InsufficientProtocolFees:       return "InsufficientProtocolFees";
        case ManagerErrorCode::HookRejected:                   return "HookRejected";
    }
    return "UnknownManagerError";
}

MathError::MathError(MathErrorCode code, const std::string& detail)
    : std::runtime_error(compose(to_string(code), detail)), code_(code) {}

StateError::StateError(StateErrorCode code, const std::string& detail)
    : std::runtime_error(compose(to_string(code), detail)), code_(code) {}

StateError StateError::for_tick(StateErrorCode code, int32_t tick) {
    StateError err(code, "tick " + std::to_string(tick));
    err.tick_ = tick;
    return err;
}

ManagerError::ManagerError(ManagerErrorCode code, const std::string& detail)
    : std::runtime_error(compose(to_string(code), detail)), code_(code) {}

} // namespace clamm
