// =============================================================================
// position.cpp - Position liquidity and fee checkpoints
// =============================================================================

#include "clamm/position.hpp"
#include "clamm/errors.hpp"
#include "clamm/fixed_point.hpp"
#include "clamm/full_math.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/safe_cast.hpp"

namespace clamm {

namespace {

U128 checked_add(U128 a, U128 b) {
    if (b > U128_MAX - a) {
        throw MathError(MathErrorCode::Overflow, "tokens owed overflow");
    }
    return a + b;
}

} // namespace

PositionUpdate PositionManager::preview(const PositionKey& key,
                                        I128 liquidity_delta,
                                        const U256& fee_growth_inside0_x128,
                                        const U256& fee_growth_inside1_x128) const {
    PositionUpdate result;
    result.next = get(key).value_or(Position{});
    Position& pos = result.next;

    if (liquidity_delta == 0 && pos.liquidity == 0) {
        throw StateError(StateErrorCode::CannotUpdateEmptyPosition);
    }

    U128 liquidity_after = liquidity_math::add_delta(pos.liquidity, liquidity_delta);

    if (pos.liquidity > 0) {
        U256 growth0 = fee_growth_inside0_x128 - pos.fee_growth_inside0_last_x128;
        U256 growth1 = fee_growth_inside1_x128 - pos.fee_growth_inside1_last_x128;
        // Owed amounts wrap at 128 bits; the position stays removable
        U128 owed0 = full_math::mul_div(growth0, U256(pos.liquidity), fixed_point128::Q128).lo();
        U128 owed1 = full_math::mul_div(growth1, U256(pos.liquidity), fixed_point128::Q128).lo();
        pos.tokens_owed0 = checked_add(pos.tokens_owed0, owed0);
        pos.tokens_owed1 = checked_add(pos.tokens_owed1, owed1);
    }

    pos.liquidity = liquidity_after;
    pos.fee_growth_inside0_last_x128 = fee_growth_inside0_x128;
    pos.fee_growth_inside1_last_x128 = fee_growth_inside1_x128;

    // Settle: everything owed goes back to the caller
    result.fees = {safe_cast::to_i128(pos.tokens_owed0), safe_cast::to_i128(pos.tokens_owed1)};
    pos.tokens_owed0 = 0;
    pos.tokens_owed1 = 0;
    return result;
}

BalanceDelta PositionManager::update(const PositionKey& key,
                                     I128 liquidity_delta,
                                     const U256& fee_growth_inside0_x128,
                                     const U256& fee_growth_inside1_x128) {
    PositionUpdate result = preview(key, liquidity_delta, fee_growth_inside0_x128, fee_growth_inside1_x128);

    if (result.next.liquidity == 0) {
        positions_.erase(key);
    } else {
        positions_[key] = result.next;
    }
    return result.fees;
}

std::optional<Position> PositionManager::get(const PositionKey& key) const {
    auto it = positions_.find(key);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

} // namespace clamm
