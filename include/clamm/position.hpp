#ifndef CLAMM_POSITION_HPP
#define CLAMM_POSITION_HPP

#include <unordered_map>
#include <optional>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Position Key / Info
// =============================================================================

struct PositionKey {
    Address owner;
    int32_t tick_lower;
    int32_t tick_upper;
    Salt salt;

    bool operator==(const PositionKey& other) const {
        return owner == other.owner &&
               tick_lower == other.tick_lower &&
               tick_upper == other.tick_upper &&
               salt == other.salt;
    }
};

struct PositionKeyHash {
    size_t operator()(const PositionKey& key) const {
        uint64_t h = 1469598103934665603ULL;
        auto mix = [&h](uint8_t b) { h = (h ^ b) * 1099511628211ULL; };
        for (auto b : key.owner) mix(b);
        for (int i = 0; i < 4; ++i) mix(static_cast<uint8_t>(static_cast<uint32_t>(key.tick_lower) >> (8 * i)));
        for (int i = 0; i < 4; ++i) mix(static_cast<uint8_t>(static_cast<uint32_t>(key.tick_upper) >> (8 * i)));
        for (auto b : key.salt) mix(b);
        return static_cast<size_t>(h);
    }
};

struct Position {
    U128 liquidity = 0;
    U256 fee_growth_inside0_last_x128;
    U256 fee_growth_inside1_last_x128;
    U128 tokens_owed0 = 0;       // Accrued, not yet paid out
    U128 tokens_owed1 = 0;
};

// Outcome of applying a delta, computed without touching the registry
struct PositionUpdate {
    Position next;
    BalanceDelta fees;           // Positive: owed to the owner
};

// =============================================================================
// PositionManager
// =============================================================================

class PositionManager {
public:
    PositionManager() = default;

    // Accrue fees since the last checkpoint, apply the liquidity delta, refresh
    // the checkpoints and pay out everything owed. The position is created on the
    // first positive delta and erased once its liquidity is back to zero.
    // Throws StateError(CannotUpdateEmptyPosition) when poking an empty position,
    // MathError(Overflow) on liquidity underflow/overflow.
    BalanceDelta update(const PositionKey& key,
                        I128 liquidity_delta,
                        const U256& fee_growth_inside0_x128,
                        const U256& fee_growth_inside1_x128);

    // Same computation as update(), registry untouched
    PositionUpdate preview(const PositionKey& key,
                           I128 liquidity_delta,
                           const U256& fee_growth_inside0_x128,
                           const U256& fee_growth_inside1_x128) const;

    std::optional<Position> get(const PositionKey& key) const;
    size_t size() const { return positions_.size(); }

private:
    std::unordered_map<PositionKey, Position, PositionKeyHash> positions_;
};

} // namespace clamm

#endif // CLAMM_POSITION_HPP
