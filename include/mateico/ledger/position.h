// MATEICO - Staking Positions
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Per-caller open positions and the pool-keyed principal balances used
// for stake bounds.

#ifndef MATEICO_LEDGER_POSITION_H
#define MATEICO_LEDGER_POSITION_H

#include "mateico/core/types.h"
#include "mateico/core/serialize.h"

#include <map>
#include <utility>
#include <vector>

namespace mateico {
namespace ledger {

/// Principal plus reward, locked until unlockTime
struct Position {
    Timestamp unlockTime{0};
    Amount totalAmount{0};

    /// Claimable strictly after the unlock time
    bool IsMatured(Timestamp now) const { return now > unlockTime; }

    bool operator==(const Position& other) const {
        return unlockTime == other.unlockTime && totalAmount == other.totalAmount;
    }
};

// ============================================================================
// Position Book
// ============================================================================

/**
 * Open positions grouped by owner. Claimed positions are removed by
 * swapping the last position into the slot, so order is not preserved.
 */
class PositionBook {
public:
    void Append(const Address& owner, const Position& position);

    /// Open positions of owner (empty if none)
    std::vector<Position> GetPositions(const Address& owner) const;

    size_t Count(const Address& owner) const;

    /// Sum of all open position totals
    Amount TotalOf(const Address& owner) const;

    /// Sum of positions matured at `now`
    Amount Claimable(const Address& owner, Timestamp now) const;

    /// Remove every matured position and return their sum
    Amount TakeMatured(const Address& owner, Timestamp now);

    /// Position at index; index must be valid
    const Position& At(const Address& owner, size_t index) const;

    /// Remove the position at index by swap-with-last
    void RemoveAt(const Address& owner, size_t index);

    /// Replace owner's positions (rollback)
    void Restore(const Address& owner, std::vector<Position> positions);

    size_t OwnerCount() const { return positions_.size(); }

    void Serialize(DataStream& s) const;
    void Unserialize(DataStream& s);

private:
    std::map<Address, std::vector<Position>> positions_;
};

// ============================================================================
// Pool Keyed Balance
// ============================================================================

/// Cumulative principal per (poolHash, owner); never reduced by claims
class PoolKeyedBalance {
public:
    Amount Get(const PoolHash& pool, const Address& owner) const;
    void Add(const PoolHash& pool, const Address& owner, Amount amount);
    void Set(const PoolHash& pool, const Address& owner, Amount amount);

    void Serialize(DataStream& s) const;
    void Unserialize(DataStream& s);

private:
    std::map<std::pair<PoolHash, Address>, Amount> balances_;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_POSITION_H
