// MATEICO - Staking Pools
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Timed reward pools and the ordered registry that holds them. A pool
// accepts deposits inside its window and pays a fixed per-mille reward
// on principal after the lock period.

#ifndef MATEICO_LEDGER_POOL_H
#define MATEICO_LEDGER_POOL_H

#include "mateico/core/types.h"
#include "mateico/core/serialize.h"
#include "mateico/ledger/errors.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mateico {
namespace ledger {

// ============================================================================
// Pool Types
// ============================================================================

/// The seven creation parameters of a pool
struct PoolParams {
    /// Per-user cumulative stake bounds
    Amount minStake{0};
    Amount maxStake{0};

    /// Deposit window (open strictly after start, closed from end)
    Timestamp startTime{0};
    Timestamp endTime{0};

    /// Reward per 1000 units of principal
    uint64_t rewardRateMilli{0};

    /// Lock applied to each deposit
    Duration lockPeriod{0};

    /// Pool capacity; the reward reserve is sized against it
    Amount maxTotalStaked{0};
};

/// A live pool
struct Pool : PoolParams {
    Amount totalStaked{0};
    PoolHash poolHash;

    /// Deposits accepted at `now`
    bool IsOpen(Timestamp now) const {
        return now > startTime && now < endTime;
    }

    /// Window closed; unused reserve may be reclaimed
    bool IsExpired(Timestamp now) const {
        return now >= endTime;
    }

    /// Reserve not yet allocated to deposits
    Amount UnusedReserve() const;

    std::string ToString() const;

    void Serialize(DataStream& s) const;
    static Pool Unserialize(DataStream& s);
};

// ============================================================================
// Pool Functions
// ============================================================================

/// Check the creation invariants:
/// minStake < maxStake <= maxTotalStaked, startTime < endTime, lockPeriod > 0
LedgerError ValidatePoolParams(const PoolParams& params);

/// amount * rateMilli / 1000, truncated; nullopt on overflow
std::optional<Amount> CalculateReward(Amount amount, uint64_t rateMilli);

/// SHA-256 over the creation parameters, little-endian:
/// startTime(8) endTime(8) lockPeriod(8) minStake(16) maxStake(16)
/// maxTotalStaked(16) rewardRateMilli(8)
/// No index or nonce is mixed in: pools created with identical parameters
/// share one hash, and with it their per-caller PoolKeyedBalance entries.
PoolHash ComputePoolHash(const PoolParams& params);

// ============================================================================
// Pool Registry
// ============================================================================

/**
 * Ordered pool collection. Removal swaps the last pool into the freed
 * slot, so indices are not stable across reclamation; poolHash is.
 */
class PoolRegistry {
public:
    PoolRegistry() = default;

    /// Append a new pool with totalStaked = 0; returns its index
    size_t Add(const PoolParams& params);

    size_t Count() const { return pools_.size(); }

    bool Contains(size_t index) const { return index < pools_.size(); }

    /// Pool at index (copy), nullopt if out of range
    std::optional<Pool> Get(size_t index) const;

    /// Mutable access; index must be in range
    Pool& At(size_t index) { return pools_.at(index); }
    const Pool& At(size_t index) const { return pools_.at(index); }

    const std::vector<Pool>& All() const { return pools_; }

    /// Lowest index of a pool with this hash
    std::optional<size_t> FindByHash(const PoolHash& hash) const;

    /// Sum of unused reserve over pools expired at `now`
    Amount UnusedReserveOfExpired(Timestamp now, size_t* expiredCount = nullptr) const;

    /// Remove every pool expired at `now` (swap-with-last, re-examining the
    /// swapped-in slot); returns the number removed
    size_t RemoveExpired(Timestamp now);

    /// Replace the whole collection (rollback and restore)
    void Assign(std::vector<Pool> pools) { pools_ = std::move(pools); }

    void Serialize(DataStream& s) const;
    void Unserialize(DataStream& s);

private:
    std::vector<Pool> pools_;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_POOL_H
