// MATEICO - Staking Pools Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/pool.h"
#include "mateico/core/amount.h"
#include "mateico/crypto/sha256.h"

#include <algorithm>
#include <sstream>

namespace mateico {
namespace ledger {

// ============================================================================
// Pool Functions
// ============================================================================

LedgerError ValidatePoolParams(const PoolParams& params) {
    if (params.minStake >= params.maxStake ||
        params.maxTotalStaked < params.maxStake) {
        return LedgerError::PoolLimitsMisconfigured;
    }
    if (params.endTime <= params.startTime || params.lockPeriod <= 0) {
        return LedgerError::TimestampsMisconfigured;
    }
    return LedgerError::OK;
}

std::optional<Amount> CalculateReward(Amount amount, uint64_t rateMilli) {
    return MulDiv(amount, rateMilli, RATE_DENOMINATOR);
}

PoolHash ComputePoolHash(const PoolParams& params) {
    DataStream ss;
    ss << params.startTime << params.endTime << params.lockPeriod
       << params.minStake << params.maxStake << params.maxTotalStaked
       << params.rewardRateMilli;
    return SHA256Hash(ss.Data());
}

// ============================================================================
// Pool
// ============================================================================

Amount Pool::UnusedReserve() const {
    Amount unused = maxTotalStaked - totalStaked;
    // Cannot overflow: the full reserve was computed at creation
    return unused * rewardRateMilli / RATE_DENOMINATOR;
}

std::string Pool::ToString() const {
    std::ostringstream ss;
    ss << "Pool {"
       << " hash: " << poolHash.ToHex().substr(0, 16) << "..."
       << ", stake: " << FormatAmount(minStake) << "-" << FormatAmount(maxStake)
       << ", window: " << startTime << "-" << endTime
       << ", rate: " << rewardRateMilli << "/1000"
       << ", lock: " << lockPeriod << "s"
       << ", staked: " << FormatAmount(totalStaked) << "/" << FormatAmount(maxTotalStaked)
       << " }";
    return ss.str();
}

void Pool::Serialize(DataStream& s) const {
    s << minStake << maxStake << startTime << endTime << rewardRateMilli
      << lockPeriod << maxTotalStaked << totalStaked << poolHash;
}

Pool Pool::Unserialize(DataStream& s) {
    Pool pool;
    s >> pool.minStake >> pool.maxStake >> pool.startTime >> pool.endTime
      >> pool.rewardRateMilli >> pool.lockPeriod >> pool.maxTotalStaked
      >> pool.totalStaked >> pool.poolHash;
    return pool;
}

// ============================================================================
// Pool Registry
// ============================================================================

size_t PoolRegistry::Add(const PoolParams& params) {
    Pool pool;
    static_cast<PoolParams&>(pool) = params;
    pool.totalStaked = 0;
    pool.poolHash = ComputePoolHash(params);
    pools_.push_back(pool);
    return pools_.size() - 1;
}

std::optional<Pool> PoolRegistry::Get(size_t index) const {
    if (index >= pools_.size()) {
        return std::nullopt;
    }
    return pools_[index];
}

std::optional<size_t> PoolRegistry::FindByHash(const PoolHash& hash) const {
    for (size_t i = 0; i < pools_.size(); ++i) {
        if (pools_[i].poolHash == hash) {
            return i;
        }
    }
    return std::nullopt;
}

Amount PoolRegistry::UnusedReserveOfExpired(Timestamp now, size_t* expiredCount) const {
    Amount sum = 0;
    size_t count = 0;
    for (const auto& pool : pools_) {
        if (pool.IsExpired(now)) {
            sum += pool.UnusedReserve();
            ++count;
        }
    }
    if (expiredCount) {
        *expiredCount = count;
    }
    return sum;
}

size_t PoolRegistry::RemoveExpired(Timestamp now) {
    size_t removed = 0;
    size_t i = 0;
    while (i < pools_.size()) {
        if (pools_[i].IsExpired(now)) {
            pools_[i] = pools_.back();
            pools_.pop_back();
            ++removed;
            // Slot i now holds the former last pool; examine it next
        } else {
            ++i;
        }
    }
    return removed;
}

void PoolRegistry::Serialize(DataStream& s) const {
    WriteCompactSize(s, pools_.size());
    for (const auto& pool : pools_) {
        pool.Serialize(s);
    }
}

void PoolRegistry::Unserialize(DataStream& s) {
    uint64_t count = ReadCompactSize(s);
    std::vector<Pool> pools;
    pools.reserve(static_cast<size_t>(
        std::min(count, static_cast<uint64_t>(MAX_VECTOR_ALLOCATE / sizeof(Pool)))));
    for (uint64_t i = 0; i < count; ++i) {
        pools.push_back(Pool::Unserialize(s));
    }
    pools_ = std::move(pools);
}

} // namespace ledger
} // namespace mateico
