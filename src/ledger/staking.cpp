// MATEICO - Staking Ledger Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/staking.h"
#include "mateico/core/amount.h"
#include "mateico/core/serialize.h"
#include "mateico/util/logging.h"
#include "mateico/util/time.h"

#include <ios>

namespace mateico {
namespace ledger {

namespace {

LedgerError Reject(const char* op, LedgerError error) {
    LOG_DEBUG(util::LogCategory::STAKING) << op << " rejected: " << LedgerErrorToString(error);
    return error;
}

AmountResult RejectAmount(const char* op, LedgerError error) {
    return AmountResult::Error(Reject(op, error));
}

void WarnTransfer(const char* op, const char* direction, Amount amount) {
    LOG_WARN(util::LogCategory::STAKING) << op << ": token " << direction
                                         << " of " << FormatAmount(amount) << " failed";
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

StakingLedger::StakingLedger(const Address& self,
                             const Address& tokenAddress,
                             std::shared_ptr<token::ITokenLedger> token,
                             const Address& vestingAddress,
                             std::shared_ptr<IAdministratorGate> admin)
    : self_(self)
    , tokenAddress_(tokenAddress)
    , token_(std::move(token))
    , vestingAddress_(vestingAddress)
    , admin_(std::move(admin)) {}

bool StakingLedger::IsAdmin(const Address& caller) const {
    return admin_ && admin_->IsAdministrator(caller);
}

void StakingLedger::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

void StakingLedger::Emit(const EventCallback& callback, const LedgerEvent& event) {
    if (callback) {
        callback(event);
    }
}

// ============================================================================
// Administration
// ============================================================================

LedgerError StakingLedger::CreatePool(const Address& caller, const PoolParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsAdmin(caller)) {
        return Reject("CreatePool", LedgerError::OnlyAdministrator);
    }

    LedgerError error = ValidatePoolParams(params);
    if (error != LedgerError::OK) {
        return Reject("CreatePool", error);
    }

    auto reward = CalculateReward(params.maxTotalStaked, params.rewardRateMilli);
    if (!reward || *reward > MAX_AMOUNT - accountant_.Accounted()) {
        return Reject("CreatePool", LedgerError::AmountOverflow);
    }

    if (!token_->TransferFrom(self_, caller, self_, *reward)) {
        WarnTransfer("CreatePool", "pull", *reward);
        return Reject("CreatePool", LedgerError::TransferFailed);
    }

    size_t index = pools_.Add(params);
    accountant_.Reserve(*reward);

    LOG_INFO(util::LogCategory::STAKING) << "Created pool " << index << " "
                                         << pools_.At(index).ToString()
                                         << ", reserve " << FormatAmount(*reward);
    return LedgerError::OK;
}

ReclaimResult StakingLedger::ReclaimExpiredPools(const Address& caller) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsAdmin(caller)) {
        return RejectAmount("ReclaimExpiredPools", LedgerError::OnlyAdministrator);
    }

    Timestamp now = util::GetTime();
    size_t expired = 0;
    Amount sum = pools_.UnusedReserveOfExpired(now, &expired);
    if (expired == 0 || sum == 0) {
        return RejectAmount("ReclaimExpiredPools", LedgerError::NothingToReclaim);
    }

    std::vector<Pool> savedPools = pools_.All();
    RewardAccountant savedAccountant = accountant_;

    size_t removed = pools_.RemoveExpired(now);
    accountant_.Release(sum);

    if (!token_->Transfer(self_, caller, sum)) {
        pools_.Assign(std::move(savedPools));
        accountant_ = savedAccountant;
        WarnTransfer("ReclaimExpiredPools", "push", sum);
        return RejectAmount("ReclaimExpiredPools", LedgerError::TransferFailed);
    }

    LOG_INFO(util::LogCategory::STAKING) << "Reclaimed " << FormatAmount(sum)
                                         << " from " << removed << " expired pool(s), "
                                         << pools_.Count() << " remaining";
    return ReclaimResult::Success(sum);
}

LedgerError StakingLedger::SetBridgePool(const Address& caller, uint64_t poolIndex) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsAdmin(caller)) {
        return Reject("SetBridgePool", LedgerError::OnlyAdministrator);
    }
    if (!pools_.Contains(poolIndex)) {
        return Reject("SetBridgePool", LedgerError::WrongPoolIndex);
    }

    StakingBridgeTarget target;
    target.poolIndex = poolIndex;
    target.poolHash = pools_.At(poolIndex).poolHash;
    bridgePool_ = target;

    LOG_INFO(util::LogCategory::STAKING) << "Bridge pool set to " << poolIndex
                                         << " (" << target.poolHash.ToHex().substr(0, 16) << ")";
    return LedgerError::OK;
}

RecoverResult StakingLedger::RecoverStrayTokens(const Address& caller, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsAdmin(caller)) {
        return RejectAmount("RecoverStrayTokens", LedgerError::OnlyAdministrator);
    }

    Amount balance = token_->BalanceOf(self_);
    Amount accounted = accountant_.Accounted();
    Amount stray = balance > accounted ? balance - accounted : 0;
    if (stray == 0 || stray < amount) {
        return RejectAmount("RecoverStrayTokens", LedgerError::NothingToRecover);
    }

    Amount toSend = amount == 0 ? stray : amount;
    if (!token_->Transfer(self_, caller, toSend)) {
        WarnTransfer("RecoverStrayTokens", "push", toSend);
        return RejectAmount("RecoverStrayTokens", LedgerError::TransferFailed);
    }

    LOG_INFO(util::LogCategory::STAKING) << "Recovered " << FormatAmount(toSend)
                                         << " stray tokens to " << caller.ToHex();
    return RecoverResult::Success(toSend);
}

// ============================================================================
// Staking
// ============================================================================

LedgerError StakingLedger::DepositLocked(const Address& beneficiary, const Address& payer,
                                         uint64_t poolIndex, Amount amount, Timestamp now,
                                         DepositEvent& event) {
    if (amount == 0) {
        return LedgerError::ZeroAmount;
    }
    if (!pools_.Contains(poolIndex)) {
        return LedgerError::WrongPoolIndex;
    }

    const Pool& pool = pools_.At(poolIndex);
    if (now <= pool.startTime) {
        return LedgerError::PoolNotYetOpen;
    }
    if (now >= pool.endTime) {
        return LedgerError::AlreadyClosed;
    }
    if (amount > pool.maxTotalStaked - pool.totalStaked) {
        return LedgerError::PoolIsFull;
    }

    // Bounded by maxTotalStaked, so the sum cannot overflow
    Amount userBalance = poolBalances_.Get(pool.poolHash, beneficiary) + amount;
    if (userBalance < pool.minStake) {
        return LedgerError::PoolMinStake;
    }
    if (userBalance > pool.maxStake) {
        return LedgerError::PoolMaxStake;
    }

    auto reward = CalculateReward(amount, pool.rewardRateMilli);
    if (!reward) {
        return LedgerError::AmountOverflow;
    }

    if (!token_->TransferFrom(self_, payer, self_, amount)) {
        WarnTransfer("Deposit", "pull", amount);
        return LedgerError::TransferFailed;
    }

    Position position;
    position.unlockTime = now + pool.lockPeriod;
    position.totalAmount = amount + *reward;

    pools_.At(poolIndex).totalStaked += amount;
    poolBalances_.Set(pool.poolHash, beneficiary, userBalance);
    positions_.Append(beneficiary, position);
    accountant_.Allocate(*reward, amount);

    event.user = beneficiary;
    event.poolId = poolIndex;
    event.amount = amount;
    event.unlockTime = position.unlockTime;
    return LedgerError::OK;
}

LedgerError StakingLedger::Deposit(const Address& caller, uint64_t poolIndex, Amount amount) {
    DepositEvent event;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        LedgerError error = DepositLocked(caller, caller, poolIndex, amount,
                                          util::GetTime(), event);
        if (error != LedgerError::OK) {
            return Reject("Deposit", error);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Deposit " << FormatAmount(amount)
                                         << " into pool " << poolIndex
                                         << " by " << caller.ToHex()
                                         << ", unlocks at " << event.unlockTime;
    Emit(callback, event);
    return LedgerError::OK;
}

ClaimResult StakingLedger::ClaimAll(const Address& caller) {
    Amount sum = 0;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (positions_.Count(caller) == 0) {
            return RejectAmount("ClaimAll", LedgerError::NoStakesForCaller);
        }

        Timestamp now = util::GetTime();
        std::vector<Position> saved = positions_.GetPositions(caller);
        sum = positions_.TakeMatured(caller, now);
        if (sum == 0) {
            positions_.Restore(caller, std::move(saved));
            return RejectAmount("ClaimAll", LedgerError::NothingToClaim);
        }

        RewardAccountant savedAccountant = accountant_;
        accountant_.Settle(sum);

        if (!token_->Transfer(self_, caller, sum)) {
            positions_.Restore(caller, std::move(saved));
            accountant_ = savedAccountant;
            WarnTransfer("ClaimAll", "push", sum);
            return RejectAmount("ClaimAll", LedgerError::TransferFailed);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Withdraw " << FormatAmount(sum)
                                         << " to " << caller.ToHex();
    Emit(callback, WithdrawEvent{caller, sum});
    return ClaimResult::Success(sum);
}

ClaimResult StakingLedger::ClaimOne(const Address& caller, uint64_t positionIndex) {
    Amount amount = 0;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        size_t count = positions_.Count(caller);
        if (count == 0) {
            return RejectAmount("ClaimOne", LedgerError::NoStakesForCaller);
        }
        if (positionIndex >= count) {
            return RejectAmount("ClaimOne", LedgerError::WrongPositionIndex);
        }

        const Position& position = positions_.At(caller, positionIndex);
        if (!position.IsMatured(util::GetTime())) {
            return RejectAmount("ClaimOne", LedgerError::NothingToClaim);
        }
        amount = position.totalAmount;

        std::vector<Position> saved = positions_.GetPositions(caller);
        RewardAccountant savedAccountant = accountant_;
        positions_.RemoveAt(caller, positionIndex);
        accountant_.Settle(amount);

        if (!token_->Transfer(self_, caller, amount)) {
            positions_.Restore(caller, std::move(saved));
            accountant_ = savedAccountant;
            WarnTransfer("ClaimOne", "push", amount);
            return RejectAmount("ClaimOne", LedgerError::TransferFailed);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Withdraw " << FormatAmount(amount)
                                         << " (position " << positionIndex << ") to "
                                         << caller.ToHex();
    Emit(callback, WithdrawEvent{caller, amount});
    return ClaimResult::Success(amount);
}

// ============================================================================
// Bridge
// ============================================================================

LedgerError StakingLedger::ClaimToStake(const Address& caller, const Address& beneficiary,
                                        Amount amount) {
    DepositEvent event;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (vestingAddress_.IsNull() || caller != vestingAddress_) {
            return Reject("ClaimToStake", LedgerError::OnlyVestingContract);
        }
        if (!bridgePool_ || !pools_.Contains(bridgePool_->poolIndex) ||
            pools_.At(bridgePool_->poolIndex).poolHash != bridgePool_->poolHash) {
            return Reject("ClaimToStake", LedgerError::PoolHashMismatch);
        }

        LedgerError error = DepositLocked(beneficiary, caller, bridgePool_->poolIndex, amount,
                                          util::GetTime(), event);
        if (error != LedgerError::OK) {
            return Reject("ClaimToStake", error);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Bridge deposit " << FormatAmount(amount)
                                         << " into pool " << event.poolId
                                         << " for " << beneficiary.ToHex();
    Emit(callback, event);
    return LedgerError::OK;
}

// ============================================================================
// Readers
// ============================================================================

size_t StakingLedger::GetPoolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.Count();
}

std::optional<Pool> StakingLedger::GetPool(uint64_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.Get(index);
}

std::vector<Pool> StakingLedger::GetPools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.All();
}

Amount StakingLedger::GetTotalStakedAndReward() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accountant_.GetTotalStakedAndReward();
}

Amount StakingLedger::GetTotalFreeRewards() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accountant_.GetTotalFreeRewards();
}

std::vector<Position> StakingLedger::GetUserStakes(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.GetPositions(user);
}

size_t StakingLedger::GetUserStakeCount(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.Count(user);
}

Amount StakingLedger::GetStakedWithRewards(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.TotalOf(user);
}

Amount StakingLedger::GetClaimable(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.Claimable(user, util::GetTime());
}

Amount StakingLedger::GetUserPoolBalance(const PoolHash& pool, const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return poolBalances_.Get(pool, user);
}

std::optional<StakingBridgeTarget> StakingLedger::GetBridgePool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bridgePool_;
}

bool StakingLedger::IsBridgeConfigured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bridgePool_.has_value();
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> StakingLedger::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;

    pools_.Serialize(ss);
    positions_.Serialize(ss);
    poolBalances_.Serialize(ss);
    accountant_.Serialize(ss);

    ss << bridgePool_.has_value();
    if (bridgePool_) {
        ss << bridgePool_->poolIndex << bridgePool_->poolHash;
    }

    return std::vector<Byte>(ss.begin(), ss.end());
}

bool StakingLedger::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    try {
        DataStream ss(data, len);

        PoolRegistry pools;
        PositionBook positions;
        PoolKeyedBalance poolBalances;
        RewardAccountant accountant;
        std::optional<StakingBridgeTarget> bridgePool;

        pools.Unserialize(ss);
        positions.Unserialize(ss);
        poolBalances.Unserialize(ss);
        accountant.Unserialize(ss);

        bool hasBridge = false;
        ss >> hasBridge;
        if (hasBridge) {
            StakingBridgeTarget target;
            ss >> target.poolIndex >> target.poolHash;
            bridgePool = target;
        }

        if (!ss.empty()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        pools_ = std::move(pools);
        positions_ = std::move(positions);
        poolBalances_ = std::move(poolBalances);
        accountant_ = accountant;
        bridgePool_ = bridgePool;
        return true;
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace ledger
} // namespace mateico
