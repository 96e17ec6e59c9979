// MATEICO - Staking Ledger
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Fixed-rate staking over timed pools. The administrator funds each pool's
// full reward up front; depositors lock principal for the pool's lock
// period and claim principal plus reward once it has elapsed.

#ifndef MATEICO_LEDGER_STAKING_H
#define MATEICO_LEDGER_STAKING_H

#include "mateico/core/types.h"
#include "mateico/ledger/accountant.h"
#include "mateico/ledger/bridge.h"
#include "mateico/ledger/errors.h"
#include "mateico/ledger/events.h"
#include "mateico/ledger/ownership.h"
#include "mateico/ledger/pool.h"
#include "mateico/ledger/position.h"
#include "mateico/token/token.h"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace mateico {
namespace ledger {

/**
 * Staking ledger.
 *
 * All entry points are serialized by one mutex and read the current time
 * from util::GetTime(). Every operation either commits completely or
 * returns an error with state unchanged, including when a token transfer
 * fails after the ledger has been updated.
 */
class StakingLedger : public IStakeBridge {
public:
    /**
     * @param self Address the ledger's token balance is held under
     * @param tokenAddress Identity of the staked token
     * @param token Token ledger used for all transfers
     * @param vestingAddress Vesting ledger allowed to use ClaimToStake
     * @param admin Administration gate
     */
    StakingLedger(const Address& self,
                  const Address& tokenAddress,
                  std::shared_ptr<token::ITokenLedger> token,
                  const Address& vestingAddress,
                  std::shared_ptr<IAdministratorGate> admin);

    StakingLedger(const StakingLedger&) = delete;
    StakingLedger& operator=(const StakingLedger&) = delete;

    // === Administration ===

    /// Create a pool and pull its full reward reserve from the caller
    LedgerError CreatePool(const Address& caller, const PoolParams& params);

    /// Release the unused reserve of every expired pool and remove them
    ReclaimResult ReclaimExpiredPools(const Address& caller);

    /// Select the pool bridge deposits go to
    LedgerError SetBridgePool(const Address& caller, uint64_t poolIndex);

    /// Send tokens held beyond the accounted totals to the caller;
    /// amount 0 recovers all of them
    RecoverResult RecoverStrayTokens(const Address& caller, Amount amount);

    // === Staking ===

    /// Lock `amount` in pool `poolIndex`
    LedgerError Deposit(const Address& caller, uint64_t poolIndex, Amount amount);

    /// Withdraw every matured position
    ClaimResult ClaimAll(const Address& caller);

    /// Withdraw one matured position
    ClaimResult ClaimOne(const Address& caller, uint64_t positionIndex);

    // === Bridge ===

    Address GetAddress() const override { return self_; }
    Address GetVestingAddress() const override { return vestingAddress_; }
    LedgerError ClaimToStake(const Address& caller, const Address& beneficiary,
                             Amount amount) override;

    // === Readers ===

    size_t GetPoolCount() const;
    std::optional<Pool> GetPool(uint64_t index) const;
    std::vector<Pool> GetPools() const;

    Amount GetTotalStakedAndReward() const;
    Amount GetTotalFreeRewards() const;

    std::vector<Position> GetUserStakes(const Address& user) const;
    size_t GetUserStakeCount(const Address& user) const;

    /// Sum of all open positions of user
    Amount GetStakedWithRewards(const Address& user) const;

    /// Sum of user's positions matured now
    Amount GetClaimable(const Address& user) const;

    /// Cumulative principal user has deposited into a pool
    Amount GetUserPoolBalance(const PoolHash& pool, const Address& user) const;

    std::optional<StakingBridgeTarget> GetBridgePool() const;
    bool IsBridgeConfigured() const;

    Address GetTokenAddress() const { return tokenAddress_; }

    // === Events ===

    void SetEventCallback(EventCallback callback);

    // === Persistence ===

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    /// Shared deposit path; caller must hold mutex_
    LedgerError DepositLocked(const Address& beneficiary, const Address& payer,
                              uint64_t poolIndex, Amount amount, Timestamp now,
                              DepositEvent& event);

    bool IsAdmin(const Address& caller) const;
    /// Invoked after mutex_ is released
    static void Emit(const EventCallback& callback, const LedgerEvent& event);

    Address self_;
    Address tokenAddress_;
    std::shared_ptr<token::ITokenLedger> token_;
    Address vestingAddress_;
    std::shared_ptr<IAdministratorGate> admin_;

    PoolRegistry pools_;
    PositionBook positions_;
    PoolKeyedBalance poolBalances_;
    RewardAccountant accountant_;
    std::optional<StakingBridgeTarget> bridgePool_;

    EventCallback eventCallback_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_STAKING_H
