// MATEICO - Reward Accountant
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Aggregate escrow counters of the staking ledger. Each reward reserved
// at pool creation is matched by exactly one debit, either when a deposit
// allocates it or when reclamation releases it.

#ifndef MATEICO_LEDGER_ACCOUNTANT_H
#define MATEICO_LEDGER_ACCOUNTANT_H

#include "mateico/core/types.h"
#include "mateico/core/serialize.h"

namespace mateico {
namespace ledger {

class RewardAccountant {
public:
    /// Reward reserve pulled in for a new pool
    void Reserve(Amount reward);

    /// Deposit: move `reward` from free rewards into a position worth
    /// principal + reward
    void Allocate(Amount reward, Amount principal);

    /// Reclamation: unused reserve leaves the ledger
    void Release(Amount amount);

    /// Claim: matured position totals leave the ledger
    void Settle(Amount amount);

    /// Funds the ledger must hold
    Amount Accounted() const { return totalStakedAndReward_ + totalFreeRewards_; }

    Amount GetTotalFreeRewards() const { return totalFreeRewards_; }
    Amount GetTotalStakedAndReward() const { return totalStakedAndReward_; }

    void Serialize(DataStream& s) const;
    void Unserialize(DataStream& s);

private:
    Amount totalFreeRewards_{0};
    Amount totalStakedAndReward_{0};
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_ACCOUNTANT_H
