// MATEICO - Reward Accountant Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/accountant.h"

#include <stdexcept>

namespace mateico {
namespace ledger {

void RewardAccountant::Reserve(Amount reward) {
    if (reward > MAX_AMOUNT - Accounted()) {
        throw std::overflow_error("RewardAccountant::Reserve: overflow");
    }
    totalFreeRewards_ += reward;
}

void RewardAccountant::Allocate(Amount reward, Amount principal) {
    if (reward > totalFreeRewards_) {
        throw std::logic_error("RewardAccountant::Allocate: reserve exhausted");
    }
    totalFreeRewards_ -= reward;
    totalStakedAndReward_ += principal + reward;
}

void RewardAccountant::Release(Amount amount) {
    if (amount > totalFreeRewards_) {
        throw std::logic_error("RewardAccountant::Release: exceeds free rewards");
    }
    totalFreeRewards_ -= amount;
}

void RewardAccountant::Settle(Amount amount) {
    if (amount > totalStakedAndReward_) {
        throw std::logic_error("RewardAccountant::Settle: exceeds staked total");
    }
    totalStakedAndReward_ -= amount;
}

void RewardAccountant::Serialize(DataStream& s) const {
    s << totalFreeRewards_ << totalStakedAndReward_;
}

void RewardAccountant::Unserialize(DataStream& s) {
    s >> totalFreeRewards_ >> totalStakedAndReward_;
}

} // namespace ledger
} // namespace mateico
