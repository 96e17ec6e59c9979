// MATEICO - Ledger Error Codes Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/errors.h"

namespace mateico {
namespace ledger {

const char* LedgerErrorToString(LedgerError error) {
    switch (error) {
        case LedgerError::OK: return "OK";
        case LedgerError::WrongPoolIndex: return "WrongPoolIndex";
        case LedgerError::WrongPositionIndex: return "WrongPositionIndex";
        case LedgerError::PoolMinStake: return "PoolMinStake";
        case LedgerError::PoolMaxStake: return "PoolMaxStake";
        case LedgerError::PoolIsFull: return "PoolIsFull";
        case LedgerError::PoolNotYetOpen: return "PoolNotYetOpen";
        case LedgerError::AlreadyClosed: return "AlreadyClosed";
        case LedgerError::ZeroAmount: return "ZeroAmount";
        case LedgerError::ZeroAddress: return "ZeroAddress";
        case LedgerError::TimestampsMisconfigured: return "TimestampsMisconfigured";
        case LedgerError::PoolLimitsMisconfigured: return "PoolLimitsMisconfigured";
        case LedgerError::StartDateInPast: return "StartDateInPast";
        case LedgerError::StartAmountAboveTotal: return "StartAmountAboveTotal";
        case LedgerError::AmountOverflow: return "AmountOverflow";
        case LedgerError::NoStakesForCaller: return "NoStakesForCaller";
        case LedgerError::NoLocksForCaller: return "NoLocksForCaller";
        case LedgerError::NothingToClaim: return "NothingToClaim";
        case LedgerError::NothingToReclaim: return "NothingToReclaim";
        case LedgerError::NothingToRecover: return "NothingToRecover";
        case LedgerError::PoolHashMismatch: return "PoolHashMismatch";
        case LedgerError::StakeContractNotSet: return "StakeContractNotSet";
        case LedgerError::ContractAlreadySet: return "ContractAlreadySet";
        case LedgerError::CounterpartMismatch: return "CounterpartMismatch";
        case LedgerError::OnlyAdministrator: return "OnlyAdministrator";
        case LedgerError::OnlyVestingContract: return "OnlyVestingContract";
        case LedgerError::OnlyPendingOwner: return "OnlyPendingOwner";
        case LedgerError::TransferFailed: return "TransferFailed";
        default: return "Unknown";
    }
}

const char* LedgerErrorMessage(LedgerError error) {
    switch (error) {
        case LedgerError::OK: return "Success";
        case LedgerError::WrongPoolIndex: return "Wrong pool index";
        case LedgerError::WrongPositionIndex: return "Wrong stake index";
        case LedgerError::PoolMinStake: return "Pool min stake per user";
        case LedgerError::PoolMaxStake: return "Pool max stake per user";
        case LedgerError::PoolIsFull: return "Pool is full";
        case LedgerError::PoolNotYetOpen: return "Pool not yet open";
        case LedgerError::AlreadyClosed: return "Already closed";
        case LedgerError::ZeroAmount: return "Zero amount";
        case LedgerError::ZeroAddress: return "Zero address";
        case LedgerError::TimestampsMisconfigured: return "Timestamps misconfigured";
        case LedgerError::PoolLimitsMisconfigured: return "Pool stake limits misconfigured";
        case LedgerError::StartDateInPast: return "startDate below current time";
        case LedgerError::StartAmountAboveTotal: return "Start amount above total amount";
        case LedgerError::AmountOverflow: return "Amount overflow";
        case LedgerError::NoStakesForCaller: return "No stakes for user";
        case LedgerError::NoLocksForCaller: return "No locks for user";
        case LedgerError::NothingToClaim: return "Nothing to claim";
        case LedgerError::NothingToReclaim: return "Nothing to reclaim";
        case LedgerError::NothingToRecover: return "Nothing to recover";
        case LedgerError::PoolHashMismatch: return "Pool hash mismatch";
        case LedgerError::StakeContractNotSet: return "Stake contract not set";
        case LedgerError::ContractAlreadySet: return "Contract already set";
        case LedgerError::CounterpartMismatch: return "Stake contract bound to another vesting ledger";
        case LedgerError::OnlyAdministrator: return "Only for Owner";
        case LedgerError::OnlyVestingContract: return "Only for vesting contract";
        case LedgerError::OnlyPendingOwner: return "Only newOwner";
        case LedgerError::TransferFailed: return "Token transfer failed";
        default: return "Unknown error";
    }
}

} // namespace ledger
} // namespace mateico
