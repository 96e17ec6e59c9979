// MATEICO - Ledger Error Codes
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Named failure codes shared by the staking and vesting ledgers, and the
// result type returned by operations that move an amount.

#ifndef MATEICO_LEDGER_ERRORS_H
#define MATEICO_LEDGER_ERRORS_H

#include "mateico/core/types.h"

namespace mateico {
namespace ledger {

// ============================================================================
// Error Codes
// ============================================================================

/**
 * Every rejected ledger operation reports exactly one of these and leaves
 * ledger state as it was before the call.
 */
enum class LedgerError {
    OK = 0,

    // Input validation
    WrongPoolIndex,
    WrongPositionIndex,
    PoolMinStake,
    PoolMaxStake,
    PoolIsFull,
    PoolNotYetOpen,
    AlreadyClosed,
    ZeroAmount,
    ZeroAddress,
    TimestampsMisconfigured,
    PoolLimitsMisconfigured,
    StartDateInPast,
    StartAmountAboveTotal,
    AmountOverflow,

    // State preconditions
    NoStakesForCaller,
    NoLocksForCaller,
    NothingToClaim,
    NothingToReclaim,
    NothingToRecover,
    PoolHashMismatch,
    StakeContractNotSet,
    ContractAlreadySet,
    CounterpartMismatch,

    // Authorization
    OnlyAdministrator,
    OnlyVestingContract,
    OnlyPendingOwner,

    // Collaborator failure
    TransferFailed,
};

/// Error name ("PoolIsFull")
const char* LedgerErrorToString(LedgerError error);

/// Human-readable description ("Pool is full")
const char* LedgerErrorMessage(LedgerError error);

// ============================================================================
// Amount Result
// ============================================================================

/**
 * Outcome of an operation that releases an amount (claims, reclamation,
 * recovery): an error code plus the amount moved on success.
 */
struct AmountResult {
    LedgerError error{LedgerError::OK};
    Amount amount{0};

    static AmountResult Success(Amount a) {
        AmountResult r;
        r.amount = a;
        return r;
    }

    static AmountResult Error(LedgerError e) {
        AmountResult r;
        r.error = e;
        return r;
    }

    bool IsOk() const { return error == LedgerError::OK; }
};

using ClaimResult = AmountResult;
using ReclaimResult = AmountResult;
using RecoverResult = AmountResult;

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_ERRORS_H
