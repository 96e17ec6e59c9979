// MATEICO - Cross-Ledger Bridge
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// The narrow surface the vesting ledger uses to deposit claimed amounts
// straight into a staking pool.

#ifndef MATEICO_LEDGER_BRIDGE_H
#define MATEICO_LEDGER_BRIDGE_H

#include "mateico/core/types.h"
#include "mateico/ledger/errors.h"

#include <cstdint>

namespace mateico {
namespace ledger {

/// The one pool bridge deposits go to. The index is only trusted while the
/// pool at that index still carries the remembered hash.
struct StakingBridgeTarget {
    uint64_t poolIndex{0};
    PoolHash poolHash;
};

class IStakeBridge {
public:
    virtual ~IStakeBridge() = default;

    /// Address the staking ledger holds its tokens under
    virtual Address GetAddress() const = 0;

    /// The only ledger allowed to call ClaimToStake
    virtual Address GetVestingAddress() const = 0;

    /**
     * Deposit `amount` into the bridge pool on behalf of `beneficiary`,
     * pulling the tokens from `caller`.
     * @param caller Address of the calling vesting ledger
     */
    virtual LedgerError ClaimToStake(const Address& caller, const Address& beneficiary,
                                     Amount amount) = 0;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_BRIDGE_H
