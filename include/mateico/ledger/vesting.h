// MATEICO - Vesting Ledger
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Escrowed grants that release linearly between a start and end date,
// with an optional bridge that stakes claimed amounts directly.

#ifndef MATEICO_LEDGER_VESTING_H
#define MATEICO_LEDGER_VESTING_H

#include "mateico/core/types.h"
#include "mateico/core/serialize.h"
#include "mateico/ledger/bridge.h"
#include "mateico/ledger/errors.h"
#include "mateico/ledger/events.h"
#include "mateico/ledger/ownership.h"
#include "mateico/token/token.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mateico {
namespace ledger {

/// A single grant. startAmount is released at startDate, the remainder
/// linearly until endDate.
struct Vest {
    Amount startAmount{0};
    Amount totalAmount{0};
    Timestamp startDate{0};
    Timestamp endDate{0};
    Amount claimed{0};

    Amount Remaining() const { return totalAmount - claimed; }

    void Serialize(DataStream& s) const;
    static Vest Unserialize(DataStream& s);
};

/// Amount of `vest` claimable at `now`, truncating toward the ledger
Amount ClaimableAt(const Vest& vest, Timestamp now);

/**
 * Vesting ledger.
 *
 * Presents itself to wallets like a token ("vested <name>"): balanceOf is
 * the unclaimed remainder and any transfer is a claim.
 */
class VestingLedger {
public:
    VestingLedger(const Address& self,
                  const Address& tokenAddress,
                  std::shared_ptr<token::ITokenLedger> token,
                  std::shared_ptr<IAdministratorGate> admin);

    VestingLedger(const VestingLedger&) = delete;
    VestingLedger& operator=(const VestingLedger&) = delete;

    // === Administration ===

    /// Register a grant for beneficiary, pulling totalAmount from the caller
    LedgerError AddLock(const Address& caller, const Address& beneficiary,
                        Amount startAmount, Amount totalAmount,
                        Timestamp startDate, Timestamp endDate);

    /**
     * Bind the staking ledger used by ClaimToStake. One-time; the target
     * must name this ledger as its vesting counterpart. Grants the target
     * an unlimited allowance over this ledger's tokens.
     */
    LedgerError SetStakeLedger(const Address& caller, std::shared_ptr<IStakeBridge> target);

    /// Reconnect a persisted binding to a live staking ledger; false if
    /// the target is not the one that was bound
    bool AttachStakeLedger(std::shared_ptr<IStakeBridge> target);

    // === Claims ===

    /// Release everything vested so far to the caller
    ClaimResult ClaimAll(const Address& caller);

    /// Release everything vested so far into the bridge staking pool
    ClaimResult ClaimToStake(const Address& caller);

    /// Token-style transfer; recipient and amount are ignored and the
    /// caller's vested amount is claimed
    ClaimResult Transfer(const Address& caller, const Address& to, Amount amount);

    // === Readers ===

    Amount GetVestedTotal() const;
    size_t GetVestingsCount(const Address& user) const;
    std::optional<Vest> GetVesting(const Address& user, size_t index) const;
    std::vector<Vest> GetVestings(const Address& user) const;
    Amount GetClaimable(const Address& user) const;

    /// Unclaimed remainder over all of user's grants
    Amount BalanceOf(const Address& user) const;

    std::string Name() const;
    std::string Symbol() const;
    int Decimals() const;

    Address GetAddress() const { return self_; }
    Address GetTokenAddress() const { return tokenAddress_; }
    Address GetStakeAddress() const;

    // === Events ===

    void SetEventCallback(EventCallback callback);

    // === Persistence ===

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    /// Advance claimed on every vest of user; caller must hold mutex_
    Amount TakeClaimable(const Address& user, Timestamp now);

    bool IsAdmin(const Address& caller) const;

    Address self_;
    Address tokenAddress_;
    std::shared_ptr<token::ITokenLedger> token_;
    std::shared_ptr<IAdministratorGate> admin_;

    std::map<Address, std::vector<Vest>> vests_;
    Amount vestedTotal_{0};

    Address stakeAddress_;
    std::shared_ptr<IStakeBridge> stakeLedger_;

    EventCallback eventCallback_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_VESTING_H
