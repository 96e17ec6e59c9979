// MATEICO - Ledger Events
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Notifications emitted by the staking and vesting ledgers after a
// successful state change.

#ifndef MATEICO_LEDGER_EVENTS_H
#define MATEICO_LEDGER_EVENTS_H

#include "mateico/core/types.h"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace mateico {
namespace ledger {

/// Principal accepted into a pool
struct DepositEvent {
    Address user;
    uint64_t poolId{0};
    Amount amount{0};
    Timestamp unlockTime{0};
};

/// Matured positions paid out
struct WithdrawEvent {
    Address user;
    Amount amount{0};
};

/// Escrowed grant registered
struct VestingAddedEvent {
    Address beneficiary;
    Amount startAmount{0};
    Amount totalAmount{0};
    Timestamp startDate{0};
    Timestamp endDate{0};
};

/// Vested amount released
struct ClaimedEvent {
    Address user;
    Amount amount{0};
};

using LedgerEvent = std::variant<DepositEvent, WithdrawEvent, VestingAddedEvent, ClaimedEvent>;

/// Observer invoked synchronously, after state is committed
using EventCallback = std::function<void(const LedgerEvent&)>;

/// Event name ("Deposit", "Withdraw", "VestingAdded", "Claimed")
const char* EventName(const LedgerEvent& event);

/// One-line description for logs and the command-line tool
std::string EventToString(const LedgerEvent& event);

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_EVENTS_H
