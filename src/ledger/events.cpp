// MATEICO - Ledger Events Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/events.h"
#include "mateico/core/amount.h"

#include <sstream>
#include <type_traits>

namespace mateico {
namespace ledger {

const char* EventName(const LedgerEvent& event) {
    return std::visit([](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DepositEvent>) return "Deposit";
        else if constexpr (std::is_same_v<T, WithdrawEvent>) return "Withdraw";
        else if constexpr (std::is_same_v<T, VestingAddedEvent>) return "VestingAdded";
        else return "Claimed";
    }, event);
}

std::string EventToString(const LedgerEvent& event) {
    std::ostringstream ss;
    ss << EventName(event) << " {";

    if (const auto* e = std::get_if<DepositEvent>(&event)) {
        ss << " user: " << e->user.ToHex()
           << ", pool: " << e->poolId
           << ", amount: " << FormatAmount(e->amount)
           << ", unlock: " << e->unlockTime;
    } else if (const auto* e = std::get_if<WithdrawEvent>(&event)) {
        ss << " user: " << e->user.ToHex()
           << ", amount: " << FormatAmount(e->amount);
    } else if (const auto* e = std::get_if<VestingAddedEvent>(&event)) {
        ss << " beneficiary: " << e->beneficiary.ToHex()
           << ", start amount: " << FormatAmount(e->startAmount)
           << ", total: " << FormatAmount(e->totalAmount)
           << ", from: " << e->startDate
           << ", to: " << e->endDate;
    } else if (const auto* e = std::get_if<ClaimedEvent>(&event)) {
        ss << " user: " << e->user.ToHex()
           << ", amount: " << FormatAmount(e->amount);
    }

    ss << " }";
    return ss.str();
}

} // namespace ledger
} // namespace mateico
