// MATEICO - Vesting Ledger Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/vesting.h"
#include "mateico/core/amount.h"
#include "mateico/util/logging.h"
#include "mateico/util/time.h"

#include <ios>

namespace mateico {
namespace ledger {

namespace {

LedgerError Reject(const char* op, LedgerError error) {
    LOG_DEBUG(util::LogCategory::VESTING) << op << " rejected: " << LedgerErrorToString(error);
    return error;
}

AmountResult RejectAmount(const char* op, LedgerError error) {
    return AmountResult::Error(Reject(op, error));
}

} // anonymous namespace

// ============================================================================
// Vest
// ============================================================================

void Vest::Serialize(DataStream& s) const {
    s << startAmount << totalAmount << startDate << endDate << claimed;
}

Vest Vest::Unserialize(DataStream& s) {
    Vest vest;
    s >> vest.startAmount >> vest.totalAmount >> vest.startDate >> vest.endDate >> vest.claimed;
    return vest;
}

Amount ClaimableAt(const Vest& vest, Timestamp now) {
    if (now <= vest.startDate) {
        return 0;
    }
    if (now >= vest.endDate) {
        return vest.totalAmount - vest.claimed;
    }

    // floor(linear * elapsed / duration) split so the product stays in range
    Amount linear = vest.totalAmount - vest.startAmount;
    Amount elapsed = static_cast<Amount>(now - vest.startDate);
    Amount duration = static_cast<Amount>(vest.endDate - vest.startDate);
    Amount released = (linear / duration) * elapsed + (linear % duration) * elapsed / duration;

    Amount vested = vest.startAmount + released;
    return vested > vest.claimed ? vested - vest.claimed : 0;
}

// ============================================================================
// Construction
// ============================================================================

VestingLedger::VestingLedger(const Address& self,
                             const Address& tokenAddress,
                             std::shared_ptr<token::ITokenLedger> token,
                             std::shared_ptr<IAdministratorGate> admin)
    : self_(self)
    , tokenAddress_(tokenAddress)
    , token_(std::move(token))
    , admin_(std::move(admin)) {}

bool VestingLedger::IsAdmin(const Address& caller) const {
    return admin_ && admin_->IsAdministrator(caller);
}

void VestingLedger::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

// ============================================================================
// Administration
// ============================================================================

LedgerError VestingLedger::AddLock(const Address& caller, const Address& beneficiary,
                                   Amount startAmount, Amount totalAmount,
                                   Timestamp startDate, Timestamp endDate) {
    VestingAddedEvent event;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!IsAdmin(caller)) {
            return Reject("AddLock", LedgerError::OnlyAdministrator);
        }
        if (totalAmount == 0) {
            return Reject("AddLock", LedgerError::ZeroAmount);
        }
        if (beneficiary.IsNull()) {
            return Reject("AddLock", LedgerError::ZeroAddress);
        }
        if (startDate <= util::GetTime()) {
            return Reject("AddLock", LedgerError::StartDateInPast);
        }
        if (endDate <= startDate) {
            return Reject("AddLock", LedgerError::TimestampsMisconfigured);
        }
        if (startAmount > totalAmount) {
            return Reject("AddLock", LedgerError::StartAmountAboveTotal);
        }
        if (totalAmount > MAX_AMOUNT - vestedTotal_) {
            return Reject("AddLock", LedgerError::AmountOverflow);
        }

        if (!token_->TransferFrom(self_, caller, self_, totalAmount)) {
            LOG_WARN(util::LogCategory::VESTING) << "AddLock: token pull of "
                                                 << FormatAmount(totalAmount) << " failed";
            return Reject("AddLock", LedgerError::TransferFailed);
        }

        Vest vest;
        vest.startAmount = startAmount;
        vest.totalAmount = totalAmount;
        vest.startDate = startDate;
        vest.endDate = endDate;
        vests_[beneficiary].push_back(vest);
        vestedTotal_ += totalAmount;

        event.beneficiary = beneficiary;
        event.startAmount = startAmount;
        event.totalAmount = totalAmount;
        event.startDate = startDate;
        event.endDate = endDate;
        callback = eventCallback_;
    }

    LogInfoF(util::LogCategory::VESTING, "VestingAdded for %s: %s (%s at start) from %s to %s",
             beneficiary.ToHex().c_str(), FormatAmount(totalAmount).c_str(),
             FormatAmount(startAmount).c_str(), util::FormatISO8601(startDate).c_str(),
             util::FormatISO8601(endDate).c_str());
    if (callback) {
        callback(event);
    }
    return LedgerError::OK;
}

LedgerError VestingLedger::SetStakeLedger(const Address& caller,
                                          std::shared_ptr<IStakeBridge> target) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!IsAdmin(caller)) {
        return Reject("SetStakeLedger", LedgerError::OnlyAdministrator);
    }
    if (!stakeAddress_.IsNull()) {
        return Reject("SetStakeLedger", LedgerError::ContractAlreadySet);
    }
    if (!target || target->GetAddress().IsNull()) {
        return Reject("SetStakeLedger", LedgerError::ZeroAddress);
    }
    if (target->GetVestingAddress() != self_) {
        return Reject("SetStakeLedger", LedgerError::CounterpartMismatch);
    }
    if (!token_->Approve(self_, target->GetAddress(), MAX_AMOUNT)) {
        LOG_WARN(util::LogCategory::VESTING) << "SetStakeLedger: allowance grant failed";
        return Reject("SetStakeLedger", LedgerError::TransferFailed);
    }

    stakeAddress_ = target->GetAddress();
    stakeLedger_ = std::move(target);

    LOG_INFO(util::LogCategory::VESTING) << "Bound staking ledger " << stakeAddress_.ToHex();
    return LedgerError::OK;
}

bool VestingLedger::AttachStakeLedger(std::shared_ptr<IStakeBridge> target) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!target || stakeAddress_.IsNull() || target->GetAddress() != stakeAddress_) {
        return false;
    }
    stakeLedger_ = std::move(target);
    return true;
}

// ============================================================================
// Claims
// ============================================================================

Amount VestingLedger::TakeClaimable(const Address& user, Timestamp now) {
    Amount sum = 0;
    auto it = vests_.find(user);
    if (it == vests_.end()) {
        return 0;
    }
    for (auto& vest : it->second) {
        Amount amount = ClaimableAt(vest, now);
        vest.claimed += amount;
        sum += amount;
    }
    return sum;
}

ClaimResult VestingLedger::ClaimAll(const Address& caller) {
    Amount sum = 0;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = vests_.find(caller);
        if (it == vests_.end() || it->second.empty()) {
            return RejectAmount("ClaimAll", LedgerError::NoLocksForCaller);
        }

        std::vector<Vest> saved = it->second;
        sum = TakeClaimable(caller, util::GetTime());
        if (sum == 0) {
            return RejectAmount("ClaimAll", LedgerError::NothingToClaim);
        }
        vestedTotal_ -= sum;

        if (!token_->Transfer(self_, caller, sum)) {
            it->second = std::move(saved);
            vestedTotal_ += sum;
            LOG_WARN(util::LogCategory::VESTING) << "ClaimAll: token push of "
                                                 << FormatAmount(sum) << " failed";
            return RejectAmount("ClaimAll", LedgerError::TransferFailed);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::VESTING) << "Claimed " << FormatAmount(sum)
                                         << " by " << caller.ToHex();
    if (callback) {
        callback(ClaimedEvent{caller, sum});
    }
    return ClaimResult::Success(sum);
}

ClaimResult VestingLedger::ClaimToStake(const Address& caller) {
    Amount sum = 0;
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!stakeLedger_) {
            return RejectAmount("ClaimToStake", LedgerError::StakeContractNotSet);
        }

        auto it = vests_.find(caller);
        if (it == vests_.end() || it->second.empty()) {
            return RejectAmount("ClaimToStake", LedgerError::NoLocksForCaller);
        }

        std::vector<Vest> saved = it->second;
        sum = TakeClaimable(caller, util::GetTime());
        if (sum == 0) {
            return RejectAmount("ClaimToStake", LedgerError::NothingToClaim);
        }
        vestedTotal_ -= sum;

        LedgerError error = stakeLedger_->ClaimToStake(self_, caller, sum);
        if (error != LedgerError::OK) {
            it->second = std::move(saved);
            vestedTotal_ += sum;
            return RejectAmount("ClaimToStake", error);
        }
        callback = eventCallback_;
    }

    LOG_INFO(util::LogCategory::VESTING) << "Claimed " << FormatAmount(sum)
                                         << " by " << caller.ToHex() << " into staking";
    if (callback) {
        callback(ClaimedEvent{caller, sum});
    }
    return ClaimResult::Success(sum);
}

ClaimResult VestingLedger::Transfer(const Address& caller, const Address& /*to*/,
                                    Amount /*amount*/) {
    return ClaimAll(caller);
}

// ============================================================================
// Readers
// ============================================================================

Amount VestingLedger::GetVestedTotal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vestedTotal_;
}

size_t VestingLedger::GetVestingsCount(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vests_.find(user);
    return it == vests_.end() ? 0 : it->second.size();
}

std::optional<Vest> VestingLedger::GetVesting(const Address& user, size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vests_.find(user);
    if (it == vests_.end() || index >= it->second.size()) {
        return std::nullopt;
    }
    return it->second[index];
}

std::vector<Vest> VestingLedger::GetVestings(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vests_.find(user);
    if (it == vests_.end()) {
        return {};
    }
    return it->second;
}

Amount VestingLedger::GetClaimable(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount sum = 0;
    auto it = vests_.find(user);
    if (it != vests_.end()) {
        Timestamp now = util::GetTime();
        for (const auto& vest : it->second) {
            sum += ClaimableAt(vest, now);
        }
    }
    return sum;
}

Amount VestingLedger::BalanceOf(const Address& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount sum = 0;
    auto it = vests_.find(user);
    if (it != vests_.end()) {
        for (const auto& vest : it->second) {
            sum += vest.Remaining();
        }
    }
    return sum;
}

std::string VestingLedger::Name() const {
    return "vested " + token_->GetName();
}

std::string VestingLedger::Symbol() const {
    return "v" + token_->GetSymbol();
}

int VestingLedger::Decimals() const {
    return token_->GetDecimals();
}

Address VestingLedger::GetStakeAddress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stakeAddress_;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Byte> VestingLedger::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;

    WriteCompactSize(ss, vests_.size());
    for (const auto& [user, list] : vests_) {
        ss << user;
        WriteCompactSize(ss, list.size());
        for (const auto& vest : list) {
            vest.Serialize(ss);
        }
    }
    ss << vestedTotal_ << stakeAddress_;

    return std::vector<Byte>(ss.begin(), ss.end());
}

bool VestingLedger::Deserialize(const Byte* data, size_t len) {
    if (!data || len == 0) {
        return false;
    }

    try {
        DataStream ss(data, len);

        std::map<Address, std::vector<Vest>> vests;
        uint64_t users = ReadCompactSize(ss);
        for (uint64_t i = 0; i < users; ++i) {
            Address user;
            ss >> user;
            uint64_t count = ReadCompactSize(ss);
            std::vector<Vest> list;
            for (uint64_t j = 0; j < count; ++j) {
                list.push_back(Vest::Unserialize(ss));
            }
            vests[user] = std::move(list);
        }

        Amount vestedTotal = 0;
        Address stakeAddress;
        ss >> vestedTotal >> stakeAddress;

        if (!ss.empty()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        vests_ = std::move(vests);
        vestedTotal_ = vestedTotal;
        if (stakeAddress != stakeAddress_) {
            stakeLedger_.reset();
        }
        stakeAddress_ = stakeAddress;
        return true;
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace ledger
} // namespace mateico
