// MATEICO - Ledger Ownership Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/ledger/ownership.h"
#include "mateico/core/serialize.h"
#include "mateico/util/logging.h"

namespace mateico {
namespace ledger {

namespace {

void LogOwnershipChanged(const Address& from, const Address& to) {
    LOG_INFO(util::LogCategory::DEFAULT) << "OwnershipChanged from " << from.ToHex()
                                         << " to " << to.ToHex();
}

} // anonymous namespace

Ownership::Ownership(const Address& owner) : owner_(owner) {}

bool Ownership::IsAdministrator(const Address& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !owner_.IsNull() && caller == owner_;
}

LedgerError Ownership::GiveOwnership(const Address& caller, const Address& newOwner) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owner_.IsNull() || caller != owner_) {
        return LedgerError::OnlyAdministrator;
    }
    pendingOwner_ = newOwner;
    LOG_DEBUG(util::LogCategory::DEFAULT) << "Ownership offered to " << newOwner.ToHex();
    return LedgerError::OK;
}

LedgerError Ownership::AcceptOwnership(const Address& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pendingOwner_.IsNull() || caller != pendingOwner_) {
        return LedgerError::OnlyPendingOwner;
    }
    Address previous = owner_;
    owner_ = pendingOwner_;
    pendingOwner_.SetNull();
    LogOwnershipChanged(previous, owner_);
    return LedgerError::OK;
}

LedgerError Ownership::RenounceOwnership(const Address& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (owner_.IsNull() || caller != owner_) {
        return LedgerError::OnlyAdministrator;
    }
    Address previous = owner_;
    owner_.SetNull();
    pendingOwner_.SetNull();
    LogOwnershipChanged(previous, owner_);
    return LedgerError::OK;
}

Address Ownership::GetOwner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

Address Ownership::GetPendingOwner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingOwner_;
}

std::vector<Byte> Ownership::Serialize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataStream ss;
    ss << owner_ << pendingOwner_;
    return std::vector<Byte>(ss.begin(), ss.end());
}

bool Ownership::Deserialize(const Byte* data, size_t len) {
    if (!data || len != 2 * Address::SIZE) {
        return false;
    }
    DataStream ss(data, len);
    Address owner;
    Address pending;
    ss >> owner >> pending;

    std::lock_guard<std::mutex> lock(mutex_);
    owner_ = owner;
    pendingOwner_ = pending;
    return true;
}

} // namespace ledger
} // namespace mateico
