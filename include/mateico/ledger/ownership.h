// MATEICO - Ledger Ownership
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Administrator capability check and a two-step ownership transfer.

#ifndef MATEICO_LEDGER_OWNERSHIP_H
#define MATEICO_LEDGER_OWNERSHIP_H

#include "mateico/core/types.h"
#include "mateico/ledger/errors.h"

#include <mutex>
#include <vector>

namespace mateico {
namespace ledger {

/// Capability check consumed by the ledgers for privileged operations
class IAdministratorGate {
public:
    virtual ~IAdministratorGate() = default;

    virtual bool IsAdministrator(const Address& caller) const = 0;
};

/**
 * Two-step ownership: the current owner nominates a successor, which
 * becomes owner only after accepting. Renouncing leaves no administrator.
 */
class Ownership : public IAdministratorGate {
public:
    explicit Ownership(const Address& owner);

    /// True only for the current, non-null owner
    bool IsAdministrator(const Address& caller) const override;

    /// Nominate a new owner (a null address cancels a pending nomination)
    LedgerError GiveOwnership(const Address& caller, const Address& newOwner);

    /// Complete a nomination; caller must be the pending owner
    LedgerError AcceptOwnership(const Address& caller);

    /// Drop ownership permanently
    LedgerError RenounceOwnership(const Address& caller);

    Address GetOwner() const;
    Address GetPendingOwner() const;

    std::vector<Byte> Serialize() const;
    bool Deserialize(const Byte* data, size_t len);

private:
    Address owner_;
    Address pendingOwner_;
    mutable std::mutex mutex_;
};

} // namespace ledger
} // namespace mateico

#endif // MATEICO_LEDGER_OWNERSHIP_H
