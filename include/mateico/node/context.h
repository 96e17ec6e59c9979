// MATEICO - Ledger Context
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Owns the token, ownership, staking and vesting components together with
// the snapshot database, and wires them to each other.

#ifndef MATEICO_NODE_CONTEXT_H
#define MATEICO_NODE_CONTEXT_H

#include "mateico/core/types.h"
#include "mateico/db/database.h"
#include "mateico/db/ledgerdb.h"
#include "mateico/ledger/ownership.h"
#include "mateico/ledger/staking.h"
#include "mateico/ledger/vesting.h"
#include "mateico/token/token.h"

#include <filesystem>
#include <memory>
#include <string>

namespace mateico {

// ============================================================================
// Well-known Addresses
// ============================================================================

/// Fixed identities of the ledger components, derived from labels
namespace addresses {
    constexpr const char* TOKEN_LABEL = "mateico:token";
    constexpr const char* STAKING_LABEL = "mateico:staking";
    constexpr const char* VESTING_LABEL = "mateico:vesting";

    Address Token();
    Address Staking();
    Address Vesting();
}

// ============================================================================
// Initialization Options
// ============================================================================

struct LedgerInitOptions {
    /// Data directory; the database lives in <dataDir>/ledger
    std::filesystem::path dataDir;

    /// Token identity used when creating a new ledger
    std::string tokenName{"Mateico"};
    std::string tokenSymbol{"MATE"};

    /// Keep everything in memory (no files are touched)
    bool inMemory{false};
};

// ============================================================================
// Ledger Context
// ============================================================================

struct LedgerContext {
    std::shared_ptr<token::MemoryTokenLedger> token;
    std::shared_ptr<ledger::Ownership> ownership;
    std::shared_ptr<ledger::StakingLedger> staking;
    std::shared_ptr<ledger::VestingLedger> vesting;

    std::unique_ptr<db::LedgerDB> ledgerDB;

    std::filesystem::path dataDir;

    /// A genesis has been created or loaded
    bool initialized{false};

    LedgerContext() = default;
    LedgerContext(const LedgerContext&) = delete;
    LedgerContext& operator=(const LedgerContext&) = delete;

    bool IsReady() const { return initialized && staking && vesting; }
};

// ============================================================================
// Lifecycle Functions
// ============================================================================

/**
 * Open the database and build the components. If a snapshot exists it is
 * restored and the bridge binding is reconnected.
 * @return Ok, or the database / Corruption status
 */
db::Status OpenLedger(LedgerContext& ctx, const LedgerInitOptions& options);

/**
 * Create a fresh ledger: mint `supply` to `owner`, who also becomes the
 * administrator. InvalidArgument if the ledger is already initialized.
 */
db::Status CreateGenesis(LedgerContext& ctx, const LedgerInitOptions& options,
                         const Address& owner, Amount supply);

/// Persist the current state
db::Status FlushLedger(LedgerContext& ctx);

/// Release all components and close the database
void CloseLedger(LedgerContext& ctx);

} // namespace mateico

#endif // MATEICO_NODE_CONTEXT_H
