// MATEICO - Ledger Database
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Snapshot persistence for the token, ownership, staking and vesting
// state. Each save replaces every record in one atomic batch.

#ifndef MATEICO_DB_LEDGERDB_H
#define MATEICO_DB_LEDGERDB_H

#include "mateico/db/database.h"
#include "mateico/ledger/ownership.h"
#include "mateico/ledger/staking.h"
#include "mateico/ledger/vesting.h"
#include "mateico/token/token.h"

#include <memory>

namespace mateico {
namespace db {

/// Record keys
namespace key {
    constexpr const char* VERSION = "v";
    constexpr const char* TOKEN = "t";
    constexpr const char* OWNERSHIP = "o";
    constexpr const char* STAKING = "s";
    constexpr const char* VESTING = "g";
}

class LedgerDB {
public:
    static constexpr uint32_t FORMAT_VERSION = 1;

    explicit LedgerDB(std::unique_ptr<Database> db);

    /// True if a snapshot has been written
    bool HasSnapshot();

    /// Write all four records and the format version atomically
    Status Save(const token::MemoryTokenLedger& token,
                const ledger::Ownership& ownership,
                const ledger::StakingLedger& staking,
                const ledger::VestingLedger& vesting,
                bool sync = true);

    /**
     * Restore all four components. NotFound if no snapshot exists,
     * Corruption if a record is missing or fails to decode. Components
     * may be partially restored when Corruption is returned.
     */
    Status Load(token::MemoryTokenLedger& token,
                ledger::Ownership& ownership,
                ledger::StakingLedger& staking,
                ledger::VestingLedger& vesting);

    Database& GetDatabase() { return *db_; }

private:
    Status ReadRecord(const char* name, std::string* value);

    std::unique_ptr<Database> db_;
};

} // namespace db
} // namespace mateico

#endif // MATEICO_DB_LEDGERDB_H
