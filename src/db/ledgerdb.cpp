// MATEICO - Ledger Database Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/db/ledgerdb.h"
#include "mateico/core/serialize.h"
#include "mateico/util/logging.h"

#include <ios>

namespace mateico {
namespace db {

namespace {

const Byte* AsBytes(const std::string& s) {
    return reinterpret_cast<const Byte*>(s.data());
}

} // anonymous namespace

LedgerDB::LedgerDB(std::unique_ptr<Database> db) : db_(std::move(db)) {}

bool LedgerDB::HasSnapshot() {
    return db_->Exists(key::VERSION);
}

Status LedgerDB::Save(const token::MemoryTokenLedger& token,
                      const ledger::Ownership& ownership,
                      const ledger::StakingLedger& staking,
                      const ledger::VestingLedger& vesting,
                      bool sync) {
    DataStream version;
    version << FORMAT_VERSION;

    WriteBatch batch;
    batch.Put(key::VERSION, version.Data());
    batch.Put(key::TOKEN, token.Serialize());
    batch.Put(key::OWNERSHIP, ownership.Serialize());
    batch.Put(key::STAKING, staking.Serialize());
    batch.Put(key::VESTING, vesting.Serialize());

    WriteOptions options;
    options.sync = sync;
    Status s = db_->Write(options, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Snapshot write failed: " << s.ToString();
        return s;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Snapshot written (" << batch.Count() << " records)";
    return Status::Ok();
}

Status LedgerDB::ReadRecord(const char* name, std::string* value) {
    Status s = db_->Get(name, value);
    if (s.IsNotFound()) {
        return Status::Corruption(std::string("missing record '") + name + "'");
    }
    return s;
}

Status LedgerDB::Load(token::MemoryTokenLedger& token,
                      ledger::Ownership& ownership,
                      ledger::StakingLedger& staking,
                      ledger::VestingLedger& vesting) {
    std::string value;
    Status s = db_->Get(key::VERSION, &value);
    if (!s.ok()) {
        return s;
    }

    try {
        DataStream ss(std::vector<uint8_t>(value.begin(), value.end()));
        uint32_t version = 0;
        ss >> version;
        if (version != FORMAT_VERSION || !ss.empty()) {
            return Status::Corruption("unsupported snapshot version " + std::to_string(version));
        }
    } catch (const std::ios_base::failure& e) {
        return Status::Corruption(std::string("version record: ") + e.what());
    }

    if (!(s = ReadRecord(key::TOKEN, &value)).ok()) return s;
    if (!token.Deserialize(AsBytes(value), value.size())) {
        return Status::Corruption("token record");
    }

    if (!(s = ReadRecord(key::OWNERSHIP, &value)).ok()) return s;
    if (!ownership.Deserialize(AsBytes(value), value.size())) {
        return Status::Corruption("ownership record");
    }

    if (!(s = ReadRecord(key::STAKING, &value)).ok()) return s;
    if (!staking.Deserialize(AsBytes(value), value.size())) {
        return Status::Corruption("staking record");
    }

    if (!(s = ReadRecord(key::VESTING, &value)).ok()) return s;
    if (!vesting.Deserialize(AsBytes(value), value.size())) {
        return Status::Corruption("vesting record");
    }

    LOG_DEBUG(util::LogCategory::DB) << "Snapshot loaded";
    return Status::Ok();
}

} // namespace db
} // namespace mateico
