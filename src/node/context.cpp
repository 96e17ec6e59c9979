// MATEICO - Ledger Context Implementation
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "mateico/node/context.h"
#include "mateico/core/amount.h"
#include "mateico/crypto/sha256.h"
#include "mateico/db/leveldb.h"
#include "mateico/util/logging.h"

namespace mateico {

namespace addresses {

Address Token() { return AddressFromLabel(TOKEN_LABEL); }
Address Staking() { return AddressFromLabel(STAKING_LABEL); }
Address Vesting() { return AddressFromLabel(VESTING_LABEL); }

} // namespace addresses

namespace {

/// Build the components around a token and an owner
void BuildComponents(LedgerContext& ctx, std::shared_ptr<token::MemoryTokenLedger> token,
                     const Address& owner) {
    ctx.token = std::move(token);
    ctx.ownership = std::make_shared<ledger::Ownership>(owner);
    ctx.staking = std::make_shared<ledger::StakingLedger>(
        addresses::Staking(), addresses::Token(), ctx.token,
        addresses::Vesting(), ctx.ownership);
    ctx.vesting = std::make_shared<ledger::VestingLedger>(
        addresses::Vesting(), addresses::Token(), ctx.token, ctx.ownership);
}

} // anonymous namespace

db::Status OpenLedger(LedgerContext& ctx, const LedgerInitOptions& options) {
    ctx.dataDir = options.dataDir;

    std::unique_ptr<db::Database> database;
    if (options.inMemory) {
        database = std::make_unique<db::MemoryDatabase>();
    } else {
        auto [status, opened] = db::OpenDatabase(options.dataDir / "ledger");
        if (!status.ok()) {
            return status;
        }
        database = std::move(opened);
    }
    ctx.ledgerDB = std::make_unique<db::LedgerDB>(std::move(database));

    BuildComponents(ctx, std::make_shared<token::MemoryTokenLedger>(
                             options.tokenName, options.tokenSymbol, Address(), 0),
                    Address());

    if (!ctx.ledgerDB->HasSnapshot()) {
        LOG_INFO(util::LogCategory::DB) << "No ledger snapshot found; run 'init' first";
        ctx.initialized = false;
        return db::Status::Ok();
    }

    db::Status s = ctx.ledgerDB->Load(*ctx.token, *ctx.ownership, *ctx.staking, *ctx.vesting);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to load ledger: " << s.ToString();
        return s;
    }

    if (!ctx.vesting->GetStakeAddress().IsNull() &&
        !ctx.vesting->AttachStakeLedger(ctx.staking)) {
        return db::Status::Corruption("vesting ledger bound to unknown staking ledger " +
                                      ctx.vesting->GetStakeAddress().ToHex());
    }

    ctx.initialized = true;
    LOG_INFO(util::LogCategory::DB) << "Loaded ledger: " << ctx.staking->GetPoolCount()
                                    << " pool(s), vested " << FormatAmount(ctx.vesting->GetVestedTotal());
    return db::Status::Ok();
}

db::Status CreateGenesis(LedgerContext& ctx, const LedgerInitOptions& options,
                         const Address& owner, Amount supply) {
    if (!ctx.ledgerDB) {
        return db::Status::InvalidArgument("ledger database is not open");
    }
    if (ctx.initialized) {
        return db::Status::InvalidArgument("ledger already initialized");
    }
    if (owner.IsNull()) {
        return db::Status::InvalidArgument("owner must not be the null address");
    }

    BuildComponents(ctx, std::make_shared<token::MemoryTokenLedger>(
                             options.tokenName, options.tokenSymbol, owner, supply),
                    owner);
    ctx.initialized = true;

    LOG_INFO(util::LogCategory::DEFAULT) << "Created " << options.tokenName << " ("
                                         << options.tokenSymbol << ") with supply "
                                         << FormatAmount(supply) << " owned by " << owner.ToHex();
    return FlushLedger(ctx);
}

db::Status FlushLedger(LedgerContext& ctx) {
    if (!ctx.ledgerDB || !ctx.IsReady()) {
        return db::Status::InvalidArgument("ledger is not initialized");
    }
    return ctx.ledgerDB->Save(*ctx.token, *ctx.ownership, *ctx.staking, *ctx.vesting);
}

void CloseLedger(LedgerContext& ctx) {
    ctx.vesting.reset();
    ctx.staking.reset();
    ctx.ownership.reset();
    ctx.token.reset();
    ctx.ledgerDB.reset();
    ctx.initialized = false;
}

} // namespace mateico
