// MATEICO - Ledger Context Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include <gtest/gtest.h>
#include "mateico/core/amount.h"
#include "mateico/crypto/sha256.h"
#include "mateico/node/context.h"
#include "mateico/util/time.h"

#include <filesystem>
#include <random>

using namespace mateico;
using namespace mateico::ledger;

namespace {

constexpr Timestamp T0 = 1700000000;

} // anonymous namespace

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerContextTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;
    Address owner_ = AddressFromLabel("owner");
    Address user_ = AddressFromLabel("user1");

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("mateico_context_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    LedgerInitOptions DiskOptions() const {
        LedgerInitOptions options;
        options.dataDir = testDir_;
        return options;
    }

    static LedgerInitOptions MemoryOptions() {
        LedgerInitOptions options;
        options.inMemory = true;
        return options;
    }
};

// ============================================================================
// Genesis Tests
// ============================================================================

TEST_F(LedgerContextTest, WellKnownAddresses) {
    EXPECT_EQ(addresses::Token(), AddressFromLabel("mateico:token"));
    EXPECT_EQ(addresses::Staking(), AddressFromLabel("mateico:staking"));
    EXPECT_EQ(addresses::Vesting(), AddressFromLabel("mateico:vesting"));
}

TEST_F(LedgerContextTest, OpenEmptyLedger) {
    LedgerContext ctx;
    ASSERT_TRUE(OpenLedger(ctx, MemoryOptions()).ok());
    EXPECT_FALSE(ctx.initialized);
    EXPECT_FALSE(ctx.IsReady());
    EXPECT_TRUE(FlushLedger(ctx).IsInvalidArgument());
}

TEST_F(LedgerContextTest, CreateGenesis) {
    LedgerContext ctx;
    ASSERT_TRUE(OpenLedger(ctx, MemoryOptions()).ok());
    ASSERT_TRUE(CreateGenesis(ctx, MemoryOptions(), owner_, 1000 * COIN).ok());

    ASSERT_TRUE(ctx.IsReady());
    EXPECT_EQ(ctx.token->GetName(), "Mateico");
    EXPECT_EQ(ctx.token->GetSymbol(), "MATE");
    EXPECT_EQ(FormatAmount(ctx.token->BalanceOf(owner_)), "1000");
    EXPECT_TRUE(ctx.ownership->IsAdministrator(owner_));
    EXPECT_EQ(ctx.staking->GetAddress(), addresses::Staking());
    EXPECT_EQ(ctx.vesting->GetAddress(), addresses::Vesting());
    EXPECT_TRUE(ctx.ledgerDB->HasSnapshot());

    EXPECT_TRUE(CreateGenesis(ctx, MemoryOptions(), owner_, 1000 * COIN).IsInvalidArgument());
}

TEST_F(LedgerContextTest, GenesisPreconditions) {
    LedgerContext closed;
    EXPECT_TRUE(CreateGenesis(closed, MemoryOptions(), owner_, COIN).IsInvalidArgument());

    LedgerContext ctx;
    ASSERT_TRUE(OpenLedger(ctx, MemoryOptions()).ok());
    EXPECT_TRUE(CreateGenesis(ctx, MemoryOptions(), Address(), COIN).IsInvalidArgument());
    EXPECT_FALSE(ctx.initialized);
}

TEST_F(LedgerContextTest, CustomTokenIdentity) {
    LedgerInitOptions options = MemoryOptions();
    options.tokenName = "Test Token";
    options.tokenSymbol = "TST";

    LedgerContext ctx;
    ASSERT_TRUE(OpenLedger(ctx, options).ok());
    ASSERT_TRUE(CreateGenesis(ctx, options, owner_, COIN).ok());
    EXPECT_EQ(ctx.token->GetName(), "Test Token");
    EXPECT_EQ(ctx.vesting->Symbol(), "vTST");
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(LedgerContextTest, ReopenRestoresStateAndBridge) {
    util::ScopedMockTime mockTime(T0);

    {
        LedgerContext ctx;
        ASSERT_TRUE(OpenLedger(ctx, DiskOptions()).ok());
        ASSERT_TRUE(CreateGenesis(ctx, DiskOptions(), owner_, 1000 * COIN).ok());

        PoolParams params;
        params.minStake = 1 * COIN;
        params.maxStake = 10 * COIN;
        params.startTime = T0 + DAY;
        params.endTime = T0 + WEEK;
        params.rewardRateMilli = 10;
        params.lockPeriod = WEEK;
        params.maxTotalStaked = 100 * COIN;

        ASSERT_TRUE(ctx.token->Approve(owner_, addresses::Staking(), MAX_AMOUNT));
        ASSERT_EQ(ctx.staking->CreatePool(owner_, params), LedgerError::OK);
        ASSERT_EQ(ctx.staking->SetBridgePool(owner_, 0), LedgerError::OK);

        ASSERT_TRUE(ctx.token->Approve(owner_, addresses::Vesting(), 10 * COIN));
        ASSERT_EQ(ctx.vesting->AddLock(owner_, user_, 0, 10 * COIN, T0 + DAY, T0 + WEEK),
                  LedgerError::OK);
        ASSERT_EQ(ctx.vesting->SetStakeLedger(owner_, ctx.staking), LedgerError::OK);

        ASSERT_TRUE(FlushLedger(ctx).ok());
        CloseLedger(ctx);
        EXPECT_FALSE(ctx.initialized);
        EXPECT_TRUE(ctx.ledgerDB == nullptr);
    }

    LedgerContext ctx;
    ASSERT_TRUE(OpenLedger(ctx, DiskOptions()).ok());
    ASSERT_TRUE(ctx.IsReady());
    EXPECT_EQ(FormatAmount(ctx.token->BalanceOf(owner_)), "989");
    EXPECT_EQ(ctx.staking->GetPoolCount(), 1u);
    EXPECT_EQ(ctx.vesting->GetStakeAddress(), addresses::Staking());

    // The bridge works again without re-binding
    util::SetMockTime(T0 + 4 * DAY);
    ClaimResult result = ctx.vesting->ClaimToStake(user_);
    ASSERT_TRUE(result.IsOk()) << LedgerErrorToString(result.error);
    EXPECT_EQ(FormatAmount(result.amount), "5");
    EXPECT_EQ(FormatAmount(ctx.staking->GetStakedWithRewards(user_)), "5.05");
}

TEST_F(LedgerContextTest, OpenFailsOnUnwritableDir) {
    LedgerInitOptions options;
    options.dataDir = "/proc/mateico-does-not-exist";

    LedgerContext ctx;
    EXPECT_FALSE(OpenLedger(ctx, options).ok());
    EXPECT_FALSE(ctx.initialized);
}
