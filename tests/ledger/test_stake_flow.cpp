// MATEICO - Staking Flow Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License
//
// Several users across four pools with different windows, rates and
// locks, followed through deposits, reclamation and claims.

#include "ledger_test_util.h"

#include <string>

using namespace mateico;
using namespace mateico::ledger;
using mateico::test::Tokens;

// ============================================================================
// Test Fixture
// ============================================================================

class StakeFlowTest : public test::LedgerTest {
protected:
    void SetUp() override {
        test::LedgerTest::SetUp();
        ASSERT_TRUE(token_->Approve(owner_, stakingAddress_, MAX_AMOUNT));

        // 1%, 2%, 0.1% and 50% pools
        const PoolParams params[] = {
            MakePool("1", "10", T0 + DAY, T0 + 2 * WEEK, 10, WEEK + 2 * DAY, "1000"),
            MakePool("1", "10", T0 + WEEK, T0 + WEEK + DAY, 20, WEEK, "1000"),
            MakePool("1", "10", T0 + DAY, T0 + 2 * DAY, 1, DAY, "1000"),
            MakePool("2", "100", T0 + WEEK, T0 + WEEK + DAY, 500, 2 * WEEK, "1000"),
        };
        for (const auto& p : params) {
            ASSERT_EQ(staking_->CreatePool(owner_, p), LedgerError::OK);
        }

        FundStaker(user1_, Tokens("1000"));
        FundStaker(user2_, Tokens("1000"));
        FundStaker(user3_, Tokens("1000"));
    }

    void DepositOk(const Address& user, size_t pool, const std::string& amount) {
        ASSERT_EQ(staking_->Deposit(user, pool, Tokens(amount)), LedgerError::OK);
        ExpectStakingConserved();
    }

    /// Deposits into pools 0 and 2 after the first day, then 1 and 3 after the first week
    void DepositAll() {
        SetTime(T0 + DAY + 1);
        DepositOk(user1_, 0, "10");
        DepositOk(user1_, 2, "10");
        DepositOk(user2_, 0, "2");
        DepositOk(user3_, 2, "10");
        DepositOk(user2_, 2, "2");

        SetTime(T0 + WEEK + 1);
        ASSERT_EQ(staking_->Deposit(user1_, 2, Tokens("2")), LedgerError::AlreadyClosed);
        ExpectStakingConserved();
        DepositOk(user2_, 1, "2");
        DepositOk(user2_, 3, "10");
        DepositOk(user3_, 1, "2");
        DepositOk(user3_, 3, "10");
        DepositOk(user3_, 3, "2");
    }
};

// ============================================================================
// Flow Tests
// ============================================================================

TEST_F(StakeFlowTest, PoolsCreated) {
    auto pools = staking_->GetPools();
    ASSERT_EQ(pools.size(), 4u);
    EXPECT_EQ(pools[2].rewardRateMilli, 1u);
    EXPECT_EQ(FormatAmount(staking_->GetTotalFreeRewards()), "531");
    ExpectStakingConserved();
}

TEST_F(StakeFlowTest, DepositsAcrossPools) {
    DepositAll();

    auto pools = staking_->GetPools();
    ASSERT_EQ(pools.size(), 4u);
    EXPECT_EQ(FormatAmount(pools[0].totalStaked), "12");
    EXPECT_EQ(FormatAmount(pools[1].totalStaked), "4");
    EXPECT_EQ(FormatAmount(pools[2].totalStaked), "22");
    EXPECT_EQ(FormatAmount(pools[3].totalStaked), "22");

    // 531 - (0.12 + 0.08 + 0.022 + 11)
    EXPECT_EQ(FormatAmount(staking_->GetTotalFreeRewards()), "519.778");

    EXPECT_EQ(staking_->GetUserStakeCount(user1_), 2u);
    EXPECT_EQ(staking_->GetUserStakeCount(user2_), 4u);
    EXPECT_EQ(staking_->GetUserStakeCount(user3_), 4u);

    for (const Address& user : {user1_, user2_, user3_}) {
        Amount sum = 0;
        for (const auto& position : staking_->GetUserStakes(user)) {
            sum += position.totalAmount;
        }
        EXPECT_TRUE(sum == staking_->GetStakedWithRewards(user));
    }
}

TEST_F(StakeFlowTest, ReclaimClaimAndCleanup) {
    DepositAll();

    // Pool 2 has expired: 1 reserved, 0.022 allocated
    Amount pre = token_->BalanceOf(owner_);
    ReclaimResult reclaimed = staking_->ReclaimExpiredPools(owner_);
    ASSERT_TRUE(reclaimed.IsOk());
    EXPECT_EQ(FormatAmount(token_->BalanceOf(owner_) - pre), "0.978");
    ExpectStakingConserved();

    // The last pool moved into the freed slot
    ASSERT_EQ(staking_->GetPoolCount(), 3u);
    EXPECT_EQ(staking_->GetPool(2)->lockPeriod, 2 * WEEK);
    EXPECT_EQ(FormatAmount(staking_->GetTotalFreeRewards()), "518.8");

    // user3's first position is the pool 2 deposit
    ClaimResult one = staking_->ClaimOne(user3_, 0);
    ASSERT_TRUE(one.IsOk());
    EXPECT_EQ(FormatAmount(one.amount), "10.01");
    ExpectStakingConserved();

    EXPECT_EQ(FormatAmount(staking_->GetClaimable(user1_)), "10.01");
    EXPECT_EQ(FormatAmount(staking_->GetClaimable(user2_)), "2.002");
    EXPECT_EQ(FormatAmount(staking_->GetClaimable(user3_)), "0");

    SetTime(T0 + 2 * WEEK + DAY);
    Amount cl1 = staking_->GetClaimable(user1_);
    Amount cl2 = staking_->GetClaimable(user2_);
    Amount cl3 = staking_->GetClaimable(user3_);
    EXPECT_EQ(FormatAmount(cl1), "20.11");
    EXPECT_EQ(FormatAmount(cl2), "6.062");
    EXPECT_EQ(FormatAmount(cl3), "2.04");

    const Address users[] = {user1_, user2_, user3_};
    const Amount expected[] = {cl1, cl2, cl3};
    for (size_t i = 0; i < 3; ++i) {
        Amount before = token_->BalanceOf(users[i]);
        ClaimResult result = staking_->ClaimAll(users[i]);
        ASSERT_TRUE(result.IsOk());
        EXPECT_TRUE(result.amount == expected[i]);
        EXPECT_TRUE(token_->BalanceOf(users[i]) - before == expected[i]);
        ExpectStakingConserved();
    }

    // Only the 50% pool positions remain
    SetTime(T0 + 5 * WEEK);
    EXPECT_EQ(staking_->GetUserStakeCount(user1_), 0u);
    auto u2 = staking_->GetUserStakes(user2_);
    auto u3 = staking_->GetUserStakes(user3_);
    ASSERT_EQ(u2.size(), 1u);
    ASSERT_EQ(u3.size(), 2u);
    EXPECT_EQ(FormatAmount(u2[0].totalAmount), "15");
    EXPECT_EQ(FormatAmount(u3[0].totalAmount), "3");
    EXPECT_EQ(FormatAmount(u3[1].totalAmount), "15");

    // Every pool has expired
    Amount free = staking_->GetTotalFreeRewards();
    pre = token_->BalanceOf(owner_);
    reclaimed = staking_->ReclaimExpiredPools(owner_);
    ASSERT_TRUE(reclaimed.IsOk());
    EXPECT_TRUE(token_->BalanceOf(owner_) - pre == free);
    ExpectStakingConserved();
    EXPECT_EQ(staking_->GetPoolCount(), 0u);
    EXPECT_EQ(FormatAmount(staking_->GetTotalFreeRewards()), "0");

    // Positions outlive their pools
    EXPECT_EQ(staking_->ClaimAll(user1_).error, LedgerError::NoStakesForCaller);
    EXPECT_EQ(FormatAmount(staking_->ClaimAll(user2_).amount), "15");
    EXPECT_EQ(FormatAmount(staking_->ClaimAll(user3_).amount), "18");
    ExpectStakingConserved();

    EXPECT_EQ(FormatAmount(staking_->GetTotalStakedAndReward()), "0");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(stakingAddress_)), "0");
}
