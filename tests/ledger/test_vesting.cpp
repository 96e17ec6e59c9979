// MATEICO - Vesting Ledger Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include "ledger_test_util.h"

#include <variant>

using namespace mateico;
using namespace mateico::ledger;
using mateico::test::Tokens;

// ============================================================================
// Test Fixture
// ============================================================================

class VestingLedgerTest : public test::LedgerTest {
protected:
    Amount InitialSupply() const override { return Tokens("1000"); }

    /// Grants for user1, user2, user3 and user5 over the next 140 days
    void AddSchedule() {
        ASSERT_TRUE(token_->Approve(owner_, vestingAddress_, Tokens("100")));

        ASSERT_EQ(vesting_->AddLock(owner_, user1_, Tokens("1"), Tokens("3"), T0 + 1, T0 + 10 * DAY),
                  LedgerError::OK);
        ASSERT_EQ(vesting_->AddLock(owner_, user1_, 0, Tokens("2"), T0 + 10 * DAY, T0 + 30 * DAY),
                  LedgerError::OK);
        ASSERT_EQ(vesting_->AddLock(owner_, user1_, 0, Tokens("1.5"), T0 + 30 * DAY, T0 + 130 * DAY),
                  LedgerError::OK);

        struct Grant {
            Address user;
            const char* total;
            Timestamp start;
            Timestamp end;
        };
        const Grant grants[] = {
            {user2_, "1", T0 + DAY, T0 + 10 * DAY},
            {user2_, "0.8", T0 + 10 * DAY, T0 + 30 * DAY},
            {user2_, "0.5", T0 + 30 * DAY, T0 + 130 * DAY},
            {user3_, "0.5", T0 + DAY, T0 + 20 * DAY},
            {user3_, "0.5", T0 + 20 * DAY, T0 + 60 * DAY},
            {user3_, "0.5", T0 + 60 * DAY, T0 + 140 * DAY},
            {user5_, "1", T0 + 60 * DAY, T0 + 140 * DAY},
        };
        for (const auto& g : grants) {
            ASSERT_EQ(vesting_->AddLock(owner_, g.user, 0, Tokens(g.total), g.start, g.end),
                      LedgerError::OK);
        }
    }
};

// ============================================================================
// Release Curve Tests
// ============================================================================

TEST(ClaimableAtTest, ReleaseCurve) {
    Vest vest;
    vest.startAmount = test::Tokens("1");
    vest.totalAmount = test::Tokens("3");
    vest.startDate = 1000;
    vest.endDate = 2000;

    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 999)), "0");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 1000)), "0");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 1001)), "1.002");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 1500)), "2");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 2000)), "3");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 5000)), "3");

    vest.claimed = test::Tokens("2");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 1500)), "0");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 1750)), "0.5");
    EXPECT_EQ(FormatAmount(ClaimableAt(vest, 2000)), "1");
}

TEST(ClaimableAtTest, LargeAmountsDoNotOverflow) {
    Vest vest;
    vest.totalAmount = MAX_AMOUNT / 2;
    vest.startDate = 0;
    vest.endDate = 100 * 365 * DAY;

    Amount half = ClaimableAt(vest, vest.endDate / 2);
    EXPECT_TRUE(half == vest.totalAmount / 2);
    EXPECT_TRUE(ClaimableAt(vest, vest.endDate) == vest.totalAmount);
}

// ============================================================================
// Lock Tests
// ============================================================================

TEST_F(VestingLedgerTest, StartsEmpty) {
    EXPECT_EQ(vesting_->GetTokenAddress(), tokenAddress_);
    EXPECT_EQ(FormatAmount(vesting_->GetVestedTotal()), "0");
    EXPECT_EQ(vesting_->GetVestingsCount(user1_), 0u);
    EXPECT_TRUE(vesting_->GetStakeAddress().IsNull());
}

TEST_F(VestingLedgerTest, AddLockRejectsBadInput) {
    const Amount one = Tokens("1");
    const Amount two = Tokens("2");

    // Valid lock, but no allowance
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, one, two, T0 + DAY, T0 + WEEK),
              LedgerError::TransferFailed);

    ASSERT_TRUE(token_->Approve(owner_, vestingAddress_, Tokens("100")));
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, one, two, T0 - 1, T0 + WEEK),
              LedgerError::StartDateInPast);
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, one, two, T0, T0 + WEEK),
              LedgerError::StartDateInPast);
    EXPECT_EQ(vesting_->AddLock(user1_, user1_, one, two, T0 + DAY, T0 + WEEK),
              LedgerError::OnlyAdministrator);
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, 0, 0, T0 + DAY, T0 + WEEK),
              LedgerError::ZeroAmount);
    EXPECT_EQ(vesting_->AddLock(owner_, Address(), one, two, T0 + DAY, T0 + WEEK),
              LedgerError::ZeroAddress);
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, one, two, T0 + WEEK, T0 + DAY),
              LedgerError::TimestampsMisconfigured);
    EXPECT_EQ(vesting_->AddLock(owner_, user1_, two, one, T0 + DAY, T0 + WEEK),
              LedgerError::StartAmountAboveTotal);

    EXPECT_EQ(vesting_->GetVestingsCount(user1_), 0u);
    EXPECT_EQ(FormatAmount(token_->BalanceOf(vestingAddress_)), "0");
    EXPECT_TRUE(events_.empty());
}

TEST_F(VestingLedgerTest, AddLockRecordsGrant) {
    AddSchedule();

    ASSERT_FALSE(events_.empty());
    const auto* added = std::get_if<VestingAddedEvent>(&events_[0]);
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(added->beneficiary, user1_);
    EXPECT_EQ(FormatAmount(added->startAmount), "1");
    EXPECT_EQ(FormatAmount(added->totalAmount), "3");
    EXPECT_EQ(added->startDate, T0 + 1);
    EXPECT_EQ(added->endDate, T0 + 10 * DAY);

    EXPECT_EQ(vesting_->GetVestingsCount(user1_), 3u);
    auto last = vesting_->GetVesting(user1_, 2);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(FormatAmount(last->startAmount), "0");
    EXPECT_EQ(FormatAmount(last->totalAmount), "1.5");
    EXPECT_EQ(last->startDate, T0 + 30 * DAY);
    EXPECT_EQ(last->endDate, T0 + 130 * DAY);
    EXPECT_EQ(FormatAmount(last->claimed), "0");
    EXPECT_FALSE(vesting_->GetVesting(user1_, 3).has_value());

    EXPECT_EQ(FormatAmount(vesting_->GetVestedTotal()), "11.3");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(vestingAddress_)), "11.3");
}

TEST_F(VestingLedgerTest, AddLockFailsOnInsufficientBalance) {
    AddSchedule();
    ASSERT_TRUE(token_->Approve(owner_, vestingAddress_, MAX_AMOUNT));

    EXPECT_EQ(vesting_->AddLock(owner_, user1_, 0, Tokens("1000"), T0 + 30 * DAY, T0 + 130 * DAY),
              LedgerError::TransferFailed);
    EXPECT_EQ(vesting_->GetVestingsCount(user1_), 3u);
    EXPECT_EQ(FormatAmount(vesting_->GetVestedTotal()), "11.3");
}

// ============================================================================
// Claim Tests
// ============================================================================

TEST_F(VestingLedgerTest, ClaimSchedule) {
    AddSchedule();
    events_.clear();

    EXPECT_EQ(vesting_->ClaimAll(user4_).error, LedgerError::NoLocksForCaller);
    EXPECT_EQ(vesting_->ClaimAll(user1_).error, LedgerError::NothingToClaim);

    // 0.5 * 4 / 19, truncated
    SetTime(T0 + 5 * DAY);
    ClaimResult result = vesting_->ClaimAll(user3_);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(AmountToString(result.amount), "105263157894736842");
    ASSERT_EQ(events_.size(), 1u);
    const auto* claimed = std::get_if<ClaimedEvent>(&events_[0]);
    ASSERT_NE(claimed, nullptr);
    EXPECT_EQ(claimed->user, user3_);
    EXPECT_TRUE(claimed->amount == result.amount);

    EXPECT_EQ(vesting_->ClaimAll(user3_).error, LedgerError::NothingToClaim);

    // First grant done, second one halfway
    SetTime(T0 + 20 * DAY);
    result = vesting_->ClaimAll(user2_);
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(FormatAmount(result.amount), "1.4");

    SetTime(T0 + 140 * DAY + 10);
    EXPECT_EQ(FormatAmount(vesting_->ClaimAll(user1_).amount), "6.5");
    EXPECT_EQ(FormatAmount(vesting_->ClaimAll(user2_).amount), "0.9");
    EXPECT_EQ(AmountToString(vesting_->ClaimAll(user3_).amount), "1394736842105263158");
    EXPECT_EQ(FormatAmount(vesting_->ClaimAll(user5_).amount), "1");

    EXPECT_EQ(FormatAmount(vesting_->GetVestedTotal()), "0");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(vestingAddress_)), "0");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(user3_)), "1.5");
    EXPECT_EQ(vesting_->ClaimAll(user1_).error, LedgerError::NothingToClaim);
}

TEST_F(VestingLedgerTest, FailedPayoutKeepsGrant) {
    class FailingToken : public token::MemoryTokenLedger {
    public:
        using token::MemoryTokenLedger::MemoryTokenLedger;
        bool Transfer(const Address&, const Address&, Amount) override { return false; }
    };

    auto token = std::make_shared<FailingToken>("Mateico", "MATE", owner_, Tokens("1000"));
    VestingLedger vesting(vestingAddress_, tokenAddress_, token, ownership_);
    ASSERT_TRUE(token->Approve(owner_, vestingAddress_, MAX_AMOUNT));
    ASSERT_EQ(vesting.AddLock(owner_, user1_, 0, Tokens("10"), T0 + DAY, T0 + WEEK),
              LedgerError::OK);

    SetTime(T0 + 4 * DAY);
    EXPECT_EQ(vesting.ClaimAll(user1_).error, LedgerError::TransferFailed);
    EXPECT_EQ(FormatAmount(vesting.GetVesting(user1_, 0)->claimed), "0");
    EXPECT_EQ(FormatAmount(vesting.GetVestedTotal()), "10");
    EXPECT_EQ(FormatAmount(vesting.GetClaimable(user1_)), "5");
}

// ============================================================================
// Token Imitation Tests
// ============================================================================

TEST_F(VestingLedgerTest, LooksLikeToken) {
    EXPECT_EQ(vesting_->Name(), "vested Mateico");
    EXPECT_EQ(vesting_->Symbol(), "vMATE");
    EXPECT_EQ(vesting_->Decimals(), 18);
}

TEST_F(VestingLedgerTest, TransferClaims) {
    ASSERT_TRUE(token_->Approve(owner_, vestingAddress_, MAX_AMOUNT));
    ASSERT_EQ(vesting_->AddLock(owner_, user1_, 0, Tokens("10"), T0 + DAY, T0 + WEEK),
              LedgerError::OK);
    EXPECT_EQ(FormatAmount(vesting_->BalanceOf(user1_)), "10");

    // 3 of 6 days elapsed
    SetTime(T0 + 4 * DAY);
    EXPECT_EQ(FormatAmount(vesting_->GetClaimable(user1_)), "5");

    ClaimResult result = vesting_->Transfer(user1_, user2_, Tokens("1"));
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(FormatAmount(result.amount), "5");
    EXPECT_EQ(FormatAmount(vesting_->BalanceOf(user1_)), "5");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(user1_)), "5");
    EXPECT_EQ(FormatAmount(token_->BalanceOf(user2_)), "0");
}

// ============================================================================
// Persistence Tests
// ============================================================================

TEST_F(VestingLedgerTest, SerializeRestoresGrants) {
    AddSchedule();
    SetTime(T0 + 20 * DAY);
    ASSERT_TRUE(vesting_->ClaimAll(user2_).IsOk());

    std::vector<Byte> data = vesting_->Serialize();

    VestingLedger restored(vestingAddress_, tokenAddress_, token_, ownership_);
    ASSERT_TRUE(restored.Deserialize(data.data(), data.size()));

    EXPECT_TRUE(restored.GetVestedTotal() == vesting_->GetVestedTotal());
    EXPECT_EQ(restored.GetVestingsCount(user2_), 3u);
    EXPECT_EQ(FormatAmount(restored.GetVesting(user2_, 1)->claimed), "0.4");
    EXPECT_TRUE(restored.GetClaimable(user1_) == vesting_->GetClaimable(user1_));
    EXPECT_TRUE(restored.GetStakeAddress().IsNull());
    EXPECT_EQ(restored.Serialize(), data);

    EXPECT_FALSE(restored.Deserialize(data.data(), data.size() - 1));
}
