// MATEICO - Pool, Position and Accountant Tests
// Copyright (c) 2024 MATEICO Developers
// MIT License

#include <gtest/gtest.h>
#include "mateico/core/amount.h"
#include "mateico/core/serialize.h"
#include "mateico/crypto/sha256.h"
#include "mateico/ledger/accountant.h"
#include "mateico/ledger/pool.h"
#include "mateico/ledger/position.h"

#include <stdexcept>

using namespace mateico;
using namespace mateico::ledger;

namespace {

PoolParams TestParams(Timestamp start = 1000, Timestamp end = 2000) {
    PoolParams p;
    p.minStake = 1 * COIN;
    p.maxStake = 10 * COIN;
    p.startTime = start;
    p.endTime = end;
    p.rewardRateMilli = 10;
    p.lockPeriod = WEEK;
    p.maxTotalStaked = 1000 * COIN;
    return p;
}

Position MakePosition(Timestamp unlock, Amount amount) {
    Position p;
    p.unlockTime = unlock;
    p.totalAmount = amount;
    return p;
}

} // anonymous namespace

// ============================================================================
// Pool Parameter Tests
// ============================================================================

TEST(PoolParamsTest, ValidParams) {
    EXPECT_EQ(ValidatePoolParams(TestParams()), LedgerError::OK);

    // maxStake may equal capacity
    PoolParams p = TestParams();
    p.maxTotalStaked = p.maxStake;
    EXPECT_EQ(ValidatePoolParams(p), LedgerError::OK);
}

TEST(PoolParamsTest, InvalidLimits) {
    PoolParams p = TestParams();
    p.minStake = p.maxStake + 1;
    EXPECT_EQ(ValidatePoolParams(p), LedgerError::PoolLimitsMisconfigured);

    p = TestParams();
    p.maxTotalStaked = p.maxStake - 1;
    EXPECT_EQ(ValidatePoolParams(p), LedgerError::PoolLimitsMisconfigured);
}

TEST(PoolParamsTest, InvalidTimes) {
    PoolParams p = TestParams(2000, 1000);
    EXPECT_EQ(ValidatePoolParams(p), LedgerError::TimestampsMisconfigured);

    p = TestParams();
    p.lockPeriod = -1;
    EXPECT_EQ(ValidatePoolParams(p), LedgerError::TimestampsMisconfigured);
}

TEST(PoolParamsTest, CalculateReward) {
    EXPECT_EQ(FormatAmount(*CalculateReward(1000 * COIN, 10)), "10");
    EXPECT_EQ(FormatAmount(*CalculateReward(22 * COIN, 1)), "0.022");
    EXPECT_EQ(FormatAmount(*CalculateReward(1 * COIN, 0)), "0");
    // Truncated toward zero
    EXPECT_EQ(AmountToString(*CalculateReward(999, 1)), "0");
    EXPECT_FALSE(CalculateReward(MAX_AMOUNT, 2).has_value());
}

TEST(PoolParamsTest, PoolHashCoversParameters) {
    PoolParams p = TestParams();

    DataStream ss;
    ss << p.startTime << p.endTime << p.lockPeriod << p.minStake << p.maxStake
       << p.maxTotalStaked << p.rewardRateMilli;
    EXPECT_EQ(ss.size(), 8u * 4 + 16u * 3);
    EXPECT_EQ(ComputePoolHash(p), SHA256Hash(ss.Data()));

    EXPECT_EQ(ComputePoolHash(p), ComputePoolHash(TestParams()));

    PoolParams q = TestParams();
    q.rewardRateMilli = 11;
    EXPECT_NE(ComputePoolHash(p), ComputePoolHash(q));

    q = TestParams();
    q.lockPeriod = WEEK + 1;
    EXPECT_NE(ComputePoolHash(p), ComputePoolHash(q));
}

// ============================================================================
// Pool Tests
// ============================================================================

TEST(PoolTest, Window) {
    Pool pool;
    static_cast<PoolParams&>(pool) = TestParams(1000, 2000);

    EXPECT_FALSE(pool.IsOpen(999));
    EXPECT_FALSE(pool.IsOpen(1000));
    EXPECT_TRUE(pool.IsOpen(1001));
    EXPECT_TRUE(pool.IsOpen(1999));
    EXPECT_FALSE(pool.IsOpen(2000));

    EXPECT_FALSE(pool.IsExpired(1999));
    EXPECT_TRUE(pool.IsExpired(2000));
}

TEST(PoolTest, UnusedReserve) {
    Pool pool;
    static_cast<PoolParams&>(pool) = TestParams();
    EXPECT_EQ(FormatAmount(pool.UnusedReserve()), "10");

    pool.totalStaked = 12 * COIN;
    EXPECT_EQ(FormatAmount(pool.UnusedReserve()), "9.88");

    pool.totalStaked = pool.maxTotalStaked;
    EXPECT_EQ(FormatAmount(pool.UnusedReserve()), "0");
}

// ============================================================================
// Pool Registry Tests
// ============================================================================

TEST(PoolRegistryTest, AddAndGet) {
    PoolRegistry registry;
    EXPECT_EQ(registry.Count(), 0u);
    EXPECT_FALSE(registry.Get(0).has_value());

    EXPECT_EQ(registry.Add(TestParams(1000, 2000)), 0u);
    EXPECT_EQ(registry.Add(TestParams(1000, 3000)), 1u);
    EXPECT_EQ(registry.Count(), 2u);
    EXPECT_TRUE(registry.Contains(1));
    EXPECT_FALSE(registry.Contains(2));

    auto pool = registry.Get(1);
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool->endTime, 3000);
    EXPECT_EQ(pool->poolHash, ComputePoolHash(TestParams(1000, 3000)));
    EXPECT_EQ(FormatAmount(pool->totalStaked), "0");

    auto found = registry.FindByHash(pool->poolHash);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, 1u);
    EXPECT_FALSE(registry.FindByHash(PoolHash()).has_value());
}

TEST(PoolRegistryTest, IdenticalParamsShareHash) {
    PoolRegistry registry;
    registry.Add(TestParams(1000, 2000));
    registry.Add(TestParams(1000, 3000));
    registry.Add(TestParams(1000, 2000));

    EXPECT_EQ(registry.At(0).poolHash, registry.At(2).poolHash);
    EXPECT_NE(registry.At(0).poolHash, registry.At(1).poolHash);

    auto found = registry.FindByHash(registry.At(2).poolHash);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, 0u);

    // Once the first twin expires and is removed, the survivor is found
    registry.At(0).endTime = 1500;
    EXPECT_EQ(registry.RemoveExpired(1600), 1u);
    found = registry.FindByHash(ComputePoolHash(TestParams(1000, 2000)));
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(registry.At(*found).endTime, 2000);
}

TEST(PoolRegistryTest, RemoveExpiredSwapsLast) {
    PoolRegistry registry;
    registry.Add(TestParams(100, 200));   // expired
    registry.Add(TestParams(100, 900));
    registry.Add(TestParams(100, 250));   // expired
    registry.Add(TestParams(100, 300));   // expired, ends up in slot 0
    registry.Add(TestParams(100, 800));

    size_t expired = 0;
    EXPECT_EQ(FormatAmount(registry.UnusedReserveOfExpired(500, &expired)), "30");
    EXPECT_EQ(expired, 3u);

    EXPECT_EQ(registry.RemoveExpired(500), 3u);
    ASSERT_EQ(registry.Count(), 2u);
    EXPECT_EQ(registry.At(0).endTime, 800);
    EXPECT_EQ(registry.At(1).endTime, 900);

    EXPECT_EQ(registry.RemoveExpired(500), 0u);
    EXPECT_EQ(FormatAmount(registry.UnusedReserveOfExpired(500)), "0");
}

TEST(PoolRegistryTest, SerializeRoundTrip) {
    PoolRegistry registry;
    registry.Add(TestParams(100, 200));
    registry.Add(TestParams(100, 300));
    registry.At(1).totalStaked = 5 * COIN;

    DataStream ss;
    registry.Serialize(ss);

    PoolRegistry restored;
    restored.Unserialize(ss);
    EXPECT_TRUE(ss.empty());
    ASSERT_EQ(restored.Count(), 2u);
    EXPECT_EQ(restored.At(1).poolHash, registry.At(1).poolHash);
    EXPECT_EQ(FormatAmount(restored.At(1).totalStaked), "5");
    EXPECT_EQ(restored.At(0).lockPeriod, WEEK);
}

// ============================================================================
// Position Book Tests
// ============================================================================

TEST(PositionBookTest, TakeMaturedKeepsOpenPositions) {
    Address owner = AddressFromLabel("owner");
    PositionBook book;
    book.Append(owner, MakePosition(100, 1 * COIN));
    book.Append(owner, MakePosition(500, 2 * COIN));
    book.Append(owner, MakePosition(200, 3 * COIN));
    book.Append(owner, MakePosition(150, 4 * COIN));

    EXPECT_EQ(FormatAmount(book.TotalOf(owner)), "10");
    EXPECT_EQ(FormatAmount(book.Claimable(owner, 200)), "5");

    EXPECT_EQ(FormatAmount(book.TakeMatured(owner, 200)), "5");
    auto left = book.GetPositions(owner);
    ASSERT_EQ(left.size(), 2u);
    EXPECT_EQ(left[0].unlockTime, 200);
    EXPECT_EQ(left[1].unlockTime, 500);

    EXPECT_EQ(FormatAmount(book.TakeMatured(owner, 1000)), "5");
    EXPECT_EQ(book.Count(owner), 0u);
    EXPECT_EQ(book.OwnerCount(), 0u);
}

TEST(PositionBookTest, RemoveAtAndRestore) {
    Address owner = AddressFromLabel("owner");
    PositionBook book;
    book.Append(owner, MakePosition(100, 1 * COIN));
    book.Append(owner, MakePosition(200, 2 * COIN));
    book.Append(owner, MakePosition(300, 3 * COIN));

    auto saved = book.GetPositions(owner);
    book.RemoveAt(owner, 0);
    ASSERT_EQ(book.Count(owner), 2u);
    EXPECT_EQ(book.At(owner, 0).unlockTime, 300);
    EXPECT_EQ(book.At(owner, 1).unlockTime, 200);

    book.Restore(owner, saved);
    EXPECT_EQ(book.GetPositions(owner), saved);

    book.Restore(owner, {});
    EXPECT_EQ(book.Count(owner), 0u);
    EXPECT_TRUE(book.GetPositions(AddressFromLabel("nobody")).empty());
}

TEST(PoolKeyedBalanceTest, PerPoolAndOwner) {
    Address a = AddressFromLabel("a");
    Address b = AddressFromLabel("b");
    PoolHash p1 = ComputePoolHash(TestParams(1, 2));
    PoolHash p2 = ComputePoolHash(TestParams(1, 3));

    PoolKeyedBalance balances;
    balances.Add(p1, a, 2 * COIN);
    balances.Add(p1, a, 1 * COIN);
    balances.Set(p2, a, 5 * COIN);
    balances.Add(p1, b, 7 * COIN);

    EXPECT_EQ(FormatAmount(balances.Get(p1, a)), "3");
    EXPECT_EQ(FormatAmount(balances.Get(p2, a)), "5");
    EXPECT_EQ(FormatAmount(balances.Get(p1, b)), "7");
    EXPECT_EQ(FormatAmount(balances.Get(p2, b)), "0");

    DataStream ss;
    balances.Serialize(ss);
    PoolKeyedBalance restored;
    restored.Unserialize(ss);
    EXPECT_EQ(FormatAmount(restored.Get(p1, a)), "3");
    EXPECT_EQ(FormatAmount(restored.Get(p1, b)), "7");
}

// ============================================================================
// Reward Accountant Tests
// ============================================================================

TEST(RewardAccountantTest, Lifecycle) {
    RewardAccountant accountant;
    accountant.Reserve(10 * COIN);
    accountant.Allocate(1 * COIN, 100 * COIN);

    EXPECT_EQ(FormatAmount(accountant.GetTotalFreeRewards()), "9");
    EXPECT_EQ(FormatAmount(accountant.GetTotalStakedAndReward()), "101");
    EXPECT_EQ(FormatAmount(accountant.Accounted()), "110");

    accountant.Release(9 * COIN);
    accountant.Settle(101 * COIN);
    EXPECT_EQ(FormatAmount(accountant.Accounted()), "0");
}

TEST(RewardAccountantTest, RejectsUnderflow) {
    RewardAccountant accountant;
    accountant.Reserve(1 * COIN);

    EXPECT_THROW(accountant.Allocate(2 * COIN, 1 * COIN), std::logic_error);
    EXPECT_THROW(accountant.Release(2 * COIN), std::logic_error);
    EXPECT_THROW(accountant.Settle(1), std::logic_error);
    EXPECT_THROW(accountant.Reserve(MAX_AMOUNT), std::overflow_error);

    EXPECT_EQ(FormatAmount(accountant.GetTotalFreeRewards()), "1");
}
