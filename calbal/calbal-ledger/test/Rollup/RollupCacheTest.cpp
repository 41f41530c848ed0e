// Ticket: 0013_rollup_cache
// Test: bounded-staleness rollup cache

#include <gtest/gtest.h>

#include <chrono>

#include "calbal-ledger/src/EventStore/InMemoryEventStore.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"
#include "calbal-ledger/src/Rollup/RollupCache.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

class RollupCacheTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    events_.append(
      makeEvent("c1", "u1", EventType::Consumed, "2025-01-15T08:00:00Z", 500));
  }

  double consumed(const RollupSnapshot& snapshot) const
  {
    return std::get<DailyRollup>(snapshot.rows.at(0)).energy.consumed;
  }

  Timestamp now_ = at("2025-01-16T00:00:00Z");
  DateRange const january_{day("2025-01-01"), day("2025-01-31")};

  InMemoryEventStore events_{ValidationLimits{}, makeNullLogger()};
  GoalManager goals_{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
  RollupEngine engine_{
    events_,
    goals_,
    RollupEngine::Config{
      std::chrono::minutes{0}, WeightWindowPolicy{}, [this] { return now_; }},
    makeNullLogger()};
};

TEST_F(RollupCacheTest, ServesCachedSnapshotWithinBound)
{
  RollupCache cache{engine_, events_, std::chrono::seconds{60}};

  RollupSnapshot const first =
    cache.get("u1", RollupGranularity::Daily, january_);
  EXPECT_FALSE(cache.isStale("u1", first));

  events_.append(
    makeEvent("c2", "u1", EventType::Consumed, "2025-01-15T12:00:00Z", 250));
  now_ += std::chrono::seconds{60};

  RollupSnapshot const cached =
    cache.get("u1", RollupGranularity::Daily, january_);
  EXPECT_DOUBLE_EQ(consumed(cached), 500.0);
  EXPECT_EQ(cached.computedAt, first.computedAt);
  EXPECT_TRUE(cache.isStale("u1", cached));
}

TEST_F(RollupCacheTest, RecomputesPastBound)
{
  RollupCache cache{engine_, events_, std::chrono::seconds{60}};
  static_cast<void>(cache.get("u1", RollupGranularity::Daily, january_));

  events_.append(
    makeEvent("c2", "u1", EventType::Consumed, "2025-01-15T12:00:00Z", 250));
  now_ += std::chrono::seconds{61};

  RollupSnapshot const fresh =
    cache.get("u1", RollupGranularity::Daily, january_);
  EXPECT_DOUBLE_EQ(consumed(fresh), 750.0);
  EXPECT_FALSE(cache.isStale("u1", fresh));
  EXPECT_EQ(cache.size(), 1u);
}

TEST_F(RollupCacheTest, ZeroBoundDisablesCaching)
{
  RollupCache cache{engine_, events_, std::chrono::seconds{0}};
  static_cast<void>(cache.get("u1", RollupGranularity::Daily, january_));

  events_.append(
    makeEvent("c2", "u1", EventType::Consumed, "2025-01-15T12:00:00Z", 250));

  EXPECT_DOUBLE_EQ(
    consumed(cache.get("u1", RollupGranularity::Daily, january_)), 750.0);
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(RollupCacheTest, KeysSeparateGranularityAndRange)
{
  RollupCache cache{engine_, events_, std::chrono::seconds{60}};
  static_cast<void>(cache.get("u1", RollupGranularity::Daily, january_));
  static_cast<void>(cache.get("u1", RollupGranularity::Weekly, january_));
  static_cast<void>(cache.get(
    "u1", RollupGranularity::Daily, DateRange{day("2025-01-15"), day("2025-01-15")}));
  static_cast<void>(cache.get("u2", RollupGranularity::Daily, january_));
  EXPECT_EQ(cache.size(), 4u);

  cache.invalidate("u1");
  EXPECT_EQ(cache.size(), 1u);
}

TEST_F(RollupCacheTest, ExpiredSnapshotsEvictedOnInsert)
{
  RollupCache cache{engine_, events_, std::chrono::seconds{60}};
  for (int d = 1; d <= 10; ++d)
  {
    Date const date = std::chrono::sys_days{day("2025-01-01")} +
                      std::chrono::days{d - 1};
    static_cast<void>(
      cache.get("u1", RollupGranularity::Daily, DateRange{date, date}));
  }
  EXPECT_EQ(cache.size(), 10u);

  now_ += std::chrono::seconds{61};
  static_cast<void>(cache.get("u2", RollupGranularity::Daily, january_));
  EXPECT_EQ(cache.size(), 1u);

  // Entries still inside the window survive
  now_ += std::chrono::seconds{30};
  static_cast<void>(cache.get("u1", RollupGranularity::Weekly, january_));
  EXPECT_EQ(cache.size(), 2u);
}

TEST_F(RollupCacheTest, NegativeBoundRejected)
{
  EXPECT_THROW(RollupCache(engine_, events_, std::chrono::seconds{-1}),
               std::invalid_argument);
}

}  // namespace test
}  // namespace calbal_ledger
