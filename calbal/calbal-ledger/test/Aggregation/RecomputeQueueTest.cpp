// Ticket: 0011_recompute_queue
// Test: background recompute lanes, coalescing and backfill rate limit

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <vector>

#include "calbal-ledger/src/Aggregation/DailyBalanceAggregator.hpp"
#include "calbal-ledger/src/Aggregation/InMemoryBalanceStore.hpp"
#include "calbal-ledger/src/Aggregation/RecomputeQueue.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/EventStore/InMemoryEventStore.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

namespace
{

/// Holds the first upsert until release() so tests can queue work behind it
class GatedBalanceStore final : public BalanceStore
{
public:
  GatedBalanceStore() : gate_{release_.get_future().share()}
  {
  }

  std::optional<DailyBalance> find(const BalanceKey& key) const override
  {
    return inner_.find(key);
  }

  DailyBalance upsert(DailyBalance row, uint64_t expectedVersion) override
  {
    if (!firstSeen_.exchange(true))
    {
      entered_.set_value();
      gate_.wait();
    }
    return inner_.upsert(std::move(row), expectedVersion);
  }

  std::vector<DailyBalance> range(const std::string& userId,
                                  const DateRange& dates) const override
  {
    return inner_.range(userId, dates);
  }

  void waitUntilBlocked()
  {
    entered_.get_future().wait();
  }

  void release()
  {
    release_.set_value();
  }

private:
  InMemoryBalanceStore inner_;
  std::atomic<bool> firstSeen_{false};
  std::promise<void> entered_;
  std::promise<void> release_;
  std::shared_future<void> gate_;
};

/// Always fails
class BrokenBalanceStore final : public BalanceStore
{
public:
  std::optional<DailyBalance> find(const BalanceKey&) const override
  {
    return std::nullopt;
  }

  DailyBalance upsert(DailyBalance, uint64_t) override
  {
    throw TransientStorageError{"backend down"};
  }

  std::vector<DailyBalance> range(const std::string&,
                                  const DateRange&) const override
  {
    return {};
  }
};

DailyBalanceAggregator::Config quickRetry()
{
  DailyBalanceAggregator::Config config;
  config.retry.maxAttempts = 2;
  config.retry.initialBackoff = std::chrono::milliseconds{1};
  config.retry.maxBackoff = std::chrono::milliseconds{1};
  return config;
}

}  // namespace

class RecomputeQueueTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    for (const char* date : {"2025-01-10", "2025-01-11", "2025-01-12",
                             "2025-01-13", "2025-01-14"})
    {
      events_.append(makeEvent(std::string{"c-"} + date,
                               "u1",
                               EventType::Consumed,
                               std::string{date} + "T12:00:00Z",
                               100.0));
    }
    aggregator_.setUpsertListener(
      [this](const DailyBalance& row)
      {
        std::scoped_lock lock{writtenMutex_};
        written_.push_back(row.date);
      });
  }

  std::vector<Date> written()
  {
    std::scoped_lock lock{writtenMutex_};
    return written_;
  }

  InMemoryEventStore events_{ValidationLimits{}, makeNullLogger()};
  GoalManager goals_{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
  GatedBalanceStore balances_;
  DailyBalanceAggregator aggregator_{
    events_, goals_, balances_, quickRetry(), makeNullLogger()};

  std::mutex writtenMutex_;
  std::vector<Date> written_;
};

TEST_F(RecomputeQueueTest, PendingKeysCoalesce)
{
  RecomputeQueue queue{aggregator_, 1000, makeNullLogger()};

  ASSERT_TRUE(
    queue.schedule(BalanceKey{"u1", day("2025-01-10")}, RecomputeLane::Live));
  balances_.waitUntilBlocked();

  BalanceKey const next{"u1", day("2025-01-11")};
  EXPECT_TRUE(queue.schedule(next, RecomputeLane::Live));
  EXPECT_FALSE(queue.schedule(next, RecomputeLane::Live));
  EXPECT_FALSE(queue.schedule(next, RecomputeLane::Backfill));
  EXPECT_EQ(queue.pending(RecomputeLane::Live), 1u);

  balances_.release();
  queue.drain();

  EXPECT_EQ(queue.completed(), 2u);
  EXPECT_EQ(queue.pending(RecomputeLane::Live), 0u);
  EXPECT_EQ(written().size(), 2u);
}

TEST_F(RecomputeQueueTest, LiveLaneIsServedFirst)
{
  RecomputeQueue queue{aggregator_, 1000, makeNullLogger()};

  queue.schedule(BalanceKey{"u1", day("2025-01-10")}, RecomputeLane::Live);
  balances_.waitUntilBlocked();

  queue.schedule(BalanceKey{"u1", day("2025-01-11")}, RecomputeLane::Backfill);
  queue.schedule(BalanceKey{"u1", day("2025-01-12")}, RecomputeLane::Backfill);
  queue.schedule(BalanceKey{"u1", day("2025-01-13")}, RecomputeLane::Live);

  balances_.release();
  queue.drain();

  std::vector<Date> const expected{day("2025-01-10"),
                                   day("2025-01-13"),
                                   day("2025-01-11"),
                                   day("2025-01-12")};
  EXPECT_EQ(written(), expected);
}

TEST_F(RecomputeQueueTest, LiveRequestPromotesBackfillKey)
{
  RecomputeQueue queue{aggregator_, 1000, makeNullLogger()};

  queue.schedule(BalanceKey{"u1", day("2025-01-10")}, RecomputeLane::Live);
  balances_.waitUntilBlocked();

  BalanceKey const key{"u1", day("2025-01-11")};
  EXPECT_TRUE(queue.schedule(key, RecomputeLane::Backfill));
  EXPECT_TRUE(queue.schedule(key, RecomputeLane::Live));
  EXPECT_EQ(queue.pending(RecomputeLane::Backfill), 0u);
  EXPECT_EQ(queue.pending(RecomputeLane::Live), 1u);

  balances_.release();
  queue.drain();

  EXPECT_EQ(queue.completed(), 2u);
  EXPECT_EQ(written().size(), 2u);
}

TEST_F(RecomputeQueueTest, BackfillIsRateLimited)
{
  // 20 per second: one key every 50 ms
  RecomputeQueue queue{aggregator_, 20, makeNullLogger()};
  balances_.release();

  auto const start = std::chrono::steady_clock::now();
  for (const char* date :
       {"2025-01-10", "2025-01-11", "2025-01-12", "2025-01-13"})
  {
    queue.schedule(BalanceKey{"u1", day(date)}, RecomputeLane::Backfill);
  }
  queue.drain();
  auto const elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_EQ(queue.completed(), 4u);
  EXPECT_GE(elapsed, std::chrono::milliseconds{140});
}

TEST(RecomputeQueueFailureTest, ExhaustedRetriesAreCounted)
{
  InMemoryEventStore events{ValidationLimits{}, makeNullLogger()};
  GoalManager goals{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
  BrokenBalanceStore balances;
  DailyBalanceAggregator aggregator{
    events, goals, balances, quickRetry(), makeNullLogger()};
  RecomputeQueue queue{aggregator, 1000, makeNullLogger()};

  queue.schedule(BalanceKey{"u1", day("2025-01-10")}, RecomputeLane::Live);
  queue.drain();

  EXPECT_EQ(queue.failures(), 1u);
  EXPECT_EQ(queue.completed(), 0u);

  // The worker keeps going after a failure
  queue.schedule(BalanceKey{"u1", day("2025-01-11")}, RecomputeLane::Live);
  queue.drain();
  EXPECT_EQ(queue.failures(), 2u);
}

TEST(RecomputeQueueConstructionTest, RequiresLogger)
{
  InMemoryEventStore events{ValidationLimits{}, makeNullLogger()};
  GoalManager goals{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
  InMemoryBalanceStore balances;
  DailyBalanceAggregator aggregator{
    events, goals, balances, quickRetry(), makeNullLogger()};

  EXPECT_THROW(RecomputeQueue(aggregator, 10, nullptr), std::invalid_argument);
}

}  // namespace test
}  // namespace calbal_ledger
