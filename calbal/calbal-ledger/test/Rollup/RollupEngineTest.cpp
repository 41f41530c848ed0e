// Ticket: 0012_temporal_rollups
// Test: hourly, daily, weekly, monthly and balance-summary projections

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/EventStore/InMemoryEventStore.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"
#include "calbal-ledger/src/Rollup/RollupEngine.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

class RollupEngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    // Week 2025-W02 (Mon 6 Jan .. Sun 12 Jan), then W03, then February
    add("a", EventType::Consumed, "2025-01-06T08:00:00Z", 500, EventSource::Manual);
    add("b", EventType::Consumed, "2025-01-06T08:30:00Z", 300, EventSource::Device);
    add("c", EventType::BurnedExercise, "2025-01-06T12:00:00Z", 200);
    add("d", EventType::Weight, "2025-01-07T07:00:00Z", 70.0);
    add("e", EventType::Consumed, "2025-01-12T13:00:00Z", 1000);
    add("f", EventType::Consumed, "2025-01-13T13:00:00Z", 400);
    add("g", EventType::Consumed, "2025-02-03T13:00:00Z", 700);
    add("h", EventType::Weight, "2025-02-03T19:00:00Z", 69.0);
  }

  void add(const std::string& id,
           EventType type,
           std::string_view timestamp,
           double value,
           EventSource source = EventSource::Manual)
  {
    ASSERT_TRUE(
      events_.append(makeEvent(id, "u1", type, timestamp, value, source))
        .inserted);
  }

  template <typename Row>
  std::vector<Row> rowsOf(RollupGranularity granularity,
                          std::string_view first,
                          std::string_view last) const
  {
    RollupSnapshot const snapshot =
      engine_.rollup("u1", granularity, DateRange{day(first), day(last)});
    EXPECT_EQ(snapshot.granularity, granularity);
    std::vector<Row> rows;
    for (const auto& row : snapshot.rows)
    {
      rows.push_back(std::get<Row>(row));
    }
    return rows;
  }

  InMemoryEventStore events_{ValidationLimits{}, makeNullLogger()};
  GoalManager goals_{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
  RollupEngine engine_{events_,
                       goals_,
                       RollupEngine::Config{
                         std::chrono::minutes{0},
                         WeightWindowPolicy{},
                         [] { return at("2025-03-01T00:00:00Z"); }},
                       makeNullLogger()};
};

TEST_F(RollupEngineTest, HourlyBucketsByLocalHour)
{
  auto const rows = rowsOf<HourlyRollup>(
    RollupGranularity::Hourly, "2025-01-06", "2025-01-06");

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].hour, 8u);
  EXPECT_DOUBLE_EQ(rows[0].energy.consumed, 800.0);
  EXPECT_EQ(rows[0].eventCount, 2u);
  EXPECT_EQ(rows[0].sourceVariety, 2u);
  EXPECT_EQ(rows[1].hour, 12u);
  EXPECT_DOUBLE_EQ(rows[1].energy.burnedExercise, 200.0);
  EXPECT_DOUBLE_EQ(rows[1].energy.net(), -200.0);
}

TEST_F(RollupEngineTest, DailyEmitsOnlyDaysWithEvents)
{
  goals_.create(makeGoal("u1", 2100.0, "2025-01-10"));

  auto const rows =
    rowsOf<DailyRollup>(RollupGranularity::Daily, "2025-01-01", "2025-01-13");

  ASSERT_EQ(rows.size(), 4u);
  EXPECT_EQ(rows[0].date, day("2025-01-06"));
  EXPECT_DOUBLE_EQ(rows[0].energy.net(), 600.0);
  EXPECT_EQ(rows[0].activeHours, 2u);
  EXPECT_FALSE(rows[0].goalTarget.has_value());
  EXPECT_EQ(rows[1].morningWeight, std::optional<double>{70.0});
  EXPECT_EQ(rows[2].date, day("2025-01-12"));
  EXPECT_EQ(rows[2].goalTarget, std::optional<double>{2100.0});
  EXPECT_EQ(rows[3].date, day("2025-01-13"));
}

TEST_F(RollupEngineTest, WeeklyWidensToWholeIsoWeek)
{
  auto const rows = rowsOf<WeeklyRollup>(
    RollupGranularity::Weekly, "2025-01-08", "2025-01-08");

  ASSERT_EQ(rows.size(), 1u);
  const WeeklyRollup& week = rows[0];
  EXPECT_EQ(week.weekStart, day("2025-01-06"));
  EXPECT_EQ(week.weekEnd, day("2025-01-12"));
  EXPECT_EQ(week.isoYear, 2025);
  EXPECT_EQ(week.isoWeek, 2u);
  EXPECT_DOUBLE_EQ(week.energy.consumed, 1800.0);
  EXPECT_EQ(week.activeDays, 3u);
  EXPECT_DOUBLE_EQ(week.averageDailyConsumed, 600.0);
  EXPECT_DOUBLE_EQ(week.averageDailyBurned, 200.0 / 3.0);
  EXPECT_EQ(week.weekStartWeight, std::optional<double>{70.0});
  EXPECT_EQ(week.eventCount, 5u);
}

TEST_F(RollupEngineTest, MonthlyWidensToCalendarMonths)
{
  auto const rows = rowsOf<MonthlyRollup>(
    RollupGranularity::Monthly, "2025-01-15", "2025-02-10");

  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].label, "2025-01");
  EXPECT_EQ(rows[0].monthStart, day("2025-01-01"));
  EXPECT_EQ(rows[0].monthEnd, day("2025-01-31"));
  EXPECT_DOUBLE_EQ(rows[0].energy.consumed, 2200.0);
  EXPECT_EQ(rows[0].activeDays, 4u);
  EXPECT_EQ(rows[0].activeWeeks, 2u);
  EXPECT_DOUBLE_EQ(rows[0].averageWeeklyConsumed, 1100.0);
  EXPECT_DOUBLE_EQ(rows[0].averageDailyConsumed, 550.0);

  EXPECT_EQ(rows[1].label, "2025-02");
  EXPECT_EQ(rows[1].monthEnd, day("2025-02-28"));
  EXPECT_EQ(rows[1].monthEndWeight, std::optional<double>{69.0});
}

TEST_F(RollupEngineTest, BalanceSummaryAgainstGoal)
{
  CalorieGoal goal = makeGoal("u1", 2000.0, "2025-01-01", GoalType::WeightLoss);
  goal.dailyDeficitTarget = 500.0;
  goals_.create(goal);

  auto const rows = rowsOf<BalanceSummaryRollup>(
    RollupGranularity::BalanceSummary, "2025-01-06", "2025-01-06");

  ASSERT_EQ(rows.size(), 1u);
  const BalanceSummaryRollup& row = rows[0];
  EXPECT_EQ(row.goalType, std::optional<GoalType>{GoalType::WeightLoss});
  EXPECT_EQ(row.dailyCalorieTarget, std::optional<double>{2000.0});
  ASSERT_TRUE(row.targetDeviation.has_value());
  EXPECT_DOUBLE_EQ(*row.targetDeviation, 600.0 - 2000.0);
  EXPECT_EQ(row.goalAchieved, std::optional<bool>{true});
  EXPECT_DOUBLE_EQ(row.dataCompletenessScore, 1.0);
  EXPECT_FALSE(row.dailyWeightChange.has_value());
}

TEST_F(RollupEngineTest, BalanceSummaryWithoutGoal)
{
  auto const rows = rowsOf<BalanceSummaryRollup>(
    RollupGranularity::BalanceSummary, "2025-02-03", "2025-02-03");

  ASSERT_EQ(rows.size(), 1u);
  EXPECT_FALSE(rows[0].dailyCalorieTarget.has_value());
  EXPECT_FALSE(rows[0].goalAchieved.has_value());
  EXPECT_EQ(rows[0].eveningWeight, std::optional<double>{69.0});
  EXPECT_EQ(rows[0].averageWeight, std::optional<double>{69.0});
}

TEST_F(RollupEngineTest, SnapshotCarriesSequenceWatermark)
{
  RollupSnapshot const snapshot = engine_.rollup(
    "u1",
    RollupGranularity::Daily,
    DateRange{day("2025-01-01"), day("2025-01-31")});

  EXPECT_EQ(snapshot.eventSequence, events_.sequence("u1"));
  EXPECT_EQ(snapshot.computedAt, at("2025-03-01T00:00:00Z"));
}

TEST_F(RollupEngineTest, InvalidQueriesRejected)
{
  EXPECT_THROW(static_cast<void>(engine_.rollup(
                 "u1",
                 RollupGranularity::Daily,
                 DateRange{day("2025-01-31"), day("2025-01-01")})),
               ValidationError);
  EXPECT_THROW(static_cast<void>(engine_.rollup(
                 "",
                 RollupGranularity::Daily,
                 DateRange{day("2025-01-01"), day("2025-01-31")})),
               ValidationError);

  EXPECT_TRUE(engine_
                .rollup("nobody",
                        RollupGranularity::Monthly,
                        DateRange{day("2025-01-01"), day("2025-12-31")})
                .rows.empty());
}

TEST(RollupGranularityTest, NamesRoundTrip)
{
  EXPECT_EQ(parseRollupGranularity("daily_balance_summary"),
            RollupGranularity::BalanceSummary);
  EXPECT_EQ(toString(RollupGranularity::Weekly), "weekly");
  EXPECT_THROW(static_cast<void>(parseRollupGranularity("yearly")),
               ValidationError);
}

TEST(RollupGranularityTest, BucketAlignedRange)
{
  DateRange const aligned = RollupEngine::bucketAlignedRange(
    RollupGranularity::Weekly, DateRange{day("2025-01-01"), day("2025-01-01")});
  EXPECT_EQ(aligned.first, day("2024-12-30"));
  EXPECT_EQ(aligned.last, day("2025-01-05"));

  DateRange const daily = RollupEngine::bucketAlignedRange(
    RollupGranularity::Daily, DateRange{day("2025-01-01"), day("2025-01-03")});
  EXPECT_EQ(daily.first, day("2025-01-01"));
  EXPECT_EQ(daily.last, day("2025-01-03"));
}

}  // namespace test
}  // namespace calbal_ledger
