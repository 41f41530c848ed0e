// Ticket: 0001_event_store_data_model
// Test: local-day arithmetic and ISO weeks

#include <gtest/gtest.h>

#include <chrono>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

using std::chrono::hours;
using std::chrono::minutes;

TEST(CalendarTest, TimestampRoundTripsThroughText)
{
  Timestamp const t = parseTimestamp("2025-01-15T08:30:05Z");
  EXPECT_EQ(formatTimestamp(t), "2025-01-15T08:30:05Z");
  EXPECT_EQ(parseTimestamp("2025-01-15 08:30:05"), t);
  EXPECT_EQ(parseTimestamp("2025-01-15T08:30:05"), t);
}

TEST(CalendarTest, MalformedTimestampsRejected)
{
  EXPECT_THROW(static_cast<void>(parseTimestamp("2025-01-15")),
               ValidationError);
  EXPECT_THROW(static_cast<void>(parseTimestamp("2025-01-15T25:00:00Z")),
               ValidationError);
  EXPECT_THROW(static_cast<void>(parseTimestamp("2025-02-30T10:00:00Z")),
               ValidationError);
  EXPECT_THROW(static_cast<void>(parseTimestamp("2025/01/15T10:00:00Z")),
               ValidationError);
}

TEST(CalendarTest, ParseDateRejectsImpossibleDates)
{
  EXPECT_EQ(formatDate(parseDate("2024-02-29")), "2024-02-29");
  EXPECT_THROW(static_cast<void>(parseDate("2025-02-29")), ValidationError);
  EXPECT_THROW(static_cast<void>(parseDate("2025-1-5")), ValidationError);
}

TEST(CalendarTest, LocalDateFollowsUtcOffset)
{
  Timestamp const lateUtc = at("2025-01-15T23:30:00Z");
  EXPECT_EQ(localDate(lateUtc, minutes{0}), day("2025-01-15"));
  EXPECT_EQ(localDate(lateUtc, hours{2}), day("2025-01-16"));
  EXPECT_EQ(localDate(at("2025-01-15T03:00:00Z"), hours{-5}),
            day("2025-01-14"));
}

TEST(CalendarTest, LocalDayRangeIsHalfOpen)
{
  TimeRange const range = localDayRange(day("2025-01-15"), hours{1});
  EXPECT_EQ(range.from, at("2025-01-14T23:00:00Z"));
  EXPECT_EQ(range.to, at("2025-01-15T23:00:00Z"));
  EXPECT_TRUE(range.contains(at("2025-01-14T23:00:00Z")));
  EXPECT_FALSE(range.contains(at("2025-01-15T23:00:00Z")));
}

TEST(CalendarTest, LocalHourAndTimeOfDay)
{
  Timestamp const t = at("2025-01-15T06:45:00Z");
  EXPECT_EQ(localHour(t, minutes{0}), 6u);
  EXPECT_EQ(localHour(t, minutes{90}), 8u);
  EXPECT_EQ(localTimeOfDay(t, minutes{0}), hours{6} + minutes{45});
}

TEST(CalendarTest, IsoWeekAcrossYearBoundary)
{
  IsoWeek const week = isoWeekOf(day("2024-12-30"));
  EXPECT_EQ(week.year, 2025);
  EXPECT_EQ(week.week, 1u);
  EXPECT_EQ(week.monday, day("2024-12-30"));
  EXPECT_EQ(week.sunday, day("2025-01-05"));

  IsoWeek const lastOf2020 = isoWeekOf(day("2021-01-03"));
  EXPECT_EQ(lastOf2020.year, 2020);
  EXPECT_EQ(lastOf2020.week, 53u);
}

TEST(CalendarTest, MonthBoundsAndDayCounts)
{
  EXPECT_EQ(firstOfMonth(day("2024-02-17")), day("2024-02-01"));
  EXPECT_EQ(lastOfMonth(day("2024-02-17")), day("2024-02-29"));
  EXPECT_EQ(addDays(day("2025-01-31"), 1), day("2025-02-01"));
  EXPECT_EQ(daysBetweenInclusive(day("2025-01-01"), day("2025-01-07")), 7);
  EXPECT_EQ(daysBetweenInclusive(day("2025-01-07"), day("2025-01-01")), 0);
}

}  // namespace test
}  // namespace calbal_ledger
