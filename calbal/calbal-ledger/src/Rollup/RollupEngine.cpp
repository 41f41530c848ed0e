// Ticket: 0012_temporal_rollups

#include "calbal-ledger/src/Rollup/RollupEngine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "calbal-ledger/src/Aggregation/DayFigures.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

using std::chrono::sys_days;

namespace
{

using EventGroups = std::map<sys_days, std::vector<CalorieEvent>>;

EnergySums sumsOf(const DayFigures& figures)
{
  return EnergySums{figures.consumed, figures.burnedExercise, figures.burnedBmr};
}

// Events arrive sorted, so each group stays sorted
template <typename BucketOf>
EventGroups groupBy(const std::vector<CalorieEvent>& events, BucketOf bucketOf)
{
  EventGroups groups;
  for (const auto& event : events)
  {
    groups[bucketOf(event)].push_back(event);
  }
  return groups;
}

uint32_t distinctDays(const std::vector<CalorieEvent>& events,
                      std::chrono::minutes utcOffset)
{
  std::set<sys_days> days;
  for (const auto& event : events)
  {
    days.insert(sys_days{localDate(event.timestamp, utcOffset)});
  }
  return static_cast<uint32_t>(days.size());
}

uint32_t distinctWeeks(const std::vector<CalorieEvent>& events,
                       std::chrono::minutes utcOffset)
{
  std::set<sys_days> mondays;
  for (const auto& event : events)
  {
    mondays.insert(
      sys_days{isoWeekOf(localDate(event.timestamp, utcOffset)).monday});
  }
  return static_cast<uint32_t>(mondays.size());
}

}  // namespace

std::string_view toString(RollupGranularity granularity)
{
  switch (granularity)
  {
    case RollupGranularity::Hourly:
      return "hourly";
    case RollupGranularity::Daily:
      return "daily";
    case RollupGranularity::Weekly:
      return "weekly";
    case RollupGranularity::Monthly:
      return "monthly";
    case RollupGranularity::BalanceSummary:
      return "daily_balance_summary";
  }
  return "unknown";
}

RollupGranularity parseRollupGranularity(std::string_view name)
{
  for (RollupGranularity const g : {RollupGranularity::Hourly,
                                    RollupGranularity::Daily,
                                    RollupGranularity::Weekly,
                                    RollupGranularity::Monthly,
                                    RollupGranularity::BalanceSummary})
  {
    if (toString(g) == name)
    {
      return g;
    }
  }
  throw ValidationError{"granularity",
                        "unknown value '" + std::string{name} + "'"};
}

RollupEngine::RollupEngine(const EventStore& events,
                           const GoalManager& goals,
                           Config config,
                           std::shared_ptr<spdlog::logger> logger)
  : events_{events},
    goals_{goals},
    config_{std::move(config)},
    logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"RollupEngine requires a logger"};
  }
  if (!config_.clock)
  {
    config_.clock = []
    {
      return std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now());
    };
  }
}

DateRange RollupEngine::bucketAlignedRange(RollupGranularity granularity,
                                           const DateRange& range)
{
  switch (granularity)
  {
    case RollupGranularity::Weekly:
      return DateRange{isoWeekOf(range.first).monday,
                       isoWeekOf(range.last).sunday};
    case RollupGranularity::Monthly:
      return DateRange{firstOfMonth(range.first), lastOfMonth(range.last)};
    case RollupGranularity::Hourly:
    case RollupGranularity::Daily:
    case RollupGranularity::BalanceSummary:
      return range;
  }
  return range;
}

RollupSnapshot RollupEngine::rollup(const std::string& userId,
                                    RollupGranularity granularity,
                                    const DateRange& range) const
{
  if (userId.empty())
  {
    throw ValidationError{"user_id", "must not be empty"};
  }
  if (!range.first.ok() || !range.last.ok())
  {
    throw ValidationError{"range", "not a valid calendar date"};
  }
  if (sys_days{range.last} < sys_days{range.first})
  {
    throw ValidationError{"range",
                          fmt::format("{} is after {}",
                                      formatDate(range.first),
                                      formatDate(range.last))};
  }

  auto const offset = config_.utcOffset;
  auto const& windows = config_.weightWindows;

  RollupSnapshot snapshot;
  snapshot.granularity = granularity;
  // Sequence first: a concurrent append can only make the snapshot look
  // staler than it is, never fresher
  snapshot.eventSequence = events_.sequence(userId);
  snapshot.computedAt = config_.clock();

  DateRange const scanned = bucketAlignedRange(granularity, range);
  auto const events =
    events_.listEffective(userId, std::nullopt, localRange(scanned, offset));

  auto const byDay = groupBy(events,
                             [offset](const CalorieEvent& e)
                             { return sys_days{localDate(e.timestamp, offset)}; });

  switch (granularity)
  {
    case RollupGranularity::Hourly:
    {
      for (const auto& [day, dayEvents] : byDay)
      {
        std::map<unsigned, std::vector<CalorieEvent>> byHour;
        for (const auto& event : dayEvents)
        {
          byHour[localHour(event.timestamp, offset)].push_back(event);
        }
        for (const auto& [hour, hourEvents] : byHour)
        {
          DayFigures const f = summarize(hourEvents, windows, offset);
          HourlyRollup row;
          row.date = Date{day};
          row.hour = hour;
          row.energy = sumsOf(f);
          row.eventCount = f.eventCount;
          row.sourceVariety = f.sourceVariety;
          row.lastWeight = f.lastWeight;
          row.averageConfidence = f.averageConfidence;
          snapshot.rows.emplace_back(row);
        }
      }
      break;
    }
    case RollupGranularity::Daily:
    {
      for (const auto& [day, dayEvents] : byDay)
      {
        DayFigures const f = summarize(dayEvents, windows, offset);
        DailyRollup row;
        row.date = Date{day};
        row.energy = sumsOf(f);
        row.morningWeight = f.morningWeight;
        row.eveningWeight = f.eveningWeight;
        row.eventCount = f.eventCount;
        row.activeHours = f.activeHours;
        row.sourceVariety = f.sourceVariety;
        row.averageConfidence = f.averageConfidence;
        if (auto const goal = goals_.resolveActive(userId, row.date))
        {
          row.goalTarget = goal->dailyCalorieTarget;
        }
        snapshot.rows.emplace_back(row);
      }
      break;
    }
    case RollupGranularity::Weekly:
    {
      auto const byWeek = groupBy(
        events,
        [offset](const CalorieEvent& e)
        { return sys_days{isoWeekOf(localDate(e.timestamp, offset)).monday}; });
      for (const auto& [monday, weekEvents] : byWeek)
      {
        DayFigures const f = summarize(weekEvents, windows, offset);
        IsoWeek const week = isoWeekOf(Date{monday});
        WeeklyRollup row;
        row.weekStart = week.monday;
        row.weekEnd = week.sunday;
        row.isoYear = week.year;
        row.isoWeek = week.week;
        row.energy = sumsOf(f);
        row.activeDays = distinctDays(weekEvents, offset);
        double const days = std::max<uint32_t>(row.activeDays, 1);
        row.averageDailyConsumed = f.consumed / days;
        row.averageDailyBurned = f.totalBurned() / days;
        row.weekStartWeight = f.firstWeight;
        row.weekEndWeight = f.lastWeight;
        row.eventCount = f.eventCount;
        snapshot.rows.emplace_back(row);
      }
      break;
    }
    case RollupGranularity::Monthly:
    {
      auto const byMonth = groupBy(
        events,
        [offset](const CalorieEvent& e)
        { return sys_days{firstOfMonth(localDate(e.timestamp, offset))}; });
      for (const auto& [first, monthEvents] : byMonth)
      {
        DayFigures const f = summarize(monthEvents, windows, offset);
        Date const start{first};
        MonthlyRollup row;
        row.monthStart = start;
        row.monthEnd = lastOfMonth(start);
        row.year = static_cast<int>(start.year());
        row.month = static_cast<unsigned>(start.month());
        row.label = fmt::format("{:04d}-{:02d}", row.year, row.month);
        row.energy = sumsOf(f);
        row.activeDays = distinctDays(monthEvents, offset);
        row.activeWeeks = distinctWeeks(monthEvents, offset);
        row.averageDailyConsumed =
          f.consumed / std::max<uint32_t>(row.activeDays, 1);
        row.averageWeeklyConsumed =
          f.consumed / std::max<uint32_t>(row.activeWeeks, 1);
        row.monthStartWeight = f.firstWeight;
        row.monthEndWeight = f.lastWeight;
        row.eventCount = f.eventCount;
        snapshot.rows.emplace_back(row);
      }
      break;
    }
    case RollupGranularity::BalanceSummary:
    {
      for (const auto& [day, dayEvents] : byDay)
      {
        DayFigures const f = summarize(dayEvents, windows, offset);
        BalanceSummaryRollup row;
        row.date = Date{day};
        row.energy = sumsOf(f);
        row.morningWeight = f.morningWeight;
        row.eveningWeight = f.eveningWeight;
        row.averageWeight = f.averageWeight;
        if (f.morningWeight && f.eveningWeight)
        {
          row.dailyWeightChange = *f.eveningWeight - *f.morningWeight;
        }
        if (auto const goal = goals_.resolveActive(userId, row.date))
        {
          row.dailyCalorieTarget = goal->dailyCalorieTarget;
          row.dailyDeficitTarget = goal->dailyDeficitTarget;
          row.goalType = goal->type;
          row.targetDeviation = row.energy.net() - goal->dailyCalorieTarget;
          if (goal->dailyDeficitTarget)
          {
            row.goalAchieved = row.energy.net() <=
                               goal->dailyCalorieTarget +
                                 *goal->dailyDeficitTarget;
          }
        }
        row.dataCompletenessScore = f.completeness();
        row.eventCount = f.eventCount;
        row.averageConfidence = f.averageConfidence;
        snapshot.rows.emplace_back(row);
      }
      break;
    }
  }

  logger_->debug("Rollup {} for user {} over {}..{}: {} rows at sequence {}",
                 toString(granularity),
                 userId,
                 formatDate(scanned.first),
                 formatDate(scanned.last),
                 snapshot.rows.size(),
                 snapshot.eventSequence);
  return snapshot;
}

}  // namespace calbal_ledger
