// Ticket: 0009_daily_balance_aggregator
// Ticket: 0010_recompute_retry

#include "calbal-ledger/src/Aggregation/DailyBalanceAggregator.hpp"

#include <set>

#include <fmt/format.h>

#include "calbal-ledger/src/Aggregation/DayFigures.hpp"
#include "calbal-ledger/src/Aggregation/Retry.hpp"

namespace calbal_ledger
{

DailyBalanceAggregator::DailyBalanceAggregator(
  const EventStore& events,
  const GoalManager& goals,
  BalanceStore& balances,
  Config config,
  std::shared_ptr<spdlog::logger> logger)
  : events_{events},
    goals_{goals},
    balances_{balances},
    config_{std::move(config)},
    logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"DailyBalanceAggregator requires a logger"};
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

DailyBalance DailyBalanceAggregator::buildRow(
  const std::string& userId,
  Date date,
  std::span<const CalorieEvent> events,
  const std::optional<CalorieGoal>& goal,
  const WeightWindowPolicy& windows,
  std::chrono::minutes utcOffset)
{
  DayFigures const figures = summarize(events, windows, utcOffset);

  DailyBalance row;
  row.userId = userId;
  row.date = date;
  row.caloriesConsumed = figures.consumed;
  row.caloriesBurnedExercise = figures.burnedExercise;
  row.caloriesBurnedBmr = figures.burnedBmr;
  row.morningWeight = figures.morningWeight;
  row.eveningWeight = figures.eveningWeight;
  row.eventsCount = figures.eventCount;
  row.lastEventTimestamp = figures.lastEventTimestamp;
  row.dataCompletenessScore = figures.completeness();
  if (goal)
  {
    row.dailyCalorieTarget = goal->dailyCalorieTarget;
    row.goalId = goal->id;
  }
  return row;
}

DailyBalance DailyBalanceAggregator::recompute(const std::string& userId,
                                               Date date)
{
  BalanceKey const key{userId, date};
  std::string const what =
    fmt::format("recompute {} {}", userId, formatDate(date));

  bool written = false;
  DailyBalance stored;
  {
    KeyedMutex<BalanceKey>::Guard guard{keyLocks_, key};

    stored = withRetry(
      config_.retry,
      *logger_,
      what,
      [&]
      {
        auto const previous = balances_.find(key);
        auto const events = events_.listEffective(
          userId, std::nullopt, localDayRange(date, config_.utcOffset));
        auto const goal = goals_.resolveActive(userId, date);

        DailyBalance row = buildRow(userId,
                                    date,
                                    events,
                                    goal,
                                    config_.weightWindows,
                                    config_.utcOffset);
        if (previous && previous->sameFigures(row))
        {
          written = false;
          return *previous;
        }

        row.computedAt = config_.clock();
        written = true;
        return balances_.upsert(std::move(row),
                                previous ? previous->version : 0);
      });
  }

  if (written)
  {
    logger_->debug("Balance {} {} v{}: net {:.1f} over {} events",
                   userId,
                   formatDate(date),
                   stored.version,
                   stored.netCalories(),
                   stored.eventsCount);

    UpsertListener listener;
    {
      std::scoped_lock lock{listenerMutex_};
      listener = listener_;
    }
    if (listener)
    {
      listener(stored);
    }
  }
  return stored;
}

std::vector<DailyBalance> DailyBalanceAggregator::reaggregate(
  const std::string& userId,
  const DateRange& dates)
{
  std::set<std::chrono::sys_days> days;
  for (const auto& event : events_.listEffective(
         userId, std::nullopt, localRange(dates, config_.utcOffset)))
  {
    days.insert(std::chrono::sys_days{
      localDate(event.timestamp, config_.utcOffset)});
  }
  for (const auto& row : balances_.range(userId, dates))
  {
    days.insert(std::chrono::sys_days{row.date});
  }

  logger_->info("Re-aggregating {} days for user {} between {} and {}",
                days.size(),
                userId,
                formatDate(dates.first),
                formatDate(dates.last));

  std::vector<DailyBalance> rows;
  rows.reserve(days.size());
  for (auto const day : days)
  {
    rows.push_back(recompute(userId, Date{day}));
  }
  return rows;
}

void DailyBalanceAggregator::setUpsertListener(UpsertListener listener)
{
  std::scoped_lock lock{listenerMutex_};
  listener_ = std::move(listener);
}

}  // namespace calbal_ledger
