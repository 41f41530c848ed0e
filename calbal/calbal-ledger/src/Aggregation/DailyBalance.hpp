// Ticket: 0009_daily_balance_aggregator

#ifndef CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_HPP
#define CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_HPP

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"

namespace calbal_ledger
{

/**
 * @brief Identity of a DailyBalance row
 */
struct BalanceKey
{
  std::string userId;
  Date date;

  auto operator<=>(const BalanceKey&) const = default;
};

/**
 * @brief Materialized energy balance of one user on one local date
 *
 * The row is a cache of the event log: every stored figure is reproducible
 * by replaying that day's events. Net calories and target deviation are
 * derived on read and never stored.
 *
 * `version` increases with every write of the row and serves as the
 * optimistic concurrency token for BalanceStore::upsert.
 *
 * @ticket 0009_daily_balance_aggregator
 */
struct DailyBalance
{
  std::string userId;
  Date date{};

  double caloriesConsumed{0.0};
  double caloriesBurnedExercise{0.0};
  double caloriesBurnedBmr{0.0};

  std::optional<double> morningWeight;  // [kg]
  std::optional<double> eveningWeight;  // [kg]

  std::optional<double> dailyCalorieTarget;
  std::optional<uint32_t> goalId;

  uint32_t eventsCount{0};
  std::optional<Timestamp> lastEventTimestamp;
  double dataCompletenessScore{0.0};

  uint64_t version{0};
  Timestamp computedAt{};

  [[nodiscard]] double totalBurned() const
  {
    return caloriesBurnedExercise + caloriesBurnedBmr;
  }

  /// consumed - (exercise + bmr)
  [[nodiscard]] double netCalories() const
  {
    return caloriesConsumed - totalBurned();
  }

  /// net - target, absent without a target
  [[nodiscard]] std::optional<double> targetDeviation() const
  {
    if (!dailyCalorieTarget)
    {
      return std::nullopt;
    }
    return netCalories() - *dailyCalorieTarget;
  }

  [[nodiscard]] BalanceKey key() const
  {
    return BalanceKey{userId, date};
  }

  /**
   * @brief Equality of everything derived from events and goals
   *
   * Ignores version and computedAt, which describe the write rather than
   * the day.
   */
  [[nodiscard]] bool sameFigures(const DailyBalance& other) const
  {
    return userId == other.userId && date == other.date &&
           caloriesConsumed == other.caloriesConsumed &&
           caloriesBurnedExercise == other.caloriesBurnedExercise &&
           caloriesBurnedBmr == other.caloriesBurnedBmr &&
           morningWeight == other.morningWeight &&
           eveningWeight == other.eveningWeight &&
           dailyCalorieTarget == other.dailyCalorieTarget &&
           goalId == other.goalId && eventsCount == other.eventsCount &&
           lastEventTimestamp == other.lastEventTimestamp &&
           dataCompletenessScore == other.dataCompletenessScore;
  }
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_HPP
