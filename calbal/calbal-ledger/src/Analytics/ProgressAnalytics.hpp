// Ticket: 0014_progress_analytics

#ifndef CALBAL_LEDGER_ANALYTICS_PROGRESS_ANALYTICS_HPP
#define CALBAL_LEDGER_ANALYTICS_PROGRESS_ANALYTICS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "calbal-ledger/src/Aggregation/DailyBalance.hpp"

namespace calbal_ledger
{

/**
 * @brief Adherence of a run of days to a calorie target
 */
struct ProgressMetrics
{
  double averageDailyConsumed{0.0};
  double adherenceRate{0.0};    // [%] of days within tolerance of target
  double calorieVariance{0.0};  // RMS of consumed - target
  uint32_t daysTracked{0};
  std::optional<double> weightChange;  // last - first weighed day [kg]
  double surplusDeficit{0.0};          // average consumed - target
};

enum class PredictionConfidence : uint8_t
{
  High,
  Medium,
  Low
};

std::string_view toString(PredictionConfidence confidence);

struct WeightPrediction
{
  double averageDailySurplus{0.0};  // net - target [kcal/day]
  double weeklyChange{0.0};         // [kg]
  double monthlyChange{0.0};        // [kg], 30 days
  std::optional<double> weeksToTarget;
  PredictionConfidence confidence{PredictionConfidence::Low};
};

struct GoalTimeline
{
  std::optional<double> weeksToGoal;
  std::optional<double> monthsToGoal;
  std::optional<Date> targetDate;
  bool feasible{false};
};

/**
 * @brief Retrospective statistics over stored DailyBalance rows
 *
 * Energy-to-mass conversion uses 7700 kcal per kg. Confidence of a
 * prediction is High when the population variance of daily net calories
 * is below 500, Medium below 1000, Low otherwise (and always Low without
 * data).
 *
 * Stateless; all members are static.
 *
 * @ticket 0014_progress_analytics
 */
class ProgressAnalytics
{
public:
  static constexpr double kKcalPerKg = 7700.0;
  static constexpr double kAdherenceTolerance = 100.0;  // [kcal]
  static constexpr double kWeeksPerMonth = 4.33;
  static constexpr double kMaxFeasibleWeeks = 104.0;

  static ProgressMetrics progressMetrics(std::span<const DailyBalance> balances,
                                         double targetCalories);

  /**
   * @param currentWeightKg, targetWeightKg When both are set, weeksToTarget
   *        projects the observed trend onto the target
   */
  static WeightPrediction predictWeightChange(
    std::span<const DailyBalance> balances,
    double targetCalories,
    std::optional<double> currentWeightKg = std::nullopt,
    std::optional<double> targetWeightKg = std::nullopt);

  /**
   * @brief Time to move from current to target weight at a weekly rate
   *
   * Feasible when the goal is between 1 and 104 weeks away; only then is
   * targetDate set. A negative weeksToGoal means the rate points away from
   * the target. All fields stay empty for a zero rate.
   */
  static GoalTimeline goalTimeline(double currentWeightKg,
                                   double targetWeightKg,
                                   double weeklyChangeKg,
                                   Date from);
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_ANALYTICS_PROGRESS_ANALYTICS_HPP
