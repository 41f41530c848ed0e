// Ticket: 0014_progress_analytics

#include "calbal-ledger/src/Analytics/ProgressAnalytics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace calbal_ledger
{

namespace
{

// Morning sample preferred; evening when the morning is missing
std::optional<double> dayWeight(const DailyBalance& balance)
{
  return balance.morningWeight ? balance.morningWeight : balance.eveningWeight;
}

}  // namespace

std::string_view toString(PredictionConfidence confidence)
{
  switch (confidence)
  {
    case PredictionConfidence::High:
      return "high";
    case PredictionConfidence::Medium:
      return "medium";
    case PredictionConfidence::Low:
      return "low";
  }
  return "low";
}

ProgressMetrics ProgressAnalytics::progressMetrics(
  std::span<const DailyBalance> balances,
  double targetCalories)
{
  ProgressMetrics metrics;
  if (balances.empty())
  {
    return metrics;
  }

  double consumed = 0.0;
  double squaredDeviation = 0.0;
  uint32_t adherent = 0;
  for (const auto& balance : balances)
  {
    double const deviation = balance.caloriesConsumed - targetCalories;
    consumed += balance.caloriesConsumed;
    squaredDeviation += deviation * deviation;
    if (std::abs(deviation) <= kAdherenceTolerance)
    {
      ++adherent;
    }
  }

  auto const days = static_cast<double>(balances.size());
  metrics.daysTracked = static_cast<uint32_t>(balances.size());
  metrics.averageDailyConsumed = consumed / days;
  metrics.adherenceRate = 100.0 * adherent / days;
  metrics.calorieVariance = std::sqrt(squaredDeviation / days);
  metrics.surplusDeficit = metrics.averageDailyConsumed - targetCalories;

  std::vector<const DailyBalance*> weighed;
  for (const auto& balance : balances)
  {
    if (dayWeight(balance))
    {
      weighed.push_back(&balance);
    }
  }
  if (weighed.size() >= 2)
  {
    auto const [first, last] = std::minmax_element(
      weighed.begin(),
      weighed.end(),
      [](const DailyBalance* lhs, const DailyBalance* rhs)
      {
        return std::chrono::sys_days{lhs->date} <
               std::chrono::sys_days{rhs->date};
      });
    metrics.weightChange = *dayWeight(**last) - *dayWeight(**first);
  }
  return metrics;
}

WeightPrediction ProgressAnalytics::predictWeightChange(
  std::span<const DailyBalance> balances,
  double targetCalories,
  std::optional<double> currentWeightKg,
  std::optional<double> targetWeightKg)
{
  WeightPrediction prediction;
  if (balances.empty())
  {
    return prediction;
  }

  auto const days = static_cast<double>(balances.size());
  double surplus = 0.0;
  double meanNet = 0.0;
  for (const auto& balance : balances)
  {
    surplus += balance.netCalories() - targetCalories;
    meanNet += balance.netCalories();
  }
  surplus /= days;
  meanNet /= days;

  double variance = 0.0;
  for (const auto& balance : balances)
  {
    double const d = balance.netCalories() - meanNet;
    variance += d * d;
  }
  variance /= days;

  double const dailyChange = surplus / kKcalPerKg;
  prediction.averageDailySurplus = surplus;
  prediction.weeklyChange = dailyChange * 7.0;
  prediction.monthlyChange = dailyChange * 30.0;
  prediction.confidence = variance < 500.0    ? PredictionConfidence::High
                          : variance < 1000.0 ? PredictionConfidence::Medium
                                              : PredictionConfidence::Low;

  if (currentWeightKg && targetWeightKg && prediction.weeklyChange != 0.0)
  {
    prediction.weeksToTarget =
      (*targetWeightKg - *currentWeightKg) / prediction.weeklyChange;
  }
  return prediction;
}

GoalTimeline ProgressAnalytics::goalTimeline(double currentWeightKg,
                                             double targetWeightKg,
                                             double weeklyChangeKg,
                                             Date from)
{
  GoalTimeline timeline;
  if (weeklyChangeKg == 0.0)
  {
    return timeline;
  }

  double const weeks = (targetWeightKg - currentWeightKg) / weeklyChangeKg;
  timeline.weeksToGoal = weeks;
  timeline.monthsToGoal = weeks / kWeeksPerMonth;
  timeline.feasible = weeks >= 1.0 && weeks <= kMaxFeasibleWeeks;
  if (timeline.feasible)
  {
    timeline.targetDate =
      addDays(from, static_cast<int>(std::lround(weeks * 7.0)));
  }
  return timeline;
}

}  // namespace calbal_ledger
