// Ticket: 0008_goal_planner

#include "calbal-ledger/src/Goals/GoalPlanner.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

namespace
{

constexpr double kMaxDailyAdjustment = 1500.0;
constexpr double kMaxWeeklyRateKg = 2.0;
constexpr double kGoalFloor = 800.0;
constexpr double kGoalCeiling = 5000.0;

// +1 gains, -1 loses, 0 holds weight
int direction(GoalType type)
{
  switch (type)
  {
    case GoalType::WeightLoss:
      return -1;
    case GoalType::WeightGain:
    case GoalType::MuscleGain:
      return 1;
    case GoalType::MaintainWeight:
    case GoalType::Performance:
      return 0;
  }
  return 0;
}

}  // namespace

double GoalPlanner::dailyAdjustment(double weeklyRateKg)
{
  return weeklyRateKg * kKcalPerKg / 7.0;
}

CalorieGoal GoalPlanner::plan(const MetabolicProfile& profile,
                              const GoalPlanRequest& request,
                              Timestamp now)
{
  int const sign = direction(request.type);
  double const rate = sign == 0 ? 0.0 : std::abs(request.weeklyRateKg);
  if (sign != 0 && (!(rate > 0.0) || rate > kMaxWeeklyRateKg))
  {
    throw ValidationError{
      "weekly_weight_change_target",
      fmt::format("{} kg/week is outside (0, {}]", rate, kMaxWeeklyRateKg)};
  }

  double const adjustment =
    std::min(dailyAdjustment(rate), kMaxDailyAdjustment);

  double lower = std::max(kMinBmrFactor * profile.bmrCalories, kGoalFloor);
  double const upper =
    std::min(kMaxTdeeFactor * profile.tdeeCalories, kGoalCeiling);
  lower = std::min(lower, upper);

  CalorieGoal goal;
  goal.userId = profile.userId;
  goal.type = request.type;
  goal.dailyCalorieTarget =
    std::clamp(profile.tdeeCalories + sign * adjustment, lower, upper);
  goal.dailyDeficitTarget = -sign * adjustment;
  goal.weeklyWeightChangeKg = sign * rate;
  goal.startDate = request.startDate;
  goal.isActive = true;
  goal.aiOptimized = true;
  goal.createdAt = now;

  if (request.targetWeightKg && sign != 0)
  {
    double const difference = *request.targetWeightKg - request.currentWeightKg;
    if (difference * sign <= 0.0)
    {
      throw ValidationError{"target_weight",
                            fmt::format("{} kg does not lie in the direction "
                                        "of a {} goal from {} kg",
                                        *request.targetWeightKg,
                                        toString(request.type),
                                        request.currentWeightKg)};
    }
    double const weeks = std::abs(difference) / rate;
    int const days = std::max(1, static_cast<int>(std::ceil(weeks * 7.0)));
    goal.endDate = addDays(request.startDate, days);
  }

  return goal;
}

}  // namespace calbal_ledger
