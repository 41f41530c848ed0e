// Ticket: 0008_goal_planner

#ifndef CALBAL_LEDGER_GOALS_GOAL_PLANNER_HPP
#define CALBAL_LEDGER_GOALS_GOAL_PLANNER_HPP

#include <optional>

#include "calbal-ledger/src/Goals/CalorieGoal.hpp"
#include "calbal-ledger/src/Metabolic/MetabolicProfile.hpp"

namespace calbal_ledger
{

/**
 * @brief What the user wants to achieve, in body-weight terms
 */
struct GoalPlanRequest
{
  GoalType type{GoalType::MaintainWeight};
  double currentWeightKg{0.0};
  std::optional<double> targetWeightKg;
  double weeklyRateKg{0.0};  // magnitude [kg/week], ignored for maintenance
  Date startDate{};
};

/**
 * @brief Derives a calorie goal from a metabolic profile
 *
 * One kilogram of body mass is taken as 7700 kcal, so a weekly rate r
 * becomes a daily adjustment of r * 7700 / 7 kcal around TDEE. The result
 * is clamped to [1.2 * BMR, 1.5 * TDEE] and to the goal validation range.
 *
 * @ticket 0008_goal_planner
 */
class GoalPlanner
{
public:
  static constexpr double kKcalPerKg = 7700.0;
  static constexpr double kMinBmrFactor = 1.2;
  static constexpr double kMaxTdeeFactor = 1.5;

  /**
   * @brief Build an ai_optimized goal for the user (not yet stored)
   * @throws ValidationError for an inconsistent request
   */
  static CalorieGoal plan(const MetabolicProfile& profile,
                          const GoalPlanRequest& request,
                          Timestamp now);

  /// Daily calorie adjustment for a weekly weight change [kcal/day]
  static double dailyAdjustment(double weeklyRateKg);
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_GOALS_GOAL_PLANNER_HPP
