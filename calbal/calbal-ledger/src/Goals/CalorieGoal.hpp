// Ticket: 0007_goal_manager

#ifndef CALBAL_LEDGER_GOALS_CALORIE_GOAL_HPP
#define CALBAL_LEDGER_GOALS_CALORIE_GOAL_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"

namespace calbal_ledger
{

/**
 * @brief Time-bounded daily calorie target
 *
 * The window [startDate, endDate] is inclusive; an absent endDate means
 * open-ended. Goals are deactivated, never deleted, so past balances can
 * still be explained.
 *
 * @ticket 0007_goal_manager
 */
struct CalorieGoal
{
  uint32_t id{0};  // assigned by GoalManager
  std::string userId;
  GoalType type{GoalType::MaintainWeight};
  double dailyCalorieTarget{0.0};               // [kcal]
  std::optional<double> dailyDeficitTarget;     // [kcal], negative = surplus
  std::optional<double> weeklyWeightChangeKg;   // [kg/week]
  Date startDate{};
  std::optional<Date> endDate;
  bool isActive{true};
  bool aiOptimized{false};
  Timestamp createdAt{};

  [[nodiscard]] bool covers(Date d) const
  {
    using std::chrono::sys_days;
    if (sys_days{d} < sys_days{startDate})
    {
      return false;
    }
    return !endDate || sys_days{d} <= sys_days{*endDate};
  }

  [[nodiscard]] bool inForceOn(Date d) const
  {
    return isActive && covers(d);
  }

  /// True when the two windows share at least one date
  [[nodiscard]] bool overlaps(const CalorieGoal& other) const
  {
    using std::chrono::sys_days;
    bool const startsBeforeOtherEnds =
      !other.endDate || sys_days{startDate} <= sys_days{*other.endDate};
    bool const otherStartsBeforeEnd =
      !endDate || sys_days{other.startDate} <= sys_days{*endDate};
    return startsBeforeOtherEnds && otherStartsBeforeEnd;
  }

  bool operator==(const CalorieGoal&) const = default;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_GOALS_CALORIE_GOAL_HPP
