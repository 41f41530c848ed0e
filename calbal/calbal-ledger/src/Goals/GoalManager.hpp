// Ticket: 0007_goal_manager

#ifndef CALBAL_LEDGER_GOALS_GOAL_MANAGER_HPP
#define CALBAL_LEDGER_GOALS_GOAL_MANAGER_HPP

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/Goals/CalorieGoal.hpp"

namespace calbal_ledger
{

/**
 * @brief Owns every user's calorie goals and resolves the goal in force
 *
 * Resolution for a date considers active goals whose window contains it.
 * When several qualify the latest startDate wins, then the highest id
 * (most recently created). Such overlaps are logged at warn level.
 *
 * Goal changes never rewrite stored DailyBalance rows; callers re-aggregate
 * explicitly when they want new targets applied to past dates.
 *
 * @ticket 0007_goal_manager
 */
class GoalManager
{
public:
  GoalManager(GoalOverlapPolicy policy, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Validate and store a new goal
   * @return Assigned goal id (ids start at 1 and increase)
   * @throws ValidationError for out-of-range targets or, under
   *         RejectOverlap, a window overlapping another active goal
   */
  uint32_t create(CalorieGoal goal);

  /**
   * @throws NotFoundError for an unknown goal id
   */
  void deactivate(uint32_t goalId);

  /**
   * @brief Replace a goal: deactivate it and create the replacement
   *
   * Both steps happen atomically; a rejected replacement leaves the old
   * goal untouched.
   *
   * @return Id of the replacement
   * @throws NotFoundError for an unknown goal id
   * @throws ValidationError for an invalid replacement or a user mismatch
   */
  uint32_t supersede(uint32_t goalId, CalorieGoal replacement);

  /**
   * @brief Re-insert a journaled goal under its original id (replay)
   */
  void restore(const CalorieGoal& goal);

  [[nodiscard]] std::optional<CalorieGoal> resolveActive(
    const std::string& userId,
    Date date) const;

  [[nodiscard]] std::optional<CalorieGoal> find(uint32_t goalId) const;

  /**
   * @brief A user's goals ordered by id
   */
  [[nodiscard]] std::vector<CalorieGoal> goals(const std::string& userId,
                                               bool activeOnly) const;

  /**
   * @throws ValidationError naming the first invalid field
   */
  static void validate(const CalorieGoal& goal);

private:
  // Requires mutex_ held exclusively
  uint32_t insertLocked(CalorieGoal goal, std::optional<uint32_t> ignoring);

  GoalOverlapPolicy policy_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex mutex_;
  std::map<uint32_t, CalorieGoal> goals_;
  uint32_t nextId_{1};
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_GOALS_GOAL_MANAGER_HPP
