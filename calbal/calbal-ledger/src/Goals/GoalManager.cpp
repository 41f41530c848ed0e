// Ticket: 0007_goal_manager

#include "calbal-ledger/src/Goals/GoalManager.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

namespace
{

constexpr double kMinDailyTarget = 800.0;
constexpr double kMaxDailyTarget = 5000.0;
constexpr double kMaxDailyDeficit = 1500.0;
constexpr double kMaxWeeklyChangeKg = 2.0;

// Latest startDate first, then highest id
bool resolvesBefore(const CalorieGoal& lhs, const CalorieGoal& rhs)
{
  using std::chrono::sys_days;
  if (lhs.startDate != rhs.startDate)
  {
    return sys_days{lhs.startDate} > sys_days{rhs.startDate};
  }
  return lhs.id > rhs.id;
}

}  // namespace

GoalManager::GoalManager(GoalOverlapPolicy policy,
                         std::shared_ptr<spdlog::logger> logger)
  : policy_{policy}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"GoalManager requires a logger"};
  }
}

void GoalManager::validate(const CalorieGoal& goal)
{
  if (goal.userId.empty())
  {
    throw ValidationError{"user_id", "must not be empty"};
  }
  if (!goal.startDate.ok())
  {
    throw ValidationError{"start_date", "not a valid calendar date"};
  }
  if (!std::isfinite(goal.dailyCalorieTarget) ||
      goal.dailyCalorieTarget < kMinDailyTarget ||
      goal.dailyCalorieTarget > kMaxDailyTarget)
  {
    throw ValidationError{"daily_calorie_target",
                          fmt::format("{} kcal is outside [{}, {}]",
                                      goal.dailyCalorieTarget,
                                      kMinDailyTarget,
                                      kMaxDailyTarget)};
  }
  if (goal.dailyDeficitTarget &&
      (!std::isfinite(*goal.dailyDeficitTarget) ||
       std::abs(*goal.dailyDeficitTarget) > kMaxDailyDeficit))
  {
    throw ValidationError{"daily_deficit_target",
                          fmt::format("{} kcal is outside [-{}, {}]",
                                      *goal.dailyDeficitTarget,
                                      kMaxDailyDeficit,
                                      kMaxDailyDeficit)};
  }
  if (goal.weeklyWeightChangeKg &&
      (!std::isfinite(*goal.weeklyWeightChangeKg) ||
       std::abs(*goal.weeklyWeightChangeKg) > kMaxWeeklyChangeKg))
  {
    throw ValidationError{"weekly_weight_change_target",
                          fmt::format("{} kg is outside [-{}, {}]",
                                      *goal.weeklyWeightChangeKg,
                                      kMaxWeeklyChangeKg,
                                      kMaxWeeklyChangeKg)};
  }
  if (goal.endDate)
  {
    if (!goal.endDate->ok())
    {
      throw ValidationError{"end_date", "not a valid calendar date"};
    }
    if (std::chrono::sys_days{*goal.endDate} <=
        std::chrono::sys_days{goal.startDate})
    {
      throw ValidationError{"end_date", "must be after start_date"};
    }
  }
}

uint32_t GoalManager::create(CalorieGoal goal)
{
  validate(goal);
  std::unique_lock lock{mutex_};
  return insertLocked(std::move(goal), std::nullopt);
}

void GoalManager::deactivate(uint32_t goalId)
{
  std::unique_lock lock{mutex_};
  auto const it = goals_.find(goalId);
  if (it == goals_.end())
  {
    throw NotFoundError{fmt::format("no goal with id {}", goalId)};
  }
  if (it->second.isActive)
  {
    it->second.isActive = false;
    logger_->info("Deactivated goal {} for user {}", goalId, it->second.userId);
  }
}

uint32_t GoalManager::supersede(uint32_t goalId, CalorieGoal replacement)
{
  validate(replacement);

  std::unique_lock lock{mutex_};
  auto const it = goals_.find(goalId);
  if (it == goals_.end())
  {
    throw NotFoundError{fmt::format("no goal with id {}", goalId)};
  }
  if (it->second.userId != replacement.userId)
  {
    throw ValidationError{"user_id",
                          "replacement belongs to a different user"};
  }

  uint32_t const newId = insertLocked(std::move(replacement), goalId);
  it->second.isActive = false;
  logger_->info("Goal {} superseded by goal {}", goalId, newId);
  return newId;
}

void GoalManager::restore(const CalorieGoal& goal)
{
  std::unique_lock lock{mutex_};
  goals_.insert_or_assign(goal.id, goal);
  nextId_ = std::max(nextId_, goal.id + 1);
}

uint32_t GoalManager::insertLocked(CalorieGoal goal,
                                   std::optional<uint32_t> ignoring)
{
  if (goal.isActive)
  {
    for (const auto& [id, existing] : goals_)
    {
      if (id == ignoring || !existing.isActive ||
          existing.userId != goal.userId || !existing.overlaps(goal))
      {
        continue;
      }
      if (policy_ == GoalOverlapPolicy::RejectOverlap)
      {
        throw ValidationError{
          "start_date",
          fmt::format("overlaps active goal {} starting {}",
                      id,
                      formatDate(existing.startDate))};
      }
      logger_->warn("New goal for user {} overlaps active goal {} starting "
                    "{}; latest start date wins",
                    goal.userId,
                    id,
                    formatDate(existing.startDate));
    }
  }

  goal.id = nextId_++;
  logger_->info("Created {} goal {} for user {}: {:.0f} kcal/day from {}",
                toString(goal.type),
                goal.id,
                goal.userId,
                goal.dailyCalorieTarget,
                formatDate(goal.startDate));
  uint32_t const id = goal.id;
  goals_.emplace(id, std::move(goal));
  return id;
}

std::optional<CalorieGoal> GoalManager::resolveActive(const std::string& userId,
                                                      Date date) const
{
  std::shared_lock lock{mutex_};

  const CalorieGoal* winner = nullptr;
  size_t candidates = 0;
  for (const auto& [id, goal] : goals_)
  {
    if (goal.userId != userId || !goal.inForceOn(date))
    {
      continue;
    }
    ++candidates;
    if (winner == nullptr || resolvesBefore(goal, *winner))
    {
      winner = &goal;
    }
  }

  if (winner == nullptr)
  {
    return std::nullopt;
  }
  if (candidates > 1)
  {
    logger_->warn("{} active goals cover {} for user {}; resolved to goal {}",
                  candidates,
                  formatDate(date),
                  userId,
                  winner->id);
  }
  return *winner;
}

std::optional<CalorieGoal> GoalManager::find(uint32_t goalId) const
{
  std::shared_lock lock{mutex_};
  auto const it = goals_.find(goalId);
  if (it == goals_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::vector<CalorieGoal> GoalManager::goals(const std::string& userId,
                                            bool activeOnly) const
{
  std::shared_lock lock{mutex_};
  std::vector<CalorieGoal> result;
  for (const auto& [id, goal] : goals_)
  {
    if (goal.userId == userId && (!activeOnly || goal.isActive))
    {
      result.push_back(goal);
    }
  }
  return result;
}

}  // namespace calbal_ledger
