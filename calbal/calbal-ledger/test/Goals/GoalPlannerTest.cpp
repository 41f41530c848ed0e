// Ticket: 0008_goal_planner
// Test: calorie targets derived from a metabolic profile

#include <gtest/gtest.h>

#include <chrono>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/Goals/GoalManager.hpp"
#include "calbal-ledger/src/Goals/GoalPlanner.hpp"
#include "calbal-ledger/src/Metabolic/MetabolicCalculator.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

class GoalPlannerTest : public ::testing::Test
{
protected:
  // BMR 1648.75, TDEE 2555.5625
  MetabolicProfile profile_ = MetabolicCalculator::buildProfile(
    "u1",
    MetabolicInputs{70.0, 175.0, Gender::Male, 30, ActivityLevel::Moderate},
    at("2025-01-01T00:00:00Z"),
    std::chrono::hours{24 * 30});
  Timestamp now_ = at("2025-01-02T09:00:00Z");

  GoalPlanRequest request(GoalType type, double rate) const
  {
    GoalPlanRequest r;
    r.type = type;
    r.currentWeightKg = 70.0;
    r.weeklyRateKg = rate;
    r.startDate = day("2025-01-06");
    return r;
  }
};

TEST(GoalPlannerRateTest, SevenThousandSevenHundredKcalPerKilogram)
{
  EXPECT_DOUBLE_EQ(GoalPlanner::dailyAdjustment(0.5), 550.0);
  EXPECT_DOUBLE_EQ(GoalPlanner::dailyAdjustment(1.0), 1100.0);
}

TEST_F(GoalPlannerTest, MaintenanceTargetsTdee)
{
  CalorieGoal const goal =
    GoalPlanner::plan(profile_, request(GoalType::MaintainWeight, 0.7), now_);

  EXPECT_EQ(goal.userId, "u1");
  EXPECT_DOUBLE_EQ(goal.dailyCalorieTarget, profile_.tdeeCalories);
  EXPECT_DOUBLE_EQ(*goal.weeklyWeightChangeKg, 0.0);
  EXPECT_TRUE(goal.aiOptimized);
  EXPECT_TRUE(goal.isActive);
  EXPECT_EQ(goal.createdAt, now_);
  EXPECT_EQ(goal.startDate, day("2025-01-06"));
  EXPECT_FALSE(goal.endDate.has_value());
  EXPECT_NO_THROW(GoalManager::validate(goal));
}

TEST_F(GoalPlannerTest, WeightLossSubtractsDeficit)
{
  CalorieGoal const goal =
    GoalPlanner::plan(profile_, request(GoalType::WeightLoss, 0.5), now_);

  EXPECT_DOUBLE_EQ(goal.dailyCalorieTarget, profile_.tdeeCalories - 550.0);
  EXPECT_DOUBLE_EQ(*goal.dailyDeficitTarget, 550.0);
  EXPECT_DOUBLE_EQ(*goal.weeklyWeightChangeKg, -0.5);
}

TEST_F(GoalPlannerTest, WeightGainAddsSurplus)
{
  CalorieGoal const goal =
    GoalPlanner::plan(profile_, request(GoalType::WeightGain, 0.5), now_);

  EXPECT_DOUBLE_EQ(goal.dailyCalorieTarget, profile_.tdeeCalories + 550.0);
  EXPECT_DOUBLE_EQ(*goal.dailyDeficitTarget, -550.0);
  EXPECT_DOUBLE_EQ(*goal.weeklyWeightChangeKg, 0.5);
}

TEST_F(GoalPlannerTest, AggressiveLossIsClampedAboveBmr)
{
  CalorieGoal const goal =
    GoalPlanner::plan(profile_, request(GoalType::WeightLoss, 1.0), now_);

  EXPECT_DOUBLE_EQ(goal.dailyCalorieTarget, 1.2 * profile_.bmrCalories);
}

TEST_F(GoalPlannerTest, TargetWeightSetsEndDate)
{
  GoalPlanRequest r = request(GoalType::WeightLoss, 0.5);
  r.targetWeightKg = 65.0;

  // 5 kg at 0.5 kg/week is ten weeks
  CalorieGoal const goal = GoalPlanner::plan(profile_, r, now_);
  ASSERT_TRUE(goal.endDate.has_value());
  EXPECT_EQ(*goal.endDate, day("2025-03-17"));
}

TEST_F(GoalPlannerTest, InconsistentRequestsRejected)
{
  EXPECT_THROW(
    GoalPlanner::plan(profile_, request(GoalType::WeightLoss, 0.0), now_),
    ValidationError);
  EXPECT_THROW(
    GoalPlanner::plan(profile_, request(GoalType::WeightGain, 2.5), now_),
    ValidationError);

  GoalPlanRequest wrongWay = request(GoalType::WeightLoss, 0.5);
  wrongWay.targetWeightKg = 72.0;
  try
  {
    GoalPlanner::plan(profile_, wrongWay, now_);
    FAIL() << "expected ValidationError";
  }
  catch (const ValidationError& e)
  {
    EXPECT_EQ(e.field(), "target_weight");
  }
}

}  // namespace test
}  // namespace calbal_ledger
