// Ticket: 0007_goal_manager
// Test: goal validation, resolution of the goal in force and supersession

#include <gtest/gtest.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/Goals/GoalManager.hpp"
#include "calbal-ledger/src/Logging/Logger.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

namespace
{

std::string rejectedField(const CalorieGoal& goal)
{
  try
  {
    GoalManager::validate(goal);
  }
  catch (const ValidationError& e)
  {
    return e.field();
  }
  return {};
}

}  // namespace

class GoalManagerTest : public ::testing::Test
{
protected:
  GoalManager goals_{GoalOverlapPolicy::ResolveLatestStart, makeNullLogger()};
};

TEST(GoalValidationTest, TargetRanges)
{
  EXPECT_EQ(rejectedField(makeGoal("u1", 2000.0, "2025-01-01")), "");
  EXPECT_EQ(rejectedField(makeGoal("u1", 800.0, "2025-01-01")), "");
  EXPECT_EQ(rejectedField(makeGoal("u1", 5000.0, "2025-01-01")), "");
  EXPECT_EQ(rejectedField(makeGoal("u1", 799.0, "2025-01-01")),
            "daily_calorie_target");
  EXPECT_EQ(rejectedField(makeGoal("u1", 5001.0, "2025-01-01")),
            "daily_calorie_target");
  EXPECT_EQ(rejectedField(makeGoal("", 2000.0, "2025-01-01")), "user_id");

  CalorieGoal deficit = makeGoal("u1", 2000.0, "2025-01-01");
  deficit.dailyDeficitTarget = -1500.0;
  EXPECT_EQ(rejectedField(deficit), "");
  deficit.dailyDeficitTarget = 1600.0;
  EXPECT_EQ(rejectedField(deficit), "daily_deficit_target");

  CalorieGoal weekly = makeGoal("u1", 2000.0, "2025-01-01");
  weekly.weeklyWeightChangeKg = -2.5;
  EXPECT_EQ(rejectedField(weekly), "weekly_weight_change_target");
}

TEST(GoalValidationTest, EndDateMustFollowStart)
{
  CalorieGoal goal = makeGoal("u1", 2000.0, "2025-01-10");
  goal.endDate = day("2025-01-10");
  EXPECT_EQ(rejectedField(goal), "end_date");
  goal.endDate = day("2025-01-11");
  EXPECT_EQ(rejectedField(goal), "");
}

TEST(CalorieGoalTest, WindowIsInclusive)
{
  CalorieGoal goal = makeGoal("u1", 2000.0, "2025-01-10");
  goal.endDate = day("2025-01-20");

  EXPECT_FALSE(goal.covers(day("2025-01-09")));
  EXPECT_TRUE(goal.covers(day("2025-01-10")));
  EXPECT_TRUE(goal.covers(day("2025-01-20")));
  EXPECT_FALSE(goal.covers(day("2025-01-21")));

  goal.isActive = false;
  EXPECT_FALSE(goal.inForceOn(day("2025-01-15")));
}

TEST_F(GoalManagerTest, IdsIncreaseFromOne)
{
  EXPECT_EQ(goals_.create(makeGoal("u1", 2000.0, "2025-01-01")), 1u);
  EXPECT_EQ(goals_.create(makeGoal("u2", 2100.0, "2025-01-01")), 2u);
  EXPECT_THROW(goals_.create(makeGoal("u1", 100.0, "2025-01-01")),
               ValidationError);
  EXPECT_EQ(goals_.create(makeGoal("u1", 2200.0, "2025-03-01")), 3u);
}

TEST_F(GoalManagerTest, NoGoalBeforeStart)
{
  goals_.create(makeGoal("u1", 2000.0, "2025-01-10"));
  EXPECT_FALSE(goals_.resolveActive("u1", day("2025-01-09")).has_value());
  EXPECT_FALSE(goals_.resolveActive("u2", day("2025-01-10")).has_value());
  EXPECT_TRUE(goals_.resolveActive("u1", day("2025-01-10")).has_value());
}

TEST_F(GoalManagerTest, LatestStartDateWinsOverlap)
{
  uint32_t const january = goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));
  uint32_t const february =
    goals_.create(makeGoal("u1", 1800.0, "2025-02-01"));

  auto const early = goals_.resolveActive("u1", day("2025-01-15"));
  ASSERT_TRUE(early.has_value());
  EXPECT_EQ(early->id, january);

  auto const late = goals_.resolveActive("u1", day("2025-02-15"));
  ASSERT_TRUE(late.has_value());
  EXPECT_EQ(late->id, february);
  EXPECT_DOUBLE_EQ(late->dailyCalorieTarget, 1800.0);
}

TEST_F(GoalManagerTest, LatestStartWinsRegardlessOfCreationOrder)
{
  uint32_t const february =
    goals_.create(makeGoal("u1", 1800.0, "2025-02-01"));
  goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));

  EXPECT_EQ(goals_.resolveActive("u1", day("2025-02-15"))->id, february);
}

TEST_F(GoalManagerTest, SameStartResolvesToNewestGoal)
{
  goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));
  uint32_t const newer = goals_.create(makeGoal("u1", 1900.0, "2025-01-01"));

  EXPECT_EQ(goals_.resolveActive("u1", day("2025-01-02"))->id, newer);
}

TEST(GoalManagerPolicyTest, RejectOverlapRefusesSecondActiveGoal)
{
  GoalManager goals{GoalOverlapPolicy::RejectOverlap, makeNullLogger()};

  CalorieGoal january = makeGoal("u1", 2000.0, "2025-01-01");
  january.endDate = day("2025-01-31");
  goals.create(january);

  try
  {
    goals.create(makeGoal("u1", 1800.0, "2025-01-31"));
    FAIL() << "expected ValidationError";
  }
  catch (const ValidationError& e)
  {
    EXPECT_EQ(e.field(), "start_date");
  }

  EXPECT_NO_THROW(goals.create(makeGoal("u1", 1800.0, "2025-02-01")));
  EXPECT_NO_THROW(goals.create(makeGoal("u2", 1800.0, "2025-01-15")));

  CalorieGoal inactive = makeGoal("u1", 1700.0, "2025-01-10");
  inactive.isActive = false;
  EXPECT_NO_THROW(goals.create(inactive));
}

TEST_F(GoalManagerTest, SupersedeDeactivatesOriginal)
{
  uint32_t const original = goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));
  uint32_t const replacement =
    goals_.supersede(original, makeGoal("u1", 1850.0, "2025-01-01"));

  EXPECT_NE(original, replacement);
  EXPECT_FALSE(goals_.find(original)->isActive);
  EXPECT_EQ(goals_.resolveActive("u1", day("2025-01-05"))->id, replacement);

  auto const active = goals_.goals("u1", true);
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].id, replacement);
  EXPECT_EQ(goals_.goals("u1", false).size(), 2u);
}

TEST(GoalManagerPolicyTest, SupersedeIsAllowedUnderRejectOverlap)
{
  GoalManager goals{GoalOverlapPolicy::RejectOverlap, makeNullLogger()};
  uint32_t const original = goals.create(makeGoal("u1", 2000.0, "2025-01-01"));

  EXPECT_NO_THROW(
    goals.supersede(original, makeGoal("u1", 1900.0, "2025-01-01")));
}

TEST_F(GoalManagerTest, RejectedSupersedeKeepsOriginal)
{
  uint32_t const original = goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));

  EXPECT_THROW(goals_.supersede(original, makeGoal("u1", 10.0, "2025-01-01")),
               ValidationError);
  EXPECT_THROW(
    goals_.supersede(original, makeGoal("u2", 1900.0, "2025-01-01")),
    ValidationError);
  EXPECT_THROW(goals_.supersede(99, makeGoal("u1", 1900.0, "2025-01-01")),
               NotFoundError);

  EXPECT_TRUE(goals_.find(original)->isActive);
  EXPECT_EQ(goals_.goals("u1", false).size(), 1u);
}

TEST_F(GoalManagerTest, DeactivateUnknownGoal)
{
  EXPECT_THROW(goals_.deactivate(42), NotFoundError);

  uint32_t const id = goals_.create(makeGoal("u1", 2000.0, "2025-01-01"));
  goals_.deactivate(id);
  goals_.deactivate(id);
  EXPECT_FALSE(goals_.resolveActive("u1", day("2025-01-02")).has_value());
  EXPECT_TRUE(goals_.find(id).has_value());
}

TEST_F(GoalManagerTest, RestoreKeepsJournaledIds)
{
  CalorieGoal journaled = makeGoal("u1", 2000.0, "2025-01-01");
  journaled.id = 7;
  goals_.restore(journaled);

  EXPECT_EQ(goals_.find(7)->dailyCalorieTarget, 2000.0);
  EXPECT_EQ(goals_.create(makeGoal("u1", 1900.0, "2025-02-01")), 8u);
}

}  // namespace test
}  // namespace calbal_ledger
