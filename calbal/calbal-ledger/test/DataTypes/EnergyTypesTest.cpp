// Ticket: 0001_event_store_data_model
// Test: wire names of the closed enumerations

#include <gtest/gtest.h>

#include <string>

#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"
#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{
namespace test
{

TEST(EnergyTypesTest, EventTypeWireNames)
{
  EXPECT_EQ(toString(EventType::Consumed), "consumed");
  EXPECT_EQ(toString(EventType::BurnedExercise), "burned_exercise");
  EXPECT_EQ(toString(EventType::BurnedBmr), "burned_bmr");
  EXPECT_EQ(toString(EventType::Weight), "weight");
}

TEST(EnergyTypesTest, EventSourceWireNames)
{
  EXPECT_EQ(toString(EventSource::FitnessTracker), "fitness_tracker");
  EXPECT_EQ(toString(EventSource::HealthKit), "healthkit");
  EXPECT_EQ(toString(EventSource::GoogleFit), "google_fit");
  EXPECT_EQ(parseEventSource("nutrition_scan"), EventSource::NutritionScan);
}

TEST(EnergyTypesTest, EveryEnumeratorParsesBackFromItsName)
{
  for (auto const type : kAllEventTypes)
  {
    EXPECT_EQ(parseEventType(toString(type)), type);
  }
  for (auto const source : kAllEventSources)
  {
    EXPECT_EQ(parseEventSource(toString(source)), source);
  }
  for (auto const level : kAllActivityLevels)
  {
    EXPECT_EQ(parseActivityLevel(toString(level)), level);
  }
  for (auto const type : kAllGoalTypes)
  {
    EXPECT_EQ(parseGoalType(toString(type)), type);
  }
}

TEST(EnergyTypesTest, UnknownNameIsValidationErrorNamingTheField)
{
  try
  {
    static_cast<void>(parseEventType("burned_calories"));
    FAIL() << "expected ValidationError";
  }
  catch (const ValidationError& e)
  {
    EXPECT_EQ(e.field(), "event_type");
    EXPECT_NE(e.reason().find("burned_calories"), std::string::npos);
  }

  EXPECT_THROW(static_cast<void>(parseGender("MALE")), ValidationError);
  EXPECT_THROW(static_cast<void>(parseGoalType("")), ValidationError);
}

TEST(EnergyTypesTest, TypePredicates)
{
  EXPECT_TRUE(isCalorieType(EventType::Consumed));
  EXPECT_TRUE(isCalorieType(EventType::BurnedBmr));
  EXPECT_FALSE(isCalorieType(EventType::Weight));

  EXPECT_TRUE(isExpenditureType(EventType::BurnedExercise));
  EXPECT_TRUE(isExpenditureType(EventType::BurnedBmr));
  EXPECT_FALSE(isExpenditureType(EventType::Consumed));
  EXPECT_FALSE(isExpenditureType(EventType::Weight));
}

}  // namespace test
}  // namespace calbal_ledger
