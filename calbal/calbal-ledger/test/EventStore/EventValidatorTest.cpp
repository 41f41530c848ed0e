// Ticket: 0001_event_store_data_model
// Test: EventValidator range checks

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/EventStore/EventValidator.hpp"
#include "calbal-ledger/test/TestHelpers.hpp"

namespace calbal_ledger
{
namespace test
{

namespace
{

// Field named by the ValidationError raised for `event`, empty when valid
std::string rejectedField(const EventValidator& validator,
                          const CalorieEvent& event)
{
  try
  {
    validator.validate(event);
  }
  catch (const ValidationError& e)
  {
    return e.field();
  }
  return {};
}

}  // namespace

class EventValidatorTest : public ::testing::Test
{
protected:
  EventValidator validator_{};
  CalorieEvent meal_ =
    makeEvent("e1", "u1", EventType::Consumed, "2025-01-15T12:00:00Z", 650.0);
};

TEST_F(EventValidatorTest, AcceptsPlausibleEvents)
{
  EXPECT_NO_THROW(validator_.validate(meal_));
  EXPECT_NO_THROW(validator_.validate(
    makeEvent("w", "u1", EventType::Weight, "2025-01-15T07:00:00Z", 70.2)));
  EXPECT_NO_THROW(validator_.validate(makeEvent(
    "b", "u1", EventType::BurnedBmr, "2025-01-15T00:00:00Z", 0.0)));
}

TEST_F(EventValidatorTest, IdentifiersRequired)
{
  CalorieEvent event = meal_;
  event.id.clear();
  EXPECT_EQ(rejectedField(validator_, event), "id");

  event = meal_;
  event.userId.clear();
  EXPECT_EQ(rejectedField(validator_, event), "user_id");
}

TEST_F(EventValidatorTest, WeightOutsidePlausibleRangeRejected)
{
  auto weight = [](double kg)
  {
    return makeEvent("w", "u1", EventType::Weight, "2025-01-15T07:00:00Z", kg);
  };
  EXPECT_EQ(rejectedField(validator_, weight(19.9)), "value");
  EXPECT_EQ(rejectedField(validator_, weight(500.1)), "value");
  EXPECT_EQ(rejectedField(validator_, weight(20.0)), "");
  EXPECT_EQ(rejectedField(validator_, weight(500.0)), "");
}

TEST_F(EventValidatorTest, NegativeAndOversizedCaloriesRejected)
{
  CalorieEvent event = meal_;
  event.value = -1.0;
  EXPECT_EQ(rejectedField(validator_, event), "value");

  event.value = 3000.5;
  EXPECT_EQ(rejectedField(validator_, event), "value");

  CalorieEvent workout = makeEvent(
    "x", "u1", EventType::BurnedExercise, "2025-01-15T18:00:00Z", 2000.0);
  EXPECT_EQ(rejectedField(validator_, workout), "");
  workout.value = 2001.0;
  EXPECT_EQ(rejectedField(validator_, workout), "value");
}

TEST_F(EventValidatorTest, DailyBmrAboveExerciseLimitAccepted)
{
  // Mifflin-St Jeor for 120 kg, 190 cm, male, 25 years
  CalorieEvent basal = makeEvent(
    "b", "u1", EventType::BurnedBmr, "2025-01-15T00:00:00Z", 2267.5);
  EXPECT_EQ(rejectedField(validator_, basal), "");

  basal.value = 15000.0;
  EXPECT_EQ(rejectedField(validator_, basal), "");
  basal.value = 15000.5;
  EXPECT_EQ(rejectedField(validator_, basal), "value");
  basal.value = -1.0;
  EXPECT_EQ(rejectedField(validator_, basal), "value");
}

TEST_F(EventValidatorTest, NonFiniteValueRejected)
{
  CalorieEvent event = meal_;
  event.value = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(rejectedField(validator_, event), "value");
  event.value = std::numeric_limits<double>::infinity();
  EXPECT_EQ(rejectedField(validator_, event), "value");
}

TEST_F(EventValidatorTest, ConfidenceOutsideUnitIntervalRejected)
{
  CalorieEvent event = meal_;
  event.confidence = 1.01;
  EXPECT_EQ(rejectedField(validator_, event), "confidence_score");
  event.confidence = -0.1;
  EXPECT_EQ(rejectedField(validator_, event), "confidence_score");
  event.confidence = 0.0;
  EXPECT_EQ(rejectedField(validator_, event), "");
}

TEST_F(EventValidatorTest, SelfSupersedeRejected)
{
  CalorieEvent event = meal_;
  event.supersedes = event.id;
  EXPECT_EQ(rejectedField(validator_, event), "supersedes");
  event.supersedes = std::string{};
  EXPECT_EQ(rejectedField(validator_, event), "supersedes");
}

TEST_F(EventValidatorTest, CustomLimitsApply)
{
  ValidationLimits limits;
  limits.maxConsumedPerEvent = 500.0;
  EventValidator const strict{limits};
  EXPECT_EQ(rejectedField(strict, meal_), "value");
}

TEST(EventValidatorConstructionTest, InvertedWeightLimitsRejected)
{
  ValidationLimits limits;
  limits.minWeightKg = 100.0;
  limits.maxWeightKg = 50.0;
  EXPECT_THROW(EventValidator{limits}, std::invalid_argument);
}

}  // namespace test
}  // namespace calbal_ledger
