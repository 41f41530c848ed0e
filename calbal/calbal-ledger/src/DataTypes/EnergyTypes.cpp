// Ticket: 0001_event_store_data_model

#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"

#include <string>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

namespace
{

template <typename Enum, std::size_t N>
Enum parseByName(std::string_view name,
                 const std::array<Enum, N>& candidates,
                 const char* field)
{
  for (Enum const candidate : candidates)
  {
    if (toString(candidate) == name)
    {
      return candidate;
    }
  }
  throw ValidationError{field, "unknown value '" + std::string{name} + "'"};
}

constexpr std::array<Gender, 3> kAllGenders{
  Gender::Male, Gender::Female, Gender::Other};

}  // namespace

std::string_view toString(EventType type)
{
  switch (type)
  {
    case EventType::Consumed:
      return "consumed";
    case EventType::BurnedExercise:
      return "burned_exercise";
    case EventType::BurnedBmr:
      return "burned_bmr";
    case EventType::Weight:
      return "weight";
  }
  return "unknown";
}

std::string_view toString(EventSource source)
{
  switch (source)
  {
    case EventSource::Manual:
      return "manual";
    case EventSource::FitnessTracker:
      return "fitness_tracker";
    case EventSource::SmartScale:
      return "smart_scale";
    case EventSource::NutritionScan:
      return "nutrition_scan";
    case EventSource::HealthKit:
      return "healthkit";
    case EventSource::GoogleFit:
      return "google_fit";
  }
  return "unknown";
}

std::string_view toString(Gender gender)
{
  switch (gender)
  {
    case Gender::Male:
      return "male";
    case Gender::Female:
      return "female";
    case Gender::Other:
      return "other";
  }
  return "unknown";
}

std::string_view toString(ActivityLevel level)
{
  switch (level)
  {
    case ActivityLevel::Sedentary:
      return "sedentary";
    case ActivityLevel::Light:
      return "light";
    case ActivityLevel::Moderate:
      return "moderate";
    case ActivityLevel::High:
      return "high";
    case ActivityLevel::Extreme:
      return "extreme";
  }
  return "unknown";
}

std::string_view toString(GoalType type)
{
  switch (type)
  {
    case GoalType::WeightLoss:
      return "weight_loss";
    case GoalType::WeightGain:
      return "weight_gain";
    case GoalType::MaintainWeight:
      return "maintain_weight";
    case GoalType::MuscleGain:
      return "muscle_gain";
    case GoalType::Performance:
      return "performance";
  }
  return "unknown";
}

EventType parseEventType(std::string_view name)
{
  return parseByName(name, kAllEventTypes, "event_type");
}

EventSource parseEventSource(std::string_view name)
{
  return parseByName(name, kAllEventSources, "source");
}

Gender parseGender(std::string_view name)
{
  return parseByName(name, kAllGenders, "gender");
}

ActivityLevel parseActivityLevel(std::string_view name)
{
  return parseByName(name, kAllActivityLevels, "activity_level");
}

GoalType parseGoalType(std::string_view name)
{
  return parseByName(name, kAllGoalTypes, "goal_type");
}

}  // namespace calbal_ledger
