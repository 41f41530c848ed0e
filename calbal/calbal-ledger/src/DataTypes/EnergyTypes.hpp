// Ticket: 0001_event_store_data_model

#ifndef CALBAL_LEDGER_DATA_TYPES_ENERGY_TYPES_HPP
#define CALBAL_LEDGER_DATA_TYPES_ENERGY_TYPES_HPP

#include <array>
#include <cstdint>
#include <string_view>

namespace calbal_ledger
{

/**
 * @brief Kind of energy-balance fact carried by a CalorieEvent
 *
 * The three calorie kinds are additive [kcal]. Weight samples carry a body
 * mass [kg] and are never summed.
 */
enum class EventType : uint8_t
{
  Consumed,
  BurnedExercise,
  BurnedBmr,
  Weight
};

/**
 * @brief Provenance of an event
 */
enum class EventSource : uint8_t
{
  Manual,
  FitnessTracker,
  SmartScale,
  NutritionScan,
  HealthKit,
  GoogleFit
};

enum class Gender : uint8_t
{
  Male,
  Female,
  Other
};

enum class ActivityLevel : uint8_t
{
  Sedentary,
  Light,
  Moderate,
  High,
  Extreme
};

enum class GoalType : uint8_t
{
  WeightLoss,
  WeightGain,
  MaintainWeight,
  MuscleGain,
  Performance
};

inline constexpr std::array<EventType, 4> kAllEventTypes{
  EventType::Consumed,
  EventType::BurnedExercise,
  EventType::BurnedBmr,
  EventType::Weight};

inline constexpr std::array<EventSource, 6> kAllEventSources{
  EventSource::Manual,
  EventSource::FitnessTracker,
  EventSource::SmartScale,
  EventSource::NutritionScan,
  EventSource::HealthKit,
  EventSource::GoogleFit};

inline constexpr std::array<ActivityLevel, 5> kAllActivityLevels{
  ActivityLevel::Sedentary,
  ActivityLevel::Light,
  ActivityLevel::Moderate,
  ActivityLevel::High,
  ActivityLevel::Extreme};

inline constexpr std::array<GoalType, 5> kAllGoalTypes{
  GoalType::WeightLoss,
  GoalType::WeightGain,
  GoalType::MaintainWeight,
  GoalType::MuscleGain,
  GoalType::Performance};

/**
 * @brief True for the additive calorie kinds (everything but Weight)
 */
[[nodiscard]] constexpr bool isCalorieType(EventType type)
{
  return type != EventType::Weight;
}

/**
 * @brief True for the two expenditure kinds
 */
[[nodiscard]] constexpr bool isExpenditureType(EventType type)
{
  return type == EventType::BurnedExercise || type == EventType::BurnedBmr;
}

// Wire names are the snake_case strings used by the transport layer.
std::string_view toString(EventType type);
std::string_view toString(EventSource source);
std::string_view toString(Gender gender);
std::string_view toString(ActivityLevel level);
std::string_view toString(GoalType type);

/**
 * @brief Parse wire names back into the closed enumerations
 * @throws ValidationError if the name is not a member of the enumeration
 */
EventType parseEventType(std::string_view name);
EventSource parseEventSource(std::string_view name);
Gender parseGender(std::string_view name);
ActivityLevel parseActivityLevel(std::string_view name);
GoalType parseGoalType(std::string_view name);

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_DATA_TYPES_ENERGY_TYPES_HPP
