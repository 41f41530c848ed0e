// Ticket: 0001_event_store_data_model

#include "calbal-ledger/src/EventStore/EventValidator.hpp"

#include <cmath>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

EventValidator::EventValidator(const ValidationLimits& limits)
  : limits_{limits}
{
  if (!(limits_.minWeightKg < limits_.maxWeightKg))
  {
    throw std::invalid_argument{"weight limits must satisfy min < max"};
  }
}

void EventValidator::validate(const CalorieEvent& event) const
{
  if (event.id.empty())
  {
    throw ValidationError{"id", "must not be empty"};
  }
  if (event.userId.empty())
  {
    throw ValidationError{"user_id", "must not be empty"};
  }
  if (!std::isfinite(event.value))
  {
    throw ValidationError{"value", "must be a finite number"};
  }
  if (std::isnan(event.confidence) || event.confidence < 0.0 ||
      event.confidence > 1.0)
  {
    throw ValidationError{
      "confidence_score",
      fmt::format("{} is outside [0, 1]", event.confidence)};
  }
  if (event.supersedes && event.supersedes->empty())
  {
    throw ValidationError{"supersedes", "must not be empty when present"};
  }
  if (event.supersedes && *event.supersedes == event.id)
  {
    throw ValidationError{"supersedes", "an event cannot supersede itself"};
  }

  switch (event.type)
  {
    case EventType::Weight:
      if (event.value < limits_.minWeightKg ||
          event.value > limits_.maxWeightKg)
      {
        throw ValidationError{"value",
                              fmt::format("weight {} kg is outside [{}, {}]",
                                          event.value,
                                          limits_.minWeightKg,
                                          limits_.maxWeightKg)};
      }
      break;
    case EventType::Consumed:
      if (event.value < 0.0)
      {
        throw ValidationError{"value", "calories must not be negative"};
      }
      if (event.value > limits_.maxConsumedPerEvent)
      {
        throw ValidationError{
          "value",
          fmt::format("{} kcal exceeds the per-event consumption limit of {}",
                      event.value,
                      limits_.maxConsumedPerEvent)};
      }
      break;
    case EventType::BurnedExercise:
      if (event.value < 0.0)
      {
        throw ValidationError{"value", "calories must not be negative"};
      }
      if (event.value > limits_.maxBurnedPerEvent)
      {
        throw ValidationError{
          "value",
          fmt::format("{} kcal exceeds the per-session exercise limit of {}",
                      event.value,
                      limits_.maxBurnedPerEvent)};
      }
      break;
    case EventType::BurnedBmr:
      if (event.value < 0.0)
      {
        throw ValidationError{"value", "calories must not be negative"};
      }
      if (event.value > limits_.maxBmrPerEvent)
      {
        throw ValidationError{
          "value",
          fmt::format("{} kcal exceeds the daily basal burn limit of {}",
                      event.value,
                      limits_.maxBmrPerEvent)};
      }
      break;
  }
}

}  // namespace calbal_ledger
