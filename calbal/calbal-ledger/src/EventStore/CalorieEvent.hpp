// Ticket: 0001_event_store_data_model

#ifndef CALBAL_LEDGER_EVENT_STORE_CALORIE_EVENT_HPP
#define CALBAL_LEDGER_EVENT_STORE_CALORIE_EVENT_HPP

#include <map>
#include <optional>
#include <string>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"

namespace calbal_ledger
{

/**
 * @brief Immutable energy-balance fact
 *
 * Calorie kinds carry `value` in [kcal], weight samples in [kg]. A
 * correction is a new event whose `supersedes` names the event it replaces;
 * stored events are never edited.
 *
 * @ticket 0001_event_store_data_model
 */
struct CalorieEvent
{
  std::string id;
  std::string userId;
  EventType type{EventType::Consumed};
  Timestamp timestamp{};
  double value{0.0};
  EventSource source{EventSource::Manual};
  double confidence{1.0};
  std::map<std::string, std::string> metadata;
  std::optional<std::string> supersedes;

  bool operator==(const CalorieEvent&) const = default;
};

/**
 * @brief Canonical event order: timestamp, then id
 */
struct EventOrder
{
  bool operator()(const CalorieEvent& lhs, const CalorieEvent& rhs) const
  {
    if (lhs.timestamp != rhs.timestamp)
    {
      return lhs.timestamp < rhs.timestamp;
    }
    return lhs.id < rhs.id;
  }
};

/**
 * @brief Outcome of EventStore::append
 */
struct AppendResult
{
  std::string eventId;
  bool inserted{false};  // false when the id was already stored
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_EVENT_STORE_CALORIE_EVENT_HPP
