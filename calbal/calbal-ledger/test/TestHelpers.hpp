// Ticket: 0001_event_store_data_model
// Test: shared builders for ledger tests

#ifndef CALBAL_LEDGER_TEST_TEST_HELPERS_HPP
#define CALBAL_LEDGER_TEST_TEST_HELPERS_HPP

#include <string>
#include <string_view>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/EventStore/CalorieEvent.hpp"
#include "calbal-ledger/src/Goals/CalorieGoal.hpp"

namespace calbal_ledger
{
namespace test
{

inline Timestamp at(std::string_view text)
{
  return parseTimestamp(text);
}

inline Date day(std::string_view text)
{
  return parseDate(text);
}

inline CalorieEvent makeEvent(std::string id,
                              std::string userId,
                              EventType type,
                              std::string_view timestamp,
                              double value,
                              EventSource source = EventSource::Manual,
                              double confidence = 1.0)
{
  CalorieEvent event;
  event.id = std::move(id);
  event.userId = std::move(userId);
  event.type = type;
  event.timestamp = at(timestamp);
  event.value = value;
  event.source = source;
  event.confidence = confidence;
  return event;
}

inline CalorieGoal makeGoal(std::string userId,
                            double target,
                            std::string_view startDate,
                            GoalType type = GoalType::MaintainWeight)
{
  CalorieGoal goal;
  goal.userId = std::move(userId);
  goal.type = type;
  goal.dailyCalorieTarget = target;
  goal.startDate = day(startDate);
  return goal;
}

}  // namespace test
}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_TEST_TEST_HELPERS_HPP
