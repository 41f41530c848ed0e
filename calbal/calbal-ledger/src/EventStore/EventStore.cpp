// Ticket: 0004_event_store

#include "calbal-ledger/src/EventStore/EventStore.hpp"

#include <algorithm>

namespace calbal_ledger
{

std::vector<CalorieEvent> EventStore::listEffective(
  const std::string& userId,
  std::optional<EventType> type,
  const TimeRange& range) const
{
  auto events = list(userId, type, range);
  auto const superseded = supersededIds(userId);
  if (superseded.empty())
  {
    return events;
  }

  std::erase_if(events,
                [&superseded](const CalorieEvent& e)
                { return superseded.contains(e.id); });
  return events;
}

}  // namespace calbal_ledger
