// Ticket: 0009_daily_balance_aggregator

#include "calbal-ledger/src/Aggregation/DayFigures.hpp"

#include <bitset>
#include <set>

namespace calbal_ledger
{

double DayFigures::completeness() const
{
  if (hasConsumption && hasExpenditure)
  {
    return 1.0;
  }
  if (hasConsumption || hasExpenditure)
  {
    return 0.7;
  }
  if (weightCount > 0)
  {
    return 0.3;
  }
  return 0.0;
}

DayFigures summarize(std::span<const CalorieEvent> events,
                     const WeightWindowPolicy& windows,
                     std::chrono::minutes utcOffset)
{
  DayFigures figures;
  std::set<EventSource> sources;
  std::bitset<24> hours;
  double confidenceSum = 0.0;
  double weightSum = 0.0;

  for (const CalorieEvent& event : events)
  {
    ++figures.eventCount;
    confidenceSum += event.confidence;
    sources.insert(event.source);
    hours.set(localHour(event.timestamp, utcOffset));
    figures.lastEventTimestamp = event.timestamp;

    switch (event.type)
    {
      case EventType::Consumed:
        figures.consumed += event.value;
        figures.hasConsumption = true;
        break;
      case EventType::BurnedExercise:
        figures.burnedExercise += event.value;
        figures.hasExpenditure = true;
        break;
      case EventType::BurnedBmr:
        figures.burnedBmr += event.value;
        figures.hasExpenditure = true;
        break;
      case EventType::Weight:
      {
        ++figures.weightCount;
        weightSum += event.value;
        if (!figures.firstWeight)
        {
          figures.firstWeight = event.value;
        }
        figures.lastWeight = event.value;

        auto const timeOfDay = localTimeOfDay(event.timestamp, utcOffset);
        if (!figures.morningWeight && windows.morning.contains(timeOfDay))
        {
          figures.morningWeight = event.value;
        }
        if (windows.evening.contains(timeOfDay))
        {
          figures.eveningWeight = event.value;
        }
        break;
      }
    }
  }

  figures.sourceVariety = static_cast<uint32_t>(sources.size());
  figures.activeHours = static_cast<uint32_t>(hours.count());
  if (figures.eventCount > 0)
  {
    figures.averageConfidence = confidenceSum / figures.eventCount;
  }
  if (figures.weightCount > 0)
  {
    figures.averageWeight = weightSum / figures.weightCount;
  }
  return figures;
}

}  // namespace calbal_ledger
