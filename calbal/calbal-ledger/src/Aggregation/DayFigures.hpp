// Ticket: 0009_daily_balance_aggregator

#ifndef CALBAL_LEDGER_AGGREGATION_DAY_FIGURES_HPP
#define CALBAL_LEDGER_AGGREGATION_DAY_FIGURES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>

#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/EventStore/CalorieEvent.hpp"

namespace calbal_ledger
{

/**
 * @brief Additive and first/last statistics of a set of events
 *
 * Shared by the DailyBalance aggregator and every rollup level so that both
 * read paths apply identical summation and weight-window rules.
 *
 * @ticket 0009_daily_balance_aggregator
 */
struct DayFigures
{
  double consumed{0.0};
  double burnedExercise{0.0};
  double burnedBmr{0.0};

  uint32_t eventCount{0};
  uint32_t weightCount{0};
  uint32_t sourceVariety{0};  // distinct sources
  uint32_t activeHours{0};    // distinct local hours with an event

  std::optional<double> morningWeight;  // first sample in the morning window
  std::optional<double> eveningWeight;  // last sample in the evening window
  std::optional<double> firstWeight;    // first sample at any time
  std::optional<double> lastWeight;     // last sample at any time
  std::optional<double> averageWeight;

  std::optional<double> averageConfidence;
  std::optional<Timestamp> lastEventTimestamp;

  bool hasConsumption{false};
  bool hasExpenditure{false};

  [[nodiscard]] double totalBurned() const
  {
    return burnedExercise + burnedBmr;
  }

  [[nodiscard]] double net() const
  {
    return consumed - totalBurned();
  }

  /**
   * @brief Tiered completeness heuristic
   *
   * 1.0 with consumption and expenditure, 0.7 with only one side, 0.3 with
   * only weight samples, 0.0 with nothing. Monotonic in information
   * present.
   */
  [[nodiscard]] double completeness() const;
};

/**
 * @brief Summarize events sorted by EventOrder
 *
 * Weight-window membership is evaluated on local time of day.
 */
DayFigures summarize(std::span<const CalorieEvent> events,
                     const WeightWindowPolicy& windows,
                     std::chrono::minutes utcOffset);

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_DAY_FIGURES_HPP
