// Ticket: 0012_temporal_rollups

#ifndef CALBAL_LEDGER_ROLLUP_ROLLUP_ENGINE_HPP
#define CALBAL_LEDGER_ROLLUP_ROLLUP_ENGINE_HPP

#include <chrono>
#include <functional>
#include <memory>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/EventStore/EventStore.hpp"
#include "calbal-ledger/src/Goals/GoalManager.hpp"
#include "calbal-ledger/src/Rollup/RollupRows.hpp"

namespace calbal_ledger
{

/**
 * @brief Read-side projections of the event log at five granularities
 *
 * Every row is computed on demand from the effective events, so results
 * are reproducible from the EventStore at any time. Buckets are local-time
 * buckets under Config::utcOffset and use the same summation and
 * weight-window rules as the DailyBalance aggregator.
 *
 * Weekly and monthly queries widen the requested range to whole ISO weeks
 * and calendar months so that every returned bucket is complete. Only
 * buckets containing at least one event are emitted, in ascending order.
 *
 * Thread safety: only takes reader locks on its collaborators.
 *
 * @ticket 0012_temporal_rollups
 */
class RollupEngine
{
public:
  struct Config
  {
    std::chrono::minutes utcOffset{0};
    WeightWindowPolicy weightWindows{};
    std::function<Timestamp()> clock;  // defaults to the system clock
  };

  RollupEngine(const EventStore& events,
               const GoalManager& goals,
               Config config,
               std::shared_ptr<spdlog::logger> logger);

  /**
   * @throws ValidationError if the range is reversed or not valid dates
   */
  [[nodiscard]] RollupSnapshot rollup(const std::string& userId,
                                      RollupGranularity granularity,
                                      const DateRange& range) const;

  /**
   * @brief The range actually scanned for a granularity
   */
  [[nodiscard]] static DateRange bucketAlignedRange(
    RollupGranularity granularity,
    const DateRange& range);

  [[nodiscard]] Timestamp now() const
  {
    return config_.clock();
  }

private:
  const EventStore& events_;
  const GoalManager& goals_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_ROLLUP_ROLLUP_ENGINE_HPP
