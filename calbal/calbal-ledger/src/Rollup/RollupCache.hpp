// Ticket: 0013_rollup_cache

#ifndef CALBAL_LEDGER_ROLLUP_ROLLUP_CACHE_HPP
#define CALBAL_LEDGER_ROLLUP_ROLLUP_CACHE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <tuple>

#include "calbal-ledger/src/EventStore/EventStore.hpp"
#include "calbal-ledger/src/Rollup/RollupEngine.hpp"

namespace calbal_ledger
{

/**
 * @brief Serves rollup snapshots with bounded staleness
 *
 * A cached snapshot is served while it is younger than `maxStaleness`
 * (by its computedAt), even if events arrived since. Callers can detect
 * that case through isStale(). A zero `maxStaleness` disables caching and
 * every call recomputes.
 *
 * Every insert first evicts the snapshots older than `maxStaleness`, so the
 * cache only ever holds the queries of the last staleness window.
 *
 * @ticket 0013_rollup_cache
 */
class RollupCache
{
public:
  RollupCache(const RollupEngine& engine,
              const EventStore& events,
              std::chrono::seconds maxStaleness);

  [[nodiscard]] RollupSnapshot get(const std::string& userId,
                                   RollupGranularity granularity,
                                   const DateRange& range);

  /**
   * @brief True when events were accepted after the snapshot was computed
   */
  [[nodiscard]] bool isStale(const std::string& userId,
                             const RollupSnapshot& snapshot) const;

  /// Drop every cached snapshot of a user
  void invalidate(const std::string& userId);

  [[nodiscard]] size_t size() const;

  [[nodiscard]] std::chrono::seconds maxStaleness() const
  {
    return maxStaleness_;
  }

private:
  using Key = std::tuple<std::string, RollupGranularity, int, int>;

  static Key keyOf(const std::string& userId,
                   RollupGranularity granularity,
                   const DateRange& range);

  const RollupEngine& engine_;
  const EventStore& events_;
  std::chrono::seconds maxStaleness_;

  mutable std::mutex mutex_;
  std::map<Key, RollupSnapshot> snapshots_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_ROLLUP_ROLLUP_CACHE_HPP
