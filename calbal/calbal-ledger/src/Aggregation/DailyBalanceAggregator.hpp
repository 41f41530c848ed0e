// Ticket: 0009_daily_balance_aggregator
// Ticket: 0010_recompute_retry

#ifndef CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_AGGREGATOR_HPP
#define CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_AGGREGATOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Aggregation/BalanceStore.hpp"
#include "calbal-ledger/src/Aggregation/DailyBalance.hpp"
#include "calbal-ledger/src/Aggregation/KeyedMutex.hpp"
#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/EventStore/EventStore.hpp"
#include "calbal-ledger/src/Goals/GoalManager.hpp"

namespace calbal_ledger
{

/**
 * @brief Materializes one DailyBalance row per (user, local date)
 *
 * Every recompute rebuilds the row from scratch out of the day's effective
 * events and the goal in force, never by patching the previous figures.
 * This makes recompute idempotent and independent of insertion order.
 *
 * Concurrency: recomputes of the same key are serialized and read the
 * event snapshot inside the critical section, so the last writer always
 * reflects the full event set. Different keys proceed in parallel.
 * Transient storage failures are retried per Config::retry.
 *
 * @ticket 0009_daily_balance_aggregator
 * @ticket 0010_recompute_retry
 */
class DailyBalanceAggregator
{
public:
  struct Config
  {
    std::chrono::minutes utcOffset{0};
    WeightWindowPolicy weightWindows{};
    RetryPolicy retry{};
    std::function<Timestamp()> clock;  // defaults to the system clock
  };

  using UpsertListener = std::function<void(const DailyBalance&)>;

  DailyBalanceAggregator(const EventStore& events,
                         const GoalManager& goals,
                         BalanceStore& balances,
                         Config config,
                         std::shared_ptr<spdlog::logger> logger);

  DailyBalanceAggregator(const DailyBalanceAggregator&) = delete;
  DailyBalanceAggregator& operator=(const DailyBalanceAggregator&) = delete;
  DailyBalanceAggregator(DailyBalanceAggregator&&) = delete;
  DailyBalanceAggregator& operator=(DailyBalanceAggregator&&) = delete;
  ~DailyBalanceAggregator() = default;

  /**
   * @brief Rebuild and store the row for (userId, date)
   *
   * A rebuilt row whose figures equal the stored row is not rewritten, so
   * repeated recomputes leave the version unchanged.
   *
   * @return The stored row
   * @throws TransientStorageError when retries are exhausted
   */
  DailyBalance recompute(const std::string& userId, Date date);

  /**
   * @brief Recompute every date in the range that has events or a row
   *
   * This is how goal changes reach past dates.
   */
  std::vector<DailyBalance> reaggregate(const std::string& userId,
                                        const DateRange& dates);

  /**
   * @brief Called after every write of a row, outside the key lock
   */
  void setUpsertListener(UpsertListener listener);

  /**
   * @brief Pure row construction from a day's effective events
   *
   * @param events Events of the local day sorted by EventOrder
   */
  [[nodiscard]] static DailyBalance buildRow(
    const std::string& userId,
    Date date,
    std::span<const CalorieEvent> events,
    const std::optional<CalorieGoal>& goal,
    const WeightWindowPolicy& windows,
    std::chrono::minutes utcOffset);

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  const EventStore& events_;
  const GoalManager& goals_;
  BalanceStore& balances_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;

  KeyedMutex<BalanceKey> keyLocks_;

  mutable std::mutex listenerMutex_;
  UpsertListener listener_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_DAILY_BALANCE_AGGREGATOR_HPP
