// Ticket: 0011_recompute_queue

#ifndef CALBAL_LEDGER_AGGREGATION_RECOMPUTE_QUEUE_HPP
#define CALBAL_LEDGER_AGGREGATION_RECOMPUTE_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Aggregation/DailyBalance.hpp"

namespace calbal_ledger
{

class DailyBalanceAggregator;

enum class RecomputeLane : uint8_t
{
  Live,     // fresh ingestion, served first
  Backfill  // historical imports, rate limited
};

/**
 * @brief Background scheduler for DailyBalance recomputes
 *
 * Two FIFO lanes feed one worker thread:
 * - Live keys are processed as soon as possible.
 * - Backfill keys are processed only while the live lane is empty, at most
 *   `backfillMaxPerSecond` per second, so imports never starve live
 *   traffic.
 *
 * A key already pending is not queued twice. A key is removed from the
 * pending set before it is recomputed, so an event arriving during the
 * recompute queues it again and the final row reflects it.
 *
 * Recompute failures (retries exhausted) are logged and counted; the key
 * can be rescheduled by the next event or by an explicit reaggregate.
 *
 * @ticket 0011_recompute_queue
 */
class RecomputeQueue
{
public:
  RecomputeQueue(DailyBalanceAggregator& aggregator,
                 uint32_t backfillMaxPerSecond,
                 std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Stops the worker; keys still pending are dropped
   */
  ~RecomputeQueue();

  RecomputeQueue(const RecomputeQueue&) = delete;
  RecomputeQueue& operator=(const RecomputeQueue&) = delete;
  RecomputeQueue(RecomputeQueue&&) = delete;
  RecomputeQueue& operator=(RecomputeQueue&&) = delete;

  /**
   * @return false when the key was already pending (coalesced)
   */
  bool schedule(BalanceKey key, RecomputeLane lane);

  /**
   * @brief Block until both lanes are empty and no recompute is running
   *
   * Returns early once the queue has been stopped.
   */
  void drain();

  [[nodiscard]] size_t pending(RecomputeLane lane) const;

  [[nodiscard]] uint64_t completed() const
  {
    return completed_.load();
  }

  [[nodiscard]] uint64_t failures() const
  {
    return failures_.load();
  }

private:
  void workerMain(std::stop_token stopToken);

  DailyBalanceAggregator& aggregator_;
  std::chrono::nanoseconds backfillInterval_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::condition_variable_any workCv_;
  std::condition_variable_any idleCv_;
  std::deque<BalanceKey> live_;
  std::deque<BalanceKey> backfill_;
  std::set<BalanceKey> pendingLive_;
  std::set<BalanceKey> pendingBackfill_;
  bool running_{false};
  bool stopped_{false};
  std::chrono::steady_clock::time_point nextBackfill_{};

  std::atomic<uint64_t> completed_{0};
  std::atomic<uint64_t> failures_{0};

  // Declared last: the worker must start after and stop before the members
  // it uses
  std::jthread worker_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_RECOMPUTE_QUEUE_HPP
