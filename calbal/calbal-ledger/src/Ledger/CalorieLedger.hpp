// Ticket: 0015_ledger_facade

#ifndef CALBAL_LEDGER_LEDGER_CALORIE_LEDGER_HPP
#define CALBAL_LEDGER_LEDGER_CALORIE_LEDGER_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Aggregation/BalanceStore.hpp"
#include "calbal-ledger/src/Aggregation/DailyBalanceAggregator.hpp"
#include "calbal-ledger/src/Aggregation/RecomputeQueue.hpp"
#include "calbal-ledger/src/Analytics/ProgressAnalytics.hpp"
#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/EventStore/EventIdGenerator.hpp"
#include "calbal-ledger/src/EventStore/InMemoryEventStore.hpp"
#include "calbal-ledger/src/Goals/GoalManager.hpp"
#include "calbal-ledger/src/Goals/GoalPlanner.hpp"
#include "calbal-ledger/src/Ledger/LedgerObserver.hpp"
#include "calbal-ledger/src/Metabolic/MetabolicProfileRegistry.hpp"
#include "calbal-ledger/src/Rollup/RollupCache.hpp"
#include "calbal-ledger/src/Rollup/RollupEngine.hpp"

namespace calbal_ledger
{

/**
 * @brief Body of a POST event call
 *
 * `id` is the idempotency key; one is generated when absent.
 */
struct EventRequest
{
  std::optional<std::string> id;
  std::string userId;
  EventType type{EventType::Consumed};
  Timestamp timestamp{};
  double value{0.0};
  EventSource source{EventSource::Manual};
  double confidence{1.0};
  std::map<std::string, std::string> metadata;
  std::optional<std::string> supersedes;
};

/**
 * @brief Everything a journal holds, in the order it must be restored
 */
struct LedgerJournal
{
  std::vector<CalorieEvent> events;
  std::vector<CalorieGoal> goals;
  std::vector<MetabolicProfile> profiles;
};

/**
 * @brief Entry point of the calorie-balance ledger
 *
 * Owns the event store, goal manager, metabolic profile registry, balance
 * store, aggregator, rollup engine and cache, and (in queued mode) the
 * recompute queue. Every accepted event schedules a recompute of its local
 * day, either inline (RecomputeMode::Synchronous) or on the queue worker.
 *
 * Goal changes never rewrite existing DailyBalance rows; call reaggregate()
 * to apply them to past dates. Storing an event drops the user's cached
 * rollups, so rollup() after postEvent() reflects it.
 *
 * Thread safety: all members may be called concurrently.
 *
 * @ticket 0015_ledger_facade
 */
class CalorieLedger
{
public:
  /**
   * @param logger Defaults to makeLogger(config.loggerName, config.logLevel)
   * @param balances Defaults to an InMemoryBalanceStore
   */
  explicit CalorieLedger(LedgerConfig config,
                         std::shared_ptr<spdlog::logger> logger = nullptr,
                         std::unique_ptr<BalanceStore> balances = nullptr);

  /**
   * @brief Drains pending recomputes, then stops the worker
   */
  ~CalorieLedger();

  CalorieLedger(const CalorieLedger&) = delete;
  CalorieLedger& operator=(const CalorieLedger&) = delete;
  CalorieLedger(CalorieLedger&&) = delete;
  CalorieLedger& operator=(CalorieLedger&&) = delete;

  // ------------------------------------------------------------------
  // Events
  // ------------------------------------------------------------------

  /**
   * @brief Validate, store, and schedule the recompute of the event's day
   *
   * A re-submitted id is a no-op that still schedules the recompute, so a
   * client retrying after a failed synchronous recompute heals the row.
   *
   * @return The event id (generated when the request has none)
   * @throws ValidationError before anything is stored
   * @throws TransientStorageError in synchronous mode when retries are
   *         exhausted (the event itself is stored)
   */
  std::string postEvent(const EventRequest& request);

  /**
   * @brief Store a batch and schedule its days on `lane`
   *
   * Every event, including each `supersedes` target (looked up in the
   * store and among earlier events of the batch), is validated before the
   * first one is stored. Days are scheduled once per batch. In synchronous
   * mode they are recomputed before returning regardless of the lane.
   *
   * @throws ValidationError with nothing stored, unless a concurrent writer
   *         invalidates a correction mid-batch; the days of the events
   *         stored by then are still scheduled
   */
  std::vector<std::string> postEvents(std::span<const EventRequest> batch,
                                      RecomputeLane lane =
                                        RecomputeLane::Backfill);

  // ------------------------------------------------------------------
  // Balances and rollups
  // ------------------------------------------------------------------

  /**
   * @brief Stored row for the day, recomputed on a miss when the day has
   * events
   */
  std::optional<DailyBalance> dailyBalance(const std::string& userId,
                                           Date date);

  /// Stored rows in the range, ascending by date
  [[nodiscard]] std::vector<DailyBalance> balances(
    const std::string& userId,
    const DateRange& dates) const;

  RollupSnapshot rollup(const std::string& userId,
                        RollupGranularity granularity,
                        const DateRange& dates);

  [[nodiscard]] bool isStale(const std::string& userId,
                             const RollupSnapshot& snapshot) const;

  /// Recompute every day of the range that has events or a row
  std::vector<DailyBalance> reaggregate(const std::string& userId,
                                        const DateRange& dates);

  // ------------------------------------------------------------------
  // Goals
  // ------------------------------------------------------------------

  uint32_t createGoal(CalorieGoal goal);

  /**
   * @brief PUT semantics: deactivate `goalId` and create `replacement`
   * @return Id of the replacement
   */
  uint32_t updateGoal(uint32_t goalId, CalorieGoal replacement);

  void deactivateGoal(uint32_t goalId);

  [[nodiscard]] std::optional<CalorieGoal> activeGoal(const std::string& userId,
                                                      Date date) const;

  [[nodiscard]] std::vector<CalorieGoal> goals(const std::string& userId,
                                               bool activeOnly) const;

  /**
   * @brief Derive a goal from the user's active metabolic profile and store
   * it
   * @throws NotFoundError without an active profile
   */
  CalorieGoal planGoal(const std::string& userId,
                       const GoalPlanRequest& request);

  // ------------------------------------------------------------------
  // Metabolic profiles
  // ------------------------------------------------------------------

  MetabolicProfile calculateMetabolicProfile(const std::string& userId,
                                             const MetabolicInputs& inputs);

  MetabolicProfile adjustMetabolicProfile(const std::string& userId,
                                          double factor);

  [[nodiscard]] std::optional<MetabolicProfile> activeMetabolicProfile(
    const std::string& userId) const;

  [[nodiscard]] bool needsProfileRecalculation(
    const std::string& userId,
    const MetabolicInputs& inputs) const;

  // ------------------------------------------------------------------
  // Analytics
  // ------------------------------------------------------------------

  /**
   * @brief Adherence over the stored rows of the range against the goal in
   * force on its last day
   * @throws NotFoundError when no goal is in force
   */
  ProgressMetrics progress(const std::string& userId, const DateRange& dates);

  /// @throws NotFoundError when no goal is in force on the last day
  WeightPrediction predictWeightChange(const std::string& userId,
                                       const DateRange& dates);

  // ------------------------------------------------------------------
  // Journal and lifecycle
  // ------------------------------------------------------------------

  /**
   * @brief Rebuild state from a journal and recompute every touched day
   *
   * Goals and profiles are restored under their journaled ids and
   * versions. Events are appended in an order that places every corrected
   * event before its correction. Observers are not notified of anything
   * the replay itself stores or recomputes; calls made concurrently on
   * other threads notify as usual. Not reentrant: run one replay at a time.
   *
   * @return Number of events newly stored
   * @throws ValidationError if an event can never be placed (its
   *         superseded event is missing from the journal)
   */
  size_t replay(const LedgerJournal& journal);

  /// Block until queued recomputes have finished (no-op when synchronous)
  void drain();

  void addObserver(std::shared_ptr<LedgerObserver> observer);
  void removeObserver(const std::shared_ptr<LedgerObserver>& observer);

  [[nodiscard]] uint64_t sequence(const std::string& userId) const;

  [[nodiscard]] Timestamp now() const
  {
    return config_.clock();
  }

  [[nodiscard]] const LedgerConfig& config() const
  {
    return config_;
  }

  [[nodiscard]] const EventStore& eventStore() const
  {
    return *events_;
  }

  /// Null in synchronous mode
  [[nodiscard]] const RecomputeQueue* recomputeQueue() const
  {
    return queue_.get();
  }

private:
  CalorieEvent toEvent(const EventRequest& request);
  void schedule(const BalanceKey& key, RecomputeLane lane);
  std::vector<BalanceKey> affectedKeys(const CalorieEvent& event) const;
  void checkBatchCorrections(const std::vector<CalorieEvent>& events) const;
  double targetOn(const std::string& userId, Date date) const;

  template <typename Callback>
  void notify(Callback&& callback);

  LedgerConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  EventIdGenerator idGenerator_;

  std::unique_ptr<InMemoryEventStore> events_;
  std::unique_ptr<GoalManager> goals_;
  std::unique_ptr<MetabolicProfileRegistry> profiles_;
  std::unique_ptr<BalanceStore> balances_;
  std::unique_ptr<DailyBalanceAggregator> aggregator_;
  std::unique_ptr<RollupEngine> rollups_;
  std::unique_ptr<RollupCache> cache_;

  mutable std::mutex observerMutex_;
  std::vector<std::shared_ptr<LedgerObserver>> observers_;
  // Thread running replay(), default id otherwise
  std::atomic<std::thread::id> replayThread_{};

  // Declared last: its worker uses the aggregator and must stop first
  std::unique_ptr<RecomputeQueue> queue_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_LEDGER_CALORIE_LEDGER_HPP
