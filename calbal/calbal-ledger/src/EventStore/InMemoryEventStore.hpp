// Ticket: 0004_event_store

#ifndef CALBAL_LEDGER_EVENT_STORE_IN_MEMORY_EVENT_STORE_HPP
#define CALBAL_LEDGER_EVENT_STORE_IN_MEMORY_EVENT_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/EventStore/EventStore.hpp"
#include "calbal-ledger/src/EventStore/EventValidator.hpp"

namespace calbal_ledger
{

/**
 * @brief EventStore partitioned by user, held in memory
 *
 * Each user owns a partition with its own reader/writer lock, so appends
 * for different users never contend. A global id index (short critical
 * section) makes idempotency hold across users.
 *
 * Durability comes from replaying the SQLite journal written by
 * LedgerRecorder.
 *
 * @ticket 0004_event_store
 */
class InMemoryEventStore final : public EventStore
{
public:
  InMemoryEventStore(const ValidationLimits& limits,
                     std::shared_ptr<spdlog::logger> logger);

  InMemoryEventStore(const InMemoryEventStore&) = delete;
  InMemoryEventStore& operator=(const InMemoryEventStore&) = delete;
  InMemoryEventStore(InMemoryEventStore&&) = delete;
  InMemoryEventStore& operator=(InMemoryEventStore&&) = delete;
  ~InMemoryEventStore() override = default;

  AppendResult append(const CalorieEvent& event) override;

  [[nodiscard]] std::vector<CalorieEvent> list(
    const std::string& userId,
    std::optional<EventType> type,
    const TimeRange& range) const override;

  [[nodiscard]] std::optional<CalorieEvent> find(
    const std::string& eventId) const override;

  [[nodiscard]] uint64_t sequence(const std::string& userId) const override;

  [[nodiscard]] std::set<std::string> supersededIds(
    const std::string& userId) const override;

  [[nodiscard]] std::vector<std::string> users() const override;

  /// Total stored events across all users
  [[nodiscard]] size_t size() const;

private:
  struct Partition
  {
    mutable std::shared_mutex mutex;
    std::map<std::string, CalorieEvent> byId;
    std::set<std::pair<Timestamp, std::string>> ordered;
    std::set<std::string> superseded;
    uint64_t sequence{0};
  };

  Partition& partitionFor(const std::string& userId);
  [[nodiscard]] const Partition* findPartition(const std::string& userId) const;

  // Requires the partition's unique lock
  void checkSupersedes(const Partition& partition,
                       const CalorieEvent& event) const;

  EventValidator validator_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::shared_mutex partitionsMutex_;
  std::unordered_map<std::string, std::unique_ptr<Partition>> partitions_;

  mutable std::mutex indexMutex_;
  std::unordered_map<std::string, std::string> ownerById_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_EVENT_STORE_IN_MEMORY_EVENT_STORE_HPP
