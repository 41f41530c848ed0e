// Ticket: 0004_event_store

#ifndef CALBAL_LEDGER_EVENT_STORE_EVENT_STORE_HPP
#define CALBAL_LEDGER_EVENT_STORE_EVENT_STORE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/EventStore/CalorieEvent.hpp"

namespace calbal_ledger
{

/**
 * @brief Abstract append-only log of calorie and weight events
 *
 * The event log is the single source of truth: every DailyBalance row and
 * every rollup must be reproducible from it. Backends must honor:
 * - append validates before storing and stores nothing on rejection
 * - append is idempotent on event id
 * - list returns events ordered by (timestamp, id) regardless of arrival
 *   order
 * - sequence(user) strictly increases with every inserted event
 *
 * Thread safety: implementations must allow concurrent append and list.
 *
 * @ticket 0004_event_store
 */
class EventStore
{
public:
  virtual ~EventStore() = default;

  /**
   * @brief Validate and store an event
   * @return Stored id, with inserted == false for an already-known id
   * @throws ValidationError if the event or its supersedes link is invalid
   */
  virtual AppendResult append(const CalorieEvent& event) = 0;

  /**
   * @brief Events of one user inside a half-open time window
   * @param type Restrict to one event type when set
   */
  [[nodiscard]] virtual std::vector<CalorieEvent> list(
    const std::string& userId,
    std::optional<EventType> type,
    const TimeRange& range) const = 0;

  [[nodiscard]] virtual std::optional<CalorieEvent> find(
    const std::string& eventId) const = 0;

  /**
   * @brief Number of events accepted for a user (cache watermark)
   */
  [[nodiscard]] virtual uint64_t sequence(const std::string& userId) const = 0;

  /**
   * @brief Ids of the user's events named by a later correction
   */
  [[nodiscard]] virtual std::set<std::string> supersededIds(
    const std::string& userId) const = 0;

  /**
   * @brief Users with at least one stored event
   */
  [[nodiscard]] virtual std::vector<std::string> users() const = 0;

  /**
   * @brief list() with superseded events removed
   *
   * This is the view aggregation and rollups consume.
   */
  [[nodiscard]] std::vector<CalorieEvent> listEffective(
    const std::string& userId,
    std::optional<EventType> type,
    const TimeRange& range) const;

protected:
  EventStore() = default;
  EventStore(const EventStore&) = default;
  EventStore& operator=(const EventStore&) = default;
  EventStore(EventStore&&) noexcept = default;
  EventStore& operator=(EventStore&&) noexcept = default;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_EVENT_STORE_EVENT_STORE_HPP
