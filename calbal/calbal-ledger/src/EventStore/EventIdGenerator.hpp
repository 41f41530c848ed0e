// Ticket: 0004_event_store

#ifndef CALBAL_LEDGER_EVENT_STORE_EVENT_ID_GENERATOR_HPP
#define CALBAL_LEDGER_EVENT_STORE_EVENT_ID_GENERATOR_HPP

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace calbal_ledger
{

/**
 * @brief Produces random RFC 4122 version-4 style identifiers
 *
 * Used when a caller posts an event without an idempotency key. Callers
 * that retry must supply their own id to benefit from idempotency.
 */
class EventIdGenerator
{
public:
  EventIdGenerator();
  explicit EventIdGenerator(uint64_t seed);

  std::string next();

private:
  std::mutex mutex_;
  std::mt19937_64 engine_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_EVENT_STORE_EVENT_ID_GENERATOR_HPP
