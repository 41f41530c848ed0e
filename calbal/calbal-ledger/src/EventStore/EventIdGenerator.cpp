// Ticket: 0004_event_store

#include "calbal-ledger/src/EventStore/EventIdGenerator.hpp"

#include <fmt/format.h>

namespace calbal_ledger
{

EventIdGenerator::EventIdGenerator() : engine_{std::random_device{}()}
{
}

EventIdGenerator::EventIdGenerator(uint64_t seed) : engine_{seed}
{
}

std::string EventIdGenerator::next()
{
  uint64_t hi = 0;
  uint64_t lo = 0;
  {
    std::scoped_lock lock{mutex_};
    hi = engine_();
    lo = engine_();
  }

  // Version nibble 4, variant bits 10
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                     hi >> 32,
                     (hi >> 16) & 0xFFFFULL,
                     hi & 0xFFFFULL,
                     lo >> 48,
                     lo & 0xFFFFFFFFFFFFULL);
}

}  // namespace calbal_ledger
