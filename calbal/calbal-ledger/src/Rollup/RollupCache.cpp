// Ticket: 0013_rollup_cache

#include "calbal-ledger/src/Rollup/RollupCache.hpp"

namespace calbal_ledger
{

RollupCache::RollupCache(const RollupEngine& engine,
                         const EventStore& events,
                         std::chrono::seconds maxStaleness)
  : engine_{engine}, events_{events}, maxStaleness_{maxStaleness}
{
  if (maxStaleness_ < std::chrono::seconds{0})
  {
    throw std::invalid_argument{"rollup staleness bound must not be negative"};
  }
}

RollupCache::Key RollupCache::keyOf(const std::string& userId,
                                    RollupGranularity granularity,
                                    const DateRange& range)
{
  return Key{userId,
             granularity,
             static_cast<int>(
               std::chrono::sys_days{range.first}.time_since_epoch().count()),
             static_cast<int>(
               std::chrono::sys_days{range.last}.time_since_epoch().count())};
}

RollupSnapshot RollupCache::get(const std::string& userId,
                                RollupGranularity granularity,
                                const DateRange& range)
{
  if (maxStaleness_ == std::chrono::seconds{0})
  {
    return engine_.rollup(userId, granularity, range);
  }

  Key const key = keyOf(userId, granularity, range);
  Timestamp const now = engine_.now();
  {
    std::scoped_lock lock{mutex_};
    auto const it = snapshots_.find(key);
    if (it != snapshots_.end() && now - it->second.computedAt <= maxStaleness_)
    {
      return it->second;
    }
  }

  // Computed outside the lock; a concurrent miss for the same key simply
  // computes twice and the later snapshot wins
  RollupSnapshot snapshot = engine_.rollup(userId, granularity, range);
  std::scoped_lock lock{mutex_};
  std::erase_if(snapshots_,
                [this, now](const auto& entry)
                { return now - entry.second.computedAt > maxStaleness_; });
  snapshots_.insert_or_assign(key, snapshot);
  return snapshot;
}

bool RollupCache::isStale(const std::string& userId,
                          const RollupSnapshot& snapshot) const
{
  return events_.sequence(userId) > snapshot.eventSequence;
}

void RollupCache::invalidate(const std::string& userId)
{
  std::scoped_lock lock{mutex_};
  std::erase_if(snapshots_,
                [&userId](const auto& entry)
                { return std::get<0>(entry.first) == userId; });
}

size_t RollupCache::size() const
{
  std::scoped_lock lock{mutex_};
  return snapshots_.size();
}

}  // namespace calbal_ledger
