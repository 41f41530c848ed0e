// Ticket: 0004_event_store

#include "calbal-ledger/src/EventStore/InMemoryEventStore.hpp"

#include <algorithm>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

InMemoryEventStore::InMemoryEventStore(const ValidationLimits& limits,
                                       std::shared_ptr<spdlog::logger> logger)
  : validator_{limits}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument{"InMemoryEventStore requires a logger"};
  }
}

AppendResult InMemoryEventStore::append(const CalorieEvent& event)
{
  validator_.validate(event);

  Partition& partition = partitionFor(event.userId);
  std::unique_lock lock{partition.mutex};

  {
    std::scoped_lock indexLock{indexMutex_};
    auto const owner = ownerById_.find(event.id);
    if (owner != ownerById_.end())
    {
      if (owner->second != event.userId)
      {
        logger_->warn(
          "Event {} re-submitted for user {} but is owned by {}; ignored",
          event.id,
          event.userId,
          owner->second);
      }
      else if (partition.byId.at(event.id) != event)
      {
        logger_->warn(
          "Event {} re-submitted with different content; keeping the "
          "original",
          event.id);
      }
      else
      {
        logger_->debug("Event {} already stored; append is a no-op",
                       event.id);
      }
      return AppendResult{event.id, false};
    }
    // Reserve the id so a concurrent append for another user sees it
    ownerById_.emplace(event.id, event.userId);
  }

  try
  {
    checkSupersedes(partition, event);
  }
  catch (const ValidationError&)
  {
    std::scoped_lock indexLock{indexMutex_};
    ownerById_.erase(event.id);
    throw;
  }

  partition.byId.emplace(event.id, event);
  partition.ordered.emplace(event.timestamp, event.id);
  if (event.supersedes)
  {
    partition.superseded.insert(*event.supersedes);
  }
  ++partition.sequence;

  logger_->debug("Appended {} event {} for user {} at {} (value {})",
                 toString(event.type),
                 event.id,
                 event.userId,
                 formatTimestamp(event.timestamp),
                 event.value);

  return AppendResult{event.id, true};
}

void InMemoryEventStore::checkSupersedes(const Partition& partition,
                                         const CalorieEvent& event) const
{
  if (!event.supersedes)
  {
    return;
  }

  auto const target = partition.byId.find(*event.supersedes);
  if (target == partition.byId.end())
  {
    throw ValidationError{"supersedes",
                          "no event '" + *event.supersedes +
                            "' for this user"};
  }
  if (target->second.type != event.type)
  {
    throw ValidationError{"supersedes",
                          "correction must keep event type " +
                            std::string{toString(target->second.type)}};
  }
  if (partition.superseded.contains(*event.supersedes))
  {
    throw ValidationError{"supersedes",
                          "event '" + *event.supersedes +
                            "' is already superseded"};
  }
}

std::vector<CalorieEvent> InMemoryEventStore::list(
  const std::string& userId,
  std::optional<EventType> type,
  const TimeRange& range) const
{
  std::vector<CalorieEvent> result;
  const Partition* partition = findPartition(userId);
  if (partition == nullptr || range.empty())
  {
    return result;
  }

  std::shared_lock lock{partition->mutex};
  auto it = partition->ordered.lower_bound({range.from, std::string{}});
  for (; it != partition->ordered.end() && it->first < range.to; ++it)
  {
    const CalorieEvent& event = partition->byId.at(it->second);
    if (!type || event.type == *type)
    {
      result.push_back(event);
    }
  }
  return result;
}

std::optional<CalorieEvent> InMemoryEventStore::find(
  const std::string& eventId) const
{
  std::string userId;
  {
    std::scoped_lock indexLock{indexMutex_};
    auto const owner = ownerById_.find(eventId);
    if (owner == ownerById_.end())
    {
      return std::nullopt;
    }
    userId = owner->second;
  }

  const Partition* partition = findPartition(userId);
  if (partition == nullptr)
  {
    return std::nullopt;
  }
  std::shared_lock lock{partition->mutex};
  auto const it = partition->byId.find(eventId);
  if (it == partition->byId.end())
  {
    return std::nullopt;
  }
  return it->second;
}

uint64_t InMemoryEventStore::sequence(const std::string& userId) const
{
  const Partition* partition = findPartition(userId);
  if (partition == nullptr)
  {
    return 0;
  }
  std::shared_lock lock{partition->mutex};
  return partition->sequence;
}

std::set<std::string> InMemoryEventStore::supersededIds(
  const std::string& userId) const
{
  const Partition* partition = findPartition(userId);
  if (partition == nullptr)
  {
    return {};
  }
  std::shared_lock lock{partition->mutex};
  return partition->superseded;
}

std::vector<std::string> InMemoryEventStore::users() const
{
  std::shared_lock lock{partitionsMutex_};
  std::vector<std::string> result;
  result.reserve(partitions_.size());
  for (const auto& [userId, partition] : partitions_)
  {
    result.push_back(userId);
  }
  std::sort(result.begin(), result.end());
  return result;
}

size_t InMemoryEventStore::size() const
{
  std::scoped_lock indexLock{indexMutex_};
  return ownerById_.size();
}

InMemoryEventStore::Partition& InMemoryEventStore::partitionFor(
  const std::string& userId)
{
  {
    std::shared_lock lock{partitionsMutex_};
    auto const it = partitions_.find(userId);
    if (it != partitions_.end())
    {
      return *it->second;
    }
  }

  std::unique_lock lock{partitionsMutex_};
  auto& slot = partitions_[userId];
  if (!slot)
  {
    slot = std::make_unique<Partition>();
  }
  return *slot;
}

const InMemoryEventStore::Partition* InMemoryEventStore::findPartition(
  const std::string& userId) const
{
  std::shared_lock lock{partitionsMutex_};
  auto const it = partitions_.find(userId);
  return it == partitions_.end() ? nullptr : it->second.get();
}

}  // namespace calbal_ledger
