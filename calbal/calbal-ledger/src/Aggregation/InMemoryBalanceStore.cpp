// Ticket: 0009_daily_balance_aggregator

#include "calbal-ledger/src/Aggregation/InMemoryBalanceStore.hpp"

#include <mutex>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

std::optional<DailyBalance> InMemoryBalanceStore::find(
  const BalanceKey& key) const
{
  std::shared_lock lock{mutex_};
  auto const it = rows_.find(key);
  if (it == rows_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

DailyBalance InMemoryBalanceStore::upsert(DailyBalance row,
                                          uint64_t expectedVersion)
{
  std::unique_lock lock{mutex_};
  BalanceKey key = row.key();
  auto const it = rows_.find(key);
  uint64_t const storedVersion = it == rows_.end() ? 0 : it->second.version;
  if (storedVersion != expectedVersion)
  {
    throw TransientStorageError{
      fmt::format("balance {} {} is at version {}, expected {}",
                  key.userId,
                  formatDate(key.date),
                  storedVersion,
                  expectedVersion)};
  }

  row.version = expectedVersion + 1;
  rows_.insert_or_assign(std::move(key), row);
  return row;
}

std::vector<DailyBalance> InMemoryBalanceStore::range(
  const std::string& userId,
  const DateRange& dates) const
{
  std::shared_lock lock{mutex_};
  std::vector<DailyBalance> result;
  auto it = rows_.lower_bound(BalanceKey{userId, dates.first});
  for (; it != rows_.end() && it->first.userId == userId &&
         dates.contains(it->first.date);
       ++it)
  {
    result.push_back(it->second);
  }
  return result;
}

size_t InMemoryBalanceStore::size() const
{
  std::shared_lock lock{mutex_};
  return rows_.size();
}

}  // namespace calbal_ledger
