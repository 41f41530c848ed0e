// Ticket: 0009_daily_balance_aggregator

#ifndef CALBAL_LEDGER_AGGREGATION_IN_MEMORY_BALANCE_STORE_HPP
#define CALBAL_LEDGER_AGGREGATION_IN_MEMORY_BALANCE_STORE_HPP

#include <map>
#include <shared_mutex>

#include "calbal-ledger/src/Aggregation/BalanceStore.hpp"

namespace calbal_ledger
{

/**
 * @brief BalanceStore backed by an ordered map under a reader/writer lock
 */
class InMemoryBalanceStore final : public BalanceStore
{
public:
  InMemoryBalanceStore() = default;
  InMemoryBalanceStore(const InMemoryBalanceStore&) = delete;
  InMemoryBalanceStore& operator=(const InMemoryBalanceStore&) = delete;
  InMemoryBalanceStore(InMemoryBalanceStore&&) = delete;
  InMemoryBalanceStore& operator=(InMemoryBalanceStore&&) = delete;
  ~InMemoryBalanceStore() override = default;

  [[nodiscard]] std::optional<DailyBalance> find(
    const BalanceKey& key) const override;

  DailyBalance upsert(DailyBalance row, uint64_t expectedVersion) override;

  [[nodiscard]] std::vector<DailyBalance> range(
    const std::string& userId,
    const DateRange& dates) const override;

  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::map<BalanceKey, DailyBalance> rows_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_IN_MEMORY_BALANCE_STORE_HPP
