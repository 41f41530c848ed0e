// Ticket: 0009_daily_balance_aggregator

#ifndef CALBAL_LEDGER_AGGREGATION_BALANCE_STORE_HPP
#define CALBAL_LEDGER_AGGREGATION_BALANCE_STORE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "calbal-ledger/src/Aggregation/DailyBalance.hpp"

namespace calbal_ledger
{

/**
 * @brief Abstract storage of materialized DailyBalance rows
 *
 * Writes are compare-and-set on the row version: upsert succeeds only when
 * the stored version equals `expectedVersion` (0 for an absent row) and
 * stores the row with version expectedVersion + 1. A lost race or a
 * transient backend failure raises TransientStorageError so the caller can
 * recompute from a fresh snapshot and retry.
 *
 * @ticket 0009_daily_balance_aggregator
 */
class BalanceStore
{
public:
  virtual ~BalanceStore() = default;

  [[nodiscard]] virtual std::optional<DailyBalance> find(
    const BalanceKey& key) const = 0;

  /**
   * @return The stored row, carrying its new version
   * @throws TransientStorageError on version mismatch or backend failure
   */
  virtual DailyBalance upsert(DailyBalance row, uint64_t expectedVersion) = 0;

  /**
   * @brief Rows of one user in an inclusive date range, ordered by date
   */
  [[nodiscard]] virtual std::vector<DailyBalance> range(
    const std::string& userId,
    const DateRange& dates) const = 0;

protected:
  BalanceStore() = default;
  BalanceStore(const BalanceStore&) = default;
  BalanceStore& operator=(const BalanceStore&) = default;
  BalanceStore(BalanceStore&&) noexcept = default;
  BalanceStore& operator=(BalanceStore&&) noexcept = default;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_AGGREGATION_BALANCE_STORE_HPP
