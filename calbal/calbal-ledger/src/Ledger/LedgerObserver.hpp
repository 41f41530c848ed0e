// Ticket: 0015_ledger_facade

#ifndef CALBAL_LEDGER_LEDGER_LEDGER_OBSERVER_HPP
#define CALBAL_LEDGER_LEDGER_LEDGER_OBSERVER_HPP

#include "calbal-ledger/src/Aggregation/DailyBalance.hpp"
#include "calbal-ledger/src/EventStore/CalorieEvent.hpp"
#include "calbal-ledger/src/Goals/CalorieGoal.hpp"
#include "calbal-ledger/src/Metabolic/MetabolicProfile.hpp"

namespace calbal_ledger
{

/**
 * @brief Receives every state change accepted by a CalorieLedger
 *
 * Callbacks run synchronously on the thread that made the change (the
 * recompute worker for queued balance upserts) and outside the ledger's
 * locks. Implementations must be thread-safe. The default implementations
 * ignore the notification.
 *
 * Nothing is reported while the ledger replays a journal.
 *
 * @ticket 0015_ledger_facade
 */
class LedgerObserver
{
public:
  virtual ~LedgerObserver() = default;

  /// A new event was stored (duplicates are not reported)
  virtual void onEventAppended(const CalorieEvent& /* event */)
  {
  }

  /// A DailyBalance row was written with a new version
  virtual void onBalanceUpserted(const DailyBalance& /* balance */)
  {
  }

  /// A goal was created, deactivated or superseded
  virtual void onGoalChanged(const CalorieGoal& /* goal */)
  {
  }

  /// A new metabolic profile version became active
  virtual void onProfileCreated(const MetabolicProfile& /* profile */)
  {
  }

protected:
  LedgerObserver() = default;
  LedgerObserver(const LedgerObserver&) = default;
  LedgerObserver& operator=(const LedgerObserver&) = default;
  LedgerObserver(LedgerObserver&&) noexcept = default;
  LedgerObserver& operator=(LedgerObserver&&) noexcept = default;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_LEDGER_LEDGER_OBSERVER_HPP
