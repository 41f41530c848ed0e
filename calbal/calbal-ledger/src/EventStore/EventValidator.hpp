// Ticket: 0001_event_store_data_model

#ifndef CALBAL_LEDGER_EVENT_STORE_EVENT_VALIDATOR_HPP
#define CALBAL_LEDGER_EVENT_STORE_EVENT_VALIDATOR_HPP

#include "calbal-ledger/src/Config/LedgerConfig.hpp"
#include "calbal-ledger/src/EventStore/CalorieEvent.hpp"

namespace calbal_ledger
{

/**
 * @brief Range checks applied to every event before it is stored
 *
 * Rules by type:
 * - consumed: 0 <= value <= maxConsumedPerEvent
 * - burned_exercise: 0 <= value <= maxBurnedPerEvent
 * - burned_bmr: 0 <= value <= maxBmrPerEvent
 * - weight: minWeightKg <= value <= maxWeightKg
 *
 * Every event additionally needs a non-empty id and user id, a finite value
 * and a confidence in [0, 1].
 *
 * @ticket 0001_event_store_data_model
 */
class EventValidator
{
public:
  explicit EventValidator(const ValidationLimits& limits = {});

  /**
   * @throws ValidationError naming the first offending field
   */
  void validate(const CalorieEvent& event) const;

  [[nodiscard]] const ValidationLimits& limits() const
  {
    return limits_;
  }

private:
  ValidationLimits limits_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_EVENT_STORE_EVENT_VALIDATOR_HPP
