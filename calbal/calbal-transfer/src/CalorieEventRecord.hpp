// Ticket: 0016_ledger_journal

#ifndef CALBAL_TRANSFER_CALORIE_EVENT_RECORD_HPP
#define CALBAL_TRANSFER_CALORIE_EVENT_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace calbal_transfer
{

/**
 * @brief Journal record of one accepted CalorieEvent
 *
 * Enumerations are stored as their wire names and timestamps as
 * "YYYY-MM-DDTHH:MM:SSZ". Rows are written in acceptance order, so reading
 * them back by record id replays events in the order the ledger stored
 * them. Metadata entries live in EventMetadataRecord rows pointing back
 * here.
 *
 * @see calbal_ledger::CalorieEvent
 * @ticket 0016_ledger_journal
 */
struct CalorieEventRecord : public cpp_sqlite::BaseTransferObject
{
  std::string event_id;
  std::string user_id;
  std::string event_type;       // consumed, burned_exercise, burned_bmr, weight
  std::string event_timestamp;  // UTC
  double value{0.0};            // [kcal] or [kg]
  std::string source;
  double confidence_score{1.0};
  std::string supersedes;  // Empty when the event corrects nothing
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(CalorieEventRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (event_id,
                       user_id,
                       event_type,
                       event_timestamp,
                       value,
                       source,
                       confidence_score,
                       supersedes));

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_CALORIE_EVENT_RECORD_HPP
