// Ticket: 0016_ledger_journal

#ifndef CALBAL_TRANSFER_EVENT_METADATA_RECORD_HPP
#define CALBAL_TRANSFER_EVENT_METADATA_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "calbal-transfer/src/CalorieEventRecord.hpp"

namespace calbal_transfer
{

/**
 * @brief One metadata entry of a journaled event
 *
 * @ticket 0016_ledger_journal
 */
struct EventMetadataRecord : public cpp_sqlite::BaseTransferObject
{
  std::string key;
  std::string value;
  cpp_sqlite::ForeignKey<CalorieEventRecord> event;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(EventMetadataRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (key, value, event));

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_EVENT_METADATA_RECORD_HPP
