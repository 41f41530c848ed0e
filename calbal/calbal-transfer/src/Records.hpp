#ifndef CALBAL_TRANSFER_RECORDS_HPP
#define CALBAL_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including every journal record
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "calbal-transfer/src/CalorieEventRecord.hpp"
#include "calbal-transfer/src/CalorieGoalRecord.hpp"
#include "calbal-transfer/src/DailyBalanceRecord.hpp"
#include "calbal-transfer/src/EventMetadataRecord.hpp"
#include "calbal-transfer/src/MetabolicProfileRecord.hpp"

namespace calbal_transfer
{

/**
 * @brief Type alias for cpp_sqlite Database
 */
using Database = cpp_sqlite::Database;

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_RECORDS_HPP
