// Ticket: 0016_ledger_journal

#ifndef CALBAL_TRANSFER_CALORIE_GOAL_RECORD_HPP
#define CALBAL_TRANSFER_CALORIE_GOAL_RECORD_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace calbal_transfer
{

/**
 * @brief Journal record of one goal state change
 *
 * A goal is journaled when it is created and again when it is deactivated
 * or superseded; the latest record per goal_id is its current state.
 *
 * @ticket 0016_ledger_journal
 */
struct CalorieGoalRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t goal_id{0};
  std::string user_id;
  std::string goal_type;
  double daily_calorie_target{0.0};
  double daily_deficit_target{std::numeric_limits<double>::quiet_NaN()};
  double weekly_weight_change_kg{std::numeric_limits<double>::quiet_NaN()};
  std::string start_date;
  std::string end_date;  // Empty when open-ended
  uint32_t is_active{1};     // Boolean as uint32_t for SQLite
  uint32_t ai_optimized{0};  // Boolean as uint32_t for SQLite
  std::string created_at;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(CalorieGoalRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (goal_id,
                       user_id,
                       goal_type,
                       daily_calorie_target,
                       daily_deficit_target,
                       weekly_weight_change_kg,
                       start_date,
                       end_date,
                       is_active,
                       ai_optimized,
                       created_at));

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_CALORIE_GOAL_RECORD_HPP
