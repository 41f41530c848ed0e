// Ticket: 0016_ledger_journal

#ifndef CALBAL_TRANSFER_DAILY_BALANCE_RECORD_HPP
#define CALBAL_TRANSFER_DAILY_BALANCE_RECORD_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace calbal_transfer
{

/**
 * @brief Snapshot of one DailyBalance row version
 *
 * Balances are journaled append-only: every write of a row adds a record
 * carrying its version, and readers keep the highest version per
 * (user_id, date). Absent optional figures are stored as NaN.
 *
 * net_calories is denormalized for ad-hoc queries against the file; the
 * ledger recomputes it from the three sums.
 *
 * @see calbal_ledger::DailyBalance
 * @ticket 0016_ledger_journal
 */
struct DailyBalanceRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  std::string date;  // YYYY-MM-DD, local
  double calories_consumed{0.0};
  double calories_burned_exercise{0.0};
  double calories_burned_bmr{0.0};
  double net_calories{0.0};
  double morning_weight{std::numeric_limits<double>::quiet_NaN()};
  double evening_weight{std::numeric_limits<double>::quiet_NaN()};
  double daily_calorie_target{std::numeric_limits<double>::quiet_NaN()};
  uint32_t goal_id{0};  // 0 when no goal was in force
  uint32_t events_count{0};
  std::string last_event_timestamp;  // Empty without events
  double data_completeness_score{0.0};
  uint64_t version{0};  // Optimistic version token, same width as the row's
  std::string computed_at;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(DailyBalanceRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id,
                       date,
                       calories_consumed,
                       calories_burned_exercise,
                       calories_burned_bmr,
                       net_calories,
                       morning_weight,
                       evening_weight,
                       daily_calorie_target,
                       goal_id,
                       events_count,
                       last_event_timestamp,
                       data_completeness_score,
                       version,
                       computed_at));

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_DAILY_BALANCE_RECORD_HPP
