// Ticket: 0016_ledger_journal

#ifndef CALBAL_RECORDER_LEDGER_RECORDER_HPP
#define CALBAL_RECORDER_LEDGER_RECORDER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Ledger/CalorieLedger.hpp"
#include "calbal-ledger/src/Ledger/LedgerObserver.hpp"

namespace calbal_recorder
{

/**
 * @brief Journals every ledger state change to a SQLite file
 *
 * Registered on a CalorieLedger as an observer. Notifications only buffer
 * records (thread-safe through cpp_sqlite's double-buffered DAOs); a
 * background thread flushes them inside one transaction every
 * `flushInterval`. The destructor performs a final flush.
 *
 * The journal is append-only:
 * - one CalorieEventRecord per accepted event, plus its metadata entries
 * - one CalorieGoalRecord per goal state change
 * - one MetabolicProfileRecord per profile version
 * - one DailyBalanceRecord per balance write (latest version wins)
 *
 * loadJournal() reads it back in the shape CalorieLedger::replay expects.
 *
 * @ticket 0016_ledger_journal
 */
class LedgerRecorder : public calbal_ledger::LedgerObserver
{
public:
  struct Config
  {
    std::chrono::milliseconds flushInterval{100};  // Flush every 100ms
    std::string databasePath;                      // SQLite database file
  };

  /**
   * @brief Open (or create) the journal and start the flush thread
   *
   * @throws std::runtime_error if the database cannot be opened
   * @throws std::invalid_argument if logger is null
   */
  LedgerRecorder(const Config& config, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Stops the flush thread, which flushes once more before exiting
   */
  ~LedgerRecorder() override;

  LedgerRecorder(const LedgerRecorder&) = delete;
  LedgerRecorder& operator=(const LedgerRecorder&) = delete;
  LedgerRecorder(LedgerRecorder&&) = delete;
  LedgerRecorder& operator=(LedgerRecorder&&) = delete;

  void onEventAppended(const calbal_ledger::CalorieEvent& event) override;
  void onBalanceUpserted(const calbal_ledger::DailyBalance& balance) override;
  void onGoalChanged(const calbal_ledger::CalorieGoal& goal) override;
  void onProfileCreated(
    const calbal_ledger::MetabolicProfile& profile) override;

  /**
   * @brief Write all buffered records now
   */
  void flush();

  /**
   * @brief Flush, then read the whole journal back
   *
   * Events come in acceptance order; goals in their latest state ordered
   * by id; profile versions in creation order.
   */
  calbal_ledger::LedgerJournal loadJournal();

  std::vector<calbal_ledger::CalorieEvent> loadEvents();
  std::vector<calbal_ledger::CalorieGoal> loadGoals();
  std::vector<calbal_ledger::MetabolicProfile> loadProfiles();

  /// Latest journaled version of every balance row, by (user, date)
  std::vector<calbal_ledger::DailyBalance> loadBalances();

  const cpp_sqlite::Database& getDatabase() const;

private:
  void recorderThreadMain(std::stop_token stopToken);

  // Requires flushMutex_
  void flushLocked();

  std::vector<calbal_ledger::CalorieEvent> loadEventsLocked();
  std::vector<calbal_ledger::CalorieGoal> loadGoalsLocked();
  std::vector<calbal_ledger::MetabolicProfile> loadProfilesLocked();

  std::unique_ptr<cpp_sqlite::Database> database_;
  std::chrono::milliseconds flushInterval_;
  std::shared_ptr<spdlog::logger> logger_;
  std::mutex flushMutex_;  // Serializes flushes and journal reads
  std::condition_variable_any wakeCv_;
  std::atomic<uint32_t> nextEventRecordId_{1};  // Pre-assigned for FKs
  // Declared last: the thread must start after and stop before the members
  // it uses
  std::jthread recorderThread_;
};

}  // namespace calbal_recorder

#endif  // CALBAL_RECORDER_LEDGER_RECORDER_HPP
