// Ticket: 0003_ledger_configuration

#ifndef CALBAL_LEDGER_CONFIG_LEDGER_CONFIG_HPP
#define CALBAL_LEDGER_CONFIG_LEDGER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include <spdlog/common.h>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"

namespace calbal_ledger
{

/**
 * @brief Half-open local time-of-day window [start, end)
 */
struct TimeWindow
{
  std::chrono::seconds start;
  std::chrono::seconds end;

  [[nodiscard]] bool contains(std::chrono::seconds timeOfDay) const
  {
    return start <= timeOfDay && timeOfDay < end;
  }
};

/**
 * @brief Local-time windows used to pick the day's reference weights
 *
 * morning_weight is the first sample inside `morning`, evening_weight is the
 * last sample inside `evening`. Samples outside both windows are ignored
 * for those two fields.
 */
struct WeightWindowPolicy
{
  TimeWindow morning{std::chrono::hours{5}, std::chrono::hours{10}};
  TimeWindow evening{std::chrono::hours{18}, std::chrono::hours{23}};
};

/**
 * @brief Plausibility limits applied to incoming events
 */
struct ValidationLimits
{
  double minWeightKg{20.0};
  double maxWeightKg{500.0};
  double maxConsumedPerEvent{3000.0};  // [kcal]
  double maxBurnedPerEvent{2000.0};    // [kcal] one exercise session
  double maxBmrPerEvent{15000.0};      // [kcal] a whole day of basal burn
};

/**
 * @brief Exponential backoff for transient storage failures
 */
struct RetryPolicy
{
  uint32_t maxAttempts{5};
  std::chrono::milliseconds initialBackoff{10};
  double multiplier{2.0};
  std::chrono::milliseconds maxBackoff{1000};
};

enum class RecomputeMode : uint8_t
{
  Synchronous,  // recompute inline on the posting thread
  Queued        // recompute on the background worker
};

enum class GoalOverlapPolicy : uint8_t
{
  ResolveLatestStart,  // accept overlaps, resolve at read time
  RejectOverlap        // refuse an active goal overlapping another
};

/**
 * @brief Configuration for CalorieLedger and the components it owns
 */
struct LedgerConfig
{
  std::chrono::minutes utcOffset{0};  // local time minus UTC
  WeightWindowPolicy weightWindows{};
  ValidationLimits limits{};
  RecomputeMode recomputeMode{RecomputeMode::Synchronous};
  RetryPolicy retry{};
  uint32_t backfillMaxPerSecond{50};
  std::chrono::seconds rollupMaxStaleness{0};  // 0 disables the rollup cache
  std::chrono::hours profileValidity{24 * 30};
  GoalOverlapPolicy goalOverlapPolicy{GoalOverlapPolicy::ResolveLatestStart};
  std::string loggerName{"calbal"};
  spdlog::level::level_enum logLevel{spdlog::level::info};
  std::function<Timestamp()> clock;  // defaults to the system clock
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_CONFIG_LEDGER_CONFIG_HPP
