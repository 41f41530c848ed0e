// Ticket: 0012_temporal_rollups

#ifndef CALBAL_LEDGER_ROLLUP_ROLLUP_ROWS_HPP
#define CALBAL_LEDGER_ROLLUP_ROLLUP_ROWS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"

namespace calbal_ledger
{

enum class RollupGranularity : uint8_t
{
  Hourly,
  Daily,
  Weekly,
  Monthly,
  BalanceSummary
};

std::string_view toString(RollupGranularity granularity);

/**
 * @throws ValidationError for an unknown name
 */
RollupGranularity parseRollupGranularity(std::string_view name);

/**
 * @brief Additive calorie sums of one bucket [kcal]
 */
struct EnergySums
{
  double consumed{0.0};
  double burnedExercise{0.0};
  double burnedBmr{0.0};

  [[nodiscard]] double totalBurned() const
  {
    return burnedExercise + burnedBmr;
  }

  [[nodiscard]] double net() const
  {
    return consumed - totalBurned();
  }

  bool operator==(const EnergySums&) const = default;
};

struct HourlyRollup
{
  Date date{};
  unsigned hour{0};  // local hour-of-day
  EnergySums energy;
  uint32_t eventCount{0};
  uint32_t sourceVariety{0};
  std::optional<double> lastWeight;
  std::optional<double> averageConfidence;
};

struct DailyRollup
{
  Date date{};
  EnergySums energy;
  std::optional<double> morningWeight;
  std::optional<double> eveningWeight;
  uint32_t eventCount{0};
  uint32_t activeHours{0};
  std::optional<double> goalTarget;
  uint32_t sourceVariety{0};
  std::optional<double> averageConfidence;
};

/**
 * @brief ISO week (Monday to Sunday)
 */
struct WeeklyRollup
{
  Date weekStart{};
  Date weekEnd{};
  int isoYear{0};
  unsigned isoWeek{0};
  EnergySums energy;
  uint32_t activeDays{0};
  double averageDailyConsumed{0.0};  // over max(activeDays, 1)
  double averageDailyBurned{0.0};
  std::optional<double> weekStartWeight;
  std::optional<double> weekEndWeight;
  uint32_t eventCount{0};
};

struct MonthlyRollup
{
  Date monthStart{};
  Date monthEnd{};
  int year{0};
  unsigned month{0};
  std::string label;  // "YYYY-MM"
  EnergySums energy;
  uint32_t activeDays{0};
  uint32_t activeWeeks{0};  // distinct ISO weeks with events
  double averageDailyConsumed{0.0};
  double averageWeeklyConsumed{0.0};
  std::optional<double> monthStartWeight;
  std::optional<double> monthEndWeight;
  uint32_t eventCount{0};
};

/**
 * @brief Goal-deviation view of one day
 *
 * goalAchieved is net <= target + deficitTarget when the goal in force has
 * a deficit target, absent otherwise.
 */
struct BalanceSummaryRollup
{
  Date date{};
  EnergySums energy;
  std::optional<double> morningWeight;
  std::optional<double> eveningWeight;
  std::optional<double> averageWeight;
  std::optional<double> dailyWeightChange;  // evening - morning
  std::optional<double> dailyCalorieTarget;
  std::optional<double> dailyDeficitTarget;
  std::optional<GoalType> goalType;
  std::optional<double> targetDeviation;
  std::optional<bool> goalAchieved;
  double dataCompletenessScore{0.0};
  uint32_t eventCount{0};
  std::optional<double> averageConfidence;
};

using RollupRow = std::variant<HourlyRollup,
                               DailyRollup,
                               WeeklyRollup,
                               MonthlyRollup,
                               BalanceSummaryRollup>;

/**
 * @brief Rows of one rollup query plus the freshness watermark
 *
 * eventSequence is the user's EventStore::sequence() observed when the
 * rows were computed; a larger current sequence means the snapshot is
 * stale.
 */
struct RollupSnapshot
{
  RollupGranularity granularity{RollupGranularity::Daily};
  std::vector<RollupRow> rows;
  Timestamp computedAt{};
  uint64_t eventSequence{0};
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_ROLLUP_ROLLUP_ROWS_HPP
