// Ticket: 0005_metabolic_calculator

#ifndef CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_HPP
#define CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "calbal-ledger/src/DataTypes/Calendar.hpp"
#include "calbal-ledger/src/DataTypes/EnergyTypes.hpp"

namespace calbal_ledger
{

/**
 * @brief User attributes supplied by the caller for one calculation
 */
struct MetabolicInputs
{
  double weightKg{0.0};
  double heightCm{0.0};
  Gender gender{Gender::Other};
  int ageYears{0};
  ActivityLevel activityLevel{ActivityLevel::Sedentary};

  bool operator==(const MetabolicInputs&) const = default;
};

/**
 * @brief One immutable version of a user's metabolic calculation
 *
 * A new calculation appends a new version and deactivates the prior one.
 * All energies in [kcal/day].
 *
 * @ticket 0005_metabolic_calculator
 */
struct MetabolicProfile
{
  std::string userId;
  uint32_t version{0};
  MetabolicInputs inputs;

  double bmrCalories{0.0};
  double tdeeCalories{0.0};
  std::optional<double> rmrCalories;
  std::string calculationMethod;
  double accuracyScore{0.0};
  // Indexed by ActivityLevel, sedentary through extreme
  std::array<double, 5> activityMultipliers{};

  bool aiAdjusted{false};
  double adjustmentFactor{1.0};

  Timestamp calculatedAt{};
  Timestamp expiresAt{};
  bool isActive{false};

  [[nodiscard]] bool isExpired(Timestamp now) const
  {
    return !(now < expiresAt);
  }
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_HPP
