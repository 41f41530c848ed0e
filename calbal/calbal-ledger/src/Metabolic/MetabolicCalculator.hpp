// Ticket: 0005_metabolic_calculator

#ifndef CALBAL_LEDGER_METABOLIC_METABOLIC_CALCULATOR_HPP
#define CALBAL_LEDGER_METABOLIC_METABOLIC_CALCULATOR_HPP

#include <chrono>
#include <string>

#include "calbal-ledger/src/Metabolic/MetabolicProfile.hpp"

namespace calbal_ledger
{

/**
 * @brief Pure energy-expenditure formulas
 *
 * BMR uses Mifflin-St Jeor:
 *
 *   BMR = 10*w + 6.25*h - 5*a + s
 *
 * with s = +5 (male), -161 (female), -78 (other, midpoint of the two).
 * TDEE scales BMR by a fixed activity multiplier.
 *
 * Stateless; all members are static.
 *
 * @ticket 0005_metabolic_calculator
 */
class MetabolicCalculator
{
public:
  static constexpr const char* kMethod = "mifflin_st_jeor";
  static constexpr double kAccuracyScore = 0.85;
  static constexpr double kRmrToBmrRatio = 1.05;
  static constexpr double kMinAdjustmentFactor = 0.5;
  static constexpr double kMaxAdjustmentFactor = 2.0;

  /**
   * @brief Basal metabolic rate [kcal/day]
   * @throws ValidationError for implausible inputs
   */
  static double bmr(double weightKg,
                    double heightCm,
                    Gender gender,
                    int ageYears);

  static double activityMultiplier(ActivityLevel level);

  /**
   * @brief Total daily energy expenditure [kcal/day]
   */
  static double tdee(double bmr, ActivityLevel level);

  /**
   * @brief Multiplicative correction of a TDEE estimate
   * @throws ValidationError if factor is outside [0.5, 2.0]
   */
  static double applyAiAdjustment(double tdee, double factor);

  /// RMR estimate when no measurement is available
  static double estimateRmr(double bmr);

  /**
   * @throws ValidationError naming the first implausible attribute
   */
  static void validate(const MetabolicInputs& inputs);

  /**
   * @brief Unversioned, active profile computed from inputs
   */
  static MetabolicProfile buildProfile(const std::string& userId,
                                       const MetabolicInputs& inputs,
                                       Timestamp calculatedAt,
                                       std::chrono::seconds validity);
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_METABOLIC_METABOLIC_CALCULATOR_HPP
