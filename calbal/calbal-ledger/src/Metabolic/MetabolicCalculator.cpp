// Ticket: 0005_metabolic_calculator

#include "calbal-ledger/src/Metabolic/MetabolicCalculator.hpp"

#include <cmath>

#include <fmt/format.h>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"

namespace calbal_ledger
{

namespace
{

double genderOffset(Gender gender)
{
  switch (gender)
  {
    case Gender::Male:
      return 5.0;
    case Gender::Female:
      return -161.0;
    case Gender::Other:
      return -78.0;
  }
  return -78.0;
}

}  // namespace

double MetabolicCalculator::bmr(double weightKg,
                                double heightCm,
                                Gender gender,
                                int ageYears)
{
  validate(MetabolicInputs{weightKg, heightCm, gender, ageYears, {}});
  return 10.0 * weightKg + 6.25 * heightCm - 5.0 * ageYears +
         genderOffset(gender);
}

double MetabolicCalculator::activityMultiplier(ActivityLevel level)
{
  switch (level)
  {
    case ActivityLevel::Sedentary:
      return 1.2;
    case ActivityLevel::Light:
      return 1.375;
    case ActivityLevel::Moderate:
      return 1.55;
    case ActivityLevel::High:
      return 1.725;
    case ActivityLevel::Extreme:
      return 1.9;
  }
  return 1.2;
}

double MetabolicCalculator::tdee(double bmr, ActivityLevel level)
{
  if (!std::isfinite(bmr) || bmr <= 0.0)
  {
    throw ValidationError{"bmr", fmt::format("{} is not a positive rate", bmr)};
  }
  return bmr * activityMultiplier(level);
}

double MetabolicCalculator::applyAiAdjustment(double tdee, double factor)
{
  if (std::isnan(factor) || factor < kMinAdjustmentFactor ||
      factor > kMaxAdjustmentFactor)
  {
    throw ValidationError{"adjustment_factor",
                          fmt::format("{} is outside [{}, {}]",
                                      factor,
                                      kMinAdjustmentFactor,
                                      kMaxAdjustmentFactor)};
  }
  return tdee * factor;
}

double MetabolicCalculator::estimateRmr(double bmr)
{
  return bmr * kRmrToBmrRatio;
}

void MetabolicCalculator::validate(const MetabolicInputs& inputs)
{
  if (!std::isfinite(inputs.weightKg) || inputs.weightKg < 20.0 ||
      inputs.weightKg > 500.0)
  {
    throw ValidationError{
      "weight", fmt::format("{} kg is outside [20, 500]", inputs.weightKg)};
  }
  if (!std::isfinite(inputs.heightCm) || inputs.heightCm <= 0.0 ||
      inputs.heightCm > 300.0)
  {
    throw ValidationError{
      "height", fmt::format("{} cm is outside (0, 300]", inputs.heightCm)};
  }
  if (inputs.ageYears < 1 || inputs.ageYears > 130)
  {
    throw ValidationError{
      "age", fmt::format("{} years is outside [1, 130]", inputs.ageYears)};
  }
}

MetabolicProfile MetabolicCalculator::buildProfile(
  const std::string& userId,
  const MetabolicInputs& inputs,
  Timestamp calculatedAt,
  std::chrono::seconds validity)
{
  if (userId.empty())
  {
    throw ValidationError{"user_id", "must not be empty"};
  }

  MetabolicProfile profile;
  profile.userId = userId;
  profile.inputs = inputs;
  profile.bmrCalories =
    bmr(inputs.weightKg, inputs.heightCm, inputs.gender, inputs.ageYears);
  profile.tdeeCalories = tdee(profile.bmrCalories, inputs.activityLevel);
  profile.rmrCalories = estimateRmr(profile.bmrCalories);
  profile.calculationMethod = kMethod;
  profile.accuracyScore = kAccuracyScore;
  for (ActivityLevel const level : kAllActivityLevels)
  {
    profile.activityMultipliers[static_cast<size_t>(level)] =
      activityMultiplier(level);
  }
  profile.calculatedAt = calculatedAt;
  profile.expiresAt = calculatedAt + validity;
  profile.isActive = true;
  return profile;
}

}  // namespace calbal_ledger
