// Ticket: 0006_metabolic_profile_versioning

#include "calbal-ledger/src/Metabolic/MetabolicProfileRegistry.hpp"

#include <cmath>

#include "calbal-ledger/src/DataTypes/LedgerErrors.hpp"
#include "calbal-ledger/src/Metabolic/MetabolicCalculator.hpp"

namespace calbal_ledger
{

namespace
{

double relativeDrift(double previous, double current)
{
  if (previous == 0.0)
  {
    return current == 0.0 ? 0.0 : 1.0;
  }
  return std::abs(current - previous) / std::abs(previous);
}

}  // namespace

MetabolicProfileRegistry::MetabolicProfileRegistry(
  std::chrono::seconds validity,
  std::shared_ptr<spdlog::logger> logger)
  : validity_{validity}, logger_{std::move(logger)}
{
  if (validity_ <= std::chrono::seconds{0})
  {
    throw std::invalid_argument{"profile validity must be positive"};
  }
  if (!logger_)
  {
    throw std::invalid_argument{"MetabolicProfileRegistry requires a logger"};
  }
}

MetabolicProfile MetabolicProfileRegistry::calculate(
  const std::string& userId,
  const MetabolicInputs& inputs,
  Timestamp now)
{
  MetabolicProfile profile =
    MetabolicCalculator::buildProfile(userId, inputs, now, validity_);

  std::scoped_lock lock{mutex_};
  const MetabolicProfile& stored = store(std::move(profile));
  logger_->info("Metabolic profile v{} for user {}: BMR {:.2f}, TDEE {:.2f}",
                stored.version,
                userId,
                stored.bmrCalories,
                stored.tdeeCalories);
  return stored;
}

MetabolicProfile MetabolicProfileRegistry::applyAdjustment(
  const std::string& userId,
  double factor,
  Timestamp now)
{
  std::scoped_lock lock{mutex_};

  auto const it = profiles_.find(userId);
  if (it == profiles_.end() || it->second.empty() ||
      !it->second.back().isActive || it->second.back().isExpired(now))
  {
    throw NotFoundError{"no active metabolic profile for user " + userId};
  }

  MetabolicProfile profile = MetabolicCalculator::buildProfile(
    userId, it->second.back().inputs, now, validity_);
  profile.tdeeCalories =
    MetabolicCalculator::applyAiAdjustment(profile.tdeeCalories, factor);
  profile.aiAdjusted = true;
  profile.adjustmentFactor = factor;

  const MetabolicProfile& stored = store(std::move(profile));
  logger_->info("Metabolic profile v{} for user {} adjusted by {:.3f}: TDEE "
                "{:.2f}",
                stored.version,
                userId,
                factor,
                stored.tdeeCalories);
  return stored;
}

void MetabolicProfileRegistry::restore(const MetabolicProfile& profile)
{
  std::scoped_lock lock{mutex_};
  auto& versions = profiles_[profile.userId];
  if (!versions.empty() && profile.version <= versions.back().version)
  {
    logger_->debug("Skipping journaled profile v{} for user {}; already at v{}",
                   profile.version,
                   profile.userId,
                   versions.back().version);
    return;
  }
  if (profile.isActive)
  {
    for (auto& prior : versions)
    {
      prior.isActive = false;
    }
  }
  versions.push_back(profile);
}

std::optional<MetabolicProfile> MetabolicProfileRegistry::active(
  const std::string& userId,
  Timestamp now) const
{
  std::scoped_lock lock{mutex_};
  auto const it = profiles_.find(userId);
  if (it == profiles_.end() || it->second.empty())
  {
    return std::nullopt;
  }
  const MetabolicProfile& latest = it->second.back();
  if (!latest.isActive || latest.isExpired(now))
  {
    return std::nullopt;
  }
  return latest;
}

bool MetabolicProfileRegistry::needsRecalculation(
  const std::string& userId,
  const MetabolicInputs& inputs,
  Timestamp now) const
{
  auto const current = active(userId, now);
  if (!current)
  {
    return true;
  }
  if (current->inputs == inputs)
  {
    return false;
  }

  double const bmr = MetabolicCalculator::bmr(
    inputs.weightKg, inputs.heightCm, inputs.gender, inputs.ageYears);
  double const tdee = MetabolicCalculator::tdee(bmr, inputs.activityLevel);
  double const baseTdee = current->tdeeCalories / current->adjustmentFactor;

  return relativeDrift(current->bmrCalories, bmr) > kRecalculationThreshold ||
         relativeDrift(baseTdee, tdee) > kRecalculationThreshold;
}

std::vector<MetabolicProfile> MetabolicProfileRegistry::history(
  const std::string& userId) const
{
  std::scoped_lock lock{mutex_};
  auto const it = profiles_.find(userId);
  if (it == profiles_.end())
  {
    return {};
  }
  return it->second;
}

MetabolicProfile& MetabolicProfileRegistry::store(MetabolicProfile profile)
{
  auto& versions = profiles_[profile.userId];
  for (auto& prior : versions)
  {
    prior.isActive = false;
  }
  profile.version =
    versions.empty() ? 1 : versions.back().version + 1;
  profile.isActive = true;
  versions.push_back(std::move(profile));
  return versions.back();
}

}  // namespace calbal_ledger
