// Ticket: 0006_metabolic_profile_versioning

#ifndef CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_REGISTRY_HPP
#define CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_REGISTRY_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "calbal-ledger/src/Metabolic/MetabolicProfile.hpp"

namespace calbal_ledger
{

/**
 * @brief Append-only version history of metabolic profiles per user
 *
 * Invariant: at most one profile per user has isActive == true, and it is
 * always the latest version. Expired profiles stay active in the history
 * but are not served by active().
 *
 * @ticket 0006_metabolic_profile_versioning
 */
class MetabolicProfileRegistry
{
public:
  /// Relative BMR or TDEE drift that triggers recalculation
  static constexpr double kRecalculationThreshold = 0.05;

  MetabolicProfileRegistry(std::chrono::seconds validity,
                           std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Calculate and store a new active version
   * @throws ValidationError for implausible inputs
   */
  MetabolicProfile calculate(const std::string& userId,
                             const MetabolicInputs& inputs,
                             Timestamp now);

  /**
   * @brief Store a new ai_adjusted version derived from the active inputs
   *
   * The factor applies to the unadjusted TDEE, so adjustments never
   * compound.
   *
   * @throws NotFoundError if the user has no unexpired active profile
   * @throws ValidationError if factor is outside [0.5, 2.0]
   */
  MetabolicProfile applyAdjustment(const std::string& userId,
                                   double factor,
                                   Timestamp now);

  /**
   * @brief Re-insert a journaled version verbatim (replay)
   */
  void restore(const MetabolicProfile& profile);

  [[nodiscard]] std::optional<MetabolicProfile> active(
    const std::string& userId,
    Timestamp now) const;

  [[nodiscard]] bool needsRecalculation(const std::string& userId,
                                        const MetabolicInputs& inputs,
                                        Timestamp now) const;

  [[nodiscard]] std::vector<MetabolicProfile> history(
    const std::string& userId) const;

private:
  MetabolicProfile& store(MetabolicProfile profile);

  std::chrono::seconds validity_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::map<std::string, std::vector<MetabolicProfile>> profiles_;
};

}  // namespace calbal_ledger

#endif  // CALBAL_LEDGER_METABOLIC_METABOLIC_PROFILE_REGISTRY_HPP
