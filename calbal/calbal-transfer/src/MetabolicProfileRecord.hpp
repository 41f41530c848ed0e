// Ticket: 0016_ledger_journal

#ifndef CALBAL_TRANSFER_METABOLIC_PROFILE_RECORD_HPP
#define CALBAL_TRANSFER_METABOLIC_PROFILE_RECORD_HPP

#include <cstdint>
#include <limits>
#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace calbal_transfer
{

/**
 * @brief Journal record of one metabolic profile version
 *
 * Inputs are stored beside the results so an ai_adjusted version can be
 * rebuilt after replay. All energies in [kcal/day].
 *
 * @ticket 0016_ledger_journal
 */
struct MetabolicProfileRecord : public cpp_sqlite::BaseTransferObject
{
  std::string user_id;
  uint32_t version{0};

  double weight_kg{0.0};
  double height_cm{0.0};
  std::string gender;
  uint32_t age_years{0};
  std::string activity_level;

  double bmr_calories{0.0};
  double tdee_calories{0.0};
  double rmr_calories{std::numeric_limits<double>::quiet_NaN()};
  std::string calculation_method;
  double accuracy_score{0.0};

  // Activity multipliers, sedentary through extreme
  double multiplier_sedentary{0.0};
  double multiplier_light{0.0};
  double multiplier_moderate{0.0};
  double multiplier_high{0.0};
  double multiplier_extreme{0.0};

  uint32_t ai_adjusted{0};  // Boolean as uint32_t for SQLite
  double adjustment_factor{1.0};
  std::string calculated_at;
  std::string expires_at;
  uint32_t is_active{1};  // Boolean as uint32_t for SQLite
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(MetabolicProfileRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (user_id,
                       version,
                       weight_kg,
                       height_cm,
                       gender,
                       age_years,
                       activity_level,
                       bmr_calories,
                       tdee_calories,
                       rmr_calories,
                       calculation_method,
                       accuracy_score,
                       multiplier_sedentary,
                       multiplier_light,
                       multiplier_moderate,
                       multiplier_high,
                       multiplier_extreme,
                       ai_adjusted,
                       adjustment_factor,
                       calculated_at,
                       expires_at,
                       is_active));

}  // namespace calbal_transfer

#endif  // CALBAL_TRANSFER_METABOLIC_PROFILE_RECORD_HPP
