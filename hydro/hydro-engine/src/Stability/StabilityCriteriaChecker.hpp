// Ticket: 0012_intact_stability_criteria

#ifndef HYDRO_ENGINE_STABILITY_STABILITY_CRITERIA_CHECKER_HPP
#define HYDRO_ENGINE_STABILITY_STABILITY_CRITERIA_CHECKER_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydro-engine/src/Numeric/Decimal.hpp"
#include "hydro-engine/src/Stability/StabilityCurve.hpp"

namespace hydro_engine
{

enum class CriterionKind
{
  AreaBetween,   ///< area under GZ between two angles [m rad]
  GzAt,          ///< GZ at an angle [m]
  AngleOfMaxGz,  ///< [deg]
  InitialGmt     ///< [m]
};

/// One rule: the measured quantity must be at least `required`
struct CriterionDefinition
{
  std::string name;
  CriterionKind kind{CriterionKind::AreaBetween};
  Decimal fromAngle{0};  // [deg], AreaBetween only
  Decimal toAngle{0};    // [deg], AreaBetween and GzAt
  Decimal required{0};
};

struct CriterionResult
{
  std::string name;
  Decimal required{0};
  std::optional<Decimal> actual;
  bool passed{false};
  std::string note;
};

struct CriteriaResult
{
  std::vector<CriterionResult> criteria;
  bool passed{false};
};

/**
 * @brief Evaluates a finished GZ curve against a fixed rule set
 *
 * Pure: the verdict depends only on the curve and the rule table. A rule the
 * curve cannot evaluate (angle outside the sampled range, no initial GMt)
 * fails with a note.
 *
 * @ticket 0012_intact_stability_criteria
 */
class StabilityCriteriaChecker
{
public:
  /// Checker with the IMO A.749 general intact stability criteria
  StabilityCriteriaChecker();

  explicit StabilityCriteriaChecker(std::vector<CriterionDefinition> criteria);

  /**
   * @brief Evaluate every criterion
   * @throws InvalidOperationError if the curve has fewer than 3 points
   */
  [[nodiscard]] CriteriaResult check(const StabilityCurve& curve) const;

  [[nodiscard]] const std::vector<CriterionDefinition>& criteria() const
  {
    return criteria_;
  }

  /// IMO Resolution A.749(18) 3.1.2 general criteria
  [[nodiscard]] static std::vector<CriterionDefinition> imoA749();

  /**
   * @brief Area under the GZ curve between two heel angles
   *
   * Trapezoidal over the curve points with linearly interpolated end points,
   * angles converted to radians.
   *
   * @return Area [m rad], or std::nullopt if the curve does not span the range
   */
  [[nodiscard]] static std::optional<Decimal> areaUnderCurve(
    const std::vector<StabilityCurvePoint>& points,
    const Decimal& fromAngle,
    const Decimal& toAngle);

  /// Linearly interpolated GZ, std::nullopt outside the sampled range
  [[nodiscard]] static std::optional<Decimal> gzAt(
    const std::vector<StabilityCurvePoint>& points,
    const Decimal& angle);

private:
  std::vector<CriterionDefinition> criteria_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_STABILITY_STABILITY_CRITERIA_CHECKER_HPP
