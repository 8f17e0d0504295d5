// Ticket: 0011_righting_arm_curve

#ifndef HYDRO_ENGINE_STABILITY_STABILITY_CURVE_HPP
#define HYDRO_ENGINE_STABILITY_STABILITY_CURVE_HPP

#include <optional>
#include <string>
#include <vector>

#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

enum class StabilityMethod
{
  FullImmersion,  ///< heeled hull integrated at equal displaced volume
  WallSided       ///< GZ = sin(phi) (GM + BMt tan^2(phi) / 2)
};

struct StabilityCurvePoint
{
  Decimal heelAngle{0};  // [deg]
  Decimal gz{0};         // [m]
  Decimal kn{0};         // [m]
};

/**
 * @brief Righting-arm curve of one loadcase
 *
 * Points are in strictly increasing heel angle. Max GZ and its angle come
 * from scanning the points.
 */
struct StabilityCurve
{
  std::string loadcaseId;
  StabilityMethod method{StabilityMethod::FullImmersion};
  Decimal kg{0};
  Decimal draft{0};
  Decimal volume{0};
  Decimal displacement{0};
  std::optional<Decimal> initialGmt;
  std::vector<StabilityCurvePoint> points;
  Decimal maxGz{0};
  Decimal angleOfMaxGz{0};
};

/**
 * @brief Point of largest GZ; the first occurrence wins a tie
 *
 * @param points Non-empty curve points
 */
inline const StabilityCurvePoint& maximumRightingArm(
  const std::vector<StabilityCurvePoint>& points)
{
  const StabilityCurvePoint* best = &points.front();
  for (const auto& point : points)
  {
    if (point.gz > best->gz)
    {
      best = &point;
    }
  }
  return *best;
}

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_STABILITY_STABILITY_CURVE_HPP
