// Ticket: 0012_intact_stability_criteria

#include "hydro-engine/src/Stability/StabilityCriteriaChecker.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace
{

constexpr size_t kMinimumCurvePoints = 3;

Decimal interpolateGz(const StabilityCurvePoint& a,
                      const StabilityCurvePoint& b,
                      const Decimal& angle)
{
  const Decimal t = (angle - a.heelAngle) / (b.heelAngle - a.heelAngle);
  return a.gz + t * (b.gz - a.gz);
}

}  // namespace

StabilityCriteriaChecker::StabilityCriteriaChecker()
  : StabilityCriteriaChecker{imoA749()}
{
}

StabilityCriteriaChecker::StabilityCriteriaChecker(
  std::vector<CriterionDefinition> criteria)
  : criteria_{std::move(criteria)}
{
}

std::vector<CriterionDefinition> StabilityCriteriaChecker::imoA749()
{
  return {
    {"Area 0-30 deg", CriterionKind::AreaBetween, Decimal{0}, Decimal{30}, Decimal{"0.055"}},
    {"Area 0-40 deg", CriterionKind::AreaBetween, Decimal{0}, Decimal{40}, Decimal{"0.090"}},
    {"Area 30-40 deg", CriterionKind::AreaBetween, Decimal{30}, Decimal{40}, Decimal{"0.030"}},
    {"GZ at 30 deg", CriterionKind::GzAt, Decimal{0}, Decimal{30}, Decimal{"0.20"}},
    {"Angle of max GZ", CriterionKind::AngleOfMaxGz, Decimal{0}, Decimal{0}, Decimal{25}},
    {"Initial GMt", CriterionKind::InitialGmt, Decimal{0}, Decimal{0}, Decimal{"0.15"}}};
}

CriteriaResult StabilityCriteriaChecker::check(const StabilityCurve& curve) const
{
  if (curve.points.size() < kMinimumCurvePoints)
  {
    throw InvalidOperationError("Stability criteria need at least 3 curve points, got " +
                                std::to_string(curve.points.size()));
  }

  CriteriaResult result;
  result.passed = true;
  for (const auto& criterion : criteria_)
  {
    CriterionResult outcome;
    outcome.name = criterion.name;
    outcome.required = criterion.required;

    switch (criterion.kind)
    {
      case CriterionKind::AreaBetween:
        outcome.actual =
          areaUnderCurve(curve.points, criterion.fromAngle, criterion.toAngle);
        if (!outcome.actual)
        {
          outcome.note = "Curve does not span " + criterion.fromAngle.str() + " to " +
                         criterion.toAngle.str() + " deg";
        }
        break;
      case CriterionKind::GzAt:
        outcome.actual = gzAt(curve.points, criterion.toAngle);
        if (!outcome.actual)
        {
          outcome.note = "Curve does not reach " + criterion.toAngle.str() + " deg";
        }
        break;
      case CriterionKind::AngleOfMaxGz:
        // Scanned from the points, not the stored angle
        outcome.actual = maximumRightingArm(curve.points).heelAngle;
        break;
      case CriterionKind::InitialGmt:
        outcome.actual = curve.initialGmt;
        if (!outcome.actual)
        {
          outcome.note = "Initial GMt not available";
        }
        break;
    }

    if (outcome.actual)
    {
      outcome.actual = Numeric::quantize(*outcome.actual);
      outcome.passed = *outcome.actual >= criterion.required;
    }
    result.passed = result.passed && outcome.passed;

    spdlog::debug("Criterion '{}': {} (required {})",
                  outcome.name,
                  outcome.passed ? "pass" : "fail",
                  Numeric::toDouble(criterion.required));
    result.criteria.push_back(std::move(outcome));
  }
  return result;
}

std::optional<Decimal> StabilityCriteriaChecker::areaUnderCurve(
  const std::vector<StabilityCurvePoint>& points,
  const Decimal& fromAngle,
  const Decimal& toAngle)
{
  if (points.size() < 2 || fromAngle >= toAngle ||
      fromAngle < points.front().heelAngle || toAngle > points.back().heelAngle)
  {
    return std::nullopt;
  }

  Decimal areaDegrees{0};
  for (size_t i = 1; i < points.size(); ++i)
  {
    const auto& a = points[i - 1];
    const auto& b = points[i];

    const Decimal lo = std::max(a.heelAngle, fromAngle);
    const Decimal hi = std::min(b.heelAngle, toAngle);
    if (hi <= lo)
    {
      continue;
    }

    areaDegrees += (interpolateGz(a, b, lo) + interpolateGz(a, b, hi)) / 2 * (hi - lo);
  }
  return Numeric::degreesToRadians(areaDegrees);
}

std::optional<Decimal> StabilityCriteriaChecker::gzAt(
  const std::vector<StabilityCurvePoint>& points,
  const Decimal& angle)
{
  if (points.empty() || angle < points.front().heelAngle ||
      angle > points.back().heelAngle)
  {
    return std::nullopt;
  }

  for (size_t i = 1; i < points.size(); ++i)
  {
    if (angle <= points[i].heelAngle)
    {
      return interpolateGz(points[i - 1], points[i], angle);
    }
  }
  return points.front().gz;
}

}  // namespace hydro_engine
