// Ticket: 0011_righting_arm_curve

#include "hydro-engine/src/Stability/StabilityCalculator.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Solvers/TrimSolver.hpp"

namespace hydro_engine
{

StabilityCalculator::StabilityCalculator(const HydroCalculator& calculator)
  : StabilityCalculator{calculator, Config{}}
{
}

StabilityCalculator::StabilityCalculator(const HydroCalculator& calculator,
                                         Config config)
  : calculator_{calculator}, config_{std::move(config)}
{
}

StabilityCurve StabilityCalculator::compute(const Vessel& vessel,
                                            const Loadcase& loadcase,
                                            const StabilityRequest& request,
                                            std::stop_token stopToken) const
{
  if (!loadcase.kg)
  {
    throw ArgumentError("Stability curve requires KG on loadcase '" + loadcase.id + "'");
  }
  if (abs(request.minAngle) >= 90 || abs(request.maxAngle) >= 90)
  {
    throw ArgumentError("Heel angles must lie strictly between -90 and 90 degrees");
  }
  const auto angles =
    sampleAngles(request.minAngle, request.maxAngle, request.angleIncrement);

  if (!vessel.geometry)
  {
    throw NotFoundError("Hull geometry of vessel '" + vessel.id + "' not found");
  }
  const HullGeometry& geometry = *vessel.geometry;
  const Decimal& kg = *loadcase.kg;

  const Decimal draft = resolveDraft(vessel, loadcase, request);
  const FloatingCondition upright{draft, {}, {}};
  const HydroResult uprightResult = calculator_.compute(vessel, loadcase, upright);
  const HullIntegrals uprightIntegrals = calculator_.integrate(geometry, upright);

  const Decimal& targetVolume = uprightIntegrals.volume;
  const Decimal initialGm =
    uprightIntegrals.kb() + uprightIntegrals.transverseInertia() / targetVolume - kg;
  const Decimal bmt = uprightIntegrals.transverseInertia() / targetVolume;

  const auto quantize = [this](const Decimal& value)
  { return Numeric::quantize(value, calculator_.config().resultDigits); };

  const SectionIntegrator integrator{geometry, calculator_.config().aboveRange};

  StabilityCurve curve;
  curve.loadcaseId = loadcase.id;
  curve.method = request.method;
  curve.kg = quantize(kg);
  curve.draft = uprightResult.draft;
  curve.volume = uprightResult.volume;
  curve.displacement = uprightResult.displacement;
  curve.initialGmt = uprightResult.gmt;
  curve.points.reserve(angles.size());

  for (const auto& angle : angles)
  {
    if (stopToken.stop_requested())
    {
      throw OperationCancelledError("Stability sweep cancelled after " +
                                    std::to_string(curve.points.size()) + " of " +
                                    std::to_string(angles.size()) + " angles");
    }

    StabilityCurvePoint point{angle, Decimal{0}, Decimal{0}};
    if (angle != 0)
    {
      const Inclination inclination = Inclination::fromDegrees(angle);

      if (request.method == StabilityMethod::WallSided)
      {
        const Decimal tanPhi = inclination.sine / inclination.cosine;
        point.gz = inclination.sine * (initialGm + bmt * tanPhi * tanPhi / 2);
        point.kn = point.gz + kg * inclination.sine;
      }
      else
      {
        const Decimal level = solveWaterLevel(integrator, inclination, targetVolume);
        const HullIntegrals heeled = integrateAtLevel(integrator, level, inclination);

        point.kn = inclination.alongWaterline(heeled.tcb(), heeled.kb());
        point.gz = point.kn - kg * inclination.sine;
      }
    }

    point.gz = quantize(point.gz);
    point.kn = quantize(point.kn);
    curve.points.push_back(point);

    spdlog::debug("Heel {} deg: GZ={} m, KN={} m",
                  Numeric::toDouble(angle),
                  Numeric::toDouble(point.gz),
                  Numeric::toDouble(point.kn));
  }

  const StabilityCurvePoint& best = maximumRightingArm(curve.points);
  curve.maxGz = best.gz;
  curve.angleOfMaxGz = best.heelAngle;

  return curve;
}

std::vector<Decimal> StabilityCalculator::sampleAngles(const Decimal& minAngle,
                                                       const Decimal& maxAngle,
                                                       const Decimal& increment)
{
  if (increment <= 0)
  {
    throw ArgumentError("Angle increment must be positive, got " + increment.str());
  }
  if (minAngle >= maxAngle)
  {
    throw ArgumentError("Minimum angle " + minAngle.str() +
                        " must be below maximum angle " + maxAngle.str());
  }

  std::vector<Decimal> angles;
  for (Decimal angle = minAngle; angle <= maxAngle; angle += increment)
  {
    angles.push_back(angle);
  }
  if (angles.back() < maxAngle)
  {
    angles.push_back(maxAngle);
  }
  return angles;
}

Decimal StabilityCalculator::solveWaterLevel(const SectionIntegrator& integrator,
                                             const Inclination& inclination,
                                             const Decimal& targetVolume) const
{
  auto [lo, hi] = integrator.levelRange(inclination);

  Decimal fLo = -targetVolume;
  Decimal fHi = integrateAtLevel(integrator, hi, inclination).volume - targetVolume;
  if (fHi < 0)
  {
    throw InvalidOperationError("Hull cannot displace " + targetVolume.str() +
                                " m^3 when heeled");
  }
  if (fHi == 0)
  {
    return hi;
  }

  const Decimal volumeTolerance = config_.volumeTolerance * targetVolume;
  int retainedSide = 0;
  for (int i = 0; i < config_.maxLevelIterations; ++i)
  {
    Decimal level = (lo * fHi - hi * fLo) / (fHi - fLo);
    if (level <= lo || level >= hi)
    {
      level = (lo + hi) / 2;
    }

    const Decimal f = integrateAtLevel(integrator, level, inclination).volume - targetVolume;
    if (abs(f) <= volumeTolerance || hi - lo <= config_.levelTolerance)
    {
      return level;
    }

    // Illinois modification: halve the stale end's value when it is kept twice
    if (f < 0)
    {
      lo = level;
      fLo = f;
      if (retainedSide == -1)
      {
        fHi /= 2;
      }
      retainedSide = -1;
    }
    else
    {
      hi = level;
      fHi = f;
      if (retainedSide == 1)
      {
        fLo /= 2;
      }
      retainedSide = 1;
    }
  }

  spdlog::warn("Water level search stopped after {} iterations (bracket {} m)",
               config_.maxLevelIterations,
               Numeric::toDouble(hi - lo));
  return (lo + hi) / 2;
}

Decimal StabilityCalculator::resolveDraft(const Vessel& vessel,
                                          const Loadcase& loadcase,
                                          const StabilityRequest& request) const
{
  if (request.draft)
  {
    if (*request.draft <= 0)
    {
      throw ArgumentError("Draft must be positive, got " + request.draft->str());
    }
    return *request.draft;
  }

  if (loadcase.targetDisplacement)
  {
    TrimSolver::Config trimConfig;
    trimConfig.balanceTrimmingMoment = false;
    trimConfig.tolerance = *loadcase.targetDisplacement * Decimal{"1e-9"};
    const TrimSolver solver{calculator_, trimConfig};

    const Decimal start =
      vessel.designDraft.value_or(vessel.geometry->topHeight() / 2);
    const TrimSolverResult solution =
      solver.solve(vessel,
                   loadcase,
                   TrimRequest{*loadcase.targetDisplacement, start, start, TargetKind::Weight, {}, {}});
    if (!solution.converged)
    {
      throw InvalidOperationError("No equilibrium draft for displacement " +
                                  loadcase.targetDisplacement->str() + " kg");
    }
    return solution.meanDraft;
  }

  if (vessel.designDraft)
  {
    return *vessel.designDraft;
  }

  throw ArgumentError("Loadcase '" + loadcase.id +
                      "' has no target displacement and vessel '" + vessel.id +
                      "' has no design draft");
}

HullIntegrals StabilityCalculator::integrateAtLevel(const SectionIntegrator& integrator,
                                                    const Decimal& waterLevel,
                                                    const Inclination& inclination)
{
  const size_t nStations = integrator.geometry().stationCount();
  std::vector<SectionProperties> sections;
  sections.reserve(nStations);
  for (size_t i = 0; i < nStations; ++i)
  {
    sections.push_back(integrator.inclined(i, waterLevel, inclination));
  }
  return LongitudinalIntegrator::integrate(integrator.geometry().stationX(), sections);
}

}  // namespace hydro_engine
