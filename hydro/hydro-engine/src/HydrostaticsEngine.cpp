// Ticket: 0013_hydrostatics_engine_facade

#include "hydro-engine/src/HydrostaticsEngine.hpp"

#include <utility>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

HydrostaticsEngine::HydrostaticsEngine(const VesselDataProvider& provider)
  : HydrostaticsEngine{provider, HydroCalculator::Config{}}
{
}

HydrostaticsEngine::HydrostaticsEngine(const VesselDataProvider& provider,
                                       HydroCalculator::Config calculatorConfig)
  : provider_{provider}, calculator_{calculatorConfig}, criteriaChecker_{}
{
}

HydroResult HydrostaticsEngine::computeAt(const std::string& vesselId,
                                          const std::string& loadcaseId,
                                          const Decimal& draft,
                                          const std::optional<Decimal>& trimAngle,
                                          const std::optional<Decimal>& heelAngle) const
{
  const Vessel vessel = provider_.vessel(vesselId);
  const Loadcase loadcase = resolveLoadcase(vesselId, loadcaseId);
  return calculator_.compute(vessel, loadcase, FloatingCondition{draft, trimAngle, heelAngle});
}

std::vector<HydroResult> HydrostaticsEngine::computeTable(const std::string& vesselId,
                                                          const std::string& loadcaseId,
                                                          std::span<const Decimal> drafts,
                                                          std::stop_token stopToken) const
{
  const Vessel vessel = provider_.vessel(vesselId);
  const Loadcase loadcase = resolveLoadcase(vesselId, loadcaseId);
  return calculator_.computeTable(vessel, loadcase, drafts, std::move(stopToken));
}

TrimSolverResult HydrostaticsEngine::solveTrim(const std::string& vesselId,
                                               const std::string& loadcaseId,
                                               const TrimRequest& request) const
{
  const Vessel vessel = provider_.vessel(vesselId);
  const Loadcase loadcase = resolveLoadcase(vesselId, loadcaseId);
  const TrimSolver solver{calculator_};
  return solver.solve(vessel, loadcase, request);
}

bool HydrostaticsEngine::isDisplacementAchievable(const std::string& vesselId,
                                                  const std::string& loadcaseId,
                                                  const Decimal& targetDisplacement,
                                                  TargetKind targetKind) const
{
  const Vessel vessel = provider_.vessel(vesselId);
  const Loadcase loadcase = resolveLoadcase(vesselId, loadcaseId);
  const TrimSolver solver{calculator_};
  return solver.isAchievable(vessel, loadcase, targetDisplacement, targetKind);
}

std::vector<Curve> HydrostaticsEngine::generateCurves(const std::string& vesselId,
                                                      const std::string& loadcaseId,
                                                      const CurveRequest& request,
                                                      std::stop_token stopToken) const
{
  const Vessel vessel = provider_.vessel(vesselId);
  const Loadcase loadcase = resolveLoadcase(vesselId, loadcaseId);
  const CurveGenerator generator{calculator_};
  return generator.generate(vessel, loadcase, request, std::move(stopToken));
}

StabilityCurve HydrostaticsEngine::computeStabilityCurve(const std::string& loadcaseId,
                                                         const StabilityRequest& request,
                                                         std::stop_token stopToken) const
{
  const Loadcase loadcase = provider_.loadcase(loadcaseId);
  const Vessel vessel = provider_.vessel(loadcase.vesselId);
  const StabilityCalculator calculator{calculator_};
  return calculator.compute(vessel, loadcase, request, std::move(stopToken));
}

CriteriaResult HydrostaticsEngine::checkCriteria(const StabilityCurve& curve) const
{
  return criteriaChecker_.check(curve);
}

Loadcase HydrostaticsEngine::resolveLoadcase(const std::string& vesselId,
                                             const std::string& loadcaseId) const
{
  if (loadcaseId.empty())
  {
    Loadcase seaWater;
    seaWater.vesselId = vesselId;
    seaWater.name = "Sea water";
    return seaWater;
  }

  Loadcase loadcase = provider_.loadcase(loadcaseId);
  if (loadcase.vesselId != vesselId)
  {
    throw ArgumentError("Loadcase '" + loadcaseId + "' belongs to vessel '" +
                        loadcase.vesselId + "', not '" + vesselId + "'");
  }
  return loadcase;
}

}  // namespace hydro_engine
