#include <exception>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/HydrostaticsEngine.hpp"
#include "hydro-engine/src/Utils/HullFactory.hpp"
#include "hydro-engine/src/Vessel/InMemoryVesselRepository.hpp"

using namespace hydro_engine;

namespace
{

void registerWigley(InMemoryVesselRepository& repository)
{
  Vessel vessel;
  vessel.id = "wigley";
  vessel.name = "Wigley parabolic hull";
  vessel.lpp = Decimal{100};
  vessel.beam = Decimal{10};
  vessel.designDraft = Decimal{"6.25"};
  vessel.geometry = std::make_shared<const HullGeometry>(HullFactory::createWigley(
    Decimal{100}, Decimal{10}, Decimal{"6.25"}, 21, 13, Decimal{"7.8125"}));
  repository.putVessel(vessel);

  Loadcase loadcase;
  loadcase.id = "wigley-departure";
  loadcase.vesselId = vessel.id;
  loadcase.name = "Departure";
  loadcase.kg = Decimal{"4.45"};
  loadcase.lcg = Decimal{"49.5"};
  repository.putLoadcase(loadcase);
}

void registerBarge(InMemoryVesselRepository& repository)
{
  Vessel vessel;
  vessel.id = "barge";
  vessel.name = "Box barge";
  vessel.lpp = Decimal{100};
  vessel.beam = Decimal{20};
  vessel.designDraft = Decimal{5};
  vessel.geometry = std::make_shared<const HullGeometry>(
    HullFactory::createBarge(Decimal{100}, Decimal{20}, Decimal{10}, 11, 11));
  repository.putVessel(vessel);
}

void run(const HydrostaticsEngine& engine)
{
  const auto barge = engine.computeAt("barge", "", Decimal{5});
  spdlog::info("Barge at T=5 m: V={} m^3, KB={} m, BMt={} m, TPC={} t/cm",
               Numeric::toDouble(barge.volume),
               Numeric::toDouble(barge.kb),
               Numeric::toDouble(barge.bmt),
               Numeric::toDouble(barge.tpc));

  const std::vector<Decimal> drafts{Decimal{2}, Decimal{4}, Decimal{6}};
  for (const auto& row : engine.computeTable("wigley", "wigley-departure", drafts))
  {
    spdlog::info("Wigley T={} m: displacement {} kg, Cb={}, GMt={} m",
                 Numeric::toDouble(row.draft),
                 Numeric::toDouble(row.displacement),
                 Numeric::toDouble(row.cb),
                 row.gmt ? Numeric::toDouble(*row.gmt) : 0.0);
  }

  TrimRequest request;
  request.targetDisplacement = Decimal{2500000};
  request.initialForwardDraft = Decimal{5};
  request.initialAftDraft = Decimal{5};
  spdlog::info("Target {} kg achievable: {}",
               Numeric::toDouble(request.targetDisplacement),
               engine.isDisplacementAchievable("wigley", "wigley-departure",
                                               request.targetDisplacement));
  const auto trim = engine.solveTrim("wigley", "wigley-departure", request);
  spdlog::info("Equilibrium: T fwd {} m, T aft {} m, converged={} after {} iterations",
               Numeric::toDouble(trim.draftForward),
               Numeric::toDouble(trim.draftAft),
               trim.converged,
               trim.iterations);

  CurveRequest curves;
  curves.types = {CurveType::Displacement, CurveType::KB, CurveType::GMt};
  curves.minDraft = Decimal{1};
  curves.maxDraft = Decimal{"6.25"};
  curves.points = 8;
  for (const auto& curve : engine.generateCurves("wigley", "wigley-departure", curves))
  {
    spdlog::info("{} curve: {} points, last value {}",
                 CurveGenerator::curveName(curve.type),
                 curve.points.size(),
                 Numeric::toDouble(curve.points.back().y));
  }

  StabilityRequest stabilityRequest;
  stabilityRequest.maxAngle = Decimal{80};
  const auto gz = engine.computeStabilityCurve("wigley-departure", stabilityRequest);
  for (const auto& point : gz.points)
  {
    spdlog::info("  heel {:>4} deg  GZ {:.4f} m", Numeric::toDouble(point.heelAngle),
                 Numeric::toDouble(point.gz));
  }

  const auto verdict = engine.checkCriteria(gz);
  for (const auto& criterion : verdict.criteria)
  {
    spdlog::info("{:<16} {} (actual {}, required {})",
                 criterion.name,
                 criterion.passed ? "PASS" : "FAIL",
                 criterion.actual ? Numeric::toDouble(*criterion.actual) : 0.0,
                 Numeric::toDouble(criterion.required));
  }
  spdlog::info("Intact stability {}", verdict.passed ? "satisfied" : "not satisfied");
}

}  // namespace

int main()
{
  InMemoryVesselRepository repository;
  const HydrostaticsEngine engine{repository};
  try
  {
    registerBarge(repository);
    registerWigley(repository);
    run(engine);
  }
  catch (const std::exception& e)
  {
    spdlog::error("Hydrostatics run failed: {}", e.what());
    return 1;
  }
  return 0;
}
