// Ticket: 0014_hydrostatics_benchmarks

#include <benchmark/benchmark.h>
#include <memory>
#include <vector>
#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"
#include "hydro-engine/src/Solvers/TrimSolver.hpp"
#include "hydro-engine/src/Stability/StabilityCalculator.hpp"
#include "hydro-engine/src/Utils/HullFactory.hpp"

using namespace hydro_engine;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Wigley hull with topsides, station count from the benchmark argument
Vessel createWigley(int stations)
{
  Vessel vessel;
  vessel.id = "wigley";
  vessel.lpp = Decimal{100};
  vessel.beam = Decimal{10};
  vessel.designDraft = Decimal{"6.25"};
  vessel.geometry = std::make_shared<const HullGeometry>(HullFactory::createWigley(
    Decimal{100}, Decimal{10}, Decimal{"6.25"}, stations, 13, Decimal{"7.8125"}));
  return vessel;
}

Loadcase createLoadcase()
{
  Loadcase loadcase;
  loadcase.id = "lc";
  loadcase.vesselId = "wigley";
  loadcase.kg = Decimal{"4.45"};
  return loadcase;
}

}  // namespace

// ============================================================================
// Hydrostatics
// ============================================================================

/**
 * @brief Upright hydrostatics at a draft between waterlines
 *
 * Dominated by the per-station Simpson prefix setup and the longitudinal sums.
 */
static void BM_HydroCalculator_Upright(benchmark::State& state)
{
  const auto vessel = createWigley(static_cast<int>(state.range(0)));
  const auto loadcase = createLoadcase();
  const HydroCalculator calculator;
  const FloatingCondition condition{Decimal{"4.3"}, {}, {}};

  for (auto _ : state)
  {
    auto result = calculator.compute(vessel, loadcase, condition);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_HydroCalculator_Upright)->Arg(11)->Arg(21)->Arg(41)->Arg(81)->Complexity();

static void BM_HydroCalculator_Heeled(benchmark::State& state)
{
  const auto vessel = createWigley(static_cast<int>(state.range(0)));
  const auto loadcase = createLoadcase();
  const HydroCalculator calculator;
  const FloatingCondition condition{Decimal{"4.3"}, {}, Decimal{20}};

  for (auto _ : state)
  {
    auto result = calculator.compute(vessel, loadcase, condition);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_HydroCalculator_Heeled)->Arg(11)->Arg(21)->Arg(41)->Arg(81)->Complexity();

// ============================================================================
// Solvers
// ============================================================================

static void BM_TrimSolver_VolumeTarget(benchmark::State& state)
{
  const auto vessel = createWigley(21);
  const auto loadcase = createLoadcase();
  const HydroCalculator calculator;
  const TrimSolver solver{calculator};

  TrimRequest request;
  request.targetDisplacement = Decimal{2000};
  request.initialForwardDraft = Decimal{3};
  request.initialAftDraft = Decimal{3};
  request.targetKind = TargetKind::Volume;
  request.tolerance = Decimal{"0.01"};

  for (auto _ : state)
  {
    auto result = solver.solve(vessel, loadcase, request);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_TrimSolver_VolumeTarget);

/**
 * @brief Full-immersion GZ curve, one water-level search per heel angle
 */
static void BM_StabilityCalculator_GzCurve(benchmark::State& state)
{
  const auto vessel = createWigley(21);
  const auto loadcase = createLoadcase();
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};

  StabilityRequest request;
  request.maxAngle = Decimal{60};
  request.angleIncrement = Decimal{static_cast<int>(state.range(0))};

  for (auto _ : state)
  {
    auto curve = stability.compute(vessel, loadcase, request);
    benchmark::DoNotOptimize(curve);
  }
}
BENCHMARK(BM_StabilityCalculator_GzCurve)->Arg(10)->Arg(5)->Arg(2);
