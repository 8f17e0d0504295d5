// Ticket: 0011_righting_arm_curve

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <stop_token>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Stability/StabilityCalculator.hpp"
#include "hydro-engine/test/Helpers/ReferenceVessels.hpp"

using namespace hydro_engine;
using hydro_engine::test::makeBargeVessel;
using hydro_engine::test::makeLoadcase;
using hydro_engine::test::makeWigleyVessel;
using hydro_engine::test::toDouble;

namespace
{

StabilityRequest sweep(int maxAngle, int increment, StabilityMethod method)
{
  StabilityRequest request;
  request.minAngle = Decimal{0};
  request.maxAngle = Decimal{maxAngle};
  request.angleIncrement = Decimal{increment};
  request.method = method;
  return request;
}

}  // anonymous namespace

// ========== Angle sampling ==========

TEST(StabilityCalculatorTest, SampleAngles_IncludesMaximum)
{
  const auto angles = StabilityCalculator::sampleAngles(Decimal{0}, Decimal{12}, Decimal{5});

  ASSERT_EQ(angles.size(), 4u);
  EXPECT_EQ(angles[0], Decimal{0});
  EXPECT_EQ(angles[2], Decimal{10});
  EXPECT_EQ(angles[3], Decimal{12});
}

TEST(StabilityCalculatorTest, SampleAngles_InvalidRange_ThrowsArgumentError)
{
  EXPECT_THROW((void)StabilityCalculator::sampleAngles(Decimal{0}, Decimal{30}, Decimal{0}),
               ArgumentError);
  EXPECT_THROW((void)StabilityCalculator::sampleAngles(Decimal{30}, Decimal{30}, Decimal{5}),
               ArgumentError);
}

// ========== Box barge ==========

TEST(StabilityCalculatorTest, Barge_FullImmersion_MatchesWallSidedBeforeDeckEdge)
{
  // Arrange
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();
  const auto loadcase = makeLoadcase(vessel.id, Decimal{"2.5"});

  // Act
  const auto full =
    stability.compute(vessel, loadcase, sweep(25, 5, StabilityMethod::FullImmersion));
  const auto wall = stability.compute(vessel, loadcase, sweep(25, 5, StabilityMethod::WallSided));

  // Assert: the deck edge enters the water at 26.57 deg
  const double expected[] = {0.0, 0.58326, 1.17565, 1.78740, 2.43116, 3.12377};
  ASSERT_EQ(full.points.size(), 6u);
  ASSERT_EQ(wall.points.size(), 6u);
  for (size_t i = 0; i < full.points.size(); ++i)
  {
    EXPECT_NEAR(toDouble(full.points[i].gz), toDouble(wall.points[i].gz), 1e-4)
      << "at " << full.points[i].heelAngle.str() << " deg";
    EXPECT_NEAR(toDouble(full.points[i].gz), expected[i], 1e-4)
      << "at " << full.points[i].heelAngle.str() << " deg";
  }
}

TEST(StabilityCalculatorTest, Barge_KnEqualsGzPlusKgSine)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();

  const auto curve = stability.compute(
    vessel, makeLoadcase(vessel.id, Decimal{3}), sweep(20, 10, StabilityMethod::FullImmersion));

  for (const auto& point : curve.points)
  {
    const double phi = toDouble(point.heelAngle) * std::numbers::pi / 180.0;
    EXPECT_NEAR(toDouble(point.kn), toDouble(point.gz) + 3.0 * std::sin(phi), 2e-6);
  }
}

TEST(StabilityCalculatorTest, Barge_CurveCarriesUprightCondition)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();
  const auto loadcase = makeLoadcase(vessel.id, Decimal{3}, "lc-3");

  const auto curve =
    stability.compute(vessel, loadcase, sweep(10, 5, StabilityMethod::FullImmersion));

  EXPECT_EQ(curve.loadcaseId, "lc-3");
  EXPECT_EQ(curve.method, StabilityMethod::FullImmersion);
  EXPECT_EQ(curve.kg, Decimal{3});
  EXPECT_EQ(curve.draft, Decimal{5});
  EXPECT_NEAR(toDouble(curve.volume), 10000.0, 1e-6);
  ASSERT_TRUE(curve.initialGmt.has_value());
  EXPECT_NEAR(toDouble(*curve.initialGmt), 6.166667, 1e-6);
  EXPECT_EQ(curve.points.front().gz, Decimal{0});
}

TEST(StabilityCalculatorTest, Barge_TargetDisplacement_ResolvesDraft)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  auto vessel = makeBargeVessel();
  vessel.designDraft = Decimal{3};
  auto loadcase = makeLoadcase(vessel.id, Decimal{3});
  loadcase.targetDisplacement = Decimal{10250000};

  const auto curve =
    stability.compute(vessel, loadcase, sweep(10, 10, StabilityMethod::FullImmersion));

  EXPECT_NEAR(toDouble(curve.draft), 5.0, 1e-6);
}

TEST(StabilityCalculatorTest, Barge_RequestDraft_OverridesDesignDraft)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();

  auto request = sweep(10, 10, StabilityMethod::FullImmersion);
  request.draft = Decimal{4};
  const auto curve = stability.compute(vessel, makeLoadcase(vessel.id, Decimal{3}), request);

  EXPECT_EQ(curve.draft, Decimal{4});
  EXPECT_NEAR(toDouble(curve.volume), 8000.0, 1e-6);
}

// ========== Wigley hull ==========

TEST(StabilityCalculatorTest, Wigley_WithTopsides_HasSinglePeak)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeWigleyVessel(Decimal{"7.8125"});
  const auto loadcase = makeLoadcase(vessel.id, Decimal{"4.45"});

  const auto curve =
    stability.compute(vessel, loadcase, sweep(80, 5, StabilityMethod::FullImmersion));

  ASSERT_EQ(curve.points.size(), 17u);
  EXPECT_EQ(curve.angleOfMaxGz, Decimal{40});
  EXPECT_NEAR(toDouble(curve.maxGz), 0.398, 2e-3);

  // Rises to the peak, falls after it
  for (size_t i = 1; i < curve.points.size(); ++i)
  {
    const bool beforePeak = curve.points[i].heelAngle <= curve.angleOfMaxGz;
    if (beforePeak)
    {
      EXPECT_GT(curve.points[i].gz, curve.points[i - 1].gz);
    }
    else
    {
      EXPECT_LT(curve.points[i].gz, curve.points[i - 1].gz);
    }
  }

  // Small-angle slope follows the initial metacentric height
  ASSERT_TRUE(curve.initialGmt.has_value());
  const double slope = toDouble(*curve.initialGmt) * std::sin(5.0 * std::numbers::pi / 180.0);
  EXPECT_NEAR(toDouble(curve.points[1].gz), slope, 2e-3);
}

// ========== Errors ==========

TEST(StabilityCalculatorTest, MissingKg_ThrowsArgumentError)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();

  EXPECT_THROW((void)stability.compute(
                 vessel, makeLoadcase(vessel.id), sweep(30, 5, StabilityMethod::FullImmersion)),
               ArgumentError);
}

TEST(StabilityCalculatorTest, RightAngle_ThrowsArgumentError)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();

  EXPECT_THROW((void)stability.compute(vessel,
                                       makeLoadcase(vessel.id, Decimal{3}),
                                       sweep(90, 5, StabilityMethod::FullImmersion)),
               ArgumentError);
}

TEST(StabilityCalculatorTest, NoDraftSource_ThrowsArgumentError)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  auto vessel = makeBargeVessel();
  vessel.designDraft.reset();

  EXPECT_THROW((void)stability.compute(vessel,
                                       makeLoadcase(vessel.id, Decimal{3}),
                                       sweep(30, 5, StabilityMethod::FullImmersion)),
               ArgumentError);
}

TEST(StabilityCalculatorTest, MissingGeometry_ThrowsNotFound)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  auto vessel = makeBargeVessel();
  vessel.geometry.reset();

  EXPECT_THROW((void)stability.compute(vessel,
                                       makeLoadcase(vessel.id, Decimal{3}),
                                       sweep(30, 5, StabilityMethod::FullImmersion)),
               NotFoundError);
}

TEST(StabilityCalculatorTest, StopRequested_ThrowsOperationCancelled)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();
  std::stop_source source;
  source.request_stop();

  EXPECT_THROW((void)stability.compute(vessel,
                                       makeLoadcase(vessel.id, Decimal{3}),
                                       sweep(30, 5, StabilityMethod::FullImmersion),
                                       source.get_token()),
               OperationCancelledError);
}

TEST(StabilityCalculatorTest, SolveWaterLevel_VolumeBeyondHull_ThrowsInvalidOperation)
{
  const HydroCalculator calculator;
  const StabilityCalculator stability{calculator};
  const auto vessel = makeBargeVessel();
  const SectionIntegrator integrator{*vessel.geometry, AboveRangePolicy::Clamp};

  // Closed barge holds 20000 m^3
  EXPECT_THROW((void)stability.solveWaterLevel(
                 integrator, Inclination::fromDegrees(Decimal{20}), Decimal{25000}),
               InvalidOperationError);
}
