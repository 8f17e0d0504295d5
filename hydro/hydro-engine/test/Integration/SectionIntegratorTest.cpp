// Ticket: 0005_sectional_integration

#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <vector>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Integration/Quadrature.hpp"
#include "hydro-engine/src/Integration/SectionIntegrator.hpp"
#include "hydro-engine/src/Utils/HullFactory.hpp"

using namespace hydro_engine;

namespace
{

/**
 * @brief Two identical stations with an irregular, non-uniformly spaced profile
 *
 * z:  0    1    2.5  3    5
 * y:  0.5  2.0  3.1  3.4  4.0
 */
HullGeometry createIrregularSection()
{
  const std::vector<Decimal> zs{Decimal{0}, Decimal{1}, Decimal{"2.5"}, Decimal{3}, Decimal{5}};
  const std::vector<Decimal> ys{Decimal{"0.5"}, Decimal{2}, Decimal{"3.1"}, Decimal{"3.4"}, Decimal{4}};

  std::vector<Waterline> waterlines;
  std::vector<Offset> offsets;
  for (int j = 0; j < static_cast<int>(zs.size()); ++j)
  {
    waterlines.push_back(Waterline{j, zs[static_cast<size_t>(j)]});
    for (int s = 0; s < 2; ++s)
    {
      offsets.push_back(Offset{s, j, ys[static_cast<size_t>(j)]});
    }
  }
  return HullGeometry{{Station{0, Decimal{0}}, Station{1, Decimal{1}}}, waterlines, offsets};
}

/**
 * @brief Flat-bottomed section with a tight bilge: waterlines at 0, 0.1 and 4 m
 */
HullGeometry createTightBilgeSection(const Decimal& bilgeHalfBreadth)
{
  const std::vector<Decimal> zs{Decimal{0}, Decimal{"0.1"}, Decimal{4}};
  const std::vector<Decimal> ys{bilgeHalfBreadth, Decimal{"9.5"}, Decimal{10}};

  std::vector<Waterline> waterlines;
  std::vector<Offset> offsets;
  for (int j = 0; j < 3; ++j)
  {
    waterlines.push_back(Waterline{j, zs[static_cast<size_t>(j)]});
    for (int s = 0; s < 3; ++s)
    {
      offsets.push_back(Offset{s, j, ys[static_cast<size_t>(j)]});
    }
  }
  return HullGeometry{{Station{0, Decimal{0}}, Station{1, Decimal{10}}, Station{2, Decimal{20}}},
                      waterlines,
                      offsets};
}

double area(const SectionIntegrator& integrator, const Decimal& draft)
{
  return Numeric::toDouble(integrator.upright(0, draft).area);
}

}  // anonymous namespace

// ========== Upright sections ==========

TEST(SectionIntegratorTest, Upright_BargeSection_MatchesRectangle)
{
  const auto geometry =
    HullFactory::createBarge(Decimal{100}, Decimal{20}, Decimal{10}, 5, 5);
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  const auto props = integrator.upright(2, Decimal{"3.7"});

  EXPECT_NEAR(Numeric::toDouble(props.area), 74.0, 1e-12);
  EXPECT_NEAR(Numeric::toDouble(props.momentZ), 136.9, 1e-12);  // 20 * 3.7^2 / 2
  EXPECT_EQ(props.waterlineHalfBreadth, Decimal{10});
  ASSERT_EQ(props.chords.size(), 1u);
  EXPECT_EQ(props.chords[0].from, Decimal{-10});
  EXPECT_EQ(props.chords[0].to, Decimal{10});
  EXPECT_FALSE(props.aboveRange);
}

TEST(SectionIntegratorTest, Upright_AtWaterline_EqualsQuadraturePrefix)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  const std::vector<Decimal> zs{Decimal{0}, Decimal{1}, Decimal{"2.5"}};
  const std::vector<Decimal> ys{Decimal{"0.5"}, Decimal{2}, Decimal{"3.1"}};
  const Decimal expected = 2 * Quadrature::simpson(zs, ys);

  EXPECT_NEAR(area(integrator, Decimal{"2.5"}), Numeric::toDouble(expected), 1e-18);
}

TEST(SectionIntegratorTest, Upright_FirstInterval_FallsBackToTrapezoid)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  // y(0.5) = 1.25; 2 * (0.5 + 1.25) / 2 * 0.5
  EXPECT_EQ(integrator.upright(0, Decimal{"0.5"}).area, Decimal{"0.875"});
}

TEST(SectionIntegratorTest, Upright_AreaContinuousAcrossWaterlines)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};
  const Decimal eps{"1e-12"};

  for (const auto& z : {Decimal{1}, Decimal{"2.5"}, Decimal{3}})
  {
    const auto below = integrator.upright(0, z - eps);
    const auto above = integrator.upright(0, z + eps);
    EXPECT_NEAR(Numeric::toDouble(above.area - below.area), 0.0, 1e-9)
      << "Area jumps at z = " << z.str();
    EXPECT_NEAR(Numeric::toDouble(above.momentZ - below.momentZ), 0.0, 1e-9)
      << "Moment jumps at z = " << z.str();
  }
}

TEST(SectionIntegratorTest, Upright_AreaIncreasesWithDraft)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  double previous = 0.0;
  for (int i = 1; i <= 60; ++i)
  {
    const double current = area(integrator, Decimal{i} / 10);
    EXPECT_GT(current, previous) << "at draft " << i / 10.0;
    previous = current;
  }
}

TEST(SectionIntegratorTest, Upright_UnevenWaterlines_StaysInsideBoundingBox)
{
  // Arrange
  const auto geometry = createTightBilgeSection(Decimal{8});
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  // Act
  const auto props = integrator.upright(1, Decimal{4});

  // Assert: 2 * (0.1 * 8.75 + 3.9 * 9.75), below the 2 * 10 * 4 box
  EXPECT_NEAR(Numeric::toDouble(props.area), 77.8, 1e-12);
  EXPECT_LT(props.area, Decimal{80});
}

TEST(SectionIntegratorTest, Upright_NarrowBilge_AreaPositiveAndIncreasing)
{
  const auto geometry = createTightBilgeSection(Decimal{"0.5"});
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  double previous = 0.0;
  for (int i = 1; i <= 40; ++i)
  {
    const double current = Numeric::toDouble(integrator.upright(1, Decimal{i} / 10).area);
    EXPECT_GT(current, previous) << "at draft " << i / 10.0;
    previous = current;
  }
  EXPECT_NEAR(previous, 2 * (0.1 * 5.0 + 3.9 * 9.75), 1e-12);
}

TEST(SectionIntegratorTest, Upright_AtOrBelowKeel_IsEmpty)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  const auto props = integrator.upright(0, Decimal{0});

  EXPECT_EQ(props.area, Decimal{0});
  EXPECT_TRUE(props.chords.empty());
}

TEST(SectionIntegratorTest, Upright_AboveRange_ClampAddsWall)
{
  const auto geometry = createIrregularSection();
  const SectionIntegrator clamp{geometry, AboveRangePolicy::Clamp};
  const SectionIntegrator flag{geometry, AboveRangePolicy::Flag};

  const auto top = clamp.upright(0, Decimal{5});
  const auto clamped = clamp.upright(0, Decimal{6});
  const auto flagged = flag.upright(0, Decimal{6});

  EXPECT_NEAR(Numeric::toDouble(clamped.area - top.area), 8.0, 1e-15);  // 2 * 4.0 * 1
  EXPECT_FALSE(clamped.aboveRange);

  EXPECT_EQ(flagged.area, top.area);
  EXPECT_TRUE(flagged.aboveRange);
  EXPECT_TRUE(flagged.chords.empty());
}

// ========== Inclined sections ==========

TEST(SectionIntegratorTest, Inclined_BargeSection_MatchesWallSidedGeometry)
{
  const auto geometry =
    HullFactory::createBarge(Decimal{100}, Decimal{20}, Decimal{10}, 5, 5);
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};
  const auto inclination = Inclination::fromDegrees(Decimal{10});
  const Decimal draft{5};

  const auto props = integrator.inclined(2, draft * inclination.cosine, inclination);

  // Waterline through the centerline at the draft keeps the area B * T;
  // the centroid moves B^2 tan(phi) / (12 T) to starboard.
  const double phi = 10.0 * std::numbers::pi / 180.0;
  const double tanPhi = std::tan(phi);
  EXPECT_NEAR(Numeric::toDouble(props.area), 100.0, 1e-12);
  EXPECT_NEAR(Numeric::toDouble(props.momentY), 8000.0 * tanPhi / 12.0, 1e-9);
  EXPECT_NEAR(Numeric::toDouble(props.momentZ),
              100.0 * (2.5 + 400.0 * tanPhi * tanPhi / 120.0),
              1e-9);

  ASSERT_EQ(props.chords.size(), 1u);
  const double chordLength = Numeric::toDouble(props.chords[0].to - props.chords[0].from);
  EXPECT_NEAR(chordLength, 20.0 / std::cos(phi), 1e-9);
}

TEST(SectionIntegratorTest, Inclined_ZeroHeel_MatchesUprightTrapezoid)
{
  const auto geometry =
    HullFactory::createBarge(Decimal{100}, Decimal{20}, Decimal{10}, 5, 5);
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  const auto inclined = integrator.inclined(1, Decimal{4}, Inclination{});
  const auto upright = integrator.upright(1, Decimal{4});

  EXPECT_NEAR(Numeric::toDouble(inclined.area), Numeric::toDouble(upright.area), 1e-12);
  EXPECT_NEAR(Numeric::toDouble(inclined.momentZ), Numeric::toDouble(upright.momentZ), 1e-12);
  EXPECT_NEAR(Numeric::toDouble(inclined.momentY), 0.0, 1e-12);
}

TEST(SectionIntegratorTest, LevelRange_SpansOutline)
{
  const auto geometry =
    HullFactory::createBarge(Decimal{100}, Decimal{20}, Decimal{10}, 5, 5);
  const SectionIntegrator integrator{geometry, AboveRangePolicy::Clamp};

  const auto [lo, hi] = integrator.levelRange(Inclination{});

  EXPECT_EQ(lo, Decimal{0});
  EXPECT_EQ(hi, Decimal{10});
}

TEST(SectionIntegratorTest, Inclination_RightAngle_ThrowsArgumentError)
{
  EXPECT_THROW((void)Inclination::fromDegrees(Decimal{90}), ArgumentError);
  EXPECT_THROW((void)Inclination::fromDegrees(Decimal{-95}), ArgumentError);
}
