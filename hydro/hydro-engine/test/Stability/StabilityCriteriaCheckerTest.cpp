// Ticket: 0012_intact_stability_criteria

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Stability/StabilityCriteriaChecker.hpp"
#include "hydro-engine/test/Helpers/ReferenceVessels.hpp"

using namespace hydro_engine;
using hydro_engine::test::toDouble;

namespace
{

/**
 * @brief Hand-built curve with a comfortable margin on every IMO rule
 *
 * heel: 0   10  20  30  40  50  60
 * GZ:   0   .2  .4  .5  .6  .5  .3
 */
StabilityCurve createPassingCurve()
{
  const std::vector<const char*> gz{"0", "0.2", "0.4", "0.5", "0.6", "0.5", "0.3"};

  StabilityCurve curve;
  curve.loadcaseId = "lc";
  curve.initialGmt = Decimal{1};
  for (size_t i = 0; i < gz.size(); ++i)
  {
    curve.points.push_back(
      StabilityCurvePoint{Decimal{static_cast<int>(i) * 10}, Decimal{gz[i]}, Decimal{0}});
  }
  curve.maxGz = Decimal{"0.6"};
  curve.angleOfMaxGz = Decimal{40};
  return curve;
}

const CriterionResult& findCriterion(const CriteriaResult& result, const std::string& name)
{
  for (const auto& criterion : result.criteria)
  {
    if (criterion.name == name)
    {
      return criterion;
    }
  }
  throw std::out_of_range("No criterion named " + name);
}

}  // anonymous namespace

// ========== Curve measures ==========

TEST(StabilityCriteriaCheckerTest, AreaUnderCurve_TrapezoidInRadians)
{
  const auto curve = createPassingCurve();

  const auto area030 = StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{0}, Decimal{30});
  const auto area040 = StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{0}, Decimal{40});
  const auto area3040 =
    StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{30}, Decimal{40});

  ASSERT_TRUE(area030 && area040 && area3040);
  EXPECT_NEAR(toDouble(*area030), 0.148353, 1e-6);
  EXPECT_NEAR(toDouble(*area040), 0.244346, 1e-6);
  EXPECT_NEAR(toDouble(*area3040), 0.095993, 1e-6);
}

TEST(StabilityCriteriaCheckerTest, AreaUnderCurve_InterpolatesEndPoints)
{
  const auto curve = createPassingCurve();

  // 8.5 deg m to 30 deg, less the 25-30 slice (0.45 + 0.5) / 2 * 5
  const auto area = StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{0}, Decimal{25});

  ASSERT_TRUE(area.has_value());
  EXPECT_NEAR(toDouble(*area), 6.125 * 3.14159265358979 / 180.0, 1e-9);
}

TEST(StabilityCriteriaCheckerTest, AreaUnderCurve_OutsideCurve_IsEmpty)
{
  const auto curve = createPassingCurve();

  EXPECT_FALSE(
    StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{0}, Decimal{70}).has_value());
  EXPECT_FALSE(
    StabilityCriteriaChecker::areaUnderCurve(curve.points, Decimal{40}, Decimal{30}).has_value());
}

TEST(StabilityCriteriaCheckerTest, GzAt_InterpolatesLinearly)
{
  const auto curve = createPassingCurve();

  EXPECT_EQ(*StabilityCriteriaChecker::gzAt(curve.points, Decimal{30}), Decimal{"0.5"});
  EXPECT_EQ(*StabilityCriteriaChecker::gzAt(curve.points, Decimal{35}), Decimal{"0.55"});
  EXPECT_EQ(*StabilityCriteriaChecker::gzAt(curve.points, Decimal{0}), Decimal{0});
  EXPECT_FALSE(StabilityCriteriaChecker::gzAt(curve.points, Decimal{65}).has_value());
}

// ========== IMO A.749 ==========

TEST(StabilityCriteriaCheckerTest, DefaultRules_AreImoGeneralCriteria)
{
  const StabilityCriteriaChecker checker;

  ASSERT_EQ(checker.criteria().size(), 6u);
  EXPECT_EQ(checker.criteria()[0].name, "Area 0-30 deg");
  EXPECT_EQ(checker.criteria()[0].required, Decimal{"0.055"});
  EXPECT_EQ(checker.criteria()[4].kind, CriterionKind::AngleOfMaxGz);
  EXPECT_EQ(checker.criteria()[5].required, Decimal{"0.15"});
}

TEST(StabilityCriteriaCheckerTest, Check_PassingCurve_PassesEveryRule)
{
  // Arrange
  const StabilityCriteriaChecker checker;
  const auto curve = createPassingCurve();

  // Act
  const auto result = checker.check(curve);

  // Assert
  EXPECT_TRUE(result.passed);
  ASSERT_EQ(result.criteria.size(), 6u);
  for (const auto& criterion : result.criteria)
  {
    EXPECT_TRUE(criterion.passed) << criterion.name;
    EXPECT_TRUE(criterion.actual.has_value()) << criterion.name;
    EXPECT_TRUE(criterion.note.empty()) << criterion.name;
  }
  EXPECT_EQ(*findCriterion(result, "Area 0-30 deg").actual, Decimal{"0.148353"});
  EXPECT_EQ(*findCriterion(result, "Angle of max GZ").actual, Decimal{40});
}

TEST(StabilityCriteriaCheckerTest, Check_WeakCurve_FailsAreaRules)
{
  const StabilityCriteriaChecker checker;
  auto curve = createPassingCurve();
  for (auto& point : curve.points)
  {
    point.gz = point.gz / 5;
  }
  curve.maxGz = curve.maxGz / 5;

  const auto result = checker.check(curve);

  EXPECT_FALSE(result.passed);
  EXPECT_FALSE(findCriterion(result, "Area 0-30 deg").passed);
  EXPECT_FALSE(findCriterion(result, "GZ at 30 deg").passed);
  EXPECT_TRUE(findCriterion(result, "Angle of max GZ").passed);
  EXPECT_TRUE(findCriterion(result, "Initial GMt").passed);
}

TEST(StabilityCriteriaCheckerTest, Check_ShortCurve_FailsWithNote)
{
  const StabilityCriteriaChecker checker;
  auto curve = createPassingCurve();
  curve.points.resize(4);  // up to 30 deg
  curve.initialGmt.reset();

  const auto result = checker.check(curve);

  const auto& area040 = findCriterion(result, "Area 0-40 deg");
  EXPECT_FALSE(area040.passed);
  EXPECT_FALSE(area040.actual.has_value());
  EXPECT_FALSE(area040.note.empty());

  const auto& gmt = findCriterion(result, "Initial GMt");
  EXPECT_FALSE(gmt.passed);
  EXPECT_FALSE(gmt.note.empty());

  EXPECT_TRUE(findCriterion(result, "Area 0-30 deg").passed);
  EXPECT_FALSE(result.passed);
}

TEST(StabilityCriteriaCheckerTest, Check_AngleOfMaxGzUnset_ScansPoints)
{
  // Arrange: points only, as a curve reloaded from storage would arrive
  const StabilityCriteriaChecker checker;
  auto curve = createPassingCurve();
  curve.maxGz = Decimal{0};
  curve.angleOfMaxGz = Decimal{0};

  // Act
  const auto result = checker.check(curve);

  // Assert
  const auto& angle = findCriterion(result, "Angle of max GZ");
  ASSERT_TRUE(angle.actual.has_value());
  EXPECT_EQ(*angle.actual, Decimal{40});
  EXPECT_TRUE(angle.passed);
  EXPECT_TRUE(result.passed);
}

TEST(StabilityCriteriaCheckerTest, Check_TiedMaximum_UsesFirstAngle)
{
  const StabilityCriteriaChecker checker;
  auto curve = createPassingCurve();
  curve.points[3].gz = Decimal{"0.6"};  // 30 deg ties with 40 deg
  curve.angleOfMaxGz = Decimal{40};

  const auto result = checker.check(curve);

  EXPECT_EQ(*findCriterion(result, "Angle of max GZ").actual, Decimal{30});
}

TEST(StabilityCriteriaCheckerTest, Check_RepeatedCalls_ReturnSameVerdicts)
{
  const StabilityCriteriaChecker checker;
  auto weak = createPassingCurve();
  for (auto& point : weak.points)
  {
    point.gz = point.gz / 5;
  }

  for (const auto& curve : {createPassingCurve(), weak})
  {
    const auto first = checker.check(curve);
    for (int repeat = 0; repeat < 3; ++repeat)
    {
      const auto again = checker.check(curve);

      EXPECT_EQ(again.passed, first.passed);
      ASSERT_EQ(again.criteria.size(), first.criteria.size());
      for (size_t i = 0; i < first.criteria.size(); ++i)
      {
        EXPECT_EQ(again.criteria[i].name, first.criteria[i].name);
        EXPECT_EQ(again.criteria[i].passed, first.criteria[i].passed);
        EXPECT_EQ(again.criteria[i].actual, first.criteria[i].actual);
        EXPECT_EQ(again.criteria[i].note, first.criteria[i].note);
      }
    }
  }
}

TEST(StabilityCriteriaCheckerTest, Check_CustomRules_AreApplied)
{
  std::vector<CriterionDefinition> rules;
  rules.push_back(
    CriterionDefinition{"GZ at 20 deg", CriterionKind::GzAt, Decimal{0}, Decimal{20}, Decimal{"0.45"}});
  const StabilityCriteriaChecker checker{std::move(rules)};

  const auto result = checker.check(createPassingCurve());

  ASSERT_EQ(result.criteria.size(), 1u);
  EXPECT_FALSE(result.passed);
  EXPECT_EQ(*result.criteria[0].actual, Decimal{"0.4"});
}

TEST(StabilityCriteriaCheckerTest, Check_TooFewPoints_ThrowsInvalidOperation)
{
  const StabilityCriteriaChecker checker;
  auto curve = createPassingCurve();
  curve.points.resize(2);

  EXPECT_THROW((void)checker.check(curve), InvalidOperationError);
}
