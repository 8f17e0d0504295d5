// Ticket: 0001_decimal_numeric_policy

#include <gtest/gtest.h>

#include <boost/math/constants/constants.hpp>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"

using namespace hydro_engine;

TEST(DecimalTest, DecimalFractions_AreExact)
{
  EXPECT_EQ(Decimal{"0.1"} + Decimal{"0.2"}, Decimal{"0.3"});
}

TEST(DecimalTest, Quantize_RoundsHalfAwayFromZero)
{
  EXPECT_EQ(Numeric::quantize(Decimal{"1.2345675"}), Decimal{"1.234568"});
  EXPECT_EQ(Numeric::quantize(Decimal{"-1.2345675"}), Decimal{"-1.234568"});
  EXPECT_EQ(Numeric::quantize(Decimal{"1.2345674"}), Decimal{"1.234567"});
}

TEST(DecimalTest, Quantize_CustomDigits)
{
  EXPECT_EQ(Numeric::quantize(Decimal{"2.675"}, 2), Decimal{"2.68"});
  EXPECT_EQ(Numeric::quantize(Decimal{"2.5"}, 0), Decimal{3});
}

TEST(DecimalTest, Quantize_NoNegativeZero)
{
  const Decimal q = Numeric::quantize(Decimal{"-0.0000001"});
  EXPECT_EQ(q, Decimal{0});
  EXPECT_EQ(q.str(), "0");
}

TEST(DecimalTest, Quantize_InvalidDigits_Throws)
{
  EXPECT_THROW((void)Numeric::quantize(Decimal{1}, -1), ArgumentError);
  EXPECT_THROW((void)Numeric::quantize(Decimal{1}, 21), ArgumentError);
}

TEST(DecimalTest, AngleConversion_RoundTrips)
{
  EXPECT_NEAR(Numeric::toDouble(Numeric::degreesToRadians(Decimal{180})),
              boost::math::constants::pi<double>(),
              1e-15);
  EXPECT_NEAR(Numeric::toDouble(Numeric::radiansToDegrees(Numeric::pi() / 2)), 90.0, 1e-12);
}
