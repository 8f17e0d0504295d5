// Ticket: 0001_decimal_numeric_policy

#include "hydro-engine/src/Numeric/Decimal.hpp"

#include <string>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace Numeric
{

Decimal quantize(const Decimal& value, int digits)
{
  if (digits < 0 || digits > 20)
  {
    throw ArgumentError("Result digits must be in [0, 20], got " +
                        std::to_string(digits));
  }

  const Decimal scale = boost::multiprecision::pow(Decimal{10}, digits);
  Decimal quantized = boost::multiprecision::round(value * scale) / scale;

  // No negative zero in published results
  if (quantized == 0)
  {
    return Decimal{0};
  }
  return quantized;
}

Decimal pi()
{
  return boost::math::constants::pi<Decimal>();
}

Decimal degreesToRadians(const Decimal& degrees)
{
  return degrees * pi() / 180;
}

Decimal radiansToDegrees(const Decimal& radians)
{
  return radians * 180 / pi();
}

}  // namespace Numeric

}  // namespace hydro_engine
