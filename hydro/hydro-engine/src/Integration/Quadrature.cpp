// Ticket: 0003_composite_quadrature

#include "hydro-engine/src/Integration/Quadrature.hpp"

#include <algorithm>
#include <string>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace Quadrature
{

namespace
{

// Relative width difference under which two intervals count as equal
const Decimal kSpacingTolerance{"1e-9"};

bool equalWidths(const Decimal& h0, const Decimal& h1)
{
  return abs(h0 - h1) <= kSpacingTolerance * std::max(h0, h1);
}

void requireMatchingSizes(std::span<const Decimal> x, std::span<const Decimal> y)
{
  if (x.size() != y.size())
  {
    throw ArgumentError("Quadrature sample mismatch: " +
                        std::to_string(x.size()) + " abscissae, " +
                        std::to_string(y.size()) + " ordinates");
  }
}

}  // namespace

Decimal trapezoid(std::span<const Decimal> x, std::span<const Decimal> y)
{
  requireMatchingSizes(x, y);

  Decimal sum{0};
  for (size_t i = 1; i < x.size(); ++i)
  {
    sum += (x[i] - x[i - 1]) * (y[i] + y[i - 1]) / 2;
  }
  return sum;
}

Decimal simpson(std::span<const Decimal> x, std::span<const Decimal> y)
{
  requireMatchingSizes(x, y);

  const size_t n = x.size();
  Decimal sum{0};
  size_t i = 0;
  while (i + 1 < n)
  {
    const Decimal h0 = x[i + 1] - x[i];
    if (i + 2 < n && equalWidths(h0, x[i + 2] - x[i + 1]))
    {
      const Decimal h1 = x[i + 2] - x[i + 1];
      const Decimal span = h0 + h1;
      sum += span / 6 *
             ((2 - h1 / h0) * y[i] + span * span / (h0 * h1) * y[i + 1] +
              (2 - h0 / h1) * y[i + 2]);
      i += 2;
    }
    else
    {
      sum += h0 * (y[i] + y[i + 1]) / 2;
      ++i;
    }
  }
  return sum;
}

}  // namespace Quadrature

}  // namespace hydro_engine
