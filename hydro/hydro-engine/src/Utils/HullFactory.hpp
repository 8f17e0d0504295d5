#ifndef HYDRO_ENGINE_UTILS_HULL_FACTORY_HPP
#define HYDRO_ENGINE_UTILS_HULL_FACTORY_HPP

#include <optional>

#include "hydro-engine/src/Geometry/HullGeometry.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/**
 * @brief Factory class for analytic reference hulls
 *
 * Provides static methods that tabulate offsets of hull forms with known
 * hydrostatics. Stations run from x = 0 (aft) to x = length, waterlines from
 * the baseline upward; indices start at 0.
 */
class HullFactory
{
public:
  /**
   * @brief Create a rectangular box barge
   *
   * @param length Length [m]
   * @param beam Full breadth [m]
   * @param depth Height of the highest waterline [m]
   * @param stations Number of equally spaced stations (>= 2)
   * @param waterlines Number of equally spaced waterlines (>= 2)
   * @throws ArgumentError for non-positive dimensions or too few divisions
   */
  static HullGeometry createBarge(const Decimal& length,
                                  const Decimal& beam,
                                  const Decimal& depth,
                                  int stations,
                                  int waterlines);

  /**
   * @brief Create a Wigley parabolic hull
   *
   * y = B/2 (1 - xi^2)(1 - zeta^2), xi = (x - L/2)/(L/2), zeta = (T - z)/T.
   * Waterlines are spaced T/(waterlines - 1) from the baseline to the design
   * draft. With a depth, the same spacing continues up to it as vertical
   * topsides carrying the design waterline's half-breadth.
   *
   * @param length Length [m]
   * @param beam Breadth at the design waterline [m]
   * @param draft Design draft [m]
   * @param stations Number of equally spaced stations (>= 2)
   * @param waterlines Number of waterlines up to the design draft (>= 2)
   * @param depth Optional height of the topsides [m], >= draft
   * @throws ArgumentError for non-positive dimensions, too few divisions or a
   *         depth below the draft
   */
  static HullGeometry createWigley(const Decimal& length,
                                   const Decimal& beam,
                                   const Decimal& draft,
                                   int stations,
                                   int waterlines,
                                   const std::optional<Decimal>& depth = std::nullopt);
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_UTILS_HULL_FACTORY_HPP
