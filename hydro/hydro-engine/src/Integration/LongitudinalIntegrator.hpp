// Ticket: 0006_longitudinal_integration

#ifndef HYDRO_ENGINE_INTEGRATION_LONGITUDINAL_INTEGRATOR_HPP
#define HYDRO_ENGINE_INTEGRATION_LONGITUDINAL_INTEGRATOR_HPP

#include <cstddef>
#include <vector>

#include "hydro-engine/src/Integration/SectionIntegrator.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/**
 * @brief Whole-hull integrals of submerged volume and waterplane
 *
 * Raw (unquantized) sums produced by composing section properties along the
 * hull. The "S" moments are taken along the waterline, about the centerplane.
 */
struct HullIntegrals
{
  Decimal volume{0};
  Decimal momentX{0};
  Decimal momentY{0};
  Decimal momentZ{0};

  Decimal waterplaneArea{0};
  Decimal waterplaneMomentX{0};
  Decimal waterplaneMomentS{0};
  Decimal waterplaneSecondX{0};
  Decimal waterplaneSecondS{0};

  std::vector<Decimal> sectionAreas;
  size_t submergedStations{0};
  bool aboveRange{false};

  [[nodiscard]] Decimal lcb() const
  {
    return momentX / volume;
  }

  [[nodiscard]] Decimal tcb() const
  {
    return momentY / volume;
  }

  [[nodiscard]] Decimal kb() const
  {
    return momentZ / volume;
  }

  [[nodiscard]] Decimal lcf() const
  {
    return waterplaneArea > 0 ? waterplaneMomentX / waterplaneArea : Decimal{0};
  }

  /// Second moment of the waterplane about the transverse axis through LCF
  [[nodiscard]] Decimal longitudinalInertia() const;

  /// Second moment of the waterplane about its longitudinal centroidal axis
  [[nodiscard]] Decimal transverseInertia() const;
};

namespace LongitudinalIntegrator
{

/**
 * @brief Integrate section properties along the stations
 *
 * Composite Simpson over station x with the same odd-interval policy as the
 * sectional integration.
 *
 * @param stationX Station x-coordinates, strictly increasing
 * @param sections One entry per station, same order
 * @throws ArgumentError if the counts differ
 */
[[nodiscard]] HullIntegrals integrate(const std::vector<Decimal>& stationX,
                                      const std::vector<SectionProperties>& sections);

}  // namespace LongitudinalIntegrator

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_INTEGRATION_LONGITUDINAL_INTEGRATOR_HPP
