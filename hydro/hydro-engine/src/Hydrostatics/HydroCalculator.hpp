// Ticket: 0008_hydrostatic_calculator

#ifndef HYDRO_ENGINE_HYDROSTATICS_HYDRO_CALCULATOR_HPP
#define HYDRO_ENGINE_HYDROSTATICS_HYDRO_CALCULATOR_HPP

#include <span>
#include <stop_token>
#include <vector>

#include "hydro-engine/src/Geometry/HullGeometry.hpp"
#include "hydro-engine/src/Hydrostatics/HydroResult.hpp"
#include "hydro-engine/src/Integration/LongitudinalIntegrator.hpp"
#include "hydro-engine/src/Vessel/Vessel.hpp"

namespace hydro_engine
{

/**
 * @brief Whole-hull hydrostatics at a draft, trim and heel
 *
 * Composes sectional integration along the stations. Local draft at station
 * x is d - (x - x_mid) tan(trim); with heel, the section is cut by an
 * inclined waterline through that local draft.
 *
 * Pure: holds only its configuration, results depend on the arguments alone.
 *
 * @ticket 0008_hydrostatic_calculator
 */
class HydroCalculator
{
public:
  struct Config
  {
    AboveRangePolicy aboveRange{AboveRangePolicy::Clamp};
    int resultDigits{kResultDigits};
  };

  HydroCalculator();

  explicit HydroCalculator(Config config);

  /**
   * @brief Complete hydrostatic result at one condition
   *
   * @param vessel Vessel particulars and geometry
   * @param loadcase Density and centre of gravity
   * @param condition Draft, optional trim and heel
   * @return Quantized result
   *
   * @throws ArgumentError if draft <= 0, rho <= 0, trim or heel not in (-90, 90)
   * @throws InvalidOperationError if no station is submerged, or every station
   *         is above its defined range under AboveRangePolicy::Flag
   */
  [[nodiscard]] HydroResult compute(const Vessel& vessel,
                                    const Loadcase& loadcase,
                                    const FloatingCondition& condition) const;

  /**
   * @brief Upright, untrimmed results for a list of drafts, in order
   * @throws OperationCancelledError if a stop is requested between drafts
   */
  [[nodiscard]] std::vector<HydroResult> computeTable(
    const Vessel& vessel,
    const Loadcase& loadcase,
    std::span<const Decimal> drafts,
    std::stop_token stopToken = {}) const;

  /**
   * @brief Raw volume and waterplane integrals, without quantization
   *
   * @throws ArgumentError if draft <= 0 or an angle is out of range
   * @throws InvalidOperationError as compute()
   */
  [[nodiscard]] HullIntegrals integrate(const HullGeometry& geometry,
                                        const FloatingCondition& condition) const;

  /// Lpp when the vessel states it, otherwise the station span
  [[nodiscard]] static Decimal referenceLength(const Vessel& vessel);

  /// Beam when the vessel states it, otherwise twice the widest half-breadth
  [[nodiscard]] static Decimal referenceBeam(const Vessel& vessel);

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  [[nodiscard]] HydroResult assemble(const Vessel& vessel,
                                     const Loadcase& loadcase,
                                     const FloatingCondition& condition,
                                     const HullIntegrals& integrals) const;

  Config config_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_HYDROSTATICS_HYDRO_CALCULATOR_HPP
