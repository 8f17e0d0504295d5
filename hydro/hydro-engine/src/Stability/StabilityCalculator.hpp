// Ticket: 0011_righting_arm_curve

#ifndef HYDRO_ENGINE_STABILITY_STABILITY_CALCULATOR_HPP
#define HYDRO_ENGINE_STABILITY_STABILITY_CALCULATOR_HPP

#include <optional>
#include <stop_token>
#include <vector>

#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"
#include "hydro-engine/src/Integration/LongitudinalIntegrator.hpp"
#include "hydro-engine/src/Integration/SectionIntegrator.hpp"
#include "hydro-engine/src/Stability/StabilityCurve.hpp"
#include "hydro-engine/src/Vessel/Vessel.hpp"

namespace hydro_engine
{

struct StabilityRequest
{
  Decimal minAngle{0};         // [deg]
  Decimal maxAngle{60};        // [deg]
  Decimal angleIncrement{5};   // [deg]
  StabilityMethod method{StabilityMethod::FullImmersion};
  std::optional<Decimal> draft;  ///< Overrides the loadcase/vessel draft
};

/**
 * @brief Builds GZ/KN curves over a heel sweep
 *
 * The displaced volume is fixed by the upright condition. For every heel the
 * inclined waterline height is solved so the heeled hull displaces that
 * volume; the righting arm then follows from the heeled centre of buoyancy:
 *
 *   KN = yB cos(phi) + zB sin(phi),  GZ = KN - KG sin(phi)
 *
 * Upright draft comes from the request, else from the loadcase target
 * displacement, else from the vessel design draft.
 *
 * @ticket 0011_righting_arm_curve
 */
class StabilityCalculator
{
public:
  struct Config
  {
    Decimal levelTolerance{"1e-9"};         // [m]
    Decimal volumeTolerance{"1e-12"};       // relative
    int maxLevelIterations{100};
  };

  explicit StabilityCalculator(const HydroCalculator& calculator);

  StabilityCalculator(const HydroCalculator& calculator, Config config);

  /**
   * @brief Righting-arm curve of a loadcase
   *
   * @throws ArgumentError if KG is missing, angleIncrement <= 0,
   *         minAngle >= maxAngle, an angle is outside (-90, 90), or no draft
   *         can be resolved
   * @throws InvalidOperationError if the hull cannot displace the volume at
   *         some heel, or the target displacement has no equilibrium draft
   * @throws OperationCancelledError if a stop is requested between angles
   */
  [[nodiscard]] StabilityCurve compute(const Vessel& vessel,
                                       const Loadcase& loadcase,
                                       const StabilityRequest& request,
                                       std::stop_token stopToken = {}) const;

  /**
   * @brief Heel angles of a sweep, increasing, including both ends
   * @throws ArgumentError for a non-positive increment or inverted range
   */
  [[nodiscard]] static std::vector<Decimal> sampleAngles(const Decimal& minAngle,
                                                         const Decimal& maxAngle,
                                                         const Decimal& increment);

  /**
   * @brief Height of the inclined waterline displacing a volume
   *
   * Safeguarded regula falsi (Illinois) on the outline's earth-height range.
   *
   * @throws InvalidOperationError if the closed hull displaces less than
   *         targetVolume at this heel
   */
  [[nodiscard]] Decimal solveWaterLevel(const SectionIntegrator& integrator,
                                        const Inclination& inclination,
                                        const Decimal& targetVolume) const;

private:
  [[nodiscard]] Decimal resolveDraft(const Vessel& vessel,
                                     const Loadcase& loadcase,
                                     const StabilityRequest& request) const;

  [[nodiscard]] static HullIntegrals integrateAtLevel(const SectionIntegrator& integrator,
                                                      const Decimal& waterLevel,
                                                      const Inclination& inclination);

  const HydroCalculator& calculator_;
  Config config_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_STABILITY_STABILITY_CALCULATOR_HPP
