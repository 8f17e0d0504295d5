// Ticket: 0013_hydrostatics_engine_facade

#ifndef HYDRO_ENGINE_HYDROSTATICS_ENGINE_HPP
#define HYDRO_ENGINE_HYDROSTATICS_ENGINE_HPP

#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include "hydro-engine/src/Curves/CurveGenerator.hpp"
#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"
#include "hydro-engine/src/Solvers/TrimSolver.hpp"
#include "hydro-engine/src/Stability/StabilityCalculator.hpp"
#include "hydro-engine/src/Stability/StabilityCriteriaChecker.hpp"
#include "hydro-engine/src/Vessel/VesselDataProvider.hpp"

namespace hydro_engine
{

/**
 * @brief In-process entry point of the hydrostatics library
 *
 * Resolves vessels and loadcases through the provider on every call and runs
 * the requested computation on that snapshot. Holds no state between calls,
 * so one engine may serve concurrent requests for different vessels.
 *
 * An empty loadcase id selects a default sea-water loadcase (rho 1025, no KG).
 */
class HydrostaticsEngine
{
public:
  explicit HydrostaticsEngine(const VesselDataProvider& provider);

  HydrostaticsEngine(const VesselDataProvider& provider,
                     HydroCalculator::Config calculatorConfig);

  /**
   * @brief Hydrostatics at a draft with optional trim and heel
   * @throws NotFoundError if the vessel or loadcase does not resolve
   * @throws ArgumentError, InvalidOperationError as HydroCalculator::compute
   */
  [[nodiscard]] HydroResult computeAt(const std::string& vesselId,
                                      const std::string& loadcaseId,
                                      const Decimal& draft,
                                      const std::optional<Decimal>& trimAngle = std::nullopt,
                                      const std::optional<Decimal>& heelAngle = std::nullopt) const;

  [[nodiscard]] std::vector<HydroResult> computeTable(const std::string& vesselId,
                                                      const std::string& loadcaseId,
                                                      std::span<const Decimal> drafts,
                                                      std::stop_token stopToken = {}) const;

  /**
   * @brief Equilibrium drafts for a target displacement
   * @throws NotFoundError if the vessel or loadcase does not resolve
   * @throws ArgumentError for a non-positive target or initial draft
   */
  [[nodiscard]] TrimSolverResult solveTrim(const std::string& vesselId,
                                           const std::string& loadcaseId,
                                           const TrimRequest& request) const;

  /**
   * @brief Whether a target displacement fits inside the vessel's geometry
   * @throws NotFoundError if the vessel or loadcase does not resolve
   */
  [[nodiscard]] bool isDisplacementAchievable(const std::string& vesselId,
                                              const std::string& loadcaseId,
                                              const Decimal& targetDisplacement,
                                              TargetKind targetKind = TargetKind::Weight) const;

  [[nodiscard]] std::vector<Curve> generateCurves(const std::string& vesselId,
                                                  const std::string& loadcaseId,
                                                  const CurveRequest& request,
                                                  std::stop_token stopToken = {}) const;

  /**
   * @brief GZ curve of a loadcase; the vessel is the loadcase's owner
   * @throws NotFoundError if the loadcase or its vessel does not resolve
   */
  [[nodiscard]] StabilityCurve computeStabilityCurve(const std::string& loadcaseId,
                                                     const StabilityRequest& request,
                                                     std::stop_token stopToken = {}) const;

  /**
   * @throws InvalidOperationError if the curve has fewer than 3 points
   */
  [[nodiscard]] CriteriaResult checkCriteria(const StabilityCurve& curve) const;

private:
  [[nodiscard]] Loadcase resolveLoadcase(const std::string& vesselId,
                                         const std::string& loadcaseId) const;

  const VesselDataProvider& provider_;
  HydroCalculator calculator_;
  StabilityCriteriaChecker criteriaChecker_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_HYDROSTATICS_ENGINE_HPP
