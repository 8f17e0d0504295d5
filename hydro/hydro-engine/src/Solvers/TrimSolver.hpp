// Ticket: 0009_trim_equilibrium_solver

#ifndef HYDRO_ENGINE_SOLVERS_TRIM_SOLVER_HPP
#define HYDRO_ENGINE_SOLVERS_TRIM_SOLVER_HPP

#include <optional>
#include <vector>

#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"
#include "hydro-engine/src/Hydrostatics/HydroResult.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"
#include "hydro-engine/src/Vessel/Vessel.hpp"

namespace hydro_engine
{

/// Unit of a trim solver target
enum class TargetKind
{
  Weight,  ///< displaced mass [kg]
  Volume   ///< displaced volume [m^3]
};

/// Equilibrium problem posed to the trim solver
struct TrimRequest
{
  Decimal targetDisplacement{0};
  Decimal initialForwardDraft{0};  // [m]
  Decimal initialAftDraft{0};      // [m]
  TargetKind targetKind{TargetKind::Weight};
  std::optional<int> maxIterations;  ///< Overrides Config::maxIterations
  std::optional<Decimal> tolerance;  ///< Overrides Config::tolerance
};

/**
 * @brief One evaluated Newton iterate
 *
 * Immutable record: the solver never modifies an iterate, it derives the next
 * one from it.
 */
struct TrimIteration
{
  int iteration{0};
  Decimal meanDraft{0};   // [m]
  Decimal trimAngle{0};   // [deg], positive bow up
  Decimal displacement{0};  // in target units
  Decimal residual{0};      // target - displacement
  Decimal derivative{0};    // d(displacement)/d(meanDraft), zero until stepped
  std::optional<Decimal> leverResidual;  // LCB - LCG corrected for trim [m]
};

/**
 * @brief Outcome of a trim solve, including the solver's own trail
 *
 * Non-convergence is reported through converged=false, never thrown.
 */
struct TrimSolverResult
{
  Decimal draftForward{0};
  Decimal draftAft{0};
  Decimal meanDraft{0};
  Decimal trim{0};       // aft minus forward draft [m]
  Decimal trimAngle{0};  // [deg]
  bool converged{false};
  int iterations{0};
  Decimal residual{0};
  std::optional<Decimal> leverResidual;
  Decimal lcf{0};
  Decimal mtc{0};
  HydroResult hydro;
  std::vector<TrimIteration> trace;
};

/**
 * @brief Newton-Raphson solver for floating equilibrium
 *
 * Finds the mean draft whose displacement matches the target. When the
 * loadcase provides an LCG (and balancing is enabled) it also solves for the
 * trim angle that brings the centre of buoyancy vertically under G, using a
 * 2x2 finite-difference Jacobian. Trim is otherwise held at the initial value.
 *
 * Per-iteration changes are damped. The mean draft is kept inside the
 * geometry and the trim angle is bounded so that the forward and aft drafts
 * stay between the keel and the highest waterline. An LCG that cannot be
 * balanced inside those bounds ends with converged=false.
 *
 * @ticket 0009_trim_equilibrium_solver
 */
class TrimSolver
{
public:
  struct Config
  {
    int maxIterations{20};
    Decimal tolerance{100};               // target units
    Decimal draftPerturbation{"0.01"};    // [m]
    Decimal trimPerturbation{"0.01"};     // [deg]
    Decimal maxDraftStep{"0.5"};          // [m]
    Decimal maxTrimStep{"0.5"};           // [deg]
    Decimal leverTolerance{"0.001"};      // [m]
    bool balanceTrimmingMoment{true};
  };

  explicit TrimSolver(const HydroCalculator& calculator);

  TrimSolver(const HydroCalculator& calculator, Config config);

  /**
   * @brief Solve for the drafts that float the target displacement
   *
   * @param vessel Vessel particulars and geometry
   * @param loadcase Density, optional KG and LCG
   * @param request Target and initial drafts
   * @return Solution, convergence flag and iteration trace
   *
   * @throws ArgumentError if the target or an initial draft is <= 0, or the
   *         iteration limit / tolerance is not positive
   * @throws NotFoundError if the vessel carries no geometry
   */
  [[nodiscard]] TrimSolverResult solve(const Vessel& vessel,
                                       const Loadcase& loadcase,
                                       const TrimRequest& request) const;

  /**
   * @brief Whether the target floats the vessel inside its geometry
   *
   * Compares the target with the even-keel displacement at the highest
   * waterline; a larger target has no root for solve() to converge to.
   *
   * @throws ArgumentError if the target or the density is <= 0
   * @throws NotFoundError if the vessel carries no geometry
   */
  [[nodiscard]] bool isAchievable(const Vessel& vessel,
                                  const Loadcase& loadcase,
                                  const Decimal& targetDisplacement,
                                  TargetKind targetKind = TargetKind::Weight) const;

  /**
   * @brief Evaluate displacement and lever residual at an iterate
   */
  [[nodiscard]] TrimIteration evaluate(const Vessel& vessel,
                                       const Loadcase& loadcase,
                                       const TrimRequest& request,
                                       int iteration,
                                       const Decimal& meanDraft,
                                       const Decimal& trimAngle) const;

  /**
   * @brief Derive the next iterate from an evaluated one
   *
   * @return Evaluated successor; its derivative field records the slope
   *         used for the update that produced it
   */
  [[nodiscard]] TrimIteration step(const Vessel& vessel,
                                   const Loadcase& loadcase,
                                   const TrimRequest& request,
                                   const TrimIteration& current) const;

  void setTolerance(const Decimal& tol)
  {
    config_.tolerance = tol;
  }

  void setMaxIterations(int n)
  {
    config_.maxIterations = n;
  }

  [[nodiscard]] const Decimal& getTolerance() const
  {
    return config_.tolerance;
  }

  [[nodiscard]] int getMaxIterations() const
  {
    return config_.maxIterations;
  }

  [[nodiscard]] const Config& config() const
  {
    return config_;
  }

private:
  [[nodiscard]] bool balancesMoment(const Loadcase& loadcase) const;

  [[nodiscard]] Decimal clampDraft(const HullGeometry& geometry,
                                   const Decimal& current,
                                   const Decimal& proposed) const;

  [[nodiscard]] Decimal clampTrim(const HullGeometry& geometry,
                                  const Decimal& meanDraft,
                                  const Decimal& proposed) const;

  const HydroCalculator& calculator_;
  Config config_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_SOLVERS_TRIM_SOLVER_HPP
