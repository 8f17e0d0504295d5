// Ticket: 0009_trim_equilibrium_solver

#include "hydro-engine/src/Solvers/TrimSolver.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace
{

bool withinTolerance(const TrimIteration& iterate,
                     const Decimal& tolerance,
                     const Decimal& leverTolerance)
{
  if (abs(iterate.residual) > tolerance)
  {
    return false;
  }
  return !iterate.leverResidual || abs(*iterate.leverResidual) <= leverTolerance;
}

Decimal limitStep(const Decimal& step, const Decimal& limit)
{
  return std::clamp(step, Decimal{-limit}, limit);
}

}  // namespace

TrimSolver::TrimSolver(const HydroCalculator& calculator)
  : TrimSolver{calculator, Config{}}
{
}

TrimSolver::TrimSolver(const HydroCalculator& calculator, Config config)
  : calculator_{calculator}, config_{std::move(config)}
{
}

TrimSolverResult TrimSolver::solve(const Vessel& vessel,
                                   const Loadcase& loadcase,
                                   const TrimRequest& request) const
{
  if (request.targetDisplacement <= 0)
  {
    throw ArgumentError("Target displacement must be positive, got " +
                        request.targetDisplacement.str());
  }
  if (request.initialForwardDraft <= 0 || request.initialAftDraft <= 0)
  {
    throw ArgumentError("Initial drafts must be positive, got forward " +
                        request.initialForwardDraft.str() + ", aft " +
                        request.initialAftDraft.str());
  }
  if (!vessel.geometry)
  {
    throw NotFoundError("Hull geometry of vessel '" + vessel.id + "' not found");
  }

  const int maxIterations = request.maxIterations.value_or(config_.maxIterations);
  const Decimal tolerance = request.tolerance.value_or(config_.tolerance);
  if (maxIterations <= 0)
  {
    throw ArgumentError("Maximum iterations must be positive, got " +
                        std::to_string(maxIterations));
  }
  if (tolerance <= 0)
  {
    throw ArgumentError("Tolerance must be positive, got " + tolerance.str());
  }

  const HullGeometry& geometry = *vessel.geometry;
  const Decimal initialMean = (request.initialForwardDraft + request.initialAftDraft) / 2;
  const Decimal initialTrim = Numeric::radiansToDegrees(
    atan((request.initialAftDraft - request.initialForwardDraft) / geometry.length()));

  std::vector<TrimIteration> trace;
  trace.push_back(evaluate(vessel, loadcase, request, 0, initialMean, initialTrim));

  bool converged = withinTolerance(trace.back(), tolerance, config_.leverTolerance);
  while (!converged && trace.back().iteration < maxIterations)
  {
    trace.push_back(step(vessel, loadcase, request, trace.back()));
    converged = withinTolerance(trace.back(), tolerance, config_.leverTolerance);

    const auto& latest = trace.back();
    spdlog::debug("Trim iteration {}: T={} m, trim={} deg, residual={}",
                  latest.iteration,
                  Numeric::toDouble(latest.meanDraft),
                  Numeric::toDouble(latest.trimAngle),
                  Numeric::toDouble(latest.residual));
  }

  // Best estimate: the converged iterate, else the smallest residual seen
  const TrimIteration& chosen =
    converged ? trace.back()
              : *std::min_element(trace.begin(),
                                  trace.end(),
                                  [](const TrimIteration& a, const TrimIteration& b)
                                  { return abs(a.residual) < abs(b.residual); });

  if (!converged)
  {
    spdlog::warn("Trim solver did not converge in {} iterations for vessel '{}' "
                 "(best residual {})",
                 maxIterations,
                 vessel.id,
                 Numeric::toDouble(chosen.residual));
  }

  const auto quantize = [this](const Decimal& value)
  { return Numeric::quantize(value, calculator_.config().resultDigits); };

  const Decimal halfRise =
    geometry.length() / 2 * tan(Numeric::degreesToRadians(chosen.trimAngle));

  TrimSolverResult result;
  result.meanDraft = quantize(chosen.meanDraft);
  result.draftAft = quantize(chosen.meanDraft + halfRise);
  result.draftForward = quantize(chosen.meanDraft - halfRise);
  result.trim = quantize(2 * halfRise);
  result.trimAngle = quantize(chosen.trimAngle);
  result.converged = converged;
  result.iterations = trace.back().iteration;
  result.residual = quantize(chosen.residual);
  if (chosen.leverResidual)
  {
    result.leverResidual = quantize(*chosen.leverResidual);
  }
  result.hydro = calculator_.compute(
    vessel, loadcase, FloatingCondition{chosen.meanDraft, chosen.trimAngle, {}});
  result.lcf = result.hydro.lcf;
  result.mtc = result.hydro.mtc;
  result.trace = std::move(trace);
  return result;
}

bool TrimSolver::isAchievable(const Vessel& vessel,
                              const Loadcase& loadcase,
                              const Decimal& targetDisplacement,
                              TargetKind targetKind) const
{
  if (targetDisplacement <= 0)
  {
    throw ArgumentError("Target displacement must be positive, got " +
                        targetDisplacement.str());
  }
  if (loadcase.rho <= 0)
  {
    throw ArgumentError("Density must be positive, got " + loadcase.rho.str());
  }
  if (!vessel.geometry)
  {
    throw NotFoundError("Hull geometry of vessel '" + vessel.id + "' not found");
  }

  const HullGeometry& geometry = *vessel.geometry;
  const HullIntegrals integrals =
    calculator_.integrate(geometry, FloatingCondition{geometry.topHeight(), {}, {}});
  const Decimal capacity = targetKind == TargetKind::Weight
                             ? integrals.volume * loadcase.rho
                             : integrals.volume;

  spdlog::debug("Vessel '{}' floats at most {} at T={} m, target {}",
                vessel.id,
                Numeric::toDouble(capacity),
                Numeric::toDouble(geometry.topHeight()),
                Numeric::toDouble(targetDisplacement));
  return targetDisplacement <= capacity;
}

TrimIteration TrimSolver::evaluate(const Vessel& vessel,
                                   const Loadcase& loadcase,
                                   const TrimRequest& request,
                                   int iteration,
                                   const Decimal& meanDraft,
                                   const Decimal& trimAngle) const
{
  FloatingCondition condition{meanDraft, {}, {}};
  if (trimAngle != 0)
  {
    condition.trimAngle = trimAngle;
  }
  const HullIntegrals integrals = calculator_.integrate(*vessel.geometry, condition);

  TrimIteration iterate;
  iterate.iteration = iteration;
  iterate.meanDraft = meanDraft;
  iterate.trimAngle = trimAngle;
  iterate.displacement = request.targetKind == TargetKind::Weight
                           ? integrals.volume * loadcase.rho
                           : integrals.volume;
  iterate.residual = request.targetDisplacement - iterate.displacement;

  if (balancesMoment(loadcase))
  {
    // B lies on the vertical through G: LCB - LCG = (KB - KG) tan(trim)
    Decimal lever = integrals.lcb() - *loadcase.lcg;
    if (loadcase.kg)
    {
      lever -= (integrals.kb() - *loadcase.kg) *
               tan(Numeric::degreesToRadians(trimAngle));
    }
    iterate.leverResidual = lever;
  }
  return iterate;
}

TrimIteration TrimSolver::step(const Vessel& vessel,
                               const Loadcase& loadcase,
                               const TrimRequest& request,
                               const TrimIteration& current) const
{
  const HullGeometry& geometry = *vessel.geometry;

  // Backward difference at the top of the geometry
  Decimal dd = config_.draftPerturbation;
  if (current.meanDraft + dd > geometry.topHeight())
  {
    dd = -dd;
  }
  const TrimIteration draftPerturbed = evaluate(
    vessel, loadcase, request, current.iteration, current.meanDraft + dd, current.trimAngle);
  const Decimal slope = (draftPerturbed.displacement - current.displacement) / dd;

  Decimal draftStep{0};
  Decimal trimStep{0};
  bool coupled = false;

  if (current.leverResidual)
  {
    const Decimal& dt = config_.trimPerturbation;
    const TrimIteration trimPerturbed = evaluate(
      vessel, loadcase, request, current.iteration, current.meanDraft, current.trimAngle + dt);

    Jacobian2 jacobian;
    jacobian << slope, (trimPerturbed.displacement - current.displacement) / dt,
      (*draftPerturbed.leverResidual - *current.leverResidual) / dd,
      (*trimPerturbed.leverResidual - *current.leverResidual) / dt;

    const Decimal det = jacobian.determinant();
    const Decimal scale = abs(jacobian(0, 0) * jacobian(1, 1)) +
                          abs(jacobian(0, 1) * jacobian(1, 0));
    if (scale > 0 && abs(det) > Decimal{"1e-12"} * scale)
    {
      Vector2 rhs;
      rhs << current.residual, -*current.leverResidual;
      const Vector2 delta = jacobian.inverse() * rhs;
      draftStep = delta(0);
      trimStep = delta(1);
      coupled = true;
    }
    else
    {
      spdlog::warn("Singular trim Jacobian at T={} m, falling back to draft-only update",
                   Numeric::toDouble(current.meanDraft));
    }
  }

  if (!coupled)
  {
    if (slope > 0)
    {
      draftStep = current.residual / slope;
    }
    else
    {
      // No waterplane at this draft: move by the damping limit toward the target
      spdlog::warn("Zero displacement slope at T={} m", Numeric::toDouble(current.meanDraft));
      draftStep = current.residual > 0 ? config_.maxDraftStep : Decimal{-config_.maxDraftStep};
    }
  }

  const Decimal limitedDraftStep = limitStep(draftStep, config_.maxDraftStep);
  const Decimal limitedTrimStep = limitStep(trimStep, config_.maxTrimStep);
  if (limitedDraftStep != draftStep || limitedTrimStep != trimStep)
  {
    spdlog::debug("Trim step damped: dT {} -> {} m, dTrim {} -> {} deg",
                  Numeric::toDouble(draftStep),
                  Numeric::toDouble(limitedDraftStep),
                  Numeric::toDouble(trimStep),
                  Numeric::toDouble(limitedTrimStep));
  }

  const Decimal nextDraft =
    clampDraft(geometry, current.meanDraft, current.meanDraft + limitedDraftStep);
  const Decimal nextTrim =
    clampTrim(geometry, nextDraft, current.trimAngle + limitedTrimStep);

  TrimIteration next =
    evaluate(vessel, loadcase, request, current.iteration + 1, nextDraft, nextTrim);
  next.derivative = slope;
  return next;
}

bool TrimSolver::balancesMoment(const Loadcase& loadcase) const
{
  return config_.balanceTrimmingMoment && loadcase.lcg.has_value();
}

Decimal TrimSolver::clampDraft(const HullGeometry& geometry,
                               const Decimal& current,
                               const Decimal& proposed) const
{
  const Decimal& lower = config_.draftPerturbation;
  const Decimal& upper = geometry.topHeight();

  if (proposed < lower)
  {
    spdlog::debug("Trim step below the keel clamped (proposed T={} m)",
                  Numeric::toDouble(proposed));
    return (current + lower) / 2;
  }
  if (proposed > upper)
  {
    spdlog::debug("Trim step above the highest waterline clamped (proposed T={} m)",
                  Numeric::toDouble(proposed));
    return upper;
  }
  return proposed;
}

Decimal TrimSolver::clampTrim(const HullGeometry& geometry,
                              const Decimal& meanDraft,
                              const Decimal& proposed) const
{
  // Forward and aft drafts stay between the keel and the highest waterline
  const Decimal room = std::max(
    Decimal{0},
    std::min(meanDraft - geometry.keelHeight(), geometry.topHeight() - meanDraft));
  const Decimal limit = Numeric::radiansToDegrees(atan(room / (geometry.length() / 2)));

  if (abs(proposed) > limit)
  {
    spdlog::debug("Trim {} deg clamped to +/-{} deg at T={} m",
                  Numeric::toDouble(proposed),
                  Numeric::toDouble(limit),
                  Numeric::toDouble(meanDraft));
    return proposed > 0 ? limit : Decimal{-limit};
  }
  return proposed;
}

}  // namespace hydro_engine
