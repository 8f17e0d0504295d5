// Ticket: 0008_hydrostatic_calculator

#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Integration/SectionIntegrator.hpp"

namespace hydro_engine
{

namespace
{

Decimal trimTangent(const std::optional<Decimal>& trimAngle)
{
  if (!trimAngle || *trimAngle == 0)
  {
    return Decimal{0};
  }
  if (abs(*trimAngle) >= 90)
  {
    throw ArgumentError("Trim angle must lie strictly between -90 and 90 degrees, got " +
                        trimAngle->str());
  }
  return tan(Numeric::degreesToRadians(*trimAngle));
}

/// Ratio with a zero denominator reported as 0
Decimal coefficient(const Decimal& numerator,
                    const Decimal& denominator,
                    const char* name)
{
  if (denominator <= 0)
  {
    spdlog::warn("Form coefficient {} undefined (denominator {}), reported as 0",
                 name,
                 Numeric::toDouble(denominator));
    return Decimal{0};
  }
  return numerator / denominator;
}

}  // namespace

HydroCalculator::HydroCalculator() : HydroCalculator{Config{}}
{
}

HydroCalculator::HydroCalculator(Config config) : config_{config}
{
}

HydroResult HydroCalculator::compute(const Vessel& vessel,
                                     const Loadcase& loadcase,
                                     const FloatingCondition& condition) const
{
  if (!vessel.geometry)
  {
    throw InvalidOperationError("Vessel '" + vessel.id + "' has no hull geometry");
  }
  if (loadcase.rho <= 0)
  {
    throw ArgumentError("Density must be positive, got " + loadcase.rho.str());
  }

  const HullIntegrals integrals = integrate(*vessel.geometry, condition);
  return assemble(vessel, loadcase, condition, integrals);
}

std::vector<HydroResult> HydroCalculator::computeTable(
  const Vessel& vessel,
  const Loadcase& loadcase,
  std::span<const Decimal> drafts,
  std::stop_token stopToken) const
{
  std::vector<HydroResult> table;
  table.reserve(drafts.size());

  for (const auto& draft : drafts)
  {
    if (stopToken.stop_requested())
    {
      throw OperationCancelledError("Hydrostatic table cancelled after " +
                                    std::to_string(table.size()) + " of " +
                                    std::to_string(drafts.size()) + " drafts");
    }
    table.push_back(compute(vessel, loadcase, FloatingCondition{draft, {}, {}}));
  }
  return table;
}

HullIntegrals HydroCalculator::integrate(const HullGeometry& geometry,
                                         const FloatingCondition& condition) const
{
  if (condition.draft <= 0)
  {
    throw ArgumentError("Draft must be positive, got " + condition.draft.str());
  }

  const Decimal tanTrim = trimTangent(condition.trimAngle);
  const Inclination inclination =
    condition.heelAngle ? Inclination::fromDegrees(*condition.heelAngle)
                        : Inclination{};

  const SectionIntegrator integrator{geometry, config_.aboveRange};
  const auto& xs = geometry.stationX();
  const Decimal xMid = geometry.midshipX();

  std::vector<SectionProperties> sections;
  sections.reserve(xs.size());
  size_t aboveRangeCount = 0;
  for (size_t i = 0; i < xs.size(); ++i)
  {
    const Decimal localDraft = condition.draft - (xs[i] - xMid) * tanTrim;

    if (inclination.isUpright())
    {
      sections.push_back(integrator.upright(i, localDraft));
    }
    else
    {
      sections.push_back(
        integrator.inclined(i, localDraft * inclination.cosine, inclination));
    }

    if (sections.back().aboveRange)
    {
      ++aboveRangeCount;
    }
  }

  HullIntegrals integrals = LongitudinalIntegrator::integrate(xs, sections);

  if (integrals.submergedStations == 0 || integrals.volume <= 0)
  {
    throw InvalidOperationError("No station is submerged at draft " +
                                condition.draft.str() + " m");
  }
  if (aboveRangeCount == xs.size())
  {
    throw InvalidOperationError("Draft " + condition.draft.str() +
                                " m lies above the defined waterlines at every station");
  }
  if (aboveRangeCount > 0)
  {
    spdlog::warn("{} of {} sections truncated at their highest offset (draft {} m)",
                 aboveRangeCount,
                 xs.size(),
                 Numeric::toDouble(condition.draft));
  }

  return integrals;
}

Decimal HydroCalculator::referenceLength(const Vessel& vessel)
{
  if (vessel.lpp && *vessel.lpp > 0)
  {
    return *vessel.lpp;
  }
  return vessel.geometry ? vessel.geometry->length() : Decimal{0};
}

Decimal HydroCalculator::referenceBeam(const Vessel& vessel)
{
  if (vessel.beam && *vessel.beam > 0)
  {
    return *vessel.beam;
  }
  return vessel.geometry ? 2 * vessel.geometry->maxHalfBreadth() : Decimal{0};
}

HydroResult HydroCalculator::assemble(const Vessel& vessel,
                                      const Loadcase& loadcase,
                                      const FloatingCondition& condition,
                                      const HullIntegrals& integrals) const
{
  const auto quantize = [this](const Decimal& value)
  { return Numeric::quantize(value, config_.resultDigits); };

  const HullGeometry& geometry = *vessel.geometry;
  const Decimal& volume = integrals.volume;
  const Decimal& draft = condition.draft;

  const Decimal kb = integrals.kb();
  const Decimal il = integrals.longitudinalInertia();
  const Decimal it = integrals.transverseInertia();
  const Decimal bmt = it / volume;
  const Decimal bml = il / volume;
  const Decimal displacement = volume * loadcase.rho;

  const Decimal length = referenceLength(vessel);
  const Decimal beam = referenceBeam(vessel);
  const Decimal midshipArea =
    integrals.sectionAreas[integrals.sectionAreas.size() / 2];

  const Decimal halfSpanRise = geometry.length() / 2 * trimTangent(condition.trimAngle);

  HydroResult result;
  result.draft = quantize(draft);
  result.trimAngle = condition.trimAngle;
  result.heelAngle = condition.heelAngle;
  result.draftAft = quantize(draft + halfSpanRise);
  result.draftForward = quantize(draft - halfSpanRise);

  result.volume = quantize(volume);
  result.displacement = quantize(displacement);
  result.kb = quantize(kb);
  result.lcb = quantize(integrals.lcb());
  result.tcb = quantize(integrals.tcb());

  result.awp = quantize(integrals.waterplaneArea);
  result.lcf = quantize(integrals.lcf());
  result.iwp = quantize(il);
  result.iwpTransverse = quantize(it);
  result.bmt = quantize(bmt);
  result.bml = quantize(bml);
  if (loadcase.kg)
  {
    result.gmt = quantize(kb + bmt - *loadcase.kg);
    result.gml = quantize(kb + bml - *loadcase.kg);
  }

  result.cb = quantize(coefficient(volume, length * beam * draft, "Cb"));
  result.cp = quantize(coefficient(volume, midshipArea * length, "Cp"));
  result.cm = quantize(coefficient(midshipArea, beam * draft, "Cm"));
  result.cwp = quantize(coefficient(integrals.waterplaneArea, length * beam, "Cwp"));

  result.tpc = quantize(integrals.waterplaneArea * loadcase.rho / 100000);
  result.mtc = length > 0 ? quantize(displacement / 1000 * bml / (100 * length))
                          : Decimal{0};

  result.sectionAreas.reserve(integrals.sectionAreas.size());
  for (const auto& area : integrals.sectionAreas)
  {
    result.sectionAreas.push_back(quantize(area));
  }
  result.aboveGeometryRange = integrals.aboveRange;

  spdlog::debug("Hydrostatics at draft {} m: V={} m^3, KB={} m, LCB={} m, BMt={} m",
                Numeric::toDouble(draft),
                Numeric::toDouble(volume),
                Numeric::toDouble(kb),
                Numeric::toDouble(integrals.lcb()),
                Numeric::toDouble(bmt));

  return result;
}

}  // namespace hydro_engine
