// Ticket: 0006_longitudinal_integration

#include "hydro-engine/src/Integration/LongitudinalIntegrator.hpp"

#include <string>
#include <utility>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Integration/Quadrature.hpp"

namespace hydro_engine
{

Decimal HullIntegrals::longitudinalInertia() const
{
  const Decimal centroid = lcf();
  return waterplaneSecondX - waterplaneArea * centroid * centroid;
}

Decimal HullIntegrals::transverseInertia() const
{
  if (waterplaneArea <= 0)
  {
    return Decimal{0};
  }
  const Decimal centroid = waterplaneMomentS / waterplaneArea;
  return waterplaneSecondS - waterplaneArea * centroid * centroid;
}

namespace LongitudinalIntegrator
{

HullIntegrals integrate(const std::vector<Decimal>& stationX,
                        const std::vector<SectionProperties>& sections)
{
  if (stationX.size() != sections.size())
  {
    throw ArgumentError("Expected " + std::to_string(stationX.size()) +
                        " sections, got " + std::to_string(sections.size()));
  }

  const size_t n = sections.size();
  std::vector<Decimal> area(n);
  std::vector<Decimal> xArea(n);
  std::vector<Decimal> yMoment(n);
  std::vector<Decimal> zMoment(n);
  std::vector<Decimal> chord(n);
  std::vector<Decimal> xChord(n);
  std::vector<Decimal> x2Chord(n);
  std::vector<Decimal> sFirst(n);
  std::vector<Decimal> sSecond(n);

  HullIntegrals result;
  for (size_t i = 0; i < n; ++i)
  {
    const auto& section = sections[i];
    const Decimal& x = stationX[i];

    area[i] = section.area;
    xArea[i] = x * section.area;
    yMoment[i] = section.momentY;
    zMoment[i] = section.momentZ;

    for (const auto& c : section.chords)
    {
      chord[i] += c.to - c.from;
      sFirst[i] += (c.to * c.to - c.from * c.from) / 2;
      sSecond[i] += (c.to * c.to * c.to - c.from * c.from * c.from) / 3;
    }
    xChord[i] = x * chord[i];
    x2Chord[i] = x * x * chord[i];

    if (section.area > 0)
    {
      ++result.submergedStations;
    }
    result.aboveRange = result.aboveRange || section.aboveRange;
  }

  result.volume = Quadrature::simpson(stationX, area);
  result.momentX = Quadrature::simpson(stationX, xArea);
  result.momentY = Quadrature::simpson(stationX, yMoment);
  result.momentZ = Quadrature::simpson(stationX, zMoment);

  result.waterplaneArea = Quadrature::simpson(stationX, chord);
  result.waterplaneMomentX = Quadrature::simpson(stationX, xChord);
  result.waterplaneMomentS = Quadrature::simpson(stationX, sFirst);
  result.waterplaneSecondX = Quadrature::simpson(stationX, x2Chord);
  result.waterplaneSecondS = Quadrature::simpson(stationX, sSecond);

  result.sectionAreas = std::move(area);
  return result;
}

}  // namespace LongitudinalIntegrator

}  // namespace hydro_engine
