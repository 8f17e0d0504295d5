// Ticket: 0005_sectional_integration

#include "hydro-engine/src/Integration/SectionIntegrator.hpp"

#include <algorithm>
#include <span>
#include <utility>

#include "hydro-engine/src/Errors.hpp"
#include "hydro-engine/src/Integration/Quadrature.hpp"

namespace hydro_engine
{

Inclination Inclination::fromDegrees(const Decimal& degrees)
{
  if (abs(degrees) >= 90)
  {
    throw ArgumentError("Heel angle must lie strictly between -90 and 90 degrees, got " +
                        degrees.str());
  }

  if (degrees == 0)
  {
    return Inclination{};
  }

  const Decimal phi = Numeric::degreesToRadians(degrees);
  return Inclination{cos(phi), sin(phi)};
}

SectionIntegrator::SectionIntegrator(const HullGeometry& geometry,
                                     AboveRangePolicy policy)
  : geometry_{geometry}, policy_{policy}
{
  const size_t nStations = geometry_.stationCount();
  profiles_.reserve(nStations);
  outlines_.reserve(nStations);

  for (size_t s = 0; s < nStations; ++s)
  {
    const auto& nodes = geometry_.sectionNodes(s);

    Profile profile;
    std::vector<Decimal> moment;
    for (const auto& node : nodes)
    {
      profile.z.push_back(node.z);
      profile.y.push_back(node.halfBreadth);
      moment.push_back(node.z * node.halfBreadth);
    }

    const std::span<const Decimal> zs{profile.z};
    const std::span<const Decimal> ys{profile.y};
    const std::span<const Decimal> ms{moment};
    for (size_t k = 0; k < nodes.size(); ++k)
    {
      profile.areaPrefix.push_back(
        Quadrature::simpson(zs.first(k + 1), ys.first(k + 1)));
      profile.momentPrefix.push_back(
        Quadrature::simpson(zs.first(k + 1), ms.first(k + 1)));
    }
    profiles_.push_back(std::move(profile));

    // Starboard side up from the keel, port side back down, closed by the deck
    std::vector<SectionNode> side = nodes;
    if (policy_ == AboveRangePolicy::Clamp && side.back().z < geometry_.topHeight())
    {
      side.push_back(SectionNode{geometry_.topHeight(), side.back().halfBreadth});
    }

    std::vector<Point> outline;
    outline.reserve(2 * side.size());
    for (const auto& node : side)
    {
      outline.push_back(Point{node.halfBreadth, node.z});
    }
    for (auto it = side.rbegin(); it != side.rend(); ++it)
    {
      outline.push_back(Point{-it->halfBreadth, it->z});
    }
    outlines_.push_back(std::move(outline));
  }
}

SectionProperties SectionIntegrator::upright(size_t stationPos,
                                             const Decimal& localDraft) const
{
  const auto& p = profiles_.at(stationPos);
  SectionProperties props;

  if (localDraft <= p.z.front())
  {
    return props;
  }

  Decimal halfArea{0};
  Decimal halfMoment{0};
  Decimal waterlineY{0};

  const size_t last = p.z.size() - 1;
  if (localDraft >= p.z[last])
  {
    halfArea = p.areaPrefix[last];
    halfMoment = p.momentPrefix[last];
    waterlineY = p.y[last];

    if (localDraft > p.z[last])
    {
      if (policy_ == AboveRangePolicy::Clamp)
      {
        const Decimal& zTop = p.z[last];
        halfArea += waterlineY * (localDraft - zTop);
        halfMoment += waterlineY * (localDraft * localDraft - zTop * zTop) / 2;
      }
      else
      {
        props.aboveRange = true;
        waterlineY = 0;
      }
    }
  }
  else
  {
    auto upper = std::upper_bound(p.z.begin(), p.z.end(), localDraft);
    const auto k = static_cast<size_t>(std::distance(p.z.begin(), upper)) - 1;

    const Decimal& z0 = p.z[k];
    const Decimal& z1 = p.z[k + 1];
    const Decimal& y0 = p.y[k];
    const Decimal& y1 = p.y[k + 1];

    const Decimal t = (localDraft - z0) / (z1 - z0);
    waterlineY = y0 + t * (y1 - y0);

    const Decimal partialArea = (y0 + waterlineY) / 2 * (localDraft - z0);
    const Decimal fullArea = (y0 + y1) / 2 * (z1 - z0);
    halfArea = p.areaPrefix[k] + partialArea +
               t * (p.areaPrefix[k + 1] - p.areaPrefix[k] - fullArea);

    const Decimal partialMoment =
      (z0 * y0 + localDraft * waterlineY) / 2 * (localDraft - z0);
    const Decimal fullMoment = (z0 * y0 + z1 * y1) / 2 * (z1 - z0);
    halfMoment = p.momentPrefix[k] + partialMoment +
                 t * (p.momentPrefix[k + 1] - p.momentPrefix[k] - fullMoment);
  }

  props.area = 2 * halfArea;
  props.momentZ = 2 * halfMoment;
  props.waterlineHalfBreadth = waterlineY;
  if (waterlineY > 0)
  {
    props.chords.push_back(WaterlineChord{-waterlineY, waterlineY});
  }
  return props;
}

SectionProperties SectionIntegrator::inclined(size_t stationPos,
                                              const Decimal& waterLevel,
                                              const Inclination& inclination) const
{
  const auto& outline = outlines_.at(stationPos);
  SectionProperties props;

  const auto submerged = clip(outline, waterLevel, inclination);

  // Shoelace area and first moments of the submerged polygon
  const size_t n = submerged.size();
  for (size_t i = 0; i < n; ++i)
  {
    const Point& a = submerged[i];
    const Point& b = submerged[(i + 1) % n];
    const Decimal cross = a.y * b.z - b.y * a.z;
    props.area += cross / 2;
    props.momentY += (a.y + b.y) * cross / 6;
    props.momentZ += (a.z + b.z) * cross / 6;
  }

  props.chords = chords(outline, waterLevel, inclination);
  for (const auto& chord : props.chords)
  {
    props.waterlineHalfBreadth += (chord.to - chord.from) / 2;
  }

  if (policy_ == AboveRangePolicy::Flag)
  {
    // Deck edges are the first starboard and first port vertex past the middle
    const Point& starboardDeck = outline[outline.size() / 2 - 1];
    const Point& portDeck = outline[outline.size() / 2];
    props.aboveRange =
      inclination.earthHeight(starboardDeck.y, starboardDeck.z) < waterLevel ||
      inclination.earthHeight(portDeck.y, portDeck.z) < waterLevel;
  }
  return props;
}

std::pair<Decimal, Decimal> SectionIntegrator::levelRange(
  const Inclination& inclination) const
{
  Decimal lowest = inclination.earthHeight(outlines_.front().front().y,
                                           outlines_.front().front().z);
  Decimal highest = lowest;
  for (const auto& outline : outlines_)
  {
    for (const auto& point : outline)
    {
      const Decimal eta = inclination.earthHeight(point.y, point.z);
      lowest = std::min(lowest, eta);
      highest = std::max(highest, eta);
    }
  }
  return {lowest, highest};
}

std::vector<SectionIntegrator::Point> SectionIntegrator::clip(
  const std::vector<Point>& outline,
  const Decimal& waterLevel,
  const Inclination& inclination)
{
  std::vector<Point> result;
  result.reserve(outline.size() + 2);

  const size_t n = outline.size();
  for (size_t i = 0; i < n; ++i)
  {
    const Point& p = outline[i];
    const Point& q = outline[(i + 1) % n];
    const Decimal dp = inclination.earthHeight(p.y, p.z) - waterLevel;
    const Decimal dq = inclination.earthHeight(q.y, q.z) - waterLevel;

    const bool pInside = dp <= 0;
    const bool qInside = dq <= 0;
    if (pInside)
    {
      result.push_back(p);
    }
    if (pInside != qInside)
    {
      const Decimal t = dp / (dp - dq);
      result.push_back(Point{p.y + t * (q.y - p.y), p.z + t * (q.z - p.z)});
    }
  }
  return result;
}

std::vector<WaterlineChord> SectionIntegrator::chords(
  const std::vector<Point>& outline,
  const Decimal& waterLevel,
  const Inclination& inclination)
{
  std::vector<Decimal> crossings;

  const size_t n = outline.size();
  for (size_t i = 0; i < n; ++i)
  {
    const Point& p = outline[i];
    const Point& q = outline[(i + 1) % n];
    const Decimal dp = inclination.earthHeight(p.y, p.z) - waterLevel;
    const Decimal dq = inclination.earthHeight(q.y, q.z) - waterLevel;

    // Half-open test so a vertex on the waterline is counted once
    if ((dp > 0) != (dq > 0))
    {
      const Decimal t = dp / (dp - dq);
      const Decimal y = p.y + t * (q.y - p.y);
      const Decimal z = p.z + t * (q.z - p.z);
      crossings.push_back(inclination.alongWaterline(y, z));
    }
  }

  std::sort(crossings.begin(), crossings.end());

  std::vector<WaterlineChord> result;
  for (size_t i = 0; i + 1 < crossings.size(); i += 2)
  {
    if (crossings[i + 1] > crossings[i])
    {
      result.push_back(WaterlineChord{crossings[i], crossings[i + 1]});
    }
  }
  return result;
}

}  // namespace hydro_engine
