#include "hydro-engine/src/Utils/HullFactory.hpp"

#include <string>
#include <utility>
#include <vector>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace
{

void requirePositive(const Decimal& value, const char* name)
{
  if (value <= 0)
  {
    throw ArgumentError(std::string{name} + " must be positive, got " + value.str());
  }
}

void requireDivisions(int count, const char* name)
{
  if (count < 2)
  {
    throw ArgumentError(std::string{"At least two "} + name + " are required, got " +
                        std::to_string(count));
  }
}

std::vector<Station> equallySpacedStations(const Decimal& length, int count)
{
  std::vector<Station> stations;
  stations.reserve(static_cast<size_t>(count));
  for (int i = 0; i < count; ++i)
  {
    stations.push_back(Station{i, length * i / (count - 1)});
  }
  return stations;
}

}  // namespace

HullGeometry HullFactory::createBarge(const Decimal& length,
                                      const Decimal& beam,
                                      const Decimal& depth,
                                      int stations,
                                      int waterlines)
{
  requirePositive(length, "Length");
  requirePositive(beam, "Beam");
  requirePositive(depth, "Depth");
  requireDivisions(stations, "stations");
  requireDivisions(waterlines, "waterlines");

  std::vector<Waterline> levels;
  std::vector<Offset> offsets;
  for (int j = 0; j < waterlines; ++j)
  {
    levels.push_back(Waterline{j, depth * j / (waterlines - 1)});
    for (int i = 0; i < stations; ++i)
    {
      offsets.push_back(Offset{i, j, beam / 2});
    }
  }

  return HullGeometry{equallySpacedStations(length, stations), std::move(levels), offsets};
}

HullGeometry HullFactory::createWigley(const Decimal& length,
                                       const Decimal& beam,
                                       const Decimal& draft,
                                       int stations,
                                       int waterlines,
                                       const std::optional<Decimal>& depth)
{
  requirePositive(length, "Length");
  requirePositive(beam, "Beam");
  requirePositive(draft, "Draft");
  requireDivisions(stations, "stations");
  requireDivisions(waterlines, "waterlines");
  if (depth && *depth < draft)
  {
    throw ArgumentError("Depth " + depth->str() + " lies below the draft " + draft.str());
  }

  const Decimal spacing = draft / (waterlines - 1);
  std::vector<Waterline> levels;
  for (int j = 0; j < waterlines; ++j)
  {
    levels.push_back(Waterline{j, spacing * j});
  }
  if (depth)
  {
    for (Decimal z = draft + spacing; z <= *depth; z += spacing)
    {
      levels.push_back(Waterline{static_cast<int>(levels.size()), z});
    }
  }

  auto positions = equallySpacedStations(length, stations);
  const Decimal halfLength = length / 2;

  std::vector<Offset> offsets;
  offsets.reserve(positions.size() * levels.size());
  for (const auto& station : positions)
  {
    const Decimal xi = (station.x - halfLength) / halfLength;
    for (const auto& level : levels)
    {
      const Decimal zeta = level.z < draft ? (draft - level.z) / draft : Decimal{0};
      offsets.push_back(Offset{station.index,
                               level.index,
                               beam / 2 * (1 - xi * xi) * (1 - zeta * zeta)});
    }
  }

  return HullGeometry{std::move(positions), std::move(levels), offsets};
}

}  // namespace hydro_engine
