// Ticket: 0004_hull_offset_grid

#include "hydro-engine/src/Geometry/HullGeometry.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace
{

template <typename T>
void sortAndValidate(std::vector<T>& entries,
                     Decimal T::*coordinate,
                     const std::string& what)
{
  std::sort(entries.begin(),
            entries.end(),
            [](const T& a, const T& b) { return a.index < b.index; });

  for (size_t i = 1; i < entries.size(); ++i)
  {
    if (entries[i].index == entries[i - 1].index)
    {
      throw ArgumentError("Duplicate " + what + " index " +
                          std::to_string(entries[i].index));
    }
    if (entries[i].*coordinate <= entries[i - 1].*coordinate)
    {
      throw ArgumentError(what + " coordinates must be strictly increasing by index (index " +
                          std::to_string(entries[i].index) + ")");
    }
  }
}

template <typename T>
size_t positionOf(const std::vector<T>& entries, int index, const std::string& what)
{
  auto it = std::lower_bound(entries.begin(),
                             entries.end(),
                             index,
                             [](const T& entry, int value) { return entry.index < value; });
  if (it == entries.end() || it->index != index)
  {
    throw ArgumentError("Unknown " + what + " index " + std::to_string(index));
  }
  return static_cast<size_t>(std::distance(entries.begin(), it));
}

}  // namespace

HullGeometry::HullGeometry(std::vector<Station> stations,
                           std::vector<Waterline> waterlines,
                           const std::vector<Offset>& offsets)
  : stations_{std::move(stations)}, waterlines_{std::move(waterlines)}
{
  if (stations_.size() < 2)
  {
    throw GeometryIncompleteError("Hull geometry needs at least two stations, got " +
                                  std::to_string(stations_.size()));
  }
  if (waterlines_.size() < 2)
  {
    throw GeometryIncompleteError("Hull geometry needs at least two waterlines, got " +
                                  std::to_string(waterlines_.size()));
  }

  sortAndValidate(stations_, &Station::x, "station");
  sortAndValidate(waterlines_, &Waterline::z, "waterline");

  const auto nStations = static_cast<Eigen::Index>(stations_.size());
  const auto nWaterlines = static_cast<Eigen::Index>(waterlines_.size());
  halfBreadths_ = DecimalMatrix::Constant(nStations, nWaterlines, Decimal{0});
  present_ = PresenceMask::Constant(nStations, nWaterlines, false);

  for (const auto& entry : offsets)
  {
    if (entry.halfBreadth < 0)
    {
      throw ArgumentError("Negative half-breadth at station " +
                          std::to_string(entry.stationIndex) + ", waterline " +
                          std::to_string(entry.waterlineIndex));
    }

    const auto s = static_cast<Eigen::Index>(
      positionOf(stations_, entry.stationIndex, "station"));
    const auto w = static_cast<Eigen::Index>(
      positionOf(waterlines_, entry.waterlineIndex, "waterline"));
    if (present_(s, w))
    {
      throw ArgumentError("Duplicate offset at station " +
                          std::to_string(entry.stationIndex) + ", waterline " +
                          std::to_string(entry.waterlineIndex));
    }

    halfBreadths_(s, w) = entry.halfBreadth;
    present_(s, w) = true;
  }

  keelHeight_ = std::min(Decimal{0}, waterlines_.front().z);

  stationX_.reserve(stations_.size());
  nodes_.resize(stations_.size());
  for (Eigen::Index s = 0; s < nStations; ++s)
  {
    stationX_.push_back(stations_[static_cast<size_t>(s)].x);

    auto& nodes = nodes_[static_cast<size_t>(s)];
    for (Eigen::Index w = 0; w < nWaterlines; ++w)
    {
      if (present_(s, w))
      {
        nodes.push_back(SectionNode{waterlines_[static_cast<size_t>(w)].z,
                                    halfBreadths_(s, w)});
      }
    }

    if (nodes.empty())
    {
      throw GeometryIncompleteError(
        "Station " + std::to_string(stations_[static_cast<size_t>(s)].index) +
        " has no offsets");
    }
    if (nodes.front().z > keelHeight_)
    {
      nodes.insert(nodes.begin(), SectionNode{keelHeight_, Decimal{0}});
    }
  }
}

size_t HullGeometry::stationPosition(int stationIndex) const
{
  return positionOf(stations_, stationIndex, "station");
}

std::optional<Decimal> HullGeometry::offset(size_t stationPos,
                                            size_t waterlinePos) const
{
  const auto s = static_cast<Eigen::Index>(stationPos);
  const auto w = static_cast<Eigen::Index>(waterlinePos);
  if (!present_(s, w))
  {
    return std::nullopt;
  }
  return halfBreadths_(s, w);
}

std::optional<Decimal> HullGeometry::halfBreadth(size_t stationPos,
                                                 const Decimal& z,
                                                 AboveRangePolicy policy) const
{
  const auto& nodes = sectionNodes(stationPos);

  if (z <= nodes.front().z)
  {
    // Only reached when the lowest offset sits on the keel itself
    return z < nodes.front().z ? Decimal{0} : nodes.front().halfBreadth;
  }

  if (z > nodes.back().z)
  {
    if (policy == AboveRangePolicy::Flag)
    {
      return std::nullopt;
    }
    return nodes.back().halfBreadth;
  }

  auto upper = std::lower_bound(
    nodes.begin(),
    nodes.end(),
    z,
    [](const SectionNode& node, const Decimal& value) { return node.z < value; });
  auto lower = std::prev(upper);

  const Decimal t = (z - lower->z) / (upper->z - lower->z);
  return lower->halfBreadth + t * (upper->halfBreadth - lower->halfBreadth);
}

const std::vector<SectionNode>& HullGeometry::sectionNodes(size_t stationPos) const
{
  if (stationPos >= nodes_.size())
  {
    throw ArgumentError("Station position " + std::to_string(stationPos) +
                        " out of range");
  }
  return nodes_[stationPos];
}

Decimal HullGeometry::length() const
{
  return stationX_.back() - stationX_.front();
}

Decimal HullGeometry::midshipX() const
{
  return (stationX_.front() + stationX_.back()) / 2;
}

Decimal HullGeometry::maxHalfBreadth() const
{
  Decimal widest{0};
  for (const auto& nodes : nodes_)
  {
    for (const auto& node : nodes)
    {
      widest = std::max(widest, node.halfBreadth);
    }
  }
  return widest;
}

}  // namespace hydro_engine
