// Ticket: 0004_hull_offset_grid

#ifndef HYDRO_ENGINE_GEOMETRY_HULL_GEOMETRY_HPP
#define HYDRO_ENGINE_GEOMETRY_HULL_GEOMETRY_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/// Transverse section position along the hull [m from the aft reference]
struct Station
{
  int index{0};
  Decimal x{0};
};

/// Horizontal plane height above the baseline [m]
struct Waterline
{
  int index{0};
  Decimal z{0};
};

/// Half-breadth at a station/waterline intersection [m]
struct Offset
{
  int stationIndex{0};
  int waterlineIndex{0};
  Decimal halfBreadth{0};
};

/// One vertex of a section's starboard profile
struct SectionNode
{
  Decimal z{0};
  Decimal halfBreadth{0};
};

/**
 * @brief Behaviour above the highest defined offset of a station
 *
 * Clamp extends the section as a vertical wall with the top half-breadth.
 * Flag reports the height as out of range and integration stops at the top.
 */
enum class AboveRangePolicy
{
  Clamp,
  Flag
};

/**
 * @brief Discretized, laterally symmetric hull shape
 *
 * Stations and waterlines are sorted by index and addressed by contiguous
 * position (0..n-1). Offsets live in a dense grid with a presence mask, so a
 * missing offset is an explicit hole rather than an absent key.
 *
 * Immutable after construction; share via std::shared_ptr<const HullGeometry>.
 *
 * @ticket 0004_hull_offset_grid
 */
class HullGeometry
{
public:
  /**
   * @brief Build and validate the offset grid
   *
   * @param stations Stations in any order
   * @param waterlines Waterlines in any order
   * @param offsets Sparse half-breadths keyed by station/waterline index
   *
   * @throws GeometryIncompleteError if fewer than two stations or waterlines
   *         exist, or a station has no offsets
   * @throws ArgumentError if indices repeat, coordinates are not strictly
   *         increasing with index, a half-breadth is negative, or an offset
   *         references an unknown index
   */
  HullGeometry(std::vector<Station> stations,
               std::vector<Waterline> waterlines,
               const std::vector<Offset>& offsets);

  [[nodiscard]] size_t stationCount() const
  {
    return stations_.size();
  }

  [[nodiscard]] size_t waterlineCount() const
  {
    return waterlines_.size();
  }

  [[nodiscard]] const std::vector<Station>& stations() const
  {
    return stations_;
  }

  [[nodiscard]] const std::vector<Waterline>& waterlines() const
  {
    return waterlines_;
  }

  /// Station x-coordinates ordered by position
  [[nodiscard]] const std::vector<Decimal>& stationX() const
  {
    return stationX_;
  }

  /**
   * @brief Position of a station index
   * @throws ArgumentError if no station carries the index
   */
  [[nodiscard]] size_t stationPosition(int stationIndex) const;

  /// Raw grid value, std::nullopt where no offset was supplied
  [[nodiscard]] std::optional<Decimal> offset(size_t stationPos,
                                              size_t waterlinePos) const;

  /**
   * @brief Half-breadth at an arbitrary height of a station
   *
   * Linear between the nearest defined offsets, tapering linearly to zero at
   * the keel below the lowest one and zero below the keel.
   *
   * @param stationPos Station position (0..stationCount()-1)
   * @param z Height above baseline [m]
   * @param policy Behaviour above the highest defined offset
   * @return Half-breadth [m], or std::nullopt above range under Flag
   */
  [[nodiscard]] std::optional<Decimal> halfBreadth(size_t stationPos,
                                                   const Decimal& z,
                                                   AboveRangePolicy policy) const;

  /**
   * @brief Integration nodes of a station's starboard profile
   *
   * The defined offsets in increasing z, preceded by a zero-breadth keel node
   * when the lowest offset sits above the keel.
   */
  [[nodiscard]] const std::vector<SectionNode>& sectionNodes(
    size_t stationPos) const;

  [[nodiscard]] const Decimal& keelHeight() const
  {
    return keelHeight_;
  }

  /// Highest defined waterline height [m]
  [[nodiscard]] const Decimal& topHeight() const
  {
    return waterlines_.back().z;
  }

  /// Longitudinal extent of the stations [m]
  [[nodiscard]] Decimal length() const;

  [[nodiscard]] Decimal midshipX() const;

  [[nodiscard]] Decimal maxHalfBreadth() const;

private:
  std::vector<Station> stations_;
  std::vector<Waterline> waterlines_;
  std::vector<Decimal> stationX_;

  DecimalMatrix halfBreadths_;
  PresenceMask present_;

  std::vector<std::vector<SectionNode>> nodes_;
  Decimal keelHeight_{0};
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_GEOMETRY_HULL_GEOMETRY_HPP
