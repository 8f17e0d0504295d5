// Ticket: 0005_sectional_integration

#ifndef HYDRO_ENGINE_INTEGRATION_SECTION_INTEGRATOR_HPP
#define HYDRO_ENGINE_INTEGRATION_SECTION_INTEGRATOR_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "hydro-engine/src/Geometry/HullGeometry.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/**
 * @brief Wetted extent of a section's waterline
 *
 * Measured along the (possibly inclined) waterline from the centerplane,
 * positive to starboard. from < to.
 */
struct WaterlineChord
{
  Decimal from{0};
  Decimal to{0};
};

/**
 * @brief Submerged properties of one transverse section
 *
 * Areas and moments cover the full (port + starboard) section.
 */
struct SectionProperties
{
  Decimal area{0};     // [m^2]
  Decimal momentY{0};  // first moment about the centerplane [m^3]
  Decimal momentZ{0};  // first moment about the baseline [m^3]
  Decimal waterlineHalfBreadth{0};
  std::vector<WaterlineChord> chords;
  bool aboveRange{false};
};

/**
 * @brief Transverse inclination of the waterline, starboard down positive
 */
struct Inclination
{
  Decimal cosine{1};
  Decimal sine{0};

  /**
   * @brief Build from a heel angle
   * @throws ArgumentError if |degrees| >= 90
   */
  static Inclination fromDegrees(const Decimal& degrees);

  [[nodiscard]] bool isUpright() const
  {
    return sine == 0;
  }

  /// Height of a section point above the inclined reference plane
  [[nodiscard]] Decimal earthHeight(const Decimal& y, const Decimal& z) const
  {
    return z * cosine - y * sine;
  }

  /// Coordinate of a section point along the inclined waterline
  [[nodiscard]] Decimal alongWaterline(const Decimal& y, const Decimal& z) const
  {
    return y * cosine + z * sine;
  }
};

/**
 * @brief Integrates single transverse sections of a hull
 *
 * Upright sections use composite Simpson over the section's profile nodes
 * with a continuity-preserving partial interval. Inclined sections clip the
 * closed section outline by the waterline half-plane and integrate the
 * resulting polygon exactly.
 *
 * Per-station profile integrals and outlines are prepared once at
 * construction. The referenced geometry must outlive the integrator.
 *
 * @ticket 0005_sectional_integration
 */
class SectionIntegrator
{
public:
  SectionIntegrator(const HullGeometry& geometry, AboveRangePolicy policy);

  /**
   * @brief Upright section submerged to a local draft
   *
   * For z_k <= d < z_{k+1} the half-section area is
   *
   *   F(k) + T(z_k, d) + t [F(k+1) - F(k) - T(z_k, z_{k+1})]
   *
   * with F the Simpson prefix integral, T the trapezoid on the interpolated
   * breadth and t the fraction of the interval covered. The expression equals
   * F(k) at d = z_k and F(k+1) at d = z_{k+1}, so area is continuous in draft.
   * Below the second node it reduces to the trapezoidal rule.
   *
   * @param stationPos Station position
   * @param localDraft Waterline height at this station [m]
   */
  [[nodiscard]] SectionProperties upright(size_t stationPos,
                                          const Decimal& localDraft) const;

  /**
   * @brief Section submerged below an inclined waterline
   *
   * Submerged region is { (y, z) : z cos(phi) - y sin(phi) <= waterLevel }.
   *
   * @param stationPos Station position
   * @param waterLevel Height of the waterline along the inclined normal [m]
   * @param inclination Heel of the waterline
   */
  [[nodiscard]] SectionProperties inclined(size_t stationPos,
                                           const Decimal& waterLevel,
                                           const Inclination& inclination) const;

  /// Lowest and highest earth height over every section outline
  [[nodiscard]] std::pair<Decimal, Decimal> levelRange(
    const Inclination& inclination) const;

  [[nodiscard]] const HullGeometry& geometry() const
  {
    return geometry_;
  }

  [[nodiscard]] AboveRangePolicy policy() const
  {
    return policy_;
  }

private:
  struct Point
  {
    Decimal y;
    Decimal z;
  };

  struct Profile
  {
    std::vector<Decimal> z;
    std::vector<Decimal> y;
    std::vector<Decimal> areaPrefix;
    std::vector<Decimal> momentPrefix;
  };

  static std::vector<Point> clip(const std::vector<Point>& outline,
                                 const Decimal& waterLevel,
                                 const Inclination& inclination);

  static std::vector<WaterlineChord> chords(const std::vector<Point>& outline,
                                            const Decimal& waterLevel,
                                            const Inclination& inclination);

  const HullGeometry& geometry_;
  AboveRangePolicy policy_;

  std::vector<Profile> profiles_;
  std::vector<std::vector<Point>> outlines_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_INTEGRATION_SECTION_INTEGRATOR_HPP
