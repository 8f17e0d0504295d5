// Ticket: 0010_hydrostatic_curves

#ifndef HYDRO_ENGINE_CURVES_CURVE_GENERATOR_HPP
#define HYDRO_ENGINE_CURVES_CURVE_GENERATOR_HPP

#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

#include "hydro-engine/src/Hydrostatics/HydroCalculator.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"
#include "hydro-engine/src/Vessel/Vessel.hpp"

namespace hydro_engine
{

enum class CurveType
{
  Displacement,  ///< displaced mass [kg]
  Volume,        ///< [m^3]
  KB,
  LCB,
  Awp,
  GMt,  ///< requires KG
  BMt,
  TPC,
  Bonjean  ///< sectional area per station
};

struct CurvePoint
{
  Decimal x{0};  // draft [m]
  Decimal y{0};
};

/**
 * @brief Ordered (draft, value) samples of one hydrostatic quantity
 *
 * Bonjean curves carry the index of their station.
 */
struct Curve
{
  CurveType type{CurveType::Displacement};
  std::optional<int> stationIndex;
  std::vector<CurvePoint> points;
};

struct CurveRequest
{
  std::vector<CurveType> types;
  Decimal minDraft{0};
  Decimal maxDraft{0};
  int points{0};
};

/**
 * @brief Sweeps the hydrostatic calculator over a draft range
 *
 * One upright calculation per sampled draft feeds every requested curve.
 * The displacement sequence of each sweep is verified non-decreasing.
 *
 * @ticket 0010_hydrostatic_curves
 */
class CurveGenerator
{
public:
  explicit CurveGenerator(const HydroCalculator& calculator);

  /**
   * @brief Generate the requested curves
   *
   * @return One curve per scalar type in request order; Bonjean expands to one
   *         curve per station
   *
   * @throws ArgumentError if no type is requested, minDraft <= 0,
   *         minDraft >= maxDraft, points < 2, or GMt is requested without KG
   * @throws OperationCancelledError if a stop is requested between drafts
   * @throws NumericalDefectError if displacement decreases with draft
   */
  [[nodiscard]] std::vector<Curve> generate(const Vessel& vessel,
                                            const Loadcase& loadcase,
                                            const CurveRequest& request,
                                            std::stop_token stopToken = {}) const;

  /**
   * @brief Linearly spaced drafts, both endpoints included exactly
   * @throws ArgumentError if minDraft >= maxDraft or points < 2
   */
  [[nodiscard]] static std::vector<Decimal> sampleDrafts(const Decimal& minDraft,
                                                         const Decimal& maxDraft,
                                                         int points);

  [[nodiscard]] static std::string_view curveName(CurveType type);

private:
  static void verifyMonotonic(const std::vector<HydroResult>& results);

  const HydroCalculator& calculator_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_CURVES_CURVE_GENERATOR_HPP
