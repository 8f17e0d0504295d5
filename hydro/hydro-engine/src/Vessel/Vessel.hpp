// Ticket: 0007_vessel_loadcase_model

#ifndef HYDRO_ENGINE_VESSEL_VESSEL_HPP
#define HYDRO_ENGINE_VESSEL_VESSEL_HPP

#include <memory>
#include <optional>
#include <string>

#include "hydro-engine/src/Geometry/HullGeometry.hpp"
#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/// Sea water density used when a loadcase does not override it [kg/m^3]
inline const Decimal kDefaultSeaWaterDensity{1025};

/**
 * @brief Principal particulars and geometry snapshot of a vessel
 *
 * Particulars are optional; when absent the engine falls back to the
 * geometry's station span and maximum breadth.
 */
struct Vessel
{
  std::string id;
  std::string name;
  std::optional<Decimal> lpp;          // [m]
  std::optional<Decimal> beam;         // [m]
  std::optional<Decimal> designDraft;  // [m]
  std::shared_ptr<const HullGeometry> geometry;
};

/**
 * @brief Loading condition of a vessel
 *
 * KG and LCG are measured from the baseline and the aft station reference
 * respectively. A target displacement is a mass [kg].
 */
struct Loadcase
{
  std::string id;
  std::string vesselId;
  std::string name;
  Decimal rho{kDefaultSeaWaterDensity};
  std::optional<Decimal> kg;
  std::optional<Decimal> lcg;
  std::optional<Decimal> targetDisplacement;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_VESSEL_VESSEL_HPP
