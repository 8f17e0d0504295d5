// Ticket: 0008_hydrostatic_calculator

#ifndef HYDRO_ENGINE_HYDROSTATICS_HYDRO_RESULT_HPP
#define HYDRO_ENGINE_HYDROSTATICS_HYDRO_RESULT_HPP

#include <optional>
#include <vector>

#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/**
 * @brief Floating condition at which hydrostatics are evaluated
 *
 * Draft is measured at midships (mid-point of the station span). Trim angle
 * is positive bow up, heel angle positive starboard down, both in degrees.
 */
struct FloatingCondition
{
  Decimal draft{0};
  std::optional<Decimal> trimAngle;
  std::optional<Decimal> heelAngle;
};

/**
 * @brief Hydrostatic properties of one floating condition
 *
 * Every value is quantized to the calculator's result digits. Lengths are in
 * metres and measured from the baseline (vertical), the aft station reference
 * (longitudinal) and the centerplane (transverse).
 */
struct HydroResult
{
  Decimal draft{0};
  std::optional<Decimal> trimAngle;  // [deg]
  std::optional<Decimal> heelAngle;  // [deg]
  Decimal draftForward{0};
  Decimal draftAft{0};

  Decimal volume{0};        // [m^3]
  Decimal displacement{0};  // displaced mass, volume * rho [kg]

  Decimal kb{0};
  Decimal lcb{0};
  Decimal tcb{0};

  Decimal awp{0};            // [m^2]
  Decimal lcf{0};
  Decimal iwp{0};            // longitudinal second moment about LCF [m^4]
  Decimal iwpTransverse{0};  // [m^4]

  Decimal bmt{0};
  Decimal bml{0};
  std::optional<Decimal> gmt;
  std::optional<Decimal> gml;

  Decimal cb{0};
  Decimal cp{0};
  Decimal cm{0};
  Decimal cwp{0};

  Decimal tpc{0};  // [t/cm]
  Decimal mtc{0};  // [t m/cm]

  std::vector<Decimal> sectionAreas;  // per station position [m^2]
  bool aboveGeometryRange{false};
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_HYDROSTATICS_HYDRO_RESULT_HPP
