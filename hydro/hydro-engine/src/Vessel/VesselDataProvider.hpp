// Ticket: 0007_vessel_loadcase_model

#ifndef HYDRO_ENGINE_VESSEL_VESSEL_DATA_PROVIDER_HPP
#define HYDRO_ENGINE_VESSEL_VESSEL_DATA_PROVIDER_HPP

#include <string>

#include "hydro-engine/src/Vessel/Vessel.hpp"

namespace hydro_engine
{

/**
 * @brief Read interface through which the engine resolves its inputs
 *
 * Implementations return snapshots: the engine keeps whatever it received
 * for the duration of one call.
 */
class VesselDataProvider
{
public:
  virtual ~VesselDataProvider() = default;

  /**
   * @throws NotFoundError if no vessel has the id
   */
  [[nodiscard]] virtual Vessel vessel(const std::string& vesselId) const = 0;

  /**
   * @throws NotFoundError if no loadcase has the id
   */
  [[nodiscard]] virtual Loadcase loadcase(const std::string& loadcaseId) const = 0;

protected:
  VesselDataProvider() = default;
  VesselDataProvider(const VesselDataProvider&) = default;
  VesselDataProvider& operator=(const VesselDataProvider&) = default;
  VesselDataProvider(VesselDataProvider&&) = default;
  VesselDataProvider& operator=(VesselDataProvider&&) = default;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_VESSEL_VESSEL_DATA_PROVIDER_HPP
