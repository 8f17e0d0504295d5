// Ticket: 0007_vessel_loadcase_model

#ifndef HYDRO_ENGINE_VESSEL_IN_MEMORY_VESSEL_REPOSITORY_HPP
#define HYDRO_ENGINE_VESSEL_IN_MEMORY_VESSEL_REPOSITORY_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "hydro-engine/src/Vessel/VesselDataProvider.hpp"

namespace hydro_engine
{

/**
 * @brief Process-local store of vessels and loadcases
 *
 * Geometry is held as shared immutable snapshots. Replacing a vessel's
 * geometry swaps the pointer; callers that already resolved the vessel keep
 * computing against the geometry they received.
 *
 * Thread Safety:
 *   All public methods are thread-safe via internal mutex.
 */
class InMemoryVesselRepository final : public VesselDataProvider
{
public:
  InMemoryVesselRepository() = default;

  InMemoryVesselRepository(const InMemoryVesselRepository&) = delete;
  InMemoryVesselRepository& operator=(const InMemoryVesselRepository&) = delete;

  /**
   * @brief Insert or replace a vessel
   * @throws ArgumentError if the id is empty or the geometry is null
   */
  void putVessel(Vessel vessel);

  /**
   * @brief Swap a vessel's geometry for a re-imported one
   * @throws NotFoundError if the vessel is unknown
   * @throws ArgumentError if the geometry is null
   */
  void replaceGeometry(const std::string& vesselId,
                       std::shared_ptr<const HullGeometry> geometry);

  /**
   * @brief Insert or replace a loadcase
   * @throws NotFoundError if the owning vessel is unknown
   * @throws ArgumentError if the id is empty or rho <= 0
   */
  void putLoadcase(Loadcase loadcase);

  /**
   * @brief Remove a vessel and its loadcases
   * @return true if the vessel existed
   */
  bool removeVessel(const std::string& vesselId);

  [[nodiscard]] std::optional<Vessel> findVessel(const std::string& vesselId) const;

  [[nodiscard]] std::optional<Loadcase> findLoadcase(
    const std::string& loadcaseId) const;

  [[nodiscard]] Vessel vessel(const std::string& vesselId) const override;

  [[nodiscard]] Loadcase loadcase(const std::string& loadcaseId) const override;

private:
  std::unordered_map<std::string, Vessel> vessels_;
  std::unordered_map<std::string, Loadcase> loadcases_;

  mutable std::mutex mutex_;
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_VESSEL_IN_MEMORY_VESSEL_REPOSITORY_HPP
