// Ticket: 0007_vessel_loadcase_model

#include "hydro-engine/src/Vessel/InMemoryVesselRepository.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

void InMemoryVesselRepository::putVessel(Vessel vessel)
{
  if (vessel.id.empty())
  {
    throw ArgumentError("Vessel id must not be empty");
  }
  if (!vessel.geometry)
  {
    throw ArgumentError("Vessel '" + vessel.id + "' has no hull geometry");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = vessel.id;
  vessels_.insert_or_assign(id, std::move(vessel));
}

void InMemoryVesselRepository::replaceGeometry(
  const std::string& vesselId,
  std::shared_ptr<const HullGeometry> geometry)
{
  if (!geometry)
  {
    throw ArgumentError("Replacement geometry for vessel '" + vesselId +
                        "' is null");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vessels_.find(vesselId);
  if (it == vessels_.end())
  {
    throw NotFoundError("Vessel '" + vesselId + "' not found");
  }
  it->second.geometry = std::move(geometry);
  spdlog::debug("Replaced geometry of vessel '{}'", vesselId);
}

void InMemoryVesselRepository::putLoadcase(Loadcase loadcase)
{
  if (loadcase.id.empty())
  {
    throw ArgumentError("Loadcase id must not be empty");
  }
  if (loadcase.rho <= 0)
  {
    throw ArgumentError("Loadcase '" + loadcase.id +
                        "' density must be positive, got " + loadcase.rho.str());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (vessels_.find(loadcase.vesselId) == vessels_.end())
  {
    throw NotFoundError("Vessel '" + loadcase.vesselId + "' of loadcase '" +
                        loadcase.id + "' not found");
  }
  const std::string id = loadcase.id;
  loadcases_.insert_or_assign(id, std::move(loadcase));
}

bool InMemoryVesselRepository::removeVessel(const std::string& vesselId)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (vessels_.erase(vesselId) == 0)
  {
    return false;
  }

  std::erase_if(loadcases_,
                [&vesselId](const auto& entry)
                { return entry.second.vesselId == vesselId; });
  return true;
}

std::optional<Vessel> InMemoryVesselRepository::findVessel(
  const std::string& vesselId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = vessels_.find(vesselId);
  if (it == vessels_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Loadcase> InMemoryVesselRepository::findLoadcase(
  const std::string& loadcaseId) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loadcases_.find(loadcaseId);
  if (it == loadcases_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

Vessel InMemoryVesselRepository::vessel(const std::string& vesselId) const
{
  auto found = findVessel(vesselId);
  if (!found)
  {
    throw NotFoundError("Vessel '" + vesselId + "' not found");
  }
  return *std::move(found);
}

Loadcase InMemoryVesselRepository::loadcase(const std::string& loadcaseId) const
{
  auto found = findLoadcase(loadcaseId);
  if (!found)
  {
    throw NotFoundError("Loadcase '" + loadcaseId + "' not found");
  }
  return *std::move(found);
}

}  // namespace hydro_engine
