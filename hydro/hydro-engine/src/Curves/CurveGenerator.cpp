// Ticket: 0010_hydrostatic_curves

#include "hydro-engine/src/Curves/CurveGenerator.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "hydro-engine/src/Errors.hpp"

namespace hydro_engine
{

namespace
{

Decimal scalarValue(CurveType type, const HydroResult& result)
{
  switch (type)
  {
    case CurveType::Displacement:
      return result.displacement;
    case CurveType::Volume:
      return result.volume;
    case CurveType::KB:
      return result.kb;
    case CurveType::LCB:
      return result.lcb;
    case CurveType::Awp:
      return result.awp;
    case CurveType::GMt:
      return result.gmt.value_or(Decimal{0});
    case CurveType::BMt:
      return result.bmt;
    case CurveType::TPC:
      return result.tpc;
    case CurveType::Bonjean:
      break;
  }
  throw ArgumentError("Curve type has no scalar value");
}

}  // namespace

CurveGenerator::CurveGenerator(const HydroCalculator& calculator)
  : calculator_{calculator}
{
}

std::vector<Curve> CurveGenerator::generate(const Vessel& vessel,
                                            const Loadcase& loadcase,
                                            const CurveRequest& request,
                                            std::stop_token stopToken) const
{
  if (request.types.empty())
  {
    throw ArgumentError("At least one curve type must be requested");
  }
  if (request.minDraft <= 0)
  {
    throw ArgumentError("Minimum draft must be positive, got " + request.minDraft.str());
  }
  for (auto type : request.types)
  {
    if (type == CurveType::GMt && !loadcase.kg)
    {
      throw ArgumentError("GMt curve requires KG on loadcase '" + loadcase.id + "'");
    }
  }

  const auto drafts = sampleDrafts(request.minDraft, request.maxDraft, request.points);

  std::vector<HydroResult> results;
  results.reserve(drafts.size());
  for (const auto& draft : drafts)
  {
    if (stopToken.stop_requested())
    {
      throw OperationCancelledError("Curve generation cancelled after " +
                                    std::to_string(results.size()) + " of " +
                                    std::to_string(drafts.size()) + " drafts");
    }
    results.push_back(calculator_.compute(vessel, loadcase, FloatingCondition{draft, {}, {}}));
    spdlog::debug("Curve sample {} of {} at T={} m",
                  results.size(),
                  drafts.size(),
                  Numeric::toDouble(draft));
  }

  verifyMonotonic(results);

  std::vector<Curve> curves;
  for (auto type : request.types)
  {
    if (type == CurveType::Bonjean)
    {
      const auto& stations = vessel.geometry->stations();
      for (size_t pos = 0; pos < stations.size(); ++pos)
      {
        Curve curve{type, stations[pos].index, {}};
        curve.points.reserve(results.size());
        for (const auto& result : results)
        {
          curve.points.push_back(CurvePoint{result.draft, result.sectionAreas[pos]});
        }
        curves.push_back(std::move(curve));
      }
      continue;
    }

    Curve curve{type, std::nullopt, {}};
    curve.points.reserve(results.size());
    for (const auto& result : results)
    {
      curve.points.push_back(CurvePoint{result.draft, scalarValue(type, result)});
    }
    curves.push_back(std::move(curve));
  }
  return curves;
}

std::vector<Decimal> CurveGenerator::sampleDrafts(const Decimal& minDraft,
                                                  const Decimal& maxDraft,
                                                  int points)
{
  if (minDraft >= maxDraft)
  {
    throw ArgumentError("Minimum draft " + minDraft.str() +
                        " must be below maximum draft " + maxDraft.str());
  }
  if (points < 2)
  {
    throw ArgumentError("At least two sample points are required, got " +
                        std::to_string(points));
  }

  std::vector<Decimal> drafts;
  drafts.reserve(static_cast<size_t>(points));
  const Decimal spacing = (maxDraft - minDraft) / (points - 1);
  for (int i = 0; i < points - 1; ++i)
  {
    drafts.push_back(minDraft + spacing * i);
  }
  drafts.push_back(maxDraft);
  return drafts;
}

std::string_view CurveGenerator::curveName(CurveType type)
{
  switch (type)
  {
    case CurveType::Displacement:
      return "Displacement";
    case CurveType::Volume:
      return "Volume";
    case CurveType::KB:
      return "KB";
    case CurveType::LCB:
      return "LCB";
    case CurveType::Awp:
      return "Awp";
    case CurveType::GMt:
      return "GMt";
    case CurveType::BMt:
      return "BMt";
    case CurveType::TPC:
      return "TPC";
    case CurveType::Bonjean:
      return "Bonjean";
  }
  return "Unknown";
}

void CurveGenerator::verifyMonotonic(const std::vector<HydroResult>& results)
{
  for (size_t i = 1; i < results.size(); ++i)
  {
    if (results[i].volume < results[i - 1].volume)
    {
      spdlog::error("Displacement decreases between T={} m ({} m^3) and T={} m ({} m^3)",
                    Numeric::toDouble(results[i - 1].draft),
                    Numeric::toDouble(results[i - 1].volume),
                    Numeric::toDouble(results[i].draft),
                    Numeric::toDouble(results[i].volume));
      throw NumericalDefectError("Displacement curve is not monotonic at draft " +
                                 results[i].draft.str() + " m");
    }
  }
}

}  // namespace hydro_engine
