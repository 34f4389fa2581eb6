#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/types.hpp"

namespace h2site::io {

// ResultFormatter turns a finished OptimizationContext into the external
// GeoJSON response:
//
//   { "type": "FeatureCollection",
//     "features": [ { "type": "Feature",
//                     "geometry": { "type": "Point", "coordinates": [lon, lat] },
//                     "properties": { site_name, region, rank, lcoh, production_cost,
//                                     transport_cost, infrastructure_proximity_km,
//                                     annual_production_tonnes, ... } } ],
//     "metadata": { optimization_criteria, algorithm, data_sources, degraded_mode,
//                   skipped_records, ... } }
//
// Values are written unrounded so lcoh == production_cost + transport_cost
// survives serialisation.
class ResultFormatter {
public:
  static nlohmann::json Format(const OptimizationContext& ctx, const EngineConfig& config);

  static nlohmann::json Feature(const RankedSite& r, const OptimizationContext& ctx);

  // { "status": "success", "message": ..., "data": collection }
  static nlohmann::json Envelope(const nlohmann::json& collection);

  // { "status": "error", "error": kind, "message": ... }
  static nlohmann::json Error(const std::string& kind, const std::string& message);
};

} // namespace h2site::io
