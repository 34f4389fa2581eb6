#include "io/result_formatter.hpp"

#include <cmath>

#include "common/region.hpp"
#include "io/config_io.hpp"
#include "io/request_io.hpp"
#include "io/store_io.hpp"

namespace h2site::io {

namespace {

using json = nlohmann::json;

// inf/NaN have no JSON form
json FiniteOrNull(double v) {
  if (!std::isfinite(v)) return nullptr;
  return v;
}

} // namespace

json ResultFormatter::Feature(const RankedSite& r, const OptimizationContext& ctx) {
  const CandidateSite& c = r.site;
  const RenewablePotentialRecord& rec = *c.record;

  json nearest = "None";
  std::string nearest_type = "none";
  if (ctx.snapshot && c.nearest_infrastructure >= 0 &&
      static_cast<std::size_t>(c.nearest_infrastructure) < ctx.snapshot->infrastructure.size()) {
    const auto& fac = ctx.snapshot->infrastructure[static_cast<std::size_t>(c.nearest_infrastructure)];
    nearest = fac.facility_name;
    nearest_type = ToString(fac.facility_type);
  }

  return json{
      {"type", "Feature"},
      {"geometry", {{"type", "Point"}, {"coordinates", json::array({rec.longitude, rec.latitude})}}},
      {"properties",
       {
           {"site_name", rec.site_name},
           {"region", rec.state.empty() ? std::string(RegionKey(ctx.request.region)) : rec.state},
           {"rank", r.rank},
           {"lcoh", c.lcoh},
           {"production_cost", c.production_cost},
           {"transport_cost", c.transport_cost},
           {"infrastructure_proximity_km", FiniteOrNull(c.infrastructure_proximity_km)},
           {"annual_production_tonnes", c.annual_production_tonnes},
           {"renewable_potential", c.renewable_score},
           {"grid_distance_km", rec.grid_distance_km},
           {"nearest_infrastructure", nearest},
           {"infrastructure_type", nearest_type},
           {"max_cost", ctx.request.max_cost},
       }},
  };
}

json ResultFormatter::Format(const OptimizationContext& ctx, const EngineConfig& config) {
  json features = json::array();
  for (const auto& r : ctx.ranked) {
    features.push_back(Feature(r, ctx));
  }

  json sources = json::array();
  if (ctx.snapshot) {
    for (const auto& s : ctx.snapshot->data_sources) sources.push_back(s);
  }

  const RegionInfo& region = GetRegionInfo(ctx.request.region);

  json metadata = {
      {"optimization_criteria", RequestIO::ToJson(ctx.request)},
      {"algorithm", kAlgorithmId},
      {"engine_version", kEngineVersion},
      {"data_sources", sources},
      {"degraded_mode", ctx.degraded_mode},
      {"total_sites_found", ctx.ranked.size()},
      {"candidates_evaluated", ctx.candidates.size()},
      {"skipped_records", ctx.skipped_records},
      {"region_focus", region.display_name},
      {"map_center", json::array({region.center_lat, region.center_lon})},
      {"map_zoom", region.zoom},
      {"methodology", "Levelized cost of hydrogen with infrastructure proximity adjustment"},
      {"cost_parameters_used", ConfigIO::ToJson(config.cost)},
  };

  return json{
      {"type", "FeatureCollection"},
      {"features", features},
      {"metadata", metadata},
  };
}

json ResultFormatter::Envelope(const json& collection) {
  return json{
      {"status", "success"},
      {"message", "Optimization completed successfully"},
      {"data", collection},
  };
}

json ResultFormatter::Error(const std::string& kind, const std::string& message) {
  return json{
      {"status", "error"},
      {"error", kind},
      {"message", message},
  };
}

} // namespace h2site::io
