#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "common/config.hpp"

namespace h2site::io {

// ConfigIO fills EngineConfig from a JSON document. Every key is optional;
// absent keys keep the compiled-in defaults.
//
//   {
//     "cost":        { "solar_capex_usd_per_kw": 550, ..., "project_lifetime_years": 20 },
//     "proximity":   { "curve": [[0, 0.4], [10, 0.4], [50, 0.2], [100, 0.0], [300, -0.6]],
//                      "facility_types": ["port", "industrial_park", "substation"],
//                      "include_planned": true },
//     "ranking":     { "grid_distance_threshold_km": 50, "max_results": 0 },
//     "data_source": { "data_dir": "demo/store", "fetch_timeout_ms": 5000, "use_cache": true },
//     "log_level":   "warn"
//   }
//
// Environment overrides (applied by ApplyEnvironment):
//   H2SITE_DATA_DIR, H2SITE_FETCH_TIMEOUT_MS, H2SITE_LOG_LEVEL
class ConfigIO {
public:
  // throws ConfigError; result is validated
  static EngineConfig Load(const std::string& path);

  // throws ConfigError; result is validated
  static EngineConfig FromJson(const nlohmann::json& root);

  // throws ConfigError on malformed values; re-validates
  static void ApplyEnvironment(EngineConfig& config);

  static nlohmann::json ToJson(const CostParameters& cost);
  static nlohmann::json ToJson(const EngineConfig& config);
};

} // namespace h2site::io
