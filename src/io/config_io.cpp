#include "io/config_io.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "common/errors.hpp"
#include "io/store_io.hpp"

namespace fs = std::filesystem;

namespace h2site::io {

namespace {

using json = nlohmann::json;

const char* LogLevelName(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "warn";
}

void ReadCost(const json& j, CostParameters& c) {
  c.solar_capex_usd_per_kw = j.value("solar_capex_usd_per_kw", c.solar_capex_usd_per_kw);
  c.wind_capex_usd_per_kw = j.value("wind_capex_usd_per_kw", c.wind_capex_usd_per_kw);
  c.electrolyzer_capex_usd_per_kw = j.value("electrolyzer_capex_usd_per_kw", c.electrolyzer_capex_usd_per_kw);
  c.storage_capex_usd_per_kwh = j.value("storage_capex_usd_per_kwh", c.storage_capex_usd_per_kwh);
  c.storage_hours = j.value("storage_hours", c.storage_hours);
  c.grid_connection_usd_per_kw = j.value("grid_connection_usd_per_kw", c.grid_connection_usd_per_kw);
  c.other_capex_fraction = j.value("other_capex_fraction", c.other_capex_fraction);

  c.om_fraction = j.value("om_fraction", c.om_fraction);
  c.insurance_rate = j.value("insurance_rate", c.insurance_rate);
  c.labor_cost_usd_per_year = j.value("labor_cost_usd_per_year", c.labor_cost_usd_per_year);
  c.water_litres_per_kg = j.value("water_litres_per_kg", c.water_litres_per_kg);
  c.water_cost_usd_per_litre = j.value("water_cost_usd_per_litre", c.water_cost_usd_per_litre);

  c.discount_rate = j.value("discount_rate", c.discount_rate);
  c.project_lifetime_years = j.value("project_lifetime_years", c.project_lifetime_years);

  c.renewable_capacity_mw = j.value("renewable_capacity_mw", c.renewable_capacity_mw);
  c.capacity_factor_solar = j.value("capacity_factor_solar", c.capacity_factor_solar);
  c.capacity_factor_wind = j.value("capacity_factor_wind", c.capacity_factor_wind);
  c.score_capacity_floor = j.value("score_capacity_floor", c.score_capacity_floor);
  c.electrolyzer_efficiency = j.value("electrolyzer_efficiency", c.electrolyzer_efficiency);
  c.h2_lhv_kwh_per_kg = j.value("h2_lhv_kwh_per_kg", c.h2_lhv_kwh_per_kg);

  c.solar_reference_kwh_m2_day = j.value("solar_reference_kwh_m2_day", c.solar_reference_kwh_m2_day);
  c.wind_reference_ms = j.value("wind_reference_ms", c.wind_reference_ms);
  c.solar_weight = j.value("solar_weight", c.solar_weight);
  c.wind_weight = j.value("wind_weight", c.wind_weight);
  c.land_cost_weight = j.value("land_cost_weight", c.land_cost_weight);

  c.base_transport_usd_per_kg = j.value("base_transport_usd_per_kg", c.base_transport_usd_per_kg);
  c.grid_cost_usd_per_kg_km = j.value("grid_cost_usd_per_kg_km", c.grid_cost_usd_per_kg_km);
  c.network_cost_usd_per_kg_km = j.value("network_cost_usd_per_kg_km", c.network_cost_usd_per_kg_km);
  c.network_distance_cap_km = j.value("network_distance_cap_km", c.network_distance_cap_km);
}

// curve entries: [distance_km, bonus] or {"distance_km": .., "bonus_usd_per_kg": ..}
ProximityCurve ReadCurve(const json& arr) {
  if (!arr.is_array()) throw ConfigError("proximity.curve must be an array");
  ProximityCurve curve;
  curve.points.clear();
  for (const auto& p : arr) {
    ProximityBreakpoint bp;
    if (p.is_array() && p.size() == 2) {
      bp.distance_km = p.at(0).get<double>();
      bp.bonus_usd_per_kg = p.at(1).get<double>();
    } else if (p.is_object()) {
      bp.distance_km = p.at("distance_km").get<double>();
      bp.bonus_usd_per_kg = p.at("bonus_usd_per_kg").get<double>();
    } else {
      throw ConfigError("proximity.curve entries must be [distance_km, bonus] pairs");
    }
    curve.points.push_back(bp);
  }
  return curve;
}

void ReadProximity(const json& j, ProximityParams& p) {
  if (j.contains("curve")) p.curve = ReadCurve(j.at("curve"));
  if (j.contains("facility_types")) {
    const json& arr = j.at("facility_types");
    if (!arr.is_array()) throw ConfigError("proximity.facility_types must be an array");
    p.facility_types.clear();
    for (const auto& t : arr) {
      const auto ft = ParseFacilityType(t.get<std::string>());
      if (!ft) throw ConfigError("unknown facility type in config: " + t.get<std::string>());
      p.facility_types.push_back(*ft);
    }
  }
  p.include_planned = j.value("include_planned", p.include_planned);
}

} // namespace

EngineConfig ConfigIO::FromJson(const json& root) {
  if (!root.is_object()) throw ConfigError("configuration root must be a JSON object");

  EngineConfig cfg;
  try {
    if (root.contains("cost")) ReadCost(root.at("cost"), cfg.cost);
    if (root.contains("proximity")) ReadProximity(root.at("proximity"), cfg.proximity);

    if (root.contains("ranking")) {
      const json& r = root.at("ranking");
      cfg.ranking.grid_distance_threshold_km =
          r.value("grid_distance_threshold_km", cfg.ranking.grid_distance_threshold_km);
      cfg.ranking.max_results = r.value("max_results", cfg.ranking.max_results);
    }

    if (root.contains("data_source")) {
      const json& d = root.at("data_source");
      cfg.data_source.data_dir = d.value("data_dir", cfg.data_source.data_dir);
      cfg.data_source.fetch_timeout_ms = d.value("fetch_timeout_ms", cfg.data_source.fetch_timeout_ms);
      cfg.data_source.use_cache = d.value("use_cache", cfg.data_source.use_cache);
    }

    if (root.contains("log_level")) {
      const auto lvl = ParseLogLevel(root.at("log_level").get<std::string>());
      if (!lvl) throw ConfigError("unknown log_level: " + root.at("log_level").get<std::string>());
      cfg.log_level = *lvl;
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("malformed configuration: ") + e.what());
  }

  cfg.Validate();
  return cfg;
}

EngineConfig ConfigIO::Load(const std::string& path) {
  json root;
  try {
    root = StoreIO::ParseJson(StoreIO::ReadAllText(path), path);
  } catch (const std::runtime_error& e) {
    throw ConfigError(e.what());
  }
  EngineConfig cfg = FromJson(root);

  // relative data_dir is resolved against the config file location
  if (!cfg.data_source.data_dir.empty()) {
    const fs::path dd(cfg.data_source.data_dir);
    if (dd.is_relative()) {
      cfg.data_source.data_dir = (fs::path(path).parent_path() / dd).lexically_normal().string();
    }
  }
  return cfg;
}

void ConfigIO::ApplyEnvironment(EngineConfig& config) {
  if (const char* dir = std::getenv("H2SITE_DATA_DIR")) {
    config.data_source.data_dir = dir;
  }
  if (const char* ms = std::getenv("H2SITE_FETCH_TIMEOUT_MS")) {
    try {
      std::size_t used = 0;
      const std::string s(ms);
      const int v = std::stoi(s, &used);
      if (used != s.size()) throw std::invalid_argument(s);
      config.data_source.fetch_timeout_ms = v;
    } catch (const std::exception&) {
      throw ConfigError(std::string("H2SITE_FETCH_TIMEOUT_MS is not an integer: ") + ms);
    }
  }
  if (const char* lvl = std::getenv("H2SITE_LOG_LEVEL")) {
    const auto parsed = ParseLogLevel(lvl);
    if (!parsed) throw ConfigError(std::string("H2SITE_LOG_LEVEL unknown: ") + lvl);
    config.log_level = *parsed;
  }
  config.Validate();
}

json ConfigIO::ToJson(const CostParameters& c) {
  return json{
      {"solar_capex_usd_per_kw", c.solar_capex_usd_per_kw},
      {"wind_capex_usd_per_kw", c.wind_capex_usd_per_kw},
      {"electrolyzer_capex_usd_per_kw", c.electrolyzer_capex_usd_per_kw},
      {"storage_capex_usd_per_kwh", c.storage_capex_usd_per_kwh},
      {"storage_hours", c.storage_hours},
      {"grid_connection_usd_per_kw", c.grid_connection_usd_per_kw},
      {"other_capex_fraction", c.other_capex_fraction},
      {"om_fraction", c.om_fraction},
      {"insurance_rate", c.insurance_rate},
      {"labor_cost_usd_per_year", c.labor_cost_usd_per_year},
      {"water_litres_per_kg", c.water_litres_per_kg},
      {"water_cost_usd_per_litre", c.water_cost_usd_per_litre},
      {"discount_rate", c.discount_rate},
      {"project_lifetime_years", c.project_lifetime_years},
      {"renewable_capacity_mw", c.renewable_capacity_mw},
      {"capacity_factor_solar", c.capacity_factor_solar},
      {"capacity_factor_wind", c.capacity_factor_wind},
      {"score_capacity_floor", c.score_capacity_floor},
      {"electrolyzer_efficiency", c.electrolyzer_efficiency},
      {"h2_lhv_kwh_per_kg", c.h2_lhv_kwh_per_kg},
      {"solar_reference_kwh_m2_day", c.solar_reference_kwh_m2_day},
      {"wind_reference_ms", c.wind_reference_ms},
      {"solar_weight", c.solar_weight},
      {"wind_weight", c.wind_weight},
      {"land_cost_weight", c.land_cost_weight},
      {"base_transport_usd_per_kg", c.base_transport_usd_per_kg},
      {"grid_cost_usd_per_kg_km", c.grid_cost_usd_per_kg_km},
      {"network_cost_usd_per_kg_km", c.network_cost_usd_per_kg_km},
      {"network_distance_cap_km", c.network_distance_cap_km},
  };
}

json ConfigIO::ToJson(const EngineConfig& config) {
  json curve = json::array();
  for (const auto& p : config.proximity.curve.points) {
    curve.push_back(json::array({p.distance_km, p.bonus_usd_per_kg}));
  }
  json types = json::array();
  for (const auto t : config.proximity.facility_types) types.push_back(ToString(t));

  return json{
      {"cost", ToJson(config.cost)},
      {"proximity", {{"curve", curve}, {"facility_types", types}, {"include_planned", config.proximity.include_planned}}},
      {"ranking", {{"grid_distance_threshold_km", config.ranking.grid_distance_threshold_km},
                   {"max_results", config.ranking.max_results}}},
      {"data_source", {{"data_dir", config.data_source.data_dir},
                       {"fetch_timeout_ms", config.data_source.fetch_timeout_ms},
                       {"use_cache", config.data_source.use_cache}}},
      {"log_level", LogLevelName(config.log_level)},
  };
}

} // namespace h2site::io
