#pragma once
#include <string>
#include <vector>

#include "common/log.hpp"
#include "common/types.hpp"

namespace h2site {

inline constexpr const char* kEngineName = "H2SITE_LCOH_Optimizer";
inline constexpr const char* kEngineVersion = "1.0.0";
inline constexpr const char* kAlgorithmId = "H2SITE_LCOH_Optimizer_v1.0";

// ========================
// Cost model coefficients
// ========================
//
// Plant layout assumed per site: `renewable_capacity_mw` of solar+wind split by
// the site's solar share, an electrolyzer of the same nameplate, battery
// storage of `storage_hours` at full power, and one grid connection.
struct CostParameters {
  // CAPEX rates
  double solar_capex_usd_per_kw{550.0};
  double wind_capex_usd_per_kw{850.0};
  double electrolyzer_capex_usd_per_kw{450.0};
  double storage_capex_usd_per_kwh{120.0};
  double storage_hours{1.0};
  double grid_connection_usd_per_kw{40.0};
  double other_capex_fraction{0.08}; // civil works, engineering

  // OPEX
  double om_fraction{0.025};       // of CAPEX per year
  double insurance_rate{0.01};     // of CAPEX per year
  double labor_cost_usd_per_year{500000.0};
  double water_litres_per_kg{20.0};
  double water_cost_usd_per_litre{0.001};

  // financing
  double discount_rate{0.08};
  int project_lifetime_years{20};

  // plant / resource
  double renewable_capacity_mw{100.0};
  double capacity_factor_solar{0.20};
  double capacity_factor_wind{0.35};
  double score_capacity_floor{0.6}; // cf multiplier at renewable_score == 0
  double electrolyzer_efficiency{0.70};
  double h2_lhv_kwh_per_kg{33.33};

  // renewable score: weight * min(value / reference, 1)
  double solar_reference_kwh_m2_day{7.0};
  double wind_reference_ms{9.0};
  double solar_weight{0.7};
  double wind_weight{0.3};

  double land_cost_weight{0.25}; // production cost x (1 + w * (1 - land_suitability))

  // transport term ($/kg)
  double base_transport_usd_per_kg{0.50};
  double grid_cost_usd_per_kg_km{0.004};
  double network_cost_usd_per_kg_km{0.002};
  double network_distance_cap_km{200.0};
};

// ========================
// Proximity bonus curve
// ========================

struct ProximityBreakpoint {
  double distance_km{0.0};
  double bonus_usd_per_kg{0.0}; // > 0 discount, < 0 penalty
};

// Piecewise-linear, clamped at both ends. Distances strictly increasing,
// bonuses non-increasing: the curve is monotone and bounded by
// [back().bonus, front().bonus].
struct ProximityCurve {
  std::vector<ProximityBreakpoint> points{
      {0.0, 0.40},
      {10.0, 0.40},
      {50.0, 0.20},
      {100.0, 0.0},
      {300.0, -0.60},
  };

  double Evaluate(double distance_km) const;
  double MaxBonus() const;
  double MaxPenalty() const;

  // throws ConfigError
  void Validate() const;
};

struct ProximityParams {
  ProximityCurve curve;
  std::vector<FacilityType> facility_types{
      FacilityType::kPort, FacilityType::kIndustrialPark, FacilityType::kSubstation};
  bool include_planned{true}; // planned / under_construction facilities count

  bool IsOfInterest(const InfrastructureRecord& rec) const;
};

struct RankingParams {
  double grid_distance_threshold_km{50.0}; // used when proximity_to_grid is set
  int max_results{0};                      // 0 = no cap
};

struct DataSourceParams {
  std::string data_dir;        // JSON store directory, empty = no live store
  int fetch_timeout_ms{5000};
  bool use_cache{true};
};

struct EngineConfig {
  CostParameters cost;
  ProximityParams proximity;
  RankingParams ranking;
  DataSourceParams data_source;
  LogLevel log_level{LogLevel::kWarn};

  // throws ConfigError
  void Validate() const;
};

} // namespace h2site
