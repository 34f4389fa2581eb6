#include "common/config.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "common/errors.hpp"

namespace h2site {

double ProximityCurve::Evaluate(double distance_km) const {
  if (points.empty()) return 0.0;
  if (!(distance_km > points.front().distance_km)) return points.front().bonus_usd_per_kg;
  if (distance_km >= points.back().distance_km) return points.back().bonus_usd_per_kg;

  const auto it = std::upper_bound(
      points.begin(), points.end(), distance_km,
      [](double d, const ProximityBreakpoint& p) { return d < p.distance_km; });
  const auto& hi = *it;
  const auto& lo = *(it - 1);
  const double span = hi.distance_km - lo.distance_km;
  const double t = (distance_km - lo.distance_km) / span;
  return lo.bonus_usd_per_kg + t * (hi.bonus_usd_per_kg - lo.bonus_usd_per_kg);
}

double ProximityCurve::MaxBonus() const {
  return points.empty() ? 0.0 : points.front().bonus_usd_per_kg;
}

double ProximityCurve::MaxPenalty() const {
  return points.empty() ? 0.0 : points.back().bonus_usd_per_kg;
}

void ProximityCurve::Validate() const {
  if (points.empty()) throw ConfigError("proximity curve: at least one breakpoint required");
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& p = points[i];
    if (!std::isfinite(p.distance_km) || !std::isfinite(p.bonus_usd_per_kg) || p.distance_km < 0.0) {
      std::ostringstream oss;
      oss << "proximity curve: invalid breakpoint #" << i;
      throw ConfigError(oss.str());
    }
    if (i == 0) continue;
    if (!(p.distance_km > points[i - 1].distance_km)) {
      std::ostringstream oss;
      oss << "proximity curve: distances must be strictly increasing (breakpoint #" << i << ")";
      throw ConfigError(oss.str());
    }
    if (p.bonus_usd_per_kg > points[i - 1].bonus_usd_per_kg) {
      std::ostringstream oss;
      oss << "proximity curve: bonus must not increase with distance (breakpoint #" << i << ")";
      throw ConfigError(oss.str());
    }
  }
}

bool ProximityParams::IsOfInterest(const InfrastructureRecord& rec) const {
  if (!include_planned && rec.status != FacilityStatus::kOperational) return false;
  return std::find(facility_types.begin(), facility_types.end(), rec.facility_type) != facility_types.end();
}

namespace {

void RequirePositive(double v, const char* name) {
  if (!std::isfinite(v) || v <= 0.0) throw ConfigError(std::string(name) + " must be > 0");
}

void RequireNonNegative(double v, const char* name) {
  if (!std::isfinite(v) || v < 0.0) throw ConfigError(std::string(name) + " must be >= 0");
}

void RequireFraction(double v, const char* name) {
  if (!std::isfinite(v) || v < 0.0 || v > 1.0) throw ConfigError(std::string(name) + " must be in [0,1]");
}

} // namespace

void EngineConfig::Validate() const {
  const auto& c = cost;
  RequireNonNegative(c.solar_capex_usd_per_kw, "solar_capex_usd_per_kw");
  RequireNonNegative(c.wind_capex_usd_per_kw, "wind_capex_usd_per_kw");
  RequireNonNegative(c.electrolyzer_capex_usd_per_kw, "electrolyzer_capex_usd_per_kw");
  RequireNonNegative(c.storage_capex_usd_per_kwh, "storage_capex_usd_per_kwh");
  RequireNonNegative(c.storage_hours, "storage_hours");
  RequireNonNegative(c.grid_connection_usd_per_kw, "grid_connection_usd_per_kw");
  RequireNonNegative(c.other_capex_fraction, "other_capex_fraction");
  RequireNonNegative(c.om_fraction, "om_fraction");
  RequireNonNegative(c.insurance_rate, "insurance_rate");
  RequireNonNegative(c.labor_cost_usd_per_year, "labor_cost_usd_per_year");
  RequireNonNegative(c.water_litres_per_kg, "water_litres_per_kg");
  RequireNonNegative(c.water_cost_usd_per_litre, "water_cost_usd_per_litre");
  if (!std::isfinite(c.discount_rate) || c.discount_rate <= -1.0) {
    throw ConfigError("discount_rate must be > -1");
  }
  if (c.project_lifetime_years < 1) throw ConfigError("project_lifetime_years must be >= 1");
  RequirePositive(c.renewable_capacity_mw, "renewable_capacity_mw");
  RequireFraction(c.capacity_factor_solar, "capacity_factor_solar");
  RequireFraction(c.capacity_factor_wind, "capacity_factor_wind");
  RequireFraction(c.score_capacity_floor, "score_capacity_floor");
  RequireFraction(c.electrolyzer_efficiency, "electrolyzer_efficiency");
  RequirePositive(c.electrolyzer_efficiency, "electrolyzer_efficiency");
  RequirePositive(c.h2_lhv_kwh_per_kg, "h2_lhv_kwh_per_kg");
  RequirePositive(c.solar_reference_kwh_m2_day, "solar_reference_kwh_m2_day");
  RequirePositive(c.wind_reference_ms, "wind_reference_ms");
  RequireNonNegative(c.solar_weight, "solar_weight");
  RequireNonNegative(c.wind_weight, "wind_weight");
  RequireNonNegative(c.land_cost_weight, "land_cost_weight");
  RequireNonNegative(c.base_transport_usd_per_kg, "base_transport_usd_per_kg");
  RequireNonNegative(c.grid_cost_usd_per_kg_km, "grid_cost_usd_per_kg_km");
  RequireNonNegative(c.network_cost_usd_per_kg_km, "network_cost_usd_per_kg_km");
  RequireNonNegative(c.network_distance_cap_km, "network_distance_cap_km");

  proximity.curve.Validate();

  RequireNonNegative(ranking.grid_distance_threshold_km, "grid_distance_threshold_km");
  if (ranking.max_results < 0) throw ConfigError("max_results must be >= 0");
  if (data_source.fetch_timeout_ms <= 0) throw ConfigError("fetch_timeout_ms must be > 0");
}

} // namespace h2site
