#include "cost/cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace h2site::cost {

namespace {

constexpr double kHoursPerYear = 8760.0;
constexpr double kKwPerMw = 1000.0;

inline double Clamp01(double v) { return std::clamp(v, 0.0, 1.0); }

} // namespace

RenewableScore ScoreResource(const RenewablePotentialRecord& rec, const CostParameters& p) {
  RenewableScore s;
  s.solar_score = Clamp01(rec.solar_irradiance / p.solar_reference_kwh_m2_day);
  s.wind_score = Clamp01(rec.wind_speed / p.wind_reference_ms);
  s.renewable_score = p.solar_weight * s.solar_score + p.wind_weight * s.wind_score;
  return s;
}

std::optional<std::string> CheckRecord(const RenewablePotentialRecord& rec) {
  if (!std::isfinite(rec.latitude) || !std::isfinite(rec.longitude) ||
      rec.latitude < -90.0 || rec.latitude > 90.0 ||
      rec.longitude < -180.0 || rec.longitude > 180.0) {
    return std::string("coordinates missing or out of range");
  }
  if (!std::isfinite(rec.solar_irradiance) || rec.solar_irradiance < 0.0) {
    return std::string("solar irradiance negative or missing");
  }
  if (!std::isfinite(rec.wind_speed) || rec.wind_speed < 0.0) {
    return std::string("wind speed negative or missing");
  }
  if (rec.solar_irradiance <= 0.0 && rec.wind_speed <= 0.0) {
    return std::string("no solar or wind resource");
  }
  if (!std::isfinite(rec.land_suitability) || rec.land_suitability < 0.0 || rec.land_suitability > 1.0) {
    return std::string("land suitability outside [0,1]");
  }
  if (!std::isfinite(rec.grid_distance_km) || rec.grid_distance_km < 0.0) {
    return std::string("grid distance negative or missing");
  }
  return std::nullopt;
}

double SolarFraction(const RenewableScore& s) {
  const double den = s.solar_score + s.wind_score;
  if (den <= 0.0) return 0.0;
  return s.solar_score / den;
}

double EffectiveCapacityFactor(const RenewableScore& s, const CostParameters& p) {
  if (s.solar_score <= 0.0 && s.wind_score <= 0.0) return 0.0;
  const double sf = SolarFraction(s);
  const double blend = sf * p.capacity_factor_solar + (1.0 - sf) * p.capacity_factor_wind;
  const double scale = p.score_capacity_floor + (1.0 - p.score_capacity_floor) * Clamp01(s.renewable_score);
  return blend * scale;
}

double AnnualProductionKg(double capacity_factor, const CostParameters& p) {
  const double kwh_per_kg = p.h2_lhv_kwh_per_kg / p.electrolyzer_efficiency;
  const double energy_kwh = p.renewable_capacity_mw * kKwPerMw * kHoursPerYear * capacity_factor;
  return energy_kwh / kwh_per_kg;
}

double Capex(const RenewableScore& s, const CostParameters& p) {
  const double kw = p.renewable_capacity_mw * kKwPerMw;
  const double sf = SolarFraction(s);

  const double solar = kw * sf * p.solar_capex_usd_per_kw;
  const double wind = kw * (1.0 - sf) * p.wind_capex_usd_per_kw;
  const double electrolyzer = kw * p.electrolyzer_capex_usd_per_kw;
  const double storage = kw * p.storage_hours * p.storage_capex_usd_per_kwh;
  const double grid = kw * p.grid_connection_usd_per_kw;

  const double direct = solar + wind + electrolyzer + storage + grid;
  return direct * (1.0 + p.other_capex_fraction);
}

double AnnualOpex(double capex, double annual_production_kg, const CostParameters& p) {
  const double om = capex * p.om_fraction;
  const double insurance = capex * p.insurance_rate;
  const double water = annual_production_kg * p.water_litres_per_kg * p.water_cost_usd_per_litre;
  return om + insurance + p.labor_cost_usd_per_year + water;
}

double DiscountFactorSum(double rate, int years) {
  double sum = 0.0;
  double df = 1.0;
  for (int t = 1; t <= years; ++t) {
    df /= (1.0 + rate);
    sum += df;
  }
  return sum;
}

double LevelizedCost(double capex, double opex_annual, double annual_production_kg, const CostParameters& p) {
  const double dfs = DiscountFactorSum(p.discount_rate, p.project_lifetime_years);
  const double pv_cost = capex + opex_annual * dfs;
  const double pv_production = annual_production_kg * dfs;
  if (pv_production <= 0.0) return std::numeric_limits<double>::infinity();
  return pv_cost / pv_production;
}

double LandFactor(double land_suitability, const CostParameters& p) {
  return 1.0 + p.land_cost_weight * (1.0 - Clamp01(land_suitability));
}

double TransportCost(double grid_distance_km, double network_km, double proximity_bonus, const CostParameters& p) {
  double network_term = 0.0;
  if (std::isfinite(network_km)) {
    network_term = p.network_cost_usd_per_kg_km * std::min(network_km, p.network_distance_cap_km);
  } else {
    network_term = p.network_cost_usd_per_kg_km * p.network_distance_cap_km;
  }
  const double raw = p.base_transport_usd_per_kg
                   + p.grid_cost_usd_per_kg_km * grid_distance_km
                   + network_term
                   - proximity_bonus;
  return std::max(0.0, raw);
}

bool Evaluate(CandidateSite& site, const CostParameters& p) {
  const RenewablePotentialRecord& rec = *site.record;
  const RenewableScore s{site.solar_score, site.wind_score, site.renewable_score};

  site.capacity_factor = EffectiveCapacityFactor(s, p);
  if (!(site.capacity_factor > 0.0)) return false;

  const double production_kg = AnnualProductionKg(site.capacity_factor, p);
  if (!(production_kg > 0.0) || !std::isfinite(production_kg)) return false;

  site.capex_usd = Capex(s, p);
  site.opex_annual_usd = AnnualOpex(site.capex_usd, production_kg, p);
  site.annual_production_tonnes = production_kg / 1000.0;

  site.production_cost = LevelizedCost(site.capex_usd, site.opex_annual_usd, production_kg, p)
                       * LandFactor(rec.land_suitability, p);
  site.transport_cost = TransportCost(rec.grid_distance_km, site.transport_network_km, site.proximity_bonus, p);
  site.lcoh = site.production_cost + site.transport_cost;

  return std::isfinite(site.lcoh);
}

} // namespace h2site::cost
