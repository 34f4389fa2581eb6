#pragma once
#include <optional>
#include <string>

#include "common/config.hpp"
#include "common/types.hpp"

namespace h2site::cost {

struct RenewableScore {
  double solar_score{0.0}; // min(irradiance / reference, 1)
  double wind_score{0.0};  // min(wind / reference, 1)
  double renewable_score{0.0};
};

RenewableScore ScoreResource(const RenewablePotentialRecord& rec, const CostParameters& p);

// Empty optional when the record can be used; otherwise why it cannot
// (the candidate is skipped, the batch continues).
std::optional<std::string> CheckRecord(const RenewablePotentialRecord& rec);

// Share of installed renewable capacity that is solar, from the two scores.
double SolarFraction(const RenewableScore& s);

// Capacity factor of the combined plant; 0 when the site has no resource.
double EffectiveCapacityFactor(const RenewableScore& s, const CostParameters& p);

double AnnualProductionKg(double capacity_factor, const CostParameters& p);

double Capex(const RenewableScore& s, const CostParameters& p);

double AnnualOpex(double capex, double annual_production_kg, const CostParameters& p);

// Sum_{t=1..T} 1/(1+r)^t
double DiscountFactorSum(double rate, int years);

// (CAPEX + Sum OPEX/(1+r)^t) / Sum P/(1+r)^t, $/kg
double LevelizedCost(double capex, double opex_annual, double annual_production_kg, const CostParameters& p);

double LandFactor(double land_suitability, const CostParameters& p);

// Additive transport term, >= 0.
double TransportCost(double grid_distance_km, double network_km, double proximity_bonus, const CostParameters& p);

// Fills the cost fields of `site` (scores and proximity must already be set).
// Returns false when no production is possible; the candidate must be dropped.
bool Evaluate(CandidateSite& site, const CostParameters& p);

} // namespace h2site::cost
