#pragma once
#include "common/config.hpp"
#include "stages/stage_base.hpp"

namespace h2site {

// ======================
// Stage: levelized cost of hydrogen
// Flow: Proximity -> [Cost] -> Ranking
//
// Input:
//   ctx.candidates (scores + proximity fields)
//
// Output (per candidate):
//   capacity_factor, capex_usd, opex_annual_usd, annual_production_tonnes,
//   production_cost, transport_cost, lcoh (= production_cost + transport_cost)
//
// Candidates that cannot produce (zero capacity factor, non-finite cost) are
// removed and counted in ctx.skipped_records.
// ======================
class CostStage final : public IStage {
public:
  explicit CostStage(const CostParameters& params) : params_(params) {}

  void Run(OptimizationContext& ctx) const override;
  const char* Name() const override { return "Cost"; }

private:
  const CostParameters& params_;
};

} // namespace h2site
