#include "stages/cost_stage.hpp"

#include <utility>
#include <vector>

#include "common/log.hpp"
#include "cost/cost_model.hpp"

namespace h2site {

// =========================
// Cost conventions
// =========================
// 1) production_cost: levelized plant cost (CAPEX + discounted OPEX over
//    discounted output), scaled by the land factor. Production is constant
//    across the lifetime, no ramp-up.
// 2) transport_cost: base + grid connection distance + distance to the
//    transport network (capped) - proximity bonus, floored at 0.
// 3) lcoh is computed as the sum of the two, never separately, so the
//    identity lcoh == production_cost + transport_cost holds exactly.
//
void CostStage::Run(OptimizationContext& ctx) const {
  std::vector<CandidateSite> kept;
  kept.reserve(ctx.candidates.size());

  for (auto& c : ctx.candidates) {
    if (!cost::Evaluate(c, params_)) {
      ++ctx.skipped_records;
      LogDebug("skipping " + c.record->site_name + ": no hydrogen output possible");
      continue;
    }
    kept.push_back(std::move(c));
  }
  ctx.candidates = std::move(kept);
}

} // namespace h2site
