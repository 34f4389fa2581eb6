#pragma once
#include "common/config.hpp"
#include "stages/stage_base.hpp"

namespace h2site {

// ======================
// Stage: infrastructure / transport proximity
// Flow: CandidateBuild -> [Proximity] -> Cost
//
// Input:
//   ctx.candidates (record coordinates)
//   ctx.snapshot->infrastructure / transport
//
// Output (per candidate):
//   infrastructure_proximity_km, nearest_infrastructure, proximity_bonus,
//   transport_network_km
// ======================
class ProximityStage final : public IStage {
public:
  explicit ProximityStage(const ProximityParams& params) : params_(params) {}

  void Run(OptimizationContext& ctx) const override;
  const char* Name() const override { return "Proximity"; }

private:
  const ProximityParams& params_;
};

} // namespace h2site
