#pragma once
#include "common/config.hpp"
#include "stages/stage_base.hpp"

namespace h2site {

// ======================
// Stage: filter + rank
// Flow: Cost -> [Ranking] -> ResultFormatter
//
// Input:
//   ctx.candidates, ctx.request (max_cost, min_production, proximity_to_grid)
//
// Output:
//   ctx.ranked (rank 1..N, lcoh non-decreasing); empty when nothing passes
// ======================
class RankingStage final : public IStage {
public:
  explicit RankingStage(const RankingParams& params) : params_(params) {}

  void Run(OptimizationContext& ctx) const override;
  const char* Name() const override { return "Ranking"; }

private:
  const RankingParams& params_;
};

} // namespace h2site
