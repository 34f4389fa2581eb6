#include "stages/ranking_stage.hpp"

#include "ranking/ranking.hpp"

namespace h2site {

void RankingStage::Run(OptimizationContext& ctx) const {
  ctx.ranked = RankCandidates(ctx.candidates, ctx.request, params_);
}

} // namespace h2site
