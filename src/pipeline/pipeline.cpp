#include "pipeline/pipeline.hpp"

#include <string>

#include "common/log.hpp"

// concrete stages
#include "stages/candidate_build_stage.hpp"
#include "stages/cost_stage.hpp"
#include "stages/proximity_stage.hpp"
#include "stages/ranking_stage.hpp"

namespace h2site {

Pipeline::Pipeline(const EngineConfig& config) {
  stages_.emplace_back(std::make_unique<CandidateBuildStage>(config.cost));
  stages_.emplace_back(std::make_unique<ProximityStage>(config.proximity));
  stages_.emplace_back(std::make_unique<CostStage>(config.cost));
  stages_.emplace_back(std::make_unique<RankingStage>(config.ranking));
}

void Pipeline::Run(OptimizationContext& ctx) const {
  for (const auto& stage : stages_) {
    stage->Run(ctx);
    LogDebug(std::string("stage ") + stage->Name() + ": candidates=" + std::to_string(ctx.candidates.size()) +
             " skipped=" + std::to_string(ctx.skipped_records) + " ranked=" + std::to_string(ctx.ranked.size()));
  }
}

} // namespace h2site
