#pragma once
#include "common/config.hpp"
#include "stages/stage_base.hpp"

namespace h2site {

// ======================
// Stage: candidate construction + renewable scoring
// Flow: fetch -> [CandidateBuild] -> Proximity -> Cost -> Ranking
//
// Input:
//   ctx.snapshot->renewable
//
// Output:
//   ctx.candidates: one per usable record, in snapshot order, with
//                   input_index/record/solar_score/wind_score/renewable_score
//   ctx.skipped_records: records rejected as InvalidRecord
// ======================
class CandidateBuildStage final : public IStage {
public:
  explicit CandidateBuildStage(const CostParameters& params) : params_(params) {}

  void Run(OptimizationContext& ctx) const override;
  const char* Name() const override { return "CandidateBuild"; }

private:
  const CostParameters& params_;
};

} // namespace h2site
