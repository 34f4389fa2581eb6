#include "stages/candidate_build_stage.hpp"

#include "common/log.hpp"
#include "cost/cost_model.hpp"

namespace h2site {

void CandidateBuildStage::Run(OptimizationContext& ctx) const {
  ctx.candidates.clear();
  ctx.skipped_records = 0;
  if (!ctx.snapshot) return;

  const auto& records = ctx.snapshot->renewable;
  ctx.candidates.reserve(records.size());

  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& rec = records[i];
    if (const auto why = cost::CheckRecord(rec)) {
      ++ctx.skipped_records;
      LogDebug("skipping record #" + std::to_string(i) + " (" + rec.site_name + "): " + *why);
      continue;
    }

    CandidateSite c;
    c.input_index = i;
    c.record = &rec;
    c.snapshot = ctx.snapshot;
    const auto score = cost::ScoreResource(rec, params_);
    c.solar_score = score.solar_score;
    c.wind_score = score.wind_score;
    c.renewable_score = score.renewable_score;
    ctx.candidates.push_back(c);
  }
}

} // namespace h2site
