#include "ranking/ranking.hpp"

#include <algorithm>
#include <cmath>

namespace h2site {

bool PassesFilters(const CandidateSite& c, const OptimizationRequest& req, const RankingParams& params) {
  if (!std::isfinite(c.lcoh) || c.lcoh > req.max_cost) return false;
  if (c.annual_production_tonnes < req.min_production) return false;
  if (req.proximity_to_grid) {
    if (c.record == nullptr) return false;
    if (!(c.record->grid_distance_km < params.grid_distance_threshold_km)) return false;
  }
  return true;
}

RankedResult RankCandidates(const std::vector<CandidateSite>& candidates,
                            const OptimizationRequest& req,
                            const RankingParams& params) {
  std::vector<const CandidateSite*> kept;
  kept.reserve(candidates.size());
  for (const auto& c : candidates) {
    if (PassesFilters(c, req, params)) kept.push_back(&c);
  }

  std::stable_sort(kept.begin(), kept.end(), [](const CandidateSite* a, const CandidateSite* b) {
    if (a->lcoh != b->lcoh) return a->lcoh < b->lcoh;
    if (a->renewable_score != b->renewable_score) return a->renewable_score > b->renewable_score;
    return a->input_index < b->input_index;
  });

  std::size_t n = kept.size();
  if (params.max_results > 0) n = std::min<std::size_t>(n, static_cast<std::size_t>(params.max_results));

  RankedResult out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(RankedSite{static_cast<int>(i + 1), *kept[i]});
  }
  return out;
}

} // namespace h2site
