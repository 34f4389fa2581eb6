#pragma once
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"

namespace h2site {

// Filter criteria for one candidate.
bool PassesFilters(const CandidateSite& c, const OptimizationRequest& req, const RankingParams& params);

// Pure: (candidates, criteria) -> ranked sequence.
//   keep:  lcoh <= max_cost && production >= min_production
//          && (!proximity_to_grid || grid_distance_km < threshold)
//   order: lcoh asc, renewable_score desc, input order
//   rank:  1..N dense
// An empty result is not an error.
// Each RankedSite copies its candidate, including the snapshot reference,
// so the result stays valid after the caller drops its own SnapshotPtr.
RankedResult RankCandidates(const std::vector<CandidateSite>& candidates,
                            const OptimizationRequest& req,
                            const RankingParams& params);

} // namespace h2site
