#pragma once
#include <cstddef>
#include <memory>
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"
#include "stages/stage_base.hpp"

namespace h2site {

// Pipeline chains the stages in flow order:
//   CandidateBuild -> Proximity -> Cost -> Ranking
// Any stage can be swapped for another implementation as long as it keeps
// its context contract. `config` must outlive the pipeline.
class Pipeline {
public:
  explicit Pipeline(const EngineConfig& config);

  // ctx.request and ctx.snapshot must be set.
  void Run(OptimizationContext& ctx) const;

  std::size_t size() const { return stages_.size(); }

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace h2site
