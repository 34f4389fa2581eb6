#pragma once
#include "common/types.hpp"

namespace h2site {

// Each step of one optimization call is a Stage; inputs and outputs travel
// through OptimizationContext. Stages hold only read-only configuration, so
// a Stage never carries state from one call into the next.
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(OptimizationContext& ctx) const = 0;
  virtual const char* Name() const = 0;
};

} // namespace h2site
