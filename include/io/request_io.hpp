#pragma once
#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace h2site::io {

// Optimize request body:
//   { "region": "<key>", "max_cost": 6.0, "min_production": 1000, "proximity_to_grid": true }
// Missing optional fields take the defaults shown. Unknown keys are ignored.
class RequestIO {
public:
  // throws InvalidRegionError / InvalidCriteriaError
  static OptimizationRequest Parse(const nlohmann::json& body);

  // throws InvalidCriteriaError (max_cost <= 0, min_production < 0, non-finite)
  static void Validate(const OptimizationRequest& req);

  // Echo used in response metadata.
  static nlohmann::json ToJson(const OptimizationRequest& req);
};

} // namespace h2site::io
