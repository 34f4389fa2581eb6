#pragma once
#include <memory>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/types.hpp"
#include "data/reference_data_provider.hpp"

namespace h2site {

// SiteOptimizer is the entry point shared by every boundary variant
// (plain collection, status envelope, status probe).
//
//   request -> validate -> live provider (bounded by fetch_timeout_ms)
//           -> on DataUnavailable: fallback provider, degraded_mode = true
//           -> Pipeline -> ResultFormatter
//
// All methods are const and keep their working state on the stack, so one
// SiteOptimizer can serve concurrent callers. Providers must be thread-safe.
class SiteOptimizer {
public:
  // `live` may be null (no store configured): every call runs degraded.
  SiteOptimizer(EngineConfig config, ProviderPtr live, ProviderPtr fallback);

  // Live provider = JSON store from config.data_source (cached when
  // use_cache), fallback = FallbackSimulator.
  static SiteOptimizer FromConfig(const EngineConfig& config);

  // Fetch step alone: live data, or fallback data tagged degraded.
  SnapshotPtr ResolveSnapshot(Region region) const;

  // Full run without formatting. throws RequestError.
  OptimizationContext Run(const OptimizationRequest& req) const;

  // GeoJSON FeatureCollection. throws RequestError.
  nlohmann::json Optimize(const OptimizationRequest& req) const;
  nlohmann::json Optimize(const nlohmann::json& body) const;

  // {status, message, data}; request errors come back as an error envelope.
  nlohmann::json OptimizeEnveloped(const nlohmann::json& body) const;

  // Engine identity plus whether the live provider is reachable.
  nlohmann::json Status() const;

  const EngineConfig& config() const { return config_; }

private:
  EngineConfig config_;
  ProviderPtr live_;
  ProviderPtr fallback_;
};

} // namespace h2site
