#include "optimizer/site_optimizer.hpp"

#include <chrono>
#include <utility>

#include "common/errors.hpp"
#include "common/log.hpp"
#include "common/region.hpp"
#include "data/caching_provider.hpp"
#include "data/fallback_simulator.hpp"
#include "data/json_store_provider.hpp"
#include "io/request_io.hpp"
#include "io/result_formatter.hpp"
#include "pipeline/pipeline.hpp"

namespace h2site {

SiteOptimizer::SiteOptimizer(EngineConfig config, ProviderPtr live, ProviderPtr fallback)
    : config_(std::move(config)), live_(std::move(live)), fallback_(std::move(fallback)) {
  config_.Validate();
  if (!fallback_) fallback_ = std::make_shared<FallbackSimulator>();
}

SiteOptimizer SiteOptimizer::FromConfig(const EngineConfig& config) {
  ProviderPtr live;
  if (!config.data_source.data_dir.empty()) {
    live = std::make_shared<JsonStoreDataProvider>(config.data_source.data_dir);
    if (config.data_source.use_cache) live = std::make_shared<CachingDataProvider>(live);
  }
  return SiteOptimizer(config, std::move(live), std::make_shared<FallbackSimulator>());
}

SnapshotPtr SiteOptimizer::ResolveSnapshot(Region region) const {
  const auto timeout = std::chrono::milliseconds(config_.data_source.fetch_timeout_ms);

  FetchResult live = FetchWithTimeout(live_, region, timeout);
  if (live.ok()) return live.snapshot;

  // DataUnavailable: explicit degraded branch
  LogWarn(std::string("reference data unavailable for ") + RegionKey(region) + " (" + live.reason +
          "), using " + fallback_->Name());
  FetchResult sim = fallback_->Fetch(region);
  if (sim.ok()) {
    if (sim.snapshot->degraded) return sim.snapshot;
    // whatever the fallback is, its data must be reported as degraded
    auto tagged = std::make_shared<ReferenceSnapshot>(*sim.snapshot);
    tagged->degraded = true;
    return tagged;
  }

  LogError("fallback provider failed for " + std::string(RegionKey(region)) + ": " + sim.reason);
  auto empty = std::make_shared<ReferenceSnapshot>();
  empty->region = region;
  empty->degraded = true;
  return empty;
}

OptimizationContext SiteOptimizer::Run(const OptimizationRequest& req) const {
  io::RequestIO::Validate(req);

  OptimizationContext ctx;
  ctx.request = req;
  ctx.snapshot = ResolveSnapshot(req.region);
  ctx.degraded_mode = ctx.snapshot->degraded;

  const Pipeline pipeline(config_);
  pipeline.Run(ctx);

  LogInfo(std::string("optimization ") + RegionKey(req.region) + ": " + std::to_string(ctx.ranked.size()) +
          " of " + std::to_string(ctx.snapshot->renewable.size()) + " sites ranked" +
          (ctx.degraded_mode ? " (degraded)" : ""));
  return ctx;
}

nlohmann::json SiteOptimizer::Optimize(const OptimizationRequest& req) const {
  const OptimizationContext ctx = Run(req);
  return io::ResultFormatter::Format(ctx, config_);
}

nlohmann::json SiteOptimizer::Optimize(const nlohmann::json& body) const {
  return Optimize(io::RequestIO::Parse(body));
}

nlohmann::json SiteOptimizer::OptimizeEnveloped(const nlohmann::json& body) const {
  try {
    return io::ResultFormatter::Envelope(Optimize(body));
  } catch (const RequestError& e) {
    return io::ResultFormatter::Error(e.kind(), e.what());
  }
}

nlohmann::json SiteOptimizer::Status() const {
  nlohmann::json regions = nlohmann::json::array();
  for (const auto& info : RegionTable()) regions.push_back(info.key);

  const bool reachable = live_ != nullptr && live_->IsReachable();

  return nlohmann::json{
      {"status", "operational"},
      {"engine", kAlgorithmId},
      {"version", kEngineVersion},
      {"data_source", live_ ? live_->Name() : std::string("none")},
      {"data_source_reachable", reachable},
      {"database_connected", reachable},
      {"fallback", fallback_->Name()},
      {"supported_regions", regions},
      {"capabilities",
       {"Geospatial renewable potential scoring",
        "LCOH calculation",
        "Infrastructure proximity analysis",
        "Multi-criteria filtering and ranking",
        "Deterministic degraded-mode simulation"}},
  };
}

} // namespace h2site
