#include "data/caching_provider.hpp"

#include <utility>

#include "common/log.hpp"

namespace h2site {

CachingDataProvider::CachingDataProvider(ProviderPtr inner) : inner_(std::move(inner)) {}

std::string CachingDataProvider::Name() const {
  return "cache(" + (inner_ ? inner_->Name() : std::string("none")) + ")";
}

bool CachingDataProvider::IsReachable() const {
  return inner_ != nullptr && inner_->IsReachable();
}

SnapshotPtr CachingDataProvider::Peek(Region region) const {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_[static_cast<std::size_t>(region)];
}

void CachingDataProvider::Store(Region region, SnapshotPtr snap) const {
  std::lock_guard<std::mutex> lk(mu_);
  slots_[static_cast<std::size_t>(region)] = std::move(snap);
}

void CachingDataProvider::Invalidate(Region region) const {
  Store(region, nullptr);
}

FetchResult CachingDataProvider::Fetch(Region region) const {
  if (SnapshotPtr hit = Peek(region)) return FetchResult::Ok(std::move(hit));
  // Two concurrent misses may both fetch; the later store wins and both
  // snapshots are complete, so readers never see a partial dataset.
  return Refresh(region);
}

FetchResult CachingDataProvider::Refresh(Region region) const {
  if (!inner_) return FetchResult::Unavailable("no upstream provider");

  FetchResult r = inner_->Fetch(region);
  if (!r.ok()) {
    LogDebug("cache refresh for " + std::string(RegionKey(region)) + " failed: " + r.reason);
    return r;
  }
  Store(region, r.snapshot);
  return r;
}

} // namespace h2site
