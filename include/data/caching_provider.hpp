#pragma once
#include <array>
#include <mutex>

#include "data/reference_data_provider.hpp"

namespace h2site {

// Read-only snapshot cache in front of another provider.
//
// Snapshots are immutable and handed out as shared_ptr<const>. Refresh()
// builds a complete new snapshot first and then swaps the pointer, so a
// call that already holds the old snapshot keeps computing on it
// (copy-on-refresh). The mutex only guards the pointer swap/copy, never a
// fetch. Failed fetches are not cached.
class CachingDataProvider final : public IReferenceDataProvider {
public:
  explicit CachingDataProvider(ProviderPtr inner);

  // Cached snapshot, fetching from the inner provider on a miss.
  FetchResult Fetch(Region region) const override;

  bool IsReachable() const override;

  std::string Name() const override;

  // Out-of-band refresh. On failure the previous snapshot stays in place.
  FetchResult Refresh(Region region) const;

  void Invalidate(Region region) const;

  // nullptr when nothing is cached
  SnapshotPtr Peek(Region region) const;

private:
  void Store(Region region, SnapshotPtr snap) const;

  ProviderPtr inner_;
  mutable std::mutex mu_;
  mutable std::array<SnapshotPtr, kRegionCount> slots_{};
};

} // namespace h2site
