#pragma once
#include <cstdint>
#include <string>

#include "data/reference_data_provider.hpp"

namespace h2site {

// ======================
// Synthetic reference data for degraded mode.
//
// Produces a snapshot with the same shape as the live store: every site has
// coordinates, non-negative irradiance/wind, land suitability in [0,1] and a
// grid distance, plus nearby infrastructure and transport features.
//
// Determinism: values come from std::mt19937_64 seeded with a stable hash of
// the region key and are mapped to doubles without std::*_distribution, so a
// region yields an identical snapshot on every call and every platform.
// kIndia is the concatenation of all state datasets. Renewable rows are
// ordered like the live store's (SortByIrradiance).
//
// Output is tagged degraded = true.
// ======================
class FallbackSimulator final : public IReferenceDataProvider {
public:
  FetchResult Fetch(Region region) const override;

  bool IsReachable() const override { return true; }

  std::string Name() const override { return "fallback-simulator"; }

  // Uncached snapshot builder, exposed for tests.
  static ReferenceSnapshot Generate(Region region);

  static std::uint64_t SeedFor(Region region);
};

} // namespace h2site
