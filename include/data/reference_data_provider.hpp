#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace h2site {

enum class FetchStatus { kOk, kDataUnavailable };

// Outcome of one reference-data fetch. kDataUnavailable is a signal for the
// caller to switch to the fallback branch, never a hard failure.
struct FetchResult {
  FetchStatus status{FetchStatus::kDataUnavailable};
  SnapshotPtr snapshot; // set iff status == kOk
  std::string reason;   // set iff status == kDataUnavailable

  bool ok() const { return status == FetchStatus::kOk && snapshot != nullptr; }

  static FetchResult Ok(SnapshotPtr s) { return {FetchStatus::kOk, std::move(s), {}}; }
  static FetchResult Unavailable(std::string why) { return {FetchStatus::kDataUnavailable, nullptr, std::move(why)}; }
};

// Capability set shared by the live store, the cache and the simulator.
// Implementations must be safe to call from several threads at once.
class IReferenceDataProvider {
public:
  virtual ~IReferenceDataProvider() = default;

  // Must not throw; every failure is reported as kDataUnavailable.
  virtual FetchResult Fetch(Region region) const = 0;

  // Cheap reachability probe used by the status operation.
  virtual bool IsReachable() const = 0;

  virtual std::string Name() const = 0;
};

using ProviderPtr = std::shared_ptr<const IReferenceDataProvider>;

// Row order every provider hands out: descending solar irradiance, stable
// w.r.t. the incoming order, NaN irradiance last.
void SortByIrradiance(std::vector<RenewablePotentialRecord>& records);

// Runs provider->Fetch on a detached worker and waits at most `timeout`.
// At most one worker runs per (provider, region): a call that finds one
// still pending waits on it instead of starting another, so a hung provider
// pins a single thread. A late result is dropped by callers that timed out.
FetchResult FetchWithTimeout(const ProviderPtr& provider, Region region, std::chrono::milliseconds timeout);

} // namespace h2site
