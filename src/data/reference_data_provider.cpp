#include "data/reference_data_provider.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

#include "common/log.hpp"

namespace h2site {

namespace {

// (provider address, region). The worker holds a provider reference, so the
// address cannot be reused while its slot exists.
using InFlightKey = std::pair<std::uintptr_t, int>;

// At most one fetch worker per key; later callers wait on the same future.
// Never destroyed: a stranded worker may still reach it during static teardown.
struct InFlightTable {
  std::mutex mu;
  std::map<InFlightKey, std::shared_future<FetchResult>> slots;
};

InFlightTable& InFlightFetches() {
  static auto* table = new InFlightTable;
  return *table;
}

} // namespace

void SortByIrradiance(std::vector<RenewablePotentialRecord>& records) {
  std::stable_sort(records.begin(), records.end(),
                   [](const RenewablePotentialRecord& a, const RenewablePotentialRecord& b) {
                     const bool a_ok = !std::isnan(a.solar_irradiance);
                     const bool b_ok = !std::isnan(b.solar_irradiance);
                     if (a_ok != b_ok) return a_ok;
                     return a_ok && a.solar_irradiance > b.solar_irradiance;
                   });
}

FetchResult FetchWithTimeout(const ProviderPtr& provider, Region region, std::chrono::milliseconds timeout) {
  if (!provider) return FetchResult::Unavailable("no reference data provider configured");

  const InFlightKey key{reinterpret_cast<std::uintptr_t>(provider.get()), static_cast<int>(region)};
  auto& inflight = InFlightFetches();
  std::shared_future<FetchResult> fut;
  bool joined = false;
  {
    std::lock_guard<std::mutex> lk(inflight.mu);
    const auto it = inflight.slots.find(key);
    if (it != inflight.slots.end()) {
      fut = it->second;
      joined = true;
    } else {
      auto promise = std::make_shared<std::promise<FetchResult>>();
      fut = promise->get_future().share();
      try {
        // The worker owns a provider reference and the promise, so it can
        // outlive this call. It clears its slot before publishing; the slot
        // is registered below while the lock is still held.
        std::thread([provider, region, promise, key]() {
          FetchResult r;
          try {
            r = provider->Fetch(region);
          } catch (const std::exception& e) {
            r = FetchResult::Unavailable(std::string("provider threw: ") + e.what());
          }
          {
            auto& f = InFlightFetches();
            std::lock_guard<std::mutex> wlk(f.mu);
            f.slots.erase(key);
          }
          promise->set_value(std::move(r));
        }).detach();
      } catch (const std::system_error& e) {
        return FetchResult::Unavailable(std::string("could not start fetch worker: ") + e.what());
      }
      inflight.slots.emplace(key, fut);
    }
  }

  if (joined) {
    LogDebug("joining pending " + std::string(RegionKey(region)) + " fetch from " + provider->Name());
  }

  if (fut.wait_for(timeout) != std::future_status::ready) {
    LogWarn("reference data fetch from " + provider->Name() + " timed out after " +
            std::to_string(timeout.count()) + " ms" + (joined ? " (previous fetch still pending)" : ""));
    return FetchResult::Unavailable("timed out after " + std::to_string(timeout.count()) + " ms");
  }
  return fut.get();
}

} // namespace h2site
