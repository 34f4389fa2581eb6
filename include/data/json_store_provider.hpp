#pragma once
#include <string>

#include "data/reference_data_provider.hpp"

namespace h2site {

// Live reference data backed by a JSON store directory (see io/store_io.hpp
// for the file layout). Every read goes to disk; wrap it in a
// CachingDataProvider to share snapshots between calls.
class JsonStoreDataProvider final : public IReferenceDataProvider {
public:
  explicit JsonStoreDataProvider(std::string data_dir);

  // kDataUnavailable when the store cannot be read/parsed or holds no
  // renewable records for `region`. Renewable records come back sorted by
  // descending solar irradiance (stable w.r.t. store order).
  FetchResult Fetch(Region region) const override;

  bool IsReachable() const override;

  std::string Name() const override;

  const std::string& data_dir() const { return data_dir_; }

private:
  std::string data_dir_;
};

} // namespace h2site
