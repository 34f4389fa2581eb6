#include "data/json_store_provider.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "common/log.hpp"
#include "io/store_io.hpp"

namespace fs = std::filesystem;

namespace h2site {

namespace {

constexpr const char* kRenewableFile = "renewable_potential.json";
constexpr const char* kInfrastructureFile = "infrastructure.json";
constexpr const char* kTransportFile = "transportation_network.json";

// Array root or {"records": [...]} root.
const nlohmann::json& RecordsOf(const nlohmann::json& root, const std::string& hint) {
  if (root.is_array()) return root;
  if (root.is_object() && root.contains("records") && root.at("records").is_array()) return root.at("records");
  throw std::runtime_error(hint + ": expected an array of records");
}

} // namespace

JsonStoreDataProvider::JsonStoreDataProvider(std::string data_dir) : data_dir_(std::move(data_dir)) {}

std::string JsonStoreDataProvider::Name() const { return "json-store:" + data_dir_; }

bool JsonStoreDataProvider::IsReachable() const {
  if (data_dir_.empty()) return false;
  std::error_code ec;
  const fs::path dir(data_dir_);
  return fs::is_directory(dir, ec) &&
         fs::is_regular_file(dir / kRenewableFile, ec) &&
         fs::is_regular_file(dir / kInfrastructureFile, ec);
}

FetchResult JsonStoreDataProvider::Fetch(Region region) const {
  if (data_dir_.empty()) return FetchResult::Unavailable("no data directory configured");

  const fs::path dir(data_dir_);
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return FetchResult::Unavailable("data directory not reachable: " + data_dir_);
  }

  auto snap = std::make_shared<ReferenceSnapshot>();
  snap->region = region;

  try {
    // ---------- renewable_potential ----------
    {
      const auto path = (dir / kRenewableFile).string();
      const auto root = io::StoreIO::ParseJson(io::StoreIO::ReadAllText(path), path);
      for (const auto& j : RecordsOf(root, path)) {
        auto rec = io::StoreIO::ParseRenewable(j);
        if (RegionContainsState(region, rec.state)) snap->renewable.push_back(std::move(rec));
      }
    }

    // ---------- infrastructure ----------
    {
      const auto path = (dir / kInfrastructureFile).string();
      const auto root = io::StoreIO::ParseJson(io::StoreIO::ReadAllText(path), path);
      std::size_t dropped = 0;
      for (const auto& j : RecordsOf(root, path)) {
        auto rec = io::StoreIO::ParseInfrastructure(j);
        if (!rec) {
          ++dropped;
          continue;
        }
        if (RegionContainsState(region, rec->state)) snap->infrastructure.push_back(std::move(*rec));
      }
      if (dropped > 0) LogDebug(path + ": dropped " + std::to_string(dropped) + " malformed records");
    }

    // ---------- transportation_network (optional) ----------
    const fs::path tpath = dir / kTransportFile;
    if (fs::is_regular_file(tpath, ec)) {
      const auto path = tpath.string();
      const auto root = io::StoreIO::ParseJson(io::StoreIO::ReadAllText(path), path);
      for (const auto& j : RecordsOf(root, path)) {
        auto rec = io::StoreIO::ParseTransportation(j);
        if (rec && RegionContainsState(region, rec->state)) snap->transport.push_back(std::move(*rec));
      }
    }
  } catch (const std::exception& e) {
    return FetchResult::Unavailable(e.what());
  }

  if (snap->renewable.empty()) {
    return FetchResult::Unavailable(std::string("no renewable records for region ") + RegionKey(region));
  }

  SortByIrradiance(snap->renewable);

  snap->data_sources = {
      "Solar irradiance data (NASA POWER)",
      "Wind speed data (MERRA-2)",
      "Grid infrastructure data",
      "Transportation networks",
      "Industrial demand centers",
      "Port facilities",
  };
  snap->degraded = false;

  LogInfo("fetched " + std::to_string(snap->renewable.size()) + " sites, " +
          std::to_string(snap->infrastructure.size()) + " facilities, " +
          std::to_string(snap->transport.size()) + " network features for " + RegionKey(region));
  return FetchResult::Ok(std::move(snap));
}

} // namespace h2site
