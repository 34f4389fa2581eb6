#include "io/store_io.hpp"

#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace h2site::io {

namespace {

using json = nlohmann::json;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::string Normalize(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == ' ' || c == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

// Numeric field or NaN; accepts numbers and numeric strings.
double NumberOr(const json& j, const char* key, double fallback) {
  if (!j.is_object() || !j.contains(key)) return fallback;
  const json& v = j.at(key);
  if (v.is_number()) return v.get<double>();
  if (v.is_string()) {
    try {
      std::size_t used = 0;
      const std::string s = v.get<std::string>();
      const double d = std::stod(s, &used);
      if (used == s.size()) return d;
    } catch (const std::exception&) {
      // non-numeric text: treated as missing
    }
  }
  return fallback;
}

std::string StringOr(const json& j, const char* key, const std::string& fallback) {
  if (!j.is_object() || !j.contains(key) || !j.at(key).is_string()) return fallback;
  return j.at(key).get<std::string>();
}

// first present key wins (store columns were renamed over time)
std::string FirstString(const json& j, std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    if (j.is_object() && j.contains(k) && j.at(k).is_string()) return j.at(k).get<std::string>();
  }
  return {};
}

double FirstNumber(const json& j, std::initializer_list<const char*> keys) {
  for (const char* k : keys) {
    const double v = NumberOr(j, k, kNaN);
    if (!std::isnan(v)) return v;
  }
  return kNaN;
}

void WriteJsonFile(const fs::path& p, const json& j) {
  std::ofstream ofs(p);
  if (!ofs) throw std::runtime_error("Failed to write: " + p.string());
  ofs << j.dump(2) << "\n";
}

} // namespace

std::optional<FacilityType> ParseFacilityType(const std::string& s) {
  const std::string n = Normalize(s);
  if (n == "port") return FacilityType::kPort;
  if (n == "industrial_park") return FacilityType::kIndustrialPark;
  if (n == "substation") return FacilityType::kSubstation;
  return std::nullopt;
}

std::optional<FacilityStatus> ParseFacilityStatus(const std::string& s) {
  const std::string n = Normalize(s);
  if (n == "operational" || n == "existing") return FacilityStatus::kOperational;
  if (n == "planned" || n == "proposed") return FacilityStatus::kPlanned;
  if (n == "under_construction") return FacilityStatus::kUnderConstruction;
  return std::nullopt;
}

std::optional<NetworkType> ParseNetworkType(const std::string& s) {
  const std::string n = Normalize(s);
  if (n == "road" || n == "highway") return NetworkType::kRoad;
  if (n == "rail" || n == "railway") return NetworkType::kRail;
  if (n == "pipeline") return NetworkType::kPipeline;
  return std::nullopt;
}

const char* ToString(FacilityType t) {
  switch (t) {
    case FacilityType::kPort: return "port";
    case FacilityType::kIndustrialPark: return "industrial_park";
    case FacilityType::kSubstation: return "substation";
  }
  return "port";
}

const char* ToString(FacilityStatus s) {
  switch (s) {
    case FacilityStatus::kOperational: return "operational";
    case FacilityStatus::kPlanned: return "planned";
    case FacilityStatus::kUnderConstruction: return "under_construction";
  }
  return "operational";
}

const char* ToString(NetworkType t) {
  switch (t) {
    case NetworkType::kRoad: return "road";
    case NetworkType::kRail: return "rail";
    case NetworkType::kPipeline: return "pipeline";
  }
  return "road";
}

std::string StoreIO::ReadAllText(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

json StoreIO::ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

RenewablePotentialRecord StoreIO::ParseRenewable(const json& j) {
  RenewablePotentialRecord r;
  r.site_name = FirstString(j, {"location_name", "site_name"});
  r.state = StringOr(j, "state", "");
  r.latitude = NumberOr(j, "latitude", kNaN);
  r.longitude = NumberOr(j, "longitude", kNaN);
  r.solar_irradiance = FirstNumber(j, {"solar_irradiance_kwh_m2_day", "solar_irradiance"});
  r.wind_speed = FirstNumber(j, {"wind_speed_ms", "wind_speed"});
  r.land_suitability = FirstNumber(j, {"land_suitability_score", "land_suitability"});
  r.grid_distance_km = NumberOr(j, "grid_distance_km", kNaN);
  return r;
}

std::optional<InfrastructureRecord> StoreIO::ParseInfrastructure(const json& j) {
  const auto type = ParseFacilityType(StringOr(j, "facility_type", ""));
  const auto status = ParseFacilityStatus(StringOr(j, "status", "operational"));
  if (!type || !status) return std::nullopt;

  InfrastructureRecord r;
  r.facility_name = StringOr(j, "facility_name", "");
  r.facility_type = *type;
  r.state = StringOr(j, "state", "");
  r.latitude = NumberOr(j, "latitude", kNaN);
  r.longitude = NumberOr(j, "longitude", kNaN);
  r.capacity_mw = NumberOr(j, "capacity_mw", 0.0);
  r.status = *status;
  if (!std::isfinite(r.latitude) || !std::isfinite(r.longitude) || r.capacity_mw < 0.0) return std::nullopt;
  return r;
}

std::optional<TransportationRecord> StoreIO::ParseTransportation(const json& j) {
  const auto type = ParseNetworkType(StringOr(j, "network_type", ""));
  const auto status = ParseFacilityStatus(StringOr(j, "status", "operational"));
  if (!type || !status) return std::nullopt;

  TransportationRecord r;
  r.network_name = FirstString(j, {"segment_name", "network_name"});
  r.network_type = *type;
  r.state = StringOr(j, "state", "");
  r.latitude = NumberOr(j, "latitude", kNaN);
  r.longitude = NumberOr(j, "longitude", kNaN);
  r.capacity_tonnes_year = NumberOr(j, "capacity_tonnes_year", 0.0);
  r.status = *status;
  if (!std::isfinite(r.latitude) || !std::isfinite(r.longitude)) return std::nullopt;
  return r;
}

json StoreIO::ToJson(const RenewablePotentialRecord& r) {
  return json{
      {"location_name", r.site_name},
      {"state", r.state},
      {"latitude", r.latitude},
      {"longitude", r.longitude},
      {"solar_irradiance_kwh_m2_day", r.solar_irradiance},
      {"wind_speed_ms", r.wind_speed},
      {"land_suitability_score", r.land_suitability},
      {"grid_distance_km", r.grid_distance_km},
  };
}

json StoreIO::ToJson(const InfrastructureRecord& r) {
  return json{
      {"facility_name", r.facility_name},
      {"facility_type", ToString(r.facility_type)},
      {"state", r.state},
      {"latitude", r.latitude},
      {"longitude", r.longitude},
      {"capacity_mw", r.capacity_mw},
      {"status", ToString(r.status)},
  };
}

json StoreIO::ToJson(const TransportationRecord& r) {
  return json{
      {"segment_name", r.network_name},
      {"network_type", ToString(r.network_type)},
      {"state", r.state},
      {"latitude", r.latitude},
      {"longitude", r.longitude},
      {"capacity_tonnes_year", r.capacity_tonnes_year},
      {"status", ToString(r.status)},
  };
}

void StoreIO::WriteStore(const ReferenceSnapshot& snapshot, const std::string& dir) {
  const fs::path out(dir);
  if (!fs::exists(out)) fs::create_directories(out);

  json renewable = json::array();
  for (const auto& r : snapshot.renewable) renewable.push_back(ToJson(r));
  json infra = json::array();
  for (const auto& r : snapshot.infrastructure) infra.push_back(ToJson(r));
  json transport = json::array();
  for (const auto& r : snapshot.transport) transport.push_back(ToJson(r));

  WriteJsonFile(out / "renewable_potential.json", renewable);
  WriteJsonFile(out / "infrastructure.json", infra);
  WriteJsonFile(out / "transportation_network.json", transport);
}

} // namespace h2site::io
