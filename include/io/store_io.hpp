#pragma once
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.hpp"

namespace h2site::io {

// StoreIO maps the reference-data JSON store onto record structs.
//
// Store layout (one directory):
//   renewable_potential.json      [ {location_name, state, latitude, longitude,
//                                    solar_irradiance_kwh_m2_day, wind_speed_ms,
//                                    land_suitability_score, grid_distance_km}, ... ]
//   infrastructure.json           [ {facility_name, facility_type, state, latitude,
//                                    longitude, capacity_mw, status}, ... ]
//   transportation_network.json   [ {segment_name, network_type, state, latitude,
//                                    longitude, capacity_tonnes_year, status}, ... ]  (optional)
//
// Missing numeric fields of a renewable record become NaN so that the record
// is rejected later as InvalidRecord instead of silently turning into zeros.
class StoreIO {
public:
  static std::string ReadAllText(const std::string& path);
  static nlohmann::json ParseJson(const std::string& text, const std::string& hint);

  static RenewablePotentialRecord ParseRenewable(const nlohmann::json& j);
  // nullopt for unknown facility types / statuses
  static std::optional<InfrastructureRecord> ParseInfrastructure(const nlohmann::json& j);
  static std::optional<TransportationRecord> ParseTransportation(const nlohmann::json& j);

  static nlohmann::json ToJson(const RenewablePotentialRecord& r);
  static nlohmann::json ToJson(const InfrastructureRecord& r);
  static nlohmann::json ToJson(const TransportationRecord& r);

  // Writes the three store files for `snapshot` into `dir` (creates it).
  static void WriteStore(const ReferenceSnapshot& snapshot, const std::string& dir);
};

std::optional<FacilityType> ParseFacilityType(const std::string& s);
std::optional<FacilityStatus> ParseFacilityStatus(const std::string& s);
std::optional<NetworkType> ParseNetworkType(const std::string& s);

const char* ToString(FacilityType t);
const char* ToString(FacilityStatus s);
const char* ToString(NetworkType t);

} // namespace h2site::io
