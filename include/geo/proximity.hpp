#pragma once
#include <vector>

#include "common/config.hpp"
#include "common/types.hpp"

namespace h2site::geo {

inline constexpr double kEarthRadiusKm = 6371.0;

// Great-circle (haversine) distance on a spherical Earth, km.
// Symmetric; exactly 0 when both points are equal.
double DistanceKm(const LatLon& a, const LatLon& b);

struct ProximityResult {
  double nearest_km{0.0}; // +inf when no facility of interest exists
  double bonus{0.0};      // $/kg from ProximityCurve
  int nearest_index{-1};  // index into the infrastructure list
};

// Nearest facility of interest and the cost offset its distance earns.
// Ties keep the earlier record.
ProximityResult ProximityScore(const LatLon& site,
                               const std::vector<InfrastructureRecord>& infrastructure,
                               const ProximityParams& params);

// Distance to the closest transport-network feature, +inf if none.
double NearestTransportKm(const LatLon& site, const std::vector<TransportationRecord>& transport);

} // namespace h2site::geo
