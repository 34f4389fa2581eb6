#include "geo/proximity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace h2site::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }

} // namespace

double DistanceKm(const LatLon& a, const LatLon& b) {
  if (a.lat_deg == b.lat_deg && a.lon_deg == b.lon_deg) return 0.0;

  const double lat1 = Deg2Rad(a.lat_deg);
  const double lat2 = Deg2Rad(b.lat_deg);
  const double dlat = Deg2Rad(b.lat_deg - a.lat_deg);
  const double dlon = Deg2Rad(b.lon_deg - a.lon_deg);

  const double s1 = std::sin(dlat / 2.0);
  const double s2 = std::sin(dlon / 2.0);
  double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
  // rounding can push h marginally outside [0,1] for antipodal points
  h = std::clamp(h, 0.0, 1.0);

  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return kEarthRadiusKm * c;
}

ProximityResult ProximityScore(const LatLon& site,
                               const std::vector<InfrastructureRecord>& infrastructure,
                               const ProximityParams& params) {
  ProximityResult out;
  out.nearest_km = std::numeric_limits<double>::infinity();

  for (std::size_t i = 0; i < infrastructure.size(); ++i) {
    const auto& rec = infrastructure[i];
    if (!params.IsOfInterest(rec)) continue;

    const double d = DistanceKm(site, {rec.latitude, rec.longitude});
    if (!std::isfinite(d)) continue;
    if (d < out.nearest_km) {
      out.nearest_km = d;
      out.nearest_index = static_cast<int>(i);
    }
  }

  // no facility at all: curve end value (maximum penalty)
  out.bonus = params.curve.Evaluate(out.nearest_km);
  return out;
}

double NearestTransportKm(const LatLon& site, const std::vector<TransportationRecord>& transport) {
  double best = std::numeric_limits<double>::infinity();
  for (const auto& t : transport) {
    const double d = DistanceKm(site, {t.latitude, t.longitude});
    if (std::isfinite(d) && d < best) best = d;
  }
  return best;
}

} // namespace h2site::geo
