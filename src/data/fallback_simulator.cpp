#include "data/fallback_simulator.hpp"

#include <memory>
#include <random>
#include <vector>

namespace h2site {

namespace {

struct SeedSite {
  const char* name;
  double lat;
  double lon;
};

// Candidate locations per state (state capitals, ports, solar/wind parks).
const std::vector<SeedSite>& SitesFor(Region r) {
  static const std::vector<SeedSite> kGujarat = {
      {"Bhuj_Solar_Park", 23.241, 69.669},     {"Kutch_Wind_Farm", 23.733, 68.867},
      {"Surat_Port_Complex", 21.170, 72.831},  {"Ahmedabad_Industrial", 23.022, 72.571},
      {"Jamnagar_Refinery", 22.470, 70.057},   {"Bhavnagar_Coast", 21.761, 72.151},
      {"Rajkot_Industrial", 22.303, 70.802},   {"Vadodara_Chemical", 22.307, 73.181},
  };
  static const std::vector<SeedSite> kRajasthan = {
      {"Jaisalmer_Wind", 26.915, 70.908},      {"Bikaner_Solar", 28.022, 73.311},
      {"Jodhpur_Industrial", 26.238, 73.024},  {"Jaipur_Smart_City", 26.912, 75.787},
      {"Barmer_Renewable", 25.753, 71.393},
  };
  static const std::vector<SeedSite> kMaharashtra = {
      {"Dhule_Solar", 20.902, 74.774},         {"Pune_Technology", 18.520, 73.856},
      {"Mumbai_Port", 18.922, 72.834},         {"Nagpur_Industrial", 21.145, 79.088},
      {"Aurangabad_Solar", 19.876, 75.343},
  };
  static const std::vector<SeedSite> kKarnataka = {
      {"Bengaluru_Tech", 12.971, 77.594},      {"Mangalore_Port", 12.914, 74.856},
      {"Hubli_Industrial", 15.364, 75.124},    {"Mysore_Heritage", 12.295, 76.639},
      {"Tumkur_Solar", 13.340, 77.101},
  };
  static const std::vector<SeedSite> kTamilNadu = {
      {"Chennai_Port", 13.082, 80.270},        {"Coimbatore_Industrial", 11.016, 76.955},
      {"Tiruchirappalli_Solar", 10.790, 78.704}, {"Madurai_Heritage", 9.925, 78.119},
      {"Tuticorin_Port", 8.764, 78.134},
  };
  static const std::vector<SeedSite> kAndhraPradesh = {
      {"Visakhapatnam_Port", 17.686, 83.218},  {"Vijayawada_Industrial", 16.506, 80.648},
      {"Tirupati_Solar", 13.628, 79.419},      {"Kakinada_Port", 16.989, 82.247},
      {"Anantapur_Wind", 14.681, 77.600},
  };
  static const std::vector<SeedSite> kNone;

  switch (r) {
    case Region::kGujarat: return kGujarat;
    case Region::kRajasthan: return kRajasthan;
    case Region::kMaharashtra: return kMaharashtra;
    case Region::kKarnataka: return kKarnataka;
    case Region::kTamilNadu: return kTamilNadu;
    case Region::kAndhraPradesh: return kAndhraPradesh;
    case Region::kIndia: return kNone;
  }
  return kNone;
}

// 53 random bits -> [0,1). mt19937_64 output is fully specified by the
// standard, unlike the distributions.
inline double Unit(std::mt19937_64& rng) {
  return static_cast<double>(rng() >> 11) * (1.0 / 9007199254740992.0);
}

inline double Uniform(std::mt19937_64& rng, double lo, double hi) {
  return lo + (hi - lo) * Unit(rng);
}

void AppendState(Region state, ReferenceSnapshot& out) {
  const auto& sites = SitesFor(state);
  const std::string state_name = GetRegionInfo(state).state_name;
  std::mt19937_64 rng(FallbackSimulator::SeedFor(state));

  static constexpr FacilityType kTypes[] = {
      FacilityType::kPort, FacilityType::kIndustrialPark, FacilityType::kSubstation};
  static constexpr const char* kTypeTag[] = {"Port", "Industrial_Park", "Substation"};

  for (std::size_t i = 0; i < sites.size(); ++i) {
    const auto& s = sites[i];

    RenewablePotentialRecord rec;
    rec.site_name = s.name;
    rec.state = state_name;
    rec.latitude = s.lat;
    rec.longitude = s.lon;
    rec.solar_irradiance = Uniform(rng, 4.5, 7.0);
    rec.wind_speed = Uniform(rng, 4.5, 9.0);
    rec.land_suitability = Uniform(rng, 0.60, 0.95);
    rec.grid_distance_km = Uniform(rng, 2.0, 60.0);
    out.renewable.push_back(std::move(rec));

    // one facility per site, up to ~35 km away
    InfrastructureRecord fac;
    const std::size_t t = i % 3;
    fac.facility_type = kTypes[t];
    fac.facility_name = std::string(s.name) + "_" + kTypeTag[t];
    fac.state = state_name;
    fac.latitude = s.lat + Uniform(rng, -0.25, 0.25);
    fac.longitude = s.lon + Uniform(rng, -0.25, 0.25);
    fac.capacity_mw = Uniform(rng, 50.0, 500.0);
    fac.status = (i % 4 == 3) ? FacilityStatus::kPlanned : FacilityStatus::kOperational;
    out.infrastructure.push_back(std::move(fac));

    TransportationRecord road;
    road.network_name = std::string(s.name) + "_Highway";
    road.network_type = NetworkType::kRoad;
    road.state = state_name;
    road.latitude = s.lat + Uniform(rng, -0.15, 0.15);
    road.longitude = s.lon + Uniform(rng, -0.15, 0.15);
    road.capacity_tonnes_year = Uniform(rng, 1.0e5, 1.0e6);
    road.status = FacilityStatus::kOperational;
    out.transport.push_back(std::move(road));

    if (i % 2 == 0) {
      TransportationRecord rail;
      rail.network_name = std::string(s.name) + "_Rail";
      rail.network_type = NetworkType::kRail;
      rail.state = state_name;
      rail.latitude = s.lat + Uniform(rng, -0.4, 0.4);
      rail.longitude = s.lon + Uniform(rng, -0.4, 0.4);
      rail.capacity_tonnes_year = Uniform(rng, 5.0e5, 5.0e6);
      rail.status = FacilityStatus::kOperational;
      out.transport.push_back(std::move(rail));
    }
  }
}

} // namespace

std::uint64_t FallbackSimulator::SeedFor(Region region) {
  // FNV-1a over the region key
  std::uint64_t h = 1469598103934665603ull;
  for (const char* p = RegionKey(region); *p; ++p) {
    h ^= static_cast<unsigned char>(*p);
    h *= 1099511628211ull;
  }
  return h;
}

ReferenceSnapshot FallbackSimulator::Generate(Region region) {
  ReferenceSnapshot snap;
  snap.region = region;

  if (region == Region::kIndia) {
    for (const auto& info : RegionTable()) {
      if (info.region == Region::kIndia) continue;
      AppendState(info.region, snap);
    }
  } else {
    AppendState(region, snap);
  }
  SortByIrradiance(snap.renewable);

  snap.data_sources = {std::string("Synthetic fallback dataset (") + RegionKey(region) + ")"};
  snap.degraded = true;
  return snap;
}

FetchResult FallbackSimulator::Fetch(Region region) const {
  return FetchResult::Ok(std::make_shared<const ReferenceSnapshot>(Generate(region)));
}

} // namespace h2site
