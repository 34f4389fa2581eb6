#include "tests/test_framework.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

// =========================
// ProximityAnalyzer tests
// =========================
//
// 覆盖：
//   1) 球面距离（haversine）的基本性质：零距离、对称、已知弧长、三角不等式
//   2) 距离 -> 成本修正曲线：分段线性、单调不增、有界
//   3) 最近设施搜索：类型/状态过滤、并列时取先出现者、无设施时的最大惩罚
//

#include "common/config.hpp"
#include "common/errors.hpp"
#include "geo/proximity.hpp"

namespace {

static constexpr double kPi = 3.14159265358979323846;

using h2site::LatLon;
using h2site::test::PrintBanner;
using h2site::test::PrintSub;

h2site::InfrastructureRecord MakeFacility(std::string name, h2site::FacilityType type, double lat, double lon,
                                          h2site::FacilityStatus status = h2site::FacilityStatus::kOperational) {
  h2site::InfrastructureRecord f;
  f.facility_name = std::move(name);
  f.facility_type = type;
  f.state = "Gujarat";
  f.latitude = lat;
  f.longitude = lon;
  f.capacity_mw = 100.0;
  f.status = status;
  return f;
}

void DumpCurve(const h2site::ProximityCurve& c) {
  for (const auto& p : c.points) {
    std::cout << "  (" << std::setw(6) << p.distance_km << " km, " << std::setw(5) << p.bonus_usd_per_kg
              << " $/kg)\n";
  }
}

// ============================================================
// Haversine
// ============================================================

bool Test_Distance_ZeroForSamePoint() {
  const LatLon p{22.47, 70.057};
  H2SITE_EXPECT_EQ(h2site::geo::DistanceKm(p, p), 0.0);

  const LatLon pole{90.0, 0.0};
  H2SITE_EXPECT_EQ(h2site::geo::DistanceKm(pole, pole), 0.0);
  return true;
}

bool Test_Distance_Symmetric() {
  const std::vector<LatLon> pts{
      {23.241, 69.669}, {21.170, 72.831}, {-33.86, 151.21}, {51.5, -0.12}, {0.0, 179.9}, {0.0, -179.9},
  };
  for (const auto& a : pts) {
    for (const auto& b : pts) {
      const double ab = h2site::geo::DistanceKm(a, b);
      const double ba = h2site::geo::DistanceKm(b, a);
      H2SITE_EXPECT_NEAR(ab, ba, 1e-9);
      H2SITE_EXPECT_TRUE(ab >= 0.0);
    }
  }
  return true;
}

bool Test_Distance_KnownArcs() {
  const double one_deg = h2site::geo::kEarthRadiusKm * kPi / 180.0; // ~111.195 km

  PrintBanner("DistanceKm: known arcs");
  const double meridian = h2site::geo::DistanceKm({10.0, 75.0}, {11.0, 75.0});
  const double equator = h2site::geo::DistanceKm({0.0, 75.0}, {0.0, 76.0});
  const double antipode = h2site::geo::DistanceKm({0.0, 0.0}, {0.0, 180.0});
  const double dateline = h2site::geo::DistanceKm({0.0, 179.5}, {0.0, -179.5});
  std::cout << std::fixed << std::setprecision(4)
            << "1 deg meridian = " << meridian << " km\n"
            << "1 deg equator  = " << equator << " km\n"
            << "antipode       = " << antipode << " km\n"
            << "across 180E    = " << dateline << " km\n";

  H2SITE_EXPECT_NEAR(meridian, one_deg, 1e-6);
  H2SITE_EXPECT_NEAR(equator, one_deg, 1e-6);
  H2SITE_EXPECT_NEAR(antipode, h2site::geo::kEarthRadiusKm * kPi, 1e-6);
  H2SITE_EXPECT_NEAR(dateline, one_deg, 1e-6);

  // Ahmedabad -> Surat, roughly 207 km
  const double ahm_surat = h2site::geo::DistanceKm({23.022, 72.571}, {21.170, 72.831});
  H2SITE_EXPECT_TRUE(ahm_surat > 200.0 && ahm_surat < 215.0);
  return true;
}

bool Test_Distance_TriangleInequality() {
  const LatLon a{23.241, 69.669};
  const LatLon b{22.303, 70.802};
  const LatLon c{21.761, 72.151};
  const double ab = h2site::geo::DistanceKm(a, b);
  const double bc = h2site::geo::DistanceKm(b, c);
  const double ac = h2site::geo::DistanceKm(a, c);
  H2SITE_EXPECT_TRUE(ac <= ab + bc + 1e-9);
  return true;
}

// ============================================================
// Proximity curve
// ============================================================

bool Test_Curve_DefaultValues() {
  const h2site::ProximityCurve curve;
  PrintBanner("ProximityCurve: default breakpoints");
  DumpCurve(curve);

  H2SITE_EXPECT_NEAR(curve.Evaluate(0.0), 0.40, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(5.0), 0.40, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(10.0), 0.40, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(30.0), 0.30, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(50.0), 0.20, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(75.0), 0.10, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(100.0), 0.0, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(200.0), -0.30, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(300.0), -0.60, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(5000.0), -0.60, 1e-12);
  H2SITE_EXPECT_NEAR(curve.Evaluate(std::numeric_limits<double>::infinity()), -0.60, 1e-12);

  H2SITE_EXPECT_NEAR(curve.MaxBonus(), 0.40, 1e-12);
  H2SITE_EXPECT_NEAR(curve.MaxPenalty(), -0.60, 1e-12);
  return true;
}

bool Test_Curve_MonotoneAndBounded() {
  const h2site::ProximityCurve curve;
  double prev = curve.Evaluate(0.0);
  for (double d = 0.0; d <= 600.0; d += 0.5) {
    const double v = curve.Evaluate(d);
    H2SITE_EXPECT_TRUE(v <= prev + 1e-12);
    H2SITE_EXPECT_TRUE(v <= curve.MaxBonus() + 1e-12);
    H2SITE_EXPECT_TRUE(v >= curve.MaxPenalty() - 1e-12);
    prev = v;
  }
  return true;
}

bool Test_Curve_ValidateRejectsBadCurves() {
  h2site::ProximityCurve ok;
  ok.Validate();

  h2site::ProximityCurve rising;
  rising.points = {{0.0, 0.1}, {10.0, 0.3}};
  H2SITE_EXPECT_THROW(rising.Validate(), h2site::ConfigError);

  h2site::ProximityCurve unordered;
  unordered.points = {{0.0, 0.4}, {50.0, 0.2}, {50.0, 0.1}};
  H2SITE_EXPECT_THROW(unordered.Validate(), h2site::ConfigError);

  h2site::ProximityCurve empty;
  empty.points.clear();
  H2SITE_EXPECT_THROW(empty.Validate(), h2site::ConfigError);

  h2site::ProximityCurve negative;
  negative.points = {{-1.0, 0.4}, {10.0, 0.0}};
  H2SITE_EXPECT_THROW(negative.Validate(), h2site::ConfigError);

  h2site::EngineConfig cfg;
  cfg.proximity.curve = rising;
  H2SITE_EXPECT_THROW(cfg.Validate(), h2site::ConfigError);
  return true;
}

// ============================================================
// Nearest facility
// ============================================================

bool Test_ProximityScore_PicksNearest() {
  using h2site::FacilityType;
  const LatLon site{22.0, 72.0};
  const std::vector<h2site::InfrastructureRecord> infra{
      MakeFacility("far_port", FacilityType::kPort, 23.0, 72.0),        // ~111 km
      MakeFacility("near_sub", FacilityType::kSubstation, 22.1, 72.0),  // ~11 km
      MakeFacility("mid_park", FacilityType::kIndustrialPark, 22.5, 72.0),
  };
  const h2site::ProximityParams params;

  const auto r = h2site::geo::ProximityScore(site, infra, params);

  PrintBanner("ProximityScore: nearest of three");
  PrintSub("OUTPUT");
  std::cout << "nearest_index=" << r.nearest_index << " nearest_km=" << r.nearest_km << " bonus=" << r.bonus
            << "\n";

  H2SITE_EXPECT_EQ(r.nearest_index, 1);
  H2SITE_EXPECT_NEAR(r.nearest_km, h2site::geo::DistanceKm(site, {22.1, 72.0}), 1e-9);
  H2SITE_EXPECT_NEAR(r.bonus, params.curve.Evaluate(r.nearest_km), 1e-12);
  return true;
}

bool Test_ProximityScore_TieKeepsEarlier() {
  using h2site::FacilityType;
  const LatLon site{22.0, 72.0};
  // mirror images across the site's meridian: identical distance
  const std::vector<h2site::InfrastructureRecord> infra{
      MakeFacility("east", FacilityType::kPort, 22.0, 72.25),
      MakeFacility("west", FacilityType::kPort, 22.0, 71.75),
  };
  const auto r = h2site::geo::ProximityScore(site, infra, h2site::ProximityParams{});
  H2SITE_EXPECT_EQ(r.nearest_index, 0);
  return true;
}

bool Test_ProximityScore_FiltersTypeAndStatus() {
  using h2site::FacilityStatus;
  using h2site::FacilityType;
  const LatLon site{22.0, 72.0};
  const std::vector<h2site::InfrastructureRecord> infra{
      MakeFacility("planned_port", FacilityType::kPort, 22.01, 72.0, FacilityStatus::kPlanned),
      MakeFacility("substation", FacilityType::kSubstation, 22.05, 72.0),
      MakeFacility("operational_port", FacilityType::kPort, 22.3, 72.0),
  };

  h2site::ProximityParams all;
  H2SITE_EXPECT_EQ(h2site::geo::ProximityScore(site, infra, all).nearest_index, 0);

  h2site::ProximityParams operational_only;
  operational_only.include_planned = false;
  H2SITE_EXPECT_EQ(h2site::geo::ProximityScore(site, infra, operational_only).nearest_index, 1);

  h2site::ProximityParams ports_only;
  ports_only.include_planned = false;
  ports_only.facility_types = {FacilityType::kPort};
  H2SITE_EXPECT_EQ(h2site::geo::ProximityScore(site, infra, ports_only).nearest_index, 2);
  return true;
}

bool Test_ProximityScore_NoFacilityIsMaxPenalty() {
  const h2site::ProximityParams params;
  const auto r = h2site::geo::ProximityScore({22.0, 72.0}, {}, params);
  H2SITE_EXPECT_TRUE(std::isinf(r.nearest_km));
  H2SITE_EXPECT_EQ(r.nearest_index, -1);
  H2SITE_EXPECT_NEAR(r.bonus, params.curve.MaxPenalty(), 1e-12);

  // facilities exist but none of interest
  h2site::ProximityParams ports_only;
  ports_only.facility_types = {h2site::FacilityType::kPort};
  const std::vector<h2site::InfrastructureRecord> infra{
      MakeFacility("sub", h2site::FacilityType::kSubstation, 22.0, 72.0),
  };
  const auto r2 = h2site::geo::ProximityScore({22.0, 72.0}, infra, ports_only);
  H2SITE_EXPECT_EQ(r2.nearest_index, -1);
  H2SITE_EXPECT_NEAR(r2.bonus, ports_only.curve.MaxPenalty(), 1e-12);
  return true;
}

bool Test_NearestTransport() {
  const LatLon site{22.0, 72.0};
  H2SITE_EXPECT_TRUE(std::isinf(h2site::geo::NearestTransportKm(site, {})));

  h2site::TransportationRecord road;
  road.latitude = 22.2;
  road.longitude = 72.0;
  h2site::TransportationRecord rail;
  rail.latitude = 22.0;
  rail.longitude = 72.1;
  const double d = h2site::geo::NearestTransportKm(site, {road, rail});
  H2SITE_EXPECT_NEAR(d, h2site::geo::DistanceKm(site, {22.0, 72.1}), 1e-9);
  return true;
}

} // namespace

int main() {
  using h2site::test::TestCase;

  std::vector<TestCase> cases{
      {"Distance_ZeroForSamePoint", Test_Distance_ZeroForSamePoint},
      {"Distance_Symmetric", Test_Distance_Symmetric},
      {"Distance_KnownArcs", Test_Distance_KnownArcs},
      {"Distance_TriangleInequality", Test_Distance_TriangleInequality},
      {"Curve_DefaultValues", Test_Curve_DefaultValues},
      {"Curve_MonotoneAndBounded", Test_Curve_MonotoneAndBounded},
      {"Curve_ValidateRejectsBadCurves", Test_Curve_ValidateRejectsBadCurves},
      {"ProximityScore_PicksNearest", Test_ProximityScore_PicksNearest},
      {"ProximityScore_TieKeepsEarlier", Test_ProximityScore_TieKeepsEarlier},
      {"ProximityScore_FiltersTypeAndStatus", Test_ProximityScore_FiltersTypeAndStatus},
      {"ProximityScore_NoFacilityIsMaxPenalty", Test_ProximityScore_NoFacilityIsMaxPenalty},
      {"NearestTransport", Test_NearestTransport},
  };

  return h2site::test::RunAll(cases);
}
