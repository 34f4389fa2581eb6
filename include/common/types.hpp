#pragma once
#include <cstddef>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "common/region.hpp"

namespace h2site {

// ========================
// 1) Basic geometry
// ========================

struct LatLon {
  double lat_deg{0.0};
  double lon_deg{0.0};
};

// ========================
// 2) Reference data (read-only inputs, owned by the data collaborator)
// ========================

// renewable_potential table: one row per surveyed location
struct RenewablePotentialRecord {
  std::string site_name;
  std::string state;
  double latitude{0.0};
  double longitude{0.0};
  double solar_irradiance{0.0};   // kWh/m2/day
  double wind_speed{0.0};         // m/s
  double land_suitability{0.0};   // [0,1]
  double grid_distance_km{0.0};
};

enum class FacilityType { kPort, kIndustrialPark, kSubstation };
enum class FacilityStatus { kOperational, kPlanned, kUnderConstruction };

struct InfrastructureRecord {
  std::string facility_name;
  FacilityType facility_type{FacilityType::kPort};
  std::string state;
  double latitude{0.0};
  double longitude{0.0};
  double capacity_mw{0.0};
  FacilityStatus status{FacilityStatus::kOperational};
};

enum class NetworkType { kRoad, kRail, kPipeline };

struct TransportationRecord {
  std::string network_name;
  NetworkType network_type{NetworkType::kRoad};
  std::string state;
  double latitude{0.0};
  double longitude{0.0};
  double capacity_tonnes_year{0.0};
  FacilityStatus status{FacilityStatus::kOperational};
};

// One fetch result for a region. Immutable once built; shared between
// concurrent calls through shared_ptr<const ReferenceSnapshot>.
struct ReferenceSnapshot {
  Region region{Region::kGujarat};
  std::vector<RenewablePotentialRecord> renewable;
  std::vector<InfrastructureRecord> infrastructure;
  std::vector<TransportationRecord> transport;
  std::vector<std::string> data_sources;
  bool degraded{false}; // true when produced by FallbackSimulator
};

using SnapshotPtr = std::shared_ptr<const ReferenceSnapshot>;

// ========================
// 3) Request
// ========================

struct OptimizationRequest {
  Region region{Region::kGujarat};
  double max_cost{6.0};          // $/kg
  double min_production{1000.0}; // t/year
  bool proximity_to_grid{true};
};

// ========================
// 4) Per-call derived entities
// ========================

struct CandidateSite {
  std::size_t input_index{0}; // position in snapshot->renewable
  const RenewablePotentialRecord* record{nullptr};
  SnapshotPtr snapshot; // owner of *record; keeps it valid in copies and RankedSite

  double solar_score{0.0};
  double wind_score{0.0};
  double renewable_score{0.0};

  // proximity
  double infrastructure_proximity_km{std::numeric_limits<double>::infinity()};
  int nearest_infrastructure{-1}; // index into snapshot->infrastructure
  double proximity_bonus{0.0};    // $/kg, positive = discount
  double transport_network_km{std::numeric_limits<double>::infinity()};

  // cost model
  double capacity_factor{0.0};
  double capex_usd{0.0};
  double opex_annual_usd{0.0};
  double annual_production_tonnes{0.0};
  double production_cost{0.0}; // $/kg
  double transport_cost{0.0};  // $/kg
  double lcoh{0.0};            // $/kg, == production_cost + transport_cost
};

struct RankedSite {
  int rank{0}; // 1-based, dense
  CandidateSite site;
};

using RankedResult = std::vector<RankedSite>;

// ========================
// 5) Context passed between stages (one per optimization call)
// ========================

struct OptimizationContext {
  OptimizationRequest request;
  SnapshotPtr snapshot;
  bool degraded_mode{false};

  std::vector<CandidateSite> candidates;
  std::size_t skipped_records{0};

  RankedResult ranked;
};

} // namespace h2site
