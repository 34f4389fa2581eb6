#include "stages/proximity_stage.hpp"

#include "geo/proximity.hpp"

namespace h2site {

void ProximityStage::Run(OptimizationContext& ctx) const {
  if (!ctx.snapshot) return;
  const auto& infra = ctx.snapshot->infrastructure;
  const auto& transport = ctx.snapshot->transport;

  for (auto& c : ctx.candidates) {
    const LatLon site{c.record->latitude, c.record->longitude};

    const geo::ProximityResult p = geo::ProximityScore(site, infra, params_);
    c.infrastructure_proximity_km = p.nearest_km;
    c.nearest_infrastructure = p.nearest_index;
    c.proximity_bonus = p.bonus;

    c.transport_network_km = geo::NearestTransportKm(site, transport);
  }
}

} // namespace h2site
