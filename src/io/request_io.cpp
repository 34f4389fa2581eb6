#include "io/request_io.hpp"

#include <cmath>
#include <sstream>
#include <string>

#include "common/errors.hpp"
#include "common/region.hpp"

namespace h2site::io {

namespace {

using json = nlohmann::json;

double NumberField(const json& body, const char* key, double fallback) {
  if (!body.contains(key) || body.at(key).is_null()) return fallback;
  const json& v = body.at(key);
  if (!v.is_number()) throw InvalidCriteriaError(std::string(key) + " must be a number");
  return v.get<double>();
}

bool BoolField(const json& body, const char* key, bool fallback) {
  if (!body.contains(key) || body.at(key).is_null()) return fallback;
  const json& v = body.at(key);
  if (!v.is_boolean()) throw InvalidCriteriaError(std::string(key) + " must be a boolean");
  return v.get<bool>();
}

std::string SupportedRegionList() {
  std::ostringstream oss;
  bool first = true;
  for (const auto& info : RegionTable()) {
    if (!first) oss << ", ";
    first = false;
    oss << info.key;
  }
  return oss.str();
}

} // namespace

OptimizationRequest RequestIO::Parse(const json& body) {
  if (!body.is_object()) throw InvalidCriteriaError("request body must be a JSON object");

  if (!body.contains("region") || !body.at("region").is_string()) {
    throw InvalidRegionError("region is required (one of: " + SupportedRegionList() + ")");
  }
  const std::string region_text = body.at("region").get<std::string>();
  const auto region = ParseRegion(region_text);
  if (!region) {
    throw InvalidRegionError("unsupported region '" + region_text + "' (one of: " + SupportedRegionList() + ")");
  }

  OptimizationRequest req;
  req.region = *region;
  req.max_cost = NumberField(body, "max_cost", req.max_cost);
  req.min_production = NumberField(body, "min_production", req.min_production);
  req.proximity_to_grid = BoolField(body, "proximity_to_grid", req.proximity_to_grid);

  Validate(req);
  return req;
}

void RequestIO::Validate(const OptimizationRequest& req) {
  if (!std::isfinite(req.max_cost) || req.max_cost <= 0.0) {
    std::ostringstream oss;
    oss << "max_cost must be > 0 (got " << req.max_cost << ")";
    throw InvalidCriteriaError(oss.str());
  }
  if (!std::isfinite(req.min_production) || req.min_production < 0.0) {
    std::ostringstream oss;
    oss << "min_production must be >= 0 (got " << req.min_production << ")";
    throw InvalidCriteriaError(oss.str());
  }
}

json RequestIO::ToJson(const OptimizationRequest& req) {
  return json{
      {"region", RegionKey(req.region)},
      {"max_cost", req.max_cost},
      {"min_production", req.min_production},
      {"proximity_to_grid", req.proximity_to_grid},
  };
}

} // namespace h2site::io
