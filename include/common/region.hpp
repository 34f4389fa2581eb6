#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace h2site {

// Supported optimization regions. kIndia covers every state.
enum class Region {
  kGujarat,
  kRajasthan,
  kMaharashtra,
  kKarnataka,
  kTamilNadu,
  kAndhraPradesh,
  kIndia,
};

inline constexpr std::size_t kRegionCount = 7;

// Display/selection data for one region. Map center and zoom are only
// consumed by front ends; the engine itself never reads them.
struct RegionInfo {
  Region region;
  const char* key;          // request value, e.g. "tamil_nadu"
  const char* display_name; // "Tamil Nadu, India"
  const char* state_name;   // value of the `state` column, empty for kIndia
  double center_lat;
  double center_lon;
  int zoom;
};

const std::array<RegionInfo, kRegionCount>& RegionTable();

const RegionInfo& GetRegionInfo(Region r);

// Case-insensitive; spaces and '-' are accepted for '_' ("Tamil Nadu").
std::optional<Region> ParseRegion(const std::string& text);

const char* RegionKey(Region r);

// True if a record tagged with `state` belongs to region `r`.
bool RegionContainsState(Region r, const std::string& state);

} // namespace h2site
