#include "common/region.hpp"

#include <algorithm>
#include <cctype>

namespace h2site {

namespace {

// Centers/zoom are the map defaults used by the dashboard.
const std::array<RegionInfo, kRegionCount> kRegions = {{
    {Region::kGujarat,       "gujarat",        "Gujarat, India",        "Gujarat",        22.2587, 71.1924, 7},
    {Region::kRajasthan,     "rajasthan",      "Rajasthan, India",      "Rajasthan",      27.0238, 74.2179, 6},
    {Region::kMaharashtra,   "maharashtra",    "Maharashtra, India",    "Maharashtra",    19.7515, 75.7139, 6},
    {Region::kKarnataka,     "karnataka",      "Karnataka, India",      "Karnataka",      15.3173, 75.7139, 6},
    {Region::kTamilNadu,     "tamil_nadu",     "Tamil Nadu, India",     "Tamil Nadu",     11.1271, 78.6569, 6},
    {Region::kAndhraPradesh, "andhra_pradesh", "Andhra Pradesh, India", "Andhra Pradesh", 15.9129, 79.7400, 6},
    {Region::kIndia,         "india",          "India (All States)",    "",               20.5937, 78.9629, 5},
}};

std::string NormalizeKey(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (c == ' ' || c == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(uc)));
    }
  }
  // trim surrounding underscores produced by stray whitespace
  const auto b = out.find_first_not_of('_');
  if (b == std::string::npos) return {};
  const auto e = out.find_last_not_of('_');
  return out.substr(b, e - b + 1);
}

} // namespace

const std::array<RegionInfo, kRegionCount>& RegionTable() { return kRegions; }

const RegionInfo& GetRegionInfo(Region r) {
  return kRegions[static_cast<std::size_t>(r)];
}

std::optional<Region> ParseRegion(const std::string& text) {
  const std::string key = NormalizeKey(text);
  for (const auto& info : kRegions) {
    if (key == info.key) return info.region;
  }
  return std::nullopt;
}

const char* RegionKey(Region r) { return GetRegionInfo(r).key; }

bool RegionContainsState(Region r, const std::string& state) {
  if (r == Region::kIndia) return true;
  return NormalizeKey(state) == GetRegionInfo(r).key;
}

} // namespace h2site
