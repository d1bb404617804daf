#pragma once

#include "annual_mosaic/geometry/region.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace annual_mosaic::geometry {

using json = nlohmann::json;

json load_geojson(const std::filesystem::path& path);

// Features whose `property` equals `value` (trimmed, case-insensitive). When
// nothing matches, features with any string property equal to `value`.
std::vector<json> find_features(const json& collection, const std::string& property,
                                const std::string& value);

// Appends the Polygon / MultiPolygon geometry of `feature` to `region`.
// Returns false for features without a supported geometry.
bool append_feature_geometry(const json& feature, Region& region);

// Union of all matching features. Throws ValidationError when none match.
Region region_from_collection(const json& collection, const std::string& property,
                              const std::string& value);

Region load_boundary(const std::filesystem::path& path, const std::string& property,
                     const std::string& value);

} // namespace annual_mosaic::geometry
