#include "annual_mosaic/geometry/boundary.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/utils.hpp"

#include <fstream>

namespace annual_mosaic::geometry {

json load_geojson(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw IOError("Cannot open boundary file: " + path.string());
    }
    try {
        return json::parse(in);
    } catch (const json::parse_error& e) {
        throw IOError("Cannot parse boundary file " + path.string() + ": " + e.what());
    }
}

static bool value_matches(const json& v, const std::string& value) {
    if (v.is_string()) {
        return core::iequals(core::trim(v.get<std::string>()), core::trim(value));
    }
    if (v.is_number() || v.is_boolean()) {
        return core::iequals(v.dump(), core::trim(value));
    }
    return false;
}

std::vector<json> find_features(const json& collection, const std::string& property,
                                const std::string& value) {
    std::vector<json> matches;
    if (!collection.is_object() || !collection.contains("features") ||
        !collection["features"].is_array()) {
        return matches;
    }

    const auto& features = collection["features"];
    if (!property.empty()) {
        for (const auto& feat : features) {
            auto props = feat.find("properties");
            if (props == feat.end() || !props->is_object()) continue;
            auto it = props->find(property);
            if (it != props->end() && value_matches(*it, value)) {
                matches.push_back(feat);
            }
        }
    }
    if (!matches.empty()) {
        return matches;
    }

    for (const auto& feat : features) {
        auto props = feat.find("properties");
        if (props == feat.end() || !props->is_object()) continue;
        for (const auto& [key, v] : props->items()) {
            if (v.is_string() && value_matches(v, value)) {
                matches.push_back(feat);
                break;
            }
        }
    }
    return matches;
}

static Ring parse_ring(const json& coords) {
    Ring ring;
    if (!coords.is_array()) {
        throw ValidationError("GeoJSON ring is not an array");
    }
    ring.reserve(coords.size());
    for (const auto& pt : coords) {
        if (!pt.is_array() || pt.size() < 2 || !pt[0].is_number() || !pt[1].is_number()) {
            throw ValidationError("GeoJSON position must be [x, y]");
        }
        ring.push_back({pt[0].get<double>(), pt[1].get<double>()});
    }
    return ring;
}

static Polygon parse_polygon(const json& coords) {
    Polygon poly;
    if (!coords.is_array()) {
        throw ValidationError("GeoJSON polygon is not an array of rings");
    }
    for (const auto& ring : coords) {
        poly.rings.push_back(parse_ring(ring));
    }
    return poly;
}

bool append_feature_geometry(const json& feature, Region& region) {
    auto geom = feature.find("geometry");
    if (geom == feature.end() || !geom->is_object()) {
        return false;
    }
    const std::string type = geom->value("type", "");
    auto coords = geom->find("coordinates");
    if (coords == geom->end()) {
        return false;
    }

    if (type == "Polygon") {
        region.polygons.push_back(parse_polygon(*coords));
        return true;
    }
    if (type == "MultiPolygon") {
        if (!coords->is_array()) {
            throw ValidationError("GeoJSON MultiPolygon coordinates must be an array");
        }
        for (const auto& poly : *coords) {
            region.polygons.push_back(parse_polygon(poly));
        }
        return true;
    }
    return false;
}

// Old-style named CRS member; defaults to WGS84 longitude/latitude.
static std::string collection_crs(const json& collection) {
    auto crs = collection.find("crs");
    if (crs != collection.end() && crs->is_object()) {
        auto props = crs->find("properties");
        if (props != crs->end() && props->is_object()) {
            std::string name = props->value("name", "");
            // urn:ogc:def:crs:EPSG::32637 -> EPSG:32637
            auto pos = name.find("EPSG::");
            if (pos != std::string::npos) {
                return "EPSG:" + name.substr(pos + 6);
            }
            if (name.find("CRS84") != std::string::npos) {
                return "EPSG:4326";
            }
            if (!name.empty()) return name;
        }
    }
    return "EPSG:4326";
}

Region region_from_collection(const json& collection, const std::string& property,
                              const std::string& value) {
    auto matches = find_features(collection, property, value);
    if (matches.empty()) {
        throw ValidationError("No boundary feature with " + property + " = '" + value + "'");
    }

    Region region;
    region.name = value;
    region.crs = collection_crs(collection);
    for (const auto& feat : matches) {
        append_feature_geometry(feat, region);
    }
    if (region.empty()) {
        throw ValidationError("Boundary features for '" + value + "' carry no polygon geometry");
    }
    return region;
}

Region load_boundary(const std::filesystem::path& path, const std::string& property,
                     const std::string& value) {
    return region_from_collection(load_geojson(path), property, value);
}

} // namespace annual_mosaic::geometry
