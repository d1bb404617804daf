#include "annual_mosaic/config/configuration.hpp"
#include "annual_mosaic/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace annual_mosaic::config {

static void read_string_list(const YAML::Node& n, std::vector<std::string>& out) {
    if (n && n.IsSequence()) {
        out.clear();
        for (const auto& item : n) {
            out.push_back(item.as<std::string>());
        }
    }
}

static void check_band_list(const std::vector<std::string>& bands, const std::string& key) {
    std::set<std::string> seen;
    for (const auto& b : bands) {
        if (b.empty()) {
            throw ValidationError(key + " must not contain empty band names");
        }
        if (!seen.insert(b).second) {
            throw ValidationError(key + " contains duplicate band '" + b + "'");
        }
    }
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["region"]) {
            auto r = node["region"];
            if (r["boundary_file"]) cfg.region.boundary_file = r["boundary_file"].as<std::string>();
            if (r["property"]) cfg.region.property = r["property"].as<std::string>();
            if (r["value"]) cfg.region.value = r["value"].as<std::string>();
        }

        if (node["years"]) {
            auto y = node["years"];
            if (y["first"]) cfg.years.first = y["first"].as<int>();
            if (y["last"]) cfg.years.last = y["last"].as<int>();
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["scene_dir"]) cfg.input.scene_dir = i["scene_dir"].as<std::string>();
            if (i["pattern"]) cfg.input.pattern = i["pattern"].as<std::string>();
            if (i["reference_grid"]) cfg.input.reference_grid = i["reference_grid"].as<std::string>();
        }

        if (node["quality"]) {
            auto q = node["quality"];
            if (q["band"]) cfg.quality.band = q["band"].as<std::string>();
            if (q["cloud_bit"]) cfg.quality.cloud_bit = q["cloud_bit"].as<int>();
            if (q["shadow_bit"]) cfg.quality.shadow_bit = q["shadow_bit"].as<int>();
        }

        if (node["reflectance"]) {
            auto r = node["reflectance"];
            if (r["scale"]) cfg.reflectance.scale = r["scale"].as<double>();
            if (r["offset"]) cfg.reflectance.offset = r["offset"].as<double>();
            read_string_list(r["bands"], cfg.reflectance.bands);
        }

        if (node["visualization"]) {
            auto v = node["visualization"];
            read_string_list(v["bands"], cfg.visualization.bands);
            if (v["min"]) cfg.visualization.min = v["min"].as<double>();
            if (v["max"]) cfg.visualization.max = v["max"].as<double>();
            if (v["gamma"]) cfg.visualization.gamma = v["gamma"].as<double>();
        }

        if (node["tiles"]) {
            auto t = node["tiles"];
            if (t["url_template"]) cfg.tiles.url_template = t["url_template"].as<std::string>();
        }

        if (node["runtime"]) {
            auto rt = node["runtime"];
            if (rt["parallel_workers"]) cfg.runtime.parallel_workers = rt["parallel_workers"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["log_file"]) cfg.output.log_file = o["log_file"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << to_yaml();
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["region"]["boundary_file"] = region.boundary_file;
    node["region"]["property"] = region.property;
    node["region"]["value"] = region.value;

    node["years"]["first"] = years.first;
    node["years"]["last"] = years.last;

    node["input"]["scene_dir"] = input.scene_dir;
    node["input"]["pattern"] = input.pattern;
    node["input"]["reference_grid"] = input.reference_grid;

    node["quality"]["band"] = quality.band;
    node["quality"]["cloud_bit"] = quality.cloud_bit;
    node["quality"]["shadow_bit"] = quality.shadow_bit;

    node["reflectance"]["scale"] = reflectance.scale;
    node["reflectance"]["offset"] = reflectance.offset;
    for (const auto& b : reflectance.bands) {
        node["reflectance"]["bands"].push_back(b);
    }

    for (const auto& b : visualization.bands) {
        node["visualization"]["bands"].push_back(b);
    }
    node["visualization"]["min"] = visualization.min;
    node["visualization"]["max"] = visualization.max;
    node["visualization"]["gamma"] = visualization.gamma;

    node["tiles"]["url_template"] = tiles.url_template;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    node["output"]["log_file"] = output.log_file;

    return node;
}

void Config::validate() const {
    if (!region.boundary_file.empty()) {
        if (region.value.empty()) {
            throw ValidationError("region.value must be set when region.boundary_file is given");
        }
    }

    if (years.first < 1 || years.first > 9999) {
        throw ValidationError("years.first must be in [1,9999]");
    }
    if (years.last < years.first || years.last > 9999) {
        throw ValidationError("years.last must be in [years.first,9999]");
    }

    if (input.scene_dir.empty()) {
        throw ValidationError("input.scene_dir must not be empty");
    }
    if (input.pattern.empty()) {
        throw ValidationError("input.pattern must not be empty");
    }

    if (quality.band.empty()) {
        throw ValidationError("quality.band must not be empty");
    }
    if (quality.cloud_bit < 0 || quality.cloud_bit > 31) {
        throw ValidationError("quality.cloud_bit must be in [0,31]");
    }
    if (quality.shadow_bit < 0 || quality.shadow_bit > 31) {
        throw ValidationError("quality.shadow_bit must be in [0,31]");
    }

    if (!std::isfinite(reflectance.scale) || reflectance.scale == 0.0) {
        throw ValidationError("reflectance.scale must be finite and non-zero");
    }
    if (!std::isfinite(reflectance.offset)) {
        throw ValidationError("reflectance.offset must be finite");
    }
    if (reflectance.bands.empty()) {
        throw ValidationError("reflectance.bands must not be empty");
    }
    check_band_list(reflectance.bands, "reflectance.bands");
    for (const auto& b : reflectance.bands) {
        if (b == quality.band) {
            throw ValidationError("reflectance.bands must not contain the quality band '" + b + "'");
        }
    }

    if (visualization.bands.size() != 3) {
        throw ValidationError("visualization.bands must name exactly 3 bands");
    }
    check_band_list(visualization.bands, "visualization.bands");
    for (const auto& b : visualization.bands) {
        bool found = false;
        for (const auto& rb : reflectance.bands) {
            if (rb == b) {
                found = true;
                break;
            }
        }
        if (!found) {
            throw ValidationError("visualization band '" + b + "' is not in reflectance.bands");
        }
    }
    if (!(visualization.min < visualization.max)) {
        throw ValidationError("visualization.min must be < visualization.max");
    }
    if (!(visualization.gamma > 0.0)) {
        throw ValidationError("visualization.gamma must be > 0");
    }

    if (tiles.url_template.empty()) {
        throw ValidationError("tiles.url_template must not be empty");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ValidationError("runtime.parallel_workers must be in [1,64]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "title": "annual_mosaic configuration",
  "type": "object",
  "properties": {
    "region": {
      "type": "object",
      "properties": {
        "boundary_file": {"type": "string"},
        "property": {"type": "string"},
        "value": {"type": "string"}
      }
    },
    "years": {
      "type": "object",
      "properties": {
        "first": {"type": "integer", "minimum": 1, "maximum": 9999},
        "last": {"type": "integer", "minimum": 1, "maximum": 9999}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "scene_dir": {"type": "string"},
        "pattern": {"type": "string"},
        "reference_grid": {"type": "string"}
      }
    },
    "quality": {
      "type": "object",
      "properties": {
        "band": {"type": "string"},
        "cloud_bit": {"type": "integer", "minimum": 0, "maximum": 31},
        "shadow_bit": {"type": "integer", "minimum": 0, "maximum": 31}
      }
    },
    "reflectance": {
      "type": "object",
      "properties": {
        "scale": {"type": "number"},
        "offset": {"type": "number"},
        "bands": {"type": "array", "items": {"type": "string"}, "minItems": 1}
      }
    },
    "visualization": {
      "type": "object",
      "properties": {
        "bands": {"type": "array", "items": {"type": "string"}, "minItems": 3, "maxItems": 3},
        "min": {"type": "number"},
        "max": {"type": "number"},
        "gamma": {"type": "number", "exclusiveMinimum": 0}
      }
    },
    "tiles": {
      "type": "object",
      "properties": {
        "url_template": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "log_file": {"type": "string"}
      }
    }
  }
})";
}

} // namespace annual_mosaic::config
