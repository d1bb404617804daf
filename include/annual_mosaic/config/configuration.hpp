#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace annual_mosaic::config {

namespace fs = std::filesystem;

struct RegionConfig {
  std::string boundary_file;   // GeoJSON FeatureCollection; empty = whole grid
  std::string property = "ADM0_NAME";
  std::string value = "Kenya";
};

struct YearsConfig {
  int first = 2013;
  int last = 0;                // must be supplied (config or --last-year)
};

struct InputConfig {
  std::string scene_dir = "scenes";
  std::string pattern = "*.fit*";
  std::string reference_grid;  // FITS file defining the target grid
};

struct QualityConfig {
  std::string band = "QA_PIXEL";
  int cloud_bit = 3;
  int shadow_bit = 4;
};

struct ReflectanceConfig {
  double scale = 0.0000275;
  double offset = -0.2;
  std::vector<std::string> bands{"SR_B1", "SR_B2", "SR_B3", "SR_B4",
                                 "SR_B5", "SR_B6", "SR_B7"};
};

struct VisualizationConfig {
  std::vector<std::string> bands{"SR_B4", "SR_B3", "SR_B2"};
  double min = 0.03;
  double max = 0.3;
  double gamma = 1.4;
};

struct TilesConfig {
  std::string url_template =
      "tiles/{region}/{year}/{z}/{x}/{y}.png?bands={bands}&min={min}&max={max}&gamma={gamma}";
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct OutputConfig {
  std::string log_file;        // JSON-lines event log; empty = stdout only
};

struct Config {
  RegionConfig region;
  YearsConfig years;
  InputConfig input;
  QualityConfig quality;
  ReflectanceConfig reflectance;
  VisualizationConfig visualization;
  TilesConfig tiles;
  RuntimeConfig runtime;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace annual_mosaic::config
