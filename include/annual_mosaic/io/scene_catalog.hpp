#pragma once

#include "annual_mosaic/core/types.hpp"
#include "annual_mosaic/pipeline/scene_source.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace annual_mosaic::io {

struct SceneFiles {
    std::string scene_id;
    Date acquired;
    std::optional<fs::path> quality;
    std::map<std::string, fs::path> bands;
};

// First underscore-separated 8-digit token that is a valid YYYYMMDD date.
// LC08_L2SP_168060_20200115_20200823_02_T1 -> 2020-01-15
std::optional<Date> date_from_scene_id(const std::string& scene_id);

// Splits "<scene_id>_<BAND>" using the longest matching band name.
std::optional<std::pair<std::string, std::string>> split_scene_stem(
    const std::string& stem, const std::vector<std::string>& known_bands);

// Groups matching files of `dir` into scenes, sorted by scene id. Scenes
// without a usable acquisition date are skipped and reported in `warnings`.
std::vector<SceneFiles> scan_scene_directory(const fs::path& dir, const std::string& pattern,
                                             const std::string& quality_band,
                                             const std::vector<std::string>& reflectance_bands,
                                             std::vector<std::string>& warnings);

// Reads the quality band (when present) and the requested reflectance bands
// that exist. Throws GridMismatch when the files disagree on the grid.
Scene load_scene(const SceneFiles& files, const std::vector<std::string>& bands);

class FitsSceneCatalog : public pipeline::SceneSource {
public:
    FitsSceneCatalog(const fs::path& scene_dir, const std::string& pattern,
                     const std::string& quality_band, std::vector<std::string> bands,
                     const fs::path& reference_grid = {});

    GridInfo target_grid() const override;
    std::vector<pipeline::SceneRef> scenes_in_window(const DateWindow& window) const override;
    Scene load(const pipeline::SceneRef& ref) const override;

    const std::vector<SceneFiles>& scenes() const { return scenes_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::vector<std::string> bands_;
    std::vector<SceneFiles> scenes_;
    std::vector<std::string> warnings_;
    GridInfo target_grid_;
};

} // namespace annual_mosaic::io
