#include "annual_mosaic/io/scene_catalog.hpp"
#include "annual_mosaic/core/dates.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/utils.hpp"
#include "annual_mosaic/geometry/region.hpp"
#include "annual_mosaic/io/fits_io.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace annual_mosaic::io {

std::optional<Date> date_from_scene_id(const std::string& scene_id) {
    for (const auto& token : core::split(scene_id, '_')) {
        if (token.size() != 8) continue;
        if (auto d = core::parse_date(token)) {
            return d;
        }
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>> split_scene_stem(
    const std::string& stem, const std::vector<std::string>& known_bands) {
    const std::string* best = nullptr;
    for (const auto& band : known_bands) {
        if (band.empty() || stem.size() <= band.size() + 1) continue;
        if (core::ends_with(stem, "_" + band) && (!best || band.size() > best->size())) {
            best = &band;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return std::make_pair(stem.substr(0, stem.size() - best->size() - 1), *best);
}

static std::string file_stem(const fs::path& p) {
    fs::path stem = p.stem();
    // x.fits.fz -> x
    if (is_fits_image_path(stem)) {
        stem = stem.stem();
    }
    return stem.string();
}

std::vector<SceneFiles> scan_scene_directory(const fs::path& dir, const std::string& pattern,
                                             const std::string& quality_band,
                                             const std::vector<std::string>& reflectance_bands,
                                             std::vector<std::string>& warnings) {
    if (!fs::exists(dir) || !fs::is_directory(dir)) {
        throw IOError("Scene directory not found: " + dir.string());
    }

    std::vector<std::string> known = reflectance_bands;
    known.push_back(quality_band);

    std::map<std::string, SceneFiles> grouped;
    for (const auto& path : core::discover_files(dir, pattern)) {
        auto split = split_scene_stem(file_stem(path), known);
        if (!split) continue;

        const auto& [scene_id, band] = *split;
        SceneFiles& files = grouped[scene_id];
        files.scene_id = scene_id;
        if (band == quality_band) {
            files.quality = path;
        } else {
            files.bands[band] = path;
        }
    }

    std::vector<SceneFiles> out;
    out.reserve(grouped.size());
    for (auto& [scene_id, files] : grouped) {
        std::optional<Date> date = date_from_scene_id(scene_id);
        if (!date) {
            const fs::path probe = files.quality ? *files.quality : files.bands.begin()->second;
            try {
                auto header = read_fits_header(probe);
                if (auto obs = header.get_string("DATE-OBS")) {
                    date = core::parse_date(*obs);
                }
            } catch (const IOError& e) {
                warnings.push_back("scene " + scene_id + ": " + e.what());
                continue;
            }
        }
        if (!date) {
            warnings.push_back("scene " + scene_id + " has no acquisition date; skipped");
            continue;
        }
        files.acquired = *date;
        out.push_back(std::move(files));
    }
    return out;
}

static Matrix2Di to_digital_numbers(const Matrix2Df& data, const fs::path& path) {
    Matrix2Di dn(data.rows(), data.cols());
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        const float v = data.data()[i];
        if (!std::isfinite(v)) {
            throw FitsError("Non-finite digital number in " + path.string());
        }
        const double rounded = std::round(static_cast<double>(v));
        if (rounded < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
            rounded > static_cast<double>(std::numeric_limits<int32_t>::max())) {
            throw FitsError("Digital number " + std::to_string(v) + " in " + path.string() +
                            " is outside the 32-bit range");
        }
        dn.data()[i] = static_cast<int32_t>(rounded);
    }
    return dn;
}

Scene load_scene(const SceneFiles& files, const std::vector<std::string>& bands) {
    Scene scene;
    scene.scene_id = files.scene_id;
    scene.acquired = files.acquired;

    std::optional<GridInfo> scene_grid;
    auto check_grid = [&](const GridInfo& g, const std::string& what) {
        if (!scene_grid) {
            scene_grid = g;
        } else if (!geometry::same_grid(*scene_grid, g)) {
            throw GridMismatch(what + " of scene " + files.scene_id +
                               " is not on the grid of its other bands");
        }
    };

    if (files.quality) {
        auto [codes, header] = read_fits_uint32(*files.quality);
        QualityRaster qa;
        qa.grid = grid_from_header(header, static_cast<int>(codes.rows()), static_cast<int>(codes.cols()));
        qa.codes = std::move(codes);
        check_grid(qa.grid, "quality band");
        scene.quality = std::move(qa);
    }

    for (const auto& band : bands) {
        auto it = files.bands.find(band);
        if (it == files.bands.end()) continue;

        auto [data, header] = read_fits_float(it->second);
        GridInfo g = grid_from_header(header, static_cast<int>(data.rows()), static_cast<int>(data.cols()));
        check_grid(g, "band " + band);
        scene.reflectance.band_names.push_back(band);
        scene.reflectance.bands.push_back(to_digital_numbers(data, it->second));
    }

    if (scene_grid) {
        scene.reflectance.grid = *scene_grid;
    }
    return scene;
}

FitsSceneCatalog::FitsSceneCatalog(const fs::path& scene_dir, const std::string& pattern,
                                   const std::string& quality_band, std::vector<std::string> bands,
                                   const fs::path& reference_grid)
    : bands_(std::move(bands)) {
    scenes_ = scan_scene_directory(scene_dir, pattern, quality_band, bands_, warnings_);

    fs::path grid_file = reference_grid;
    if (grid_file.empty()) {
        for (const auto& s : scenes_) {
            if (s.quality) {
                grid_file = *s.quality;
            } else if (!s.bands.empty()) {
                grid_file = s.bands.begin()->second;
            }
            if (!grid_file.empty()) break;
        }
    }
    if (grid_file.empty()) {
        throw PipelineError("No scenes in " + scene_dir.string() +
                            " and no reference grid configured");
    }

    auto [data, header] = read_fits_float(grid_file);
    target_grid_ = grid_from_header(header, static_cast<int>(data.rows()), static_cast<int>(data.cols()));
}

GridInfo FitsSceneCatalog::target_grid() const {
    return target_grid_;
}

std::vector<pipeline::SceneRef> FitsSceneCatalog::scenes_in_window(const DateWindow& window) const {
    std::vector<pipeline::SceneRef> refs;
    for (const auto& s : scenes_) {
        if (window.contains(s.acquired)) {
            refs.push_back({s.scene_id, s.acquired});
        }
    }
    return refs;
}

Scene FitsSceneCatalog::load(const pipeline::SceneRef& ref) const {
    auto it = std::find_if(scenes_.begin(), scenes_.end(),
                           [&](const SceneFiles& s) { return s.scene_id == ref.scene_id; });
    if (it == scenes_.end()) {
        throw IOError("Unknown scene: " + ref.scene_id);
    }
    return load_scene(*it, bands_);
}

} // namespace annual_mosaic::io
