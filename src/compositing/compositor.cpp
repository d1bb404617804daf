#include "annual_mosaic/compositing/compositor.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/utils.hpp"
#include "annual_mosaic/geometry/region.hpp"

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>

namespace annual_mosaic::compositing {

namespace {

// A scene admitted to the reduction, with the index of each requested band.
struct Contributor {
    const MaskedScene* scene;
    std::vector<size_t> band_index;
};

bool check_scene(const MaskedScene& s, const ClipRegion& region,
                 const std::vector<std::string>& band_list, Contributor& out,
                 SceneRejection& rejection) {
    rejection.scene_id = s.scene_id;

    if (!geometry::same_grid(s.grid, region.grid)) {
        rejection.kind = RejectionKind::GRID_MISMATCH;
        rejection.message = "scene " + s.scene_id + " is not on the grid of region '" +
                            region.name + "'";
        return false;
    }
    if (s.valid.rows() != region.grid.rows || s.valid.cols() != region.grid.cols) {
        rejection.kind = RejectionKind::GRID_MISMATCH;
        rejection.message = "mask of scene " + s.scene_id + " does not match its grid";
        return false;
    }

    out.scene = &s;
    out.band_index.clear();
    for (const auto& name : band_list) {
        auto it = std::find(s.band_names.begin(), s.band_names.end(), name);
        if (it == s.band_names.end()) {
            rejection.kind = RejectionKind::MISSING_BAND;
            rejection.message = "scene " + s.scene_id + " has no band " + name;
            return false;
        }
        const size_t idx = static_cast<size_t>(std::distance(s.band_names.begin(), it));
        if (idx >= s.bands.size() || s.bands[idx].rows() != region.grid.rows ||
            s.bands[idx].cols() != region.grid.cols) {
            rejection.kind = RejectionKind::GRID_MISMATCH;
            rejection.message = "band " + name + " of scene " + s.scene_id +
                                " does not match its grid";
            return false;
        }
        out.band_index.push_back(idx);
    }
    return true;
}

} // namespace

Composite composite(const std::vector<MaskedScene>& scenes, const ClipRegion& region,
                    const std::vector<std::string>& band_list,
                    const CompositeOptions& options) {
    if (band_list.empty()) {
        throw ValidationError("composite band list is empty");
    }
    std::set<std::string> unique_bands(band_list.begin(), band_list.end());
    if (unique_bands.size() != band_list.size()) {
        throw ValidationError("composite band list contains duplicates");
    }
    const int rows = region.grid.rows;
    const int cols = region.grid.cols;
    if (region.inside.rows() != rows || region.inside.cols() != cols) {
        throw GridMismatch("clip mask of region '" + region.name + "' does not match its grid");
    }

    Composite out;
    out.grid = region.grid;
    out.band_names = band_list;
    out.bands.assign(band_list.size(), Matrix2Df::Constant(rows, cols, kNoData));
    out.has_data = MaskMatrix::Constant(rows, cols, false);
    out.valid_count = Matrix2Di::Zero(rows, cols);

    std::vector<Contributor> contributors;
    contributors.reserve(scenes.size());
    for (const auto& s : scenes) {
        Contributor c;
        SceneRejection rejection;
        if (check_scene(s, region, band_list, c, rejection)) {
            contributors.push_back(std::move(c));
        } else {
            out.rejected.push_back(std::move(rejection));
        }
    }
    out.contributing_scenes = static_cast<int>(contributors.size());

    if (contributors.empty() || rows == 0 || cols == 0) {
        return out;
    }

    const size_t n_bands = band_list.size();

    // Rows are independent; each worker owns whole rows of every output.
    auto process_row = [&](int r, std::vector<size_t>& valid_idx, std::vector<float>& values) {
        for (int c = 0; c < cols; ++c) {
            if (!region.inside(r, c)) continue;

            valid_idx.clear();
            for (size_t k = 0; k < contributors.size(); ++k) {
                if (contributors[k].scene->valid(r, c)) {
                    valid_idx.push_back(k);
                }
            }
            out.valid_count(r, c) = static_cast<int32_t>(valid_idx.size());
            if (valid_idx.empty()) continue;

            out.has_data(r, c) = true;
            for (size_t b = 0; b < n_bands; ++b) {
                values.clear();
                for (size_t k : valid_idx) {
                    const Contributor& ct = contributors[k];
                    values.push_back(ct.scene->bands[ct.band_index[b]](r, c));
                }
                out.bands[b](r, c) = core::median_of(values);
            }
        }
    };

    int workers = std::max(1, options.parallel_workers);
    workers = std::min(workers, rows);

    if (workers > 1) {
        std::vector<std::thread> pool;
        std::atomic<int> next_row{0};

        for (int w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                std::vector<size_t> valid_idx;
                std::vector<float> values;
                valid_idx.reserve(contributors.size());
                values.reserve(contributors.size());
                while (true) {
                    const int r = next_row.fetch_add(1);
                    if (r >= rows) break;
                    process_row(r, valid_idx, values);
                }
            });
        }

        for (auto& t : pool) {
            t.join();
        }
    } else {
        std::vector<size_t> valid_idx;
        std::vector<float> values;
        for (int r = 0; r < rows; ++r) {
            process_row(r, valid_idx, values);
        }
    }

    return out;
}

} // namespace annual_mosaic::compositing
