#include "annual_mosaic/pipeline/yearly_runner.hpp"
#include "annual_mosaic/compositing/compositor.hpp"
#include "annual_mosaic/core/dates.hpp"
#include "annual_mosaic/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <limits>
#include <thread>

namespace annual_mosaic::pipeline {

using json = nlohmann::json;

json report_to_json(const YearReport& report) {
    json j;
    j["year"] = report.year;
    j["start"] = core::format_date(report.window.start);
    j["end"] = core::format_date(report.window.end);
    j["status"] = report.status;
    j["scenes_selected"] = report.scenes_selected;
    j["scenes_composited"] = report.scenes_composited;
    j["scenes_rejected"] = static_cast<int>(report.rejected.size());
    j["pixels_in_region"] = report.pixels_in_region;
    j["pixels_with_data"] = report.pixels_with_data;
    j["min_valid_count"] = report.min_valid_count;
    j["max_valid_count"] = report.max_valid_count;
    if (!report.tile_reference.empty()) j["tile_reference"] = report.tile_reference;
    if (!report.error.empty()) j["error"] = report.error;

    json rejected = json::array();
    for (const auto& r : report.rejected) {
        rejected.push_back({{"scene_id", r.scene_id},
                            {"reason", rejection_kind_to_string(r.kind)},
                            {"message", r.message}});
    }
    j["rejected"] = rejected;
    return j;
}

YearlyRunner::YearlyRunner(const SceneSource& source, ClipRegion region, RunParameters params,
                           core::EventEmitter* events, std::string run_id,
                           std::ostream* log_stream)
    : source_(source), region_(std::move(region)), params_(std::move(params)),
      events_(events), run_id_(std::move(run_id)), log_stream_(log_stream) {
    if (params_.bands.empty()) {
        throw ValidationError("run needs at least one composite band");
    }
}

void YearlyRunner::log(const std::string& line) const {
    if (log_stream_) {
        (*log_stream_) << line << "\n";
        log_stream_->flush();
    }
}

std::vector<MaskedScene> YearlyRunner::load_and_mask(const std::vector<SceneRef>& refs,
                                                     std::vector<SceneRejection>& rejected) const {
    const size_t n = refs.size();
    std::vector<std::optional<Scene>> loaded(n);
    std::vector<std::optional<MaskedScene>> masked(n);
    std::vector<std::optional<SceneRejection>> failures(n);

    auto reject = [&](size_t i, RejectionKind kind, const std::string& message) {
        failures[i] = SceneRejection{refs[i].scene_id, kind, message};
    };

    // Loading stays serial: cfitsio handles are not shared across threads.
    for (size_t i = 0; i < n; ++i) {
        try {
            loaded[i] = source_.load(refs[i]);
        } catch (const MissingAuxiliaryBand& e) {
            reject(i, RejectionKind::MISSING_AUXILIARY_BAND, e.what());
        } catch (const GridMismatch& e) {
            reject(i, RejectionKind::GRID_MISMATCH, e.what());
        } catch (const std::exception& e) {
            reject(i, RejectionKind::UNREADABLE, e.what());
        }
    }

    auto mask_one = [&](size_t i) {
        if (!loaded[i]) return;
        try {
            masked[i] = masking::mask_scene(*loaded[i], params_.bits, params_.scaling);
        } catch (const MissingAuxiliaryBand& e) {
            reject(i, RejectionKind::MISSING_AUXILIARY_BAND, e.what());
        } catch (const GridMismatch& e) {
            reject(i, RejectionKind::GRID_MISMATCH, e.what());
        } catch (const std::exception& e) {
            reject(i, RejectionKind::UNREADABLE, e.what());
        }
        loaded[i].reset();
    };

    const int workers = std::min<int>(std::max(1, params_.parallel_workers), static_cast<int>(n));
    if (workers > 1) {
        std::vector<std::thread> pool;
        std::atomic<size_t> next{0};
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back([&]() {
                while (true) {
                    const size_t i = next.fetch_add(1);
                    if (i >= n) break;
                    mask_one(i);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    } else {
        for (size_t i = 0; i < n; ++i) {
            mask_one(i);
        }
    }

    std::vector<MaskedScene> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (failures[i]) {
            rejected.push_back(std::move(*failures[i]));
        } else if (masked[i]) {
            out.push_back(std::move(*masked[i]));
        }
    }
    return out;
}

YearResult YearlyRunner::compose_year(const YearWindow& window) const {
    YearResult result;
    YearReport& report = result.report;
    report.year = window.year;
    report.window = window.window;

    std::vector<SceneRef> refs = source_.scenes_in_window(window.window);
    report.scenes_selected = static_cast<int>(refs.size());
    if (events_) {
        events_->year_start(run_id_, window, report.scenes_selected);
    }
    log("[" + std::to_string(window.year) + "] " + std::to_string(refs.size()) +
        " scenes between " + core::format_date(window.window.start) + " and " +
        core::format_date(window.window.end));

    std::vector<MaskedScene> masked = load_and_mask(refs, report.rejected);

    compositing::CompositeOptions options;
    options.parallel_workers = params_.parallel_workers;
    Composite comp = compositing::composite(masked, region_, params_.bands, options);
    masked.clear();

    report.rejected.insert(report.rejected.end(), comp.rejected.begin(), comp.rejected.end());
    report.scenes_composited = comp.contributing_scenes;
    report.pixels_in_region = static_cast<long long>(region_.inside.count());
    report.pixels_with_data = static_cast<long long>(comp.has_data.count());

    int min_count = std::numeric_limits<int>::max();
    int max_count = 0;
    for (Eigen::Index i = 0; i < comp.valid_count.size(); ++i) {
        if (!region_.inside.data()[i]) continue;
        min_count = std::min(min_count, static_cast<int>(comp.valid_count.data()[i]));
        max_count = std::max(max_count, static_cast<int>(comp.valid_count.data()[i]));
    }
    report.min_valid_count = report.pixels_in_region > 0 ? min_count : 0;
    report.max_valid_count = max_count;

    report.status = comp.empty_input() ? "empty" : "ok";

    TileContext ctx;
    ctx.region = region_.name;
    ctx.year = window.year;
    ctx.vis = params_.vis;
    report.tile_reference = format_tile_reference(params_.tile_url_template, ctx);

    result.composite = std::move(comp);
    return result;
}

void YearlyRunner::publish_year(const YearReport& report) const {
    if (events_) {
        for (const auto& r : report.rejected) {
            events_->scene_rejected(run_id_, report.year, r);
        }
        json extra = report_to_json(report);
        extra["visualization"] = visualization_to_json(params_.vis);
        events_->year_end(run_id_, report.year, report.status, extra);
    }
    log("[" + std::to_string(report.year) + "] " + report.status + ": " +
        std::to_string(report.scenes_composited) + " composited, " +
        std::to_string(report.rejected.size()) + " rejected, " +
        std::to_string(report.pixels_with_data) + "/" + std::to_string(report.pixels_in_region) +
        " region pixels with data");
}

YearResult YearlyRunner::run_year(const YearWindow& window) const {
    YearResult result = compose_year(window);
    publish_year(result.report);
    return result;
}

std::vector<YearReport> YearlyRunner::run_years(const std::vector<YearWindow>& windows,
                                                const CompositeSink& sink) const {
    std::vector<YearReport> reports;
    reports.reserve(windows.size());

    for (const auto& window : windows) {
        try {
            // year_end goes out only once the sink has accepted the composite.
            YearResult result = compose_year(window);
            if (sink && result.composite) {
                sink(result.report, *result.composite);
            }
            publish_year(result.report);
            reports.push_back(std::move(result.report));
        } catch (const std::exception& e) {
            YearReport failed;
            failed.year = window.year;
            failed.window = window.window;
            failed.status = "failed";
            failed.error = e.what();
            if (events_) {
                events_->year_failed(run_id_, window.year, failed.error);
            }
            log("[" + std::to_string(window.year) + "] failed: " + failed.error);
            reports.push_back(std::move(failed));
        }
    }
    return reports;
}

} // namespace annual_mosaic::pipeline
