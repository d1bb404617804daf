#pragma once

#include "annual_mosaic/core/events.hpp"
#include "annual_mosaic/core/types.hpp"
#include "annual_mosaic/masking/quality_mask.hpp"
#include "annual_mosaic/pipeline/scene_source.hpp"
#include "annual_mosaic/pipeline/tile_reference.hpp"

#include <nlohmann/json.hpp>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace annual_mosaic::pipeline {

struct RunParameters {
    masking::QualityBits bits;
    masking::ReflectanceScaling scaling;
    std::vector<std::string> bands;
    VisualizationParams vis;
    std::string tile_url_template;
    int parallel_workers = 1;
};

struct YearReport {
    int year = 0;
    DateWindow window;
    std::string status;          // ok | empty | failed
    int scenes_selected = 0;
    int scenes_composited = 0;
    std::vector<SceneRejection> rejected;
    long long pixels_in_region = 0;
    long long pixels_with_data = 0;
    int min_valid_count = 0;     // over pixels inside the region
    int max_valid_count = 0;
    std::string tile_reference;
    std::string error;
};

nlohmann::json report_to_json(const YearReport& report);

struct YearResult {
    YearReport report;
    std::optional<Composite> composite;
};

using CompositeSink = std::function<void(const YearReport&, const Composite&)>;

/**
 * Select -> mask -> composite for each year window. A scene that cannot be
 * loaded or masked is rejected and reported; a year that fails is reported
 * and the remaining years still run.
 */
class YearlyRunner {
public:
    YearlyRunner(const SceneSource& source, ClipRegion region, RunParameters params,
                 core::EventEmitter* events = nullptr, std::string run_id = {},
                 std::ostream* log_stream = nullptr);

    // Throws when the year cannot be processed at all.
    YearResult run_year(const YearWindow& window) const;

    // Never throws for a single year; failures end up in the report. A year
    // whose sink throws is reported as failed and gets no year_end event.
    std::vector<YearReport> run_years(const std::vector<YearWindow>& windows,
                                      const CompositeSink& sink = {}) const;

    const ClipRegion& region() const { return region_; }

private:
    YearResult compose_year(const YearWindow& window) const;
    // scene_rejected and year_end events plus the summary log line.
    void publish_year(const YearReport& report) const;
    std::vector<MaskedScene> load_and_mask(const std::vector<SceneRef>& refs,
                                           std::vector<SceneRejection>& rejected) const;
    void log(const std::string& line) const;

    const SceneSource& source_;
    ClipRegion region_;
    RunParameters params_;
    core::EventEmitter* events_;
    std::string run_id_;
    std::ostream* log_stream_;
};

} // namespace annual_mosaic::pipeline
