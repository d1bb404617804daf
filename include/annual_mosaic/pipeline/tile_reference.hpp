#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace annual_mosaic::pipeline {

// Display parameters of a composite; they never change composite values.
struct VisualizationParams {
    std::vector<std::string> bands{"SR_B4", "SR_B3", "SR_B2"};
    double min = 0.03;
    double max = 0.3;
    double gamma = 1.4;
};

struct TileContext {
    std::string region;
    int year = 0;
    VisualizationParams vis;
};

// Replaces {region} {year} {bands} {min} {max} {gamma}. Other placeholders,
// {z} {x} {y} among them, are kept for the tile client.
std::string format_tile_reference(const std::string& url_template, const TileContext& ctx);

// Lower-case, spaces and path separators replaced by '_'.
std::string region_slug(const std::string& region);

nlohmann::json visualization_to_json(const VisualizationParams& vis);

} // namespace annual_mosaic::pipeline
