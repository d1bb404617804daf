#include "annual_mosaic/pipeline/tile_reference.hpp"
#include "annual_mosaic/core/utils.hpp"

#include <cctype>
#include <sstream>

namespace annual_mosaic::pipeline {

static std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string region_slug(const std::string& region) {
    std::string out;
    for (unsigned char c : core::trim(region)) {
        if (std::isalnum(c) || c == '-' || c == '.') {
            out += static_cast<char>(std::tolower(c));
        } else {
            out += '_';
        }
    }
    return out.empty() ? "region" : out;
}

std::string format_tile_reference(const std::string& url_template, const TileContext& ctx) {
    const std::pair<std::string, std::string> substitutions[] = {
        {"{region}", region_slug(ctx.region)},
        {"{year}", std::to_string(ctx.year)},
        {"{bands}", core::join(ctx.vis.bands, ",")},
        {"{min}", format_number(ctx.vis.min)},
        {"{max}", format_number(ctx.vis.max)},
        {"{gamma}", format_number(ctx.vis.gamma)},
    };

    std::string out;
    out.reserve(url_template.size() + 32);
    size_t pos = 0;
    while (pos < url_template.size()) {
        bool replaced = false;
        if (url_template[pos] == '{') {
            for (const auto& [key, value] : substitutions) {
                if (url_template.compare(pos, key.size(), key) == 0) {
                    out += value;
                    pos += key.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += url_template[pos];
            ++pos;
        }
    }
    return out;
}

nlohmann::json visualization_to_json(const VisualizationParams& vis) {
    return {
        {"bands", vis.bands},
        {"min", vis.min},
        {"max", vis.max},
        {"gamma", vis.gamma}
    };
}

} // namespace annual_mosaic::pipeline
