#include "annual_mosaic/geometry/region.hpp"
#include "annual_mosaic/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace annual_mosaic {

ClipRegion ClipRegion::whole_grid(const GridInfo& grid, const std::string& name) {
    ClipRegion clip;
    clip.name = name;
    clip.grid = grid;
    clip.inside = MaskMatrix::Constant(grid.rows, grid.cols, true);
    return clip;
}

} // namespace annual_mosaic

namespace annual_mosaic::geometry {

static bool polygon_contains(const Polygon& poly, double x, double y) {
    bool inside = false;
    for (const auto& ring : poly.rings) {
        const size_t n = ring.size();
        if (n < 3) continue;
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const Point& a = ring[i];
            const Point& b = ring[j];
            if ((a.y > y) != (b.y > y)) {
                const double xi = a.x + (y - a.y) * (b.x - a.x) / (b.y - a.y);
                if (x < xi) inside = !inside;
            }
        }
    }
    return inside;
}

BoundingBox Region::bounds() const {
    BoundingBox box{std::numeric_limits<double>::infinity(),
                    std::numeric_limits<double>::infinity(),
                    -std::numeric_limits<double>::infinity(),
                    -std::numeric_limits<double>::infinity()};
    for (const auto& poly : polygons) {
        for (const auto& ring : poly.rings) {
            for (const auto& p : ring) {
                box.min_x = std::min(box.min_x, p.x);
                box.min_y = std::min(box.min_y, p.y);
                box.max_x = std::max(box.max_x, p.x);
                box.max_y = std::max(box.max_y, p.y);
            }
        }
    }
    return box;
}

bool Region::contains(double x, double y) const {
    for (const auto& poly : polygons) {
        if (polygon_contains(poly, x, y)) return true;
    }
    return false;
}

static bool nearly_equal(double a, double b) {
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    return std::fabs(a - b) <= 1e-9 * scale;
}

bool same_grid(const GridInfo& a, const GridInfo& b) {
    if (a.rows != b.rows || a.cols != b.cols || a.crs != b.crs) {
        return false;
    }
    for (size_t i = 0; i < a.transform.size(); ++i) {
        if (!nearly_equal(a.transform[i], b.transform[i])) return false;
    }
    return true;
}

BoundingBox grid_bounds(const GridInfo& grid) {
    const auto& gt = grid.transform;
    const double corners[4][2] = {
        {0.0, 0.0},
        {static_cast<double>(grid.cols), 0.0},
        {0.0, static_cast<double>(grid.rows)},
        {static_cast<double>(grid.cols), static_cast<double>(grid.rows)}
    };

    BoundingBox box{std::numeric_limits<double>::infinity(),
                    std::numeric_limits<double>::infinity(),
                    -std::numeric_limits<double>::infinity(),
                    -std::numeric_limits<double>::infinity()};
    for (const auto& c : corners) {
        const double x = gt[0] + c[0] * gt[1] + c[1] * gt[2];
        const double y = gt[3] + c[0] * gt[4] + c[1] * gt[5];
        box.min_x = std::min(box.min_x, x);
        box.min_y = std::min(box.min_y, y);
        box.max_x = std::max(box.max_x, x);
        box.max_y = std::max(box.max_y, y);
    }
    return box;
}

std::pair<double, double> pixel_center(const GridInfo& grid, int row, int col) {
    const auto& gt = grid.transform;
    const double c = static_cast<double>(col) + 0.5;
    const double r = static_cast<double>(row) + 0.5;
    return {gt[0] + c * gt[1] + r * gt[2], gt[3] + c * gt[4] + r * gt[5]};
}

// Fills the even-odd spans of one polygon row by row.
static void scanline_fill(const Polygon& poly, const GridInfo& grid, MaskMatrix& inside) {
    const auto& gt = grid.transform;
    std::vector<double> crossings;

    for (int r = 0; r < grid.rows; ++r) {
        const double y = gt[3] + (static_cast<double>(r) + 0.5) * gt[5];
        crossings.clear();
        for (const auto& ring : poly.rings) {
            const size_t n = ring.size();
            if (n < 3) continue;
            for (size_t i = 0, j = n - 1; i < n; j = i++) {
                const Point& a = ring[i];
                const Point& b = ring[j];
                if ((a.y > y) != (b.y > y)) {
                    crossings.push_back(a.x + (y - a.y) * (b.x - a.x) / (b.y - a.y));
                }
            }
        }
        if (crossings.size() < 2) continue;
        std::sort(crossings.begin(), crossings.end());

        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            // Centres x_c = gt0 + (c + 0.5) * dx with xa <= x_c < xb.
            // Clamped before the int cast; far-off crossings would overflow.
            const double limit = static_cast<double>(grid.cols);
            const double ca = std::clamp((crossings[k] - gt[0]) / gt[1] - 0.5, -1.0, limit);
            const double cb = std::clamp((crossings[k + 1] - gt[0]) / gt[1] - 0.5, -1.0, limit);
            int c0 = static_cast<int>(std::ceil(ca));
            int c1 = static_cast<int>(std::ceil(cb)) - 1;
            c0 = std::max(c0, 0);
            c1 = std::min(c1, grid.cols - 1);
            for (int c = c0; c <= c1; ++c) {
                inside(r, c) = true;
            }
        }
    }
}

ClipRegion rasterize_region(const Region& region, const GridInfo& grid) {
    if (!grid.crs.empty() && region.crs != grid.crs) {
        throw GridMismatch("region '" + region.name + "' is in " + region.crs +
                           " but the grid is in " + grid.crs);
    }

    ClipRegion clip;
    clip.name = region.name;
    clip.grid = grid;
    clip.inside = MaskMatrix::Constant(grid.rows, grid.cols, false);

    if (region.empty() || grid.rows == 0 || grid.cols == 0) {
        return clip;
    }
    if (!grid_bounds(grid).intersects(region.bounds())) {
        return clip;
    }

    if (grid.is_north_up()) {
        for (const auto& poly : region.polygons) {
            scanline_fill(poly, grid, clip.inside);
        }
        return clip;
    }

    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            auto [x, y] = pixel_center(grid, r, c);
            clip.inside(r, c) = region.contains(x, y);
        }
    }
    return clip;
}

} // namespace annual_mosaic::geometry
