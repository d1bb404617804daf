#pragma once

#include "annual_mosaic/core/types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace annual_mosaic::geometry {

struct Point {
    double x;
    double y;
};

using Ring = std::vector<Point>;

// rings[0] is the exterior ring, further rings are holes.
struct Polygon {
    std::vector<Ring> rings;
};

// Union of polygons in one CRS.
struct Region {
    std::string name;
    std::string crs = "EPSG:4326";
    std::vector<Polygon> polygons;

    bool empty() const { return polygons.empty(); }
    BoundingBox bounds() const;

    // Even-odd rule per polygon, union over polygons.
    bool contains(double x, double y) const;
};

bool same_grid(const GridInfo& a, const GridInfo& b);

BoundingBox grid_bounds(const GridInfo& grid);

std::pair<double, double> pixel_center(const GridInfo& grid, int row, int col);

// Marks pixels whose centre lies inside `region`. Throws GridMismatch when the
// grid names a CRS different from the region's.
ClipRegion rasterize_region(const Region& region, const GridInfo& grid);

} // namespace annual_mosaic::geometry
