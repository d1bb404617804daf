#pragma once

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace annual_mosaic {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Di = Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using QualityMatrix = Eigen::Matrix<uint32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// No-data sentinel for composite bands
constexpr float kNoData = std::numeric_limits<float>::quiet_NaN();

// Calendar date (proleptic Gregorian)
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

inline bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}

inline bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

inline bool operator<=(const Date& a, const Date& b) {
    return !(b < a);
}

// Closed interval [start, end]
struct DateWindow {
    Date start;
    Date end;

    bool contains(const Date& d) const { return start <= d && d <= end; }
};

struct YearWindow {
    int year;
    DateWindow window;
};

// Affine geotransform, pixel-corner convention:
//   x = gt[0] + col * gt[1] + row * gt[2]
//   y = gt[3] + col * gt[4] + row * gt[5]
using GeoTransform = std::array<double, 6>;

struct GridInfo {
    int rows = 0;
    int cols = 0;
    GeoTransform transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::string crs;

    bool is_north_up() const { return transform[2] == 0.0 && transform[4] == 0.0 && transform[1] > 0.0; }
};

struct BoundingBox {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;

    bool intersects(const BoundingBox& o) const {
        return min_x <= o.max_x && o.min_x <= max_x && min_y <= o.max_y && o.min_y <= max_y;
    }
};

// One band of bit-packed per-pixel quality flags
struct QualityRaster {
    GridInfo grid;
    QualityMatrix codes;
};

// Raw digital numbers, one matrix per spectral band
struct ReflectanceRaster {
    GridInfo grid;
    std::vector<std::string> band_names;
    std::vector<Matrix2Di> bands;
};

struct Scene {
    std::string scene_id;
    Date acquired;
    std::optional<QualityRaster> quality;
    ReflectanceRaster reflectance;
};

// Scaled reflectance plus per-pixel validity. Invalid pixels keep their
// scaled value; only `valid` hides them.
struct MaskedScene {
    std::string scene_id;
    Date acquired;
    GridInfo grid;
    std::vector<std::string> band_names;
    std::vector<Matrix2Df> bands;
    MaskMatrix valid;
};

enum class RejectionKind {
    MISSING_AUXILIARY_BAND,
    GRID_MISMATCH,
    MISSING_BAND,
    UNREADABLE
};

inline std::string rejection_kind_to_string(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::MISSING_AUXILIARY_BAND: return "MissingAuxiliaryBand";
        case RejectionKind::GRID_MISMATCH: return "GridMismatch";
        case RejectionKind::MISSING_BAND: return "MissingBand";
        case RejectionKind::UNREADABLE: return "Unreadable";
        default: return "Unknown";
    }
}

struct SceneRejection {
    std::string scene_id;
    RejectionKind kind;
    std::string message;
};

// Clip mask of a region on the target grid
struct ClipRegion {
    std::string name;
    GridInfo grid;
    MaskMatrix inside;

    static ClipRegion whole_grid(const GridInfo& grid, const std::string& name = "grid");
};

struct Composite {
    GridInfo grid;
    std::vector<std::string> band_names;
    std::vector<Matrix2Df> bands;   // kNoData where has_data is false
    MaskMatrix has_data;
    Matrix2Di valid_count;          // valid observations per pixel (0 outside region)
    int contributing_scenes = 0;
    std::vector<SceneRejection> rejected;

    bool empty_input() const { return contributing_scenes == 0; }
};

} // namespace annual_mosaic
