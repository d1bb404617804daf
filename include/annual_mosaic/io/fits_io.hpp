#pragma once

#include "annual_mosaic/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace annual_mosaic::io {

// Keywords of the primary HDU. Integer and real values are kept as double,
// everything else (strings, logicals) as text.
struct FitsHeader {
    std::map<std::string, std::string> text;
    std::map<std::string, double> numbers;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
};

bool is_fits_image_path(const fs::path& path);

FitsHeader read_fits_header(const fs::path& path);

// Primary HDU as a rows x cols float matrix. Anything but a 2-D image is a
// FitsError.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// Primary HDU as exact unsigned 32-bit codes, for bit-packed quality bands.
// Negative, fractional or out-of-range pixels are a FitsError.
std::pair<QualityMatrix, FitsHeader> read_fits_uint32(const fs::path& path);

// Both overwrite `path`.
void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);
void write_fits_uint32(const fs::path& path, const QualityMatrix& data, const FitsHeader& header);

// Grid keywords: GT_X0 GT_DX GT_RX GT_Y0 GT_RY GT_DY and CRS. Missing
// keywords leave the pixel-grid defaults in place.
GridInfo grid_from_header(const FitsHeader& header, int rows, int cols);

void write_grid_to_header(const GridInfo& grid, FitsHeader& header);

} // namespace annual_mosaic::io
