#include "annual_mosaic/io/fits_io.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <vector>

namespace annual_mosaic::io {

namespace {

constexpr const char* kGridKeys[6] = {"GT_X0", "GT_DX", "GT_RX", "GT_Y0", "GT_RY", "GT_DY"};

struct FitsCloser {
    void operator()(fitsfile* f) const {
        int status = 0;
        fits_close_file(f, &status);
    }
};

using FitsHandle = std::unique_ptr<fitsfile, FitsCloser>;

void check(int status, const std::string& what, const fs::path& path) {
    if (status == 0) return;
    char reason[FLEN_STATUS];
    fits_get_errstatus(status, reason);
    throw FitsError(what + " " + path.string() + " (" + reason + ")");
}

FitsHandle open_readonly(const fs::path& path) {
    fitsfile* raw = nullptr;
    int status = 0;
    fits_open_file(&raw, path.string().c_str(), READONLY, &status);
    check(status, "cannot open", path);
    return FitsHandle(raw);
}

// 'EPSG:32637  ' -> EPSG:32637, with '' unescaped.
std::string unquote(const std::string& value) {
    std::string s = core::trim(value);
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        s = s.substr(1, s.size() - 2);
    }
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        out += s[i];
        if (s[i] == '\'' && i + 1 < s.size() && s[i + 1] == '\'') ++i;
    }
    return core::trim(out);
}

double parse_number(std::string value) {
    // Fortran-style exponents: 1.5D+03
    std::replace(value.begin(), value.end(), 'D', 'E');
    std::replace(value.begin(), value.end(), 'd', 'e');
    return std::strtod(value.c_str(), nullptr);
}

FitsHeader read_header(fitsfile* f, const fs::path& path) {
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(f, &nkeys, nullptr, &status);
    check(status, "cannot read header of", path);

    FitsHeader header;
    char key[FLEN_KEYWORD];
    char value[FLEN_VALUE];
    char comment[FLEN_COMMENT];
    for (int i = 1; i <= nkeys; ++i) {
        if (fits_read_keyn(f, i, key, value, comment, &status)) {
            status = 0;
            continue;
        }
        // COMMENT, HISTORY and blank cards carry no value.
        if (value[0] == '\0') continue;

        char type = 'C';
        if (fits_get_keytype(value, &type, &status)) {
            status = 0;
            continue;
        }
        if (type == 'I' || type == 'F') {
            header.numbers[key] = parse_number(value);
        } else if (type == 'C') {
            header.text[key] = unquote(value);
        } else {
            header.text[key] = core::trim(value);
        }
    }
    return header;
}

// Opens a 2-D primary image; anything else is a FitsError.
FitsHandle open_image(const fs::path& path, long naxes[2]) {
    FitsHandle f = open_readonly(path);
    int status = 0;
    int bitpix = 0;
    int naxis = 0;
    fits_get_img_param(f.get(), 2, &bitpix, &naxis, naxes, &status);
    check(status, "cannot read image parameters of", path);
    if (naxis != 2) {
        throw FitsError(path.string() + " is not a 2-D image (NAXIS = " +
                        std::to_string(naxis) + ")");
    }
    return f;
}

// Keywords cfitsio derives from the image itself.
bool is_structural_key(const std::string& key) {
    return key == "SIMPLE" || key == "BITPIX" || key == "EXTEND" || key == "BZERO" ||
           key == "BSCALE" || key.rfind("NAXIS", 0) == 0;
}

FitsHandle create_image(const fs::path& path, int bitpix, Eigen::Index rows, Eigen::Index cols,
                        const FitsHeader& header) {
    fitsfile* raw = nullptr;
    int status = 0;
    const std::string target = "!" + path.string();
    fits_create_file(&raw, target.c_str(), &status);
    check(status, "cannot create", path);
    FitsHandle f(raw);

    long naxes[2] = {static_cast<long>(cols), static_cast<long>(rows)};
    fits_create_img(f.get(), bitpix, 2, naxes, &status);
    check(status, "cannot create image in", path);

    for (const auto& [key, value] : header.text) {
        if (is_structural_key(key)) continue;
        fits_update_key(f.get(), TSTRING, key.c_str(), const_cast<char*>(value.c_str()),
                        nullptr, &status);
    }
    for (const auto& [key, value] : header.numbers) {
        if (is_structural_key(key) || !std::isfinite(value)) continue;
        fits_update_key_dbl(f.get(), key.c_str(), value, -15, nullptr, &status);
    }
    check(status, "cannot write header of", path);
    return f;
}

// Closing flushes the buffers; its status counts.
void close_written(FitsHandle f, const fs::path& path) {
    int status = 0;
    fits_close_file(f.release(), &status);
    check(status, "cannot close", path);
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = text.find(key);
    if (it == text.end()) return std::nullopt;
    return it->second;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numbers.find(key);
    if (it == numbers.end()) return std::nullopt;
    return it->second;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    numbers.erase(key);
    text[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    text.erase(key);
    numbers[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

FitsHeader read_fits_header(const fs::path& path) {
    FitsHandle f = open_readonly(path);
    return read_header(f.get(), path);
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    long naxes[2] = {0, 0};
    FitsHandle f = open_image(path, naxes);

    // NAXIS1 varies fastest, which is row-major order.
    Matrix2Df data(naxes[1], naxes[0]);
    int status = 0;
    long first[2] = {1, 1};
    fits_read_pix(f.get(), TFLOAT, first, static_cast<LONGLONG>(data.size()), nullptr,
                  data.data(), nullptr, &status);
    check(status, "cannot read pixels of", path);

    FitsHeader header = read_header(f.get(), path);
    return {std::move(data), std::move(header)};
}

std::pair<QualityMatrix, FitsHeader> read_fits_uint32(const fs::path& path) {
    long naxes[2] = {0, 0};
    FitsHandle f = open_image(path, naxes);

    // Doubles hold every uint32 exactly, after BZERO/BSCALE.
    std::vector<double> pixels(static_cast<size_t>(naxes[0]) * static_cast<size_t>(naxes[1]));
    int status = 0;
    long first[2] = {1, 1};
    fits_read_pix(f.get(), TDOUBLE, first, static_cast<LONGLONG>(pixels.size()), nullptr,
                  pixels.data(), nullptr, &status);
    check(status, "cannot read pixels of", path);

    QualityMatrix codes(naxes[1], naxes[0]);
    for (size_t i = 0; i < pixels.size(); ++i) {
        const double v = pixels[i];
        if (!std::isfinite(v) || v < 0.0 || v > 4294967295.0 || std::floor(v) != v) {
            throw FitsError("pixel " + std::to_string(i) + " of " + path.string() +
                            " is not an unsigned 32-bit code");
        }
        codes.data()[i] = static_cast<uint32_t>(v);
    }

    FitsHeader header = read_header(f.get(), path);
    return {std::move(codes), std::move(header)};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    FitsHandle f = create_image(path, FLOAT_IMG, data.rows(), data.cols(), header);
    int status = 0;
    long first[2] = {1, 1};
    fits_write_pix(f.get(), TFLOAT, first, static_cast<LONGLONG>(data.size()),
                   const_cast<float*>(data.data()), &status);
    check(status, "cannot write pixels of", path);
    close_written(std::move(f), path);
}

void write_fits_uint32(const fs::path& path, const QualityMatrix& data, const FitsHeader& header) {
    FitsHandle f = create_image(path, ULONG_IMG, data.rows(), data.cols(), header);
    int status = 0;
    long first[2] = {1, 1};
    fits_write_pix(f.get(), TUINT, first, static_cast<LONGLONG>(data.size()),
                   const_cast<uint32_t*>(data.data()), &status);
    check(status, "cannot write pixels of", path);
    close_written(std::move(f), path);
}

GridInfo grid_from_header(const FitsHeader& header, int rows, int cols) {
    GridInfo grid;
    grid.rows = rows;
    grid.cols = cols;
    for (size_t i = 0; i < 6; ++i) {
        if (auto v = header.get_double(kGridKeys[i])) {
            grid.transform[i] = *v;
        }
    }
    if (auto crs = header.get_string("CRS")) {
        grid.crs = *crs;
    }
    return grid;
}

void write_grid_to_header(const GridInfo& grid, FitsHeader& header) {
    for (size_t i = 0; i < 6; ++i) {
        header.set(kGridKeys[i], grid.transform[i]);
    }
    if (!grid.crs.empty()) {
        header.set("CRS", grid.crs);
    }
}

} // namespace annual_mosaic::io
