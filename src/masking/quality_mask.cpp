#include "annual_mosaic/masking/quality_mask.hpp"
#include "annual_mosaic/core/errors.hpp"
#include "annual_mosaic/geometry/region.hpp"

#include <string>

namespace annual_mosaic::masking {

static void check_bit(int bit, const char* name) {
    if (bit < 0 || bit > 31) {
        throw ValidationError(std::string(name) + " must be in [0,31], got " + std::to_string(bit));
    }
}

MaskMatrix quality_mask(const QualityMatrix& codes, const QualityBits& bits) {
    check_bit(bits.cloud_bit, "cloud_bit");
    check_bit(bits.shadow_bit, "shadow_bit");

    const uint32_t flags = (uint32_t{1} << bits.cloud_bit) | (uint32_t{1} << bits.shadow_bit);

    MaskMatrix mask(codes.rows(), codes.cols());
    for (Eigen::Index i = 0; i < codes.size(); ++i) {
        mask.data()[i] = (codes.data()[i] & flags) == 0;
    }
    return mask;
}

Matrix2Df scale_reflectance(const Matrix2Di& raw, const ReflectanceScaling& scaling) {
    Matrix2Df out(raw.rows(), raw.cols());
    for (Eigen::Index i = 0; i < raw.size(); ++i) {
        const double v = static_cast<double>(raw.data()[i]) * scaling.scale + scaling.offset;
        out.data()[i] = static_cast<float>(v);
    }
    return out;
}

MaskedScene mask_scene(const Scene& scene, const QualityBits& bits,
                       const ReflectanceScaling& scaling) {
    if (!scene.quality) {
        throw MissingAuxiliaryBand("scene " + scene.scene_id + " has no quality band");
    }

    const GridInfo& grid = scene.reflectance.grid;
    const QualityRaster& qa = *scene.quality;
    if (!geometry::same_grid(qa.grid, grid)) {
        throw GridMismatch("quality band of scene " + scene.scene_id +
                           " is not on the reflectance grid");
    }
    if (qa.codes.rows() != grid.rows || qa.codes.cols() != grid.cols) {
        throw GridMismatch("quality band of scene " + scene.scene_id + " is " +
                           std::to_string(qa.codes.rows()) + "x" + std::to_string(qa.codes.cols()) +
                           ", grid is " + std::to_string(grid.rows) + "x" + std::to_string(grid.cols));
    }
    if (scene.reflectance.bands.size() != scene.reflectance.band_names.size()) {
        throw ValidationError("scene " + scene.scene_id + " has mismatched band names and data");
    }

    MaskedScene out;
    out.scene_id = scene.scene_id;
    out.acquired = scene.acquired;
    out.grid = grid;
    out.band_names = scene.reflectance.band_names;
    out.valid = quality_mask(qa.codes, bits);
    out.bands.reserve(scene.reflectance.bands.size());

    for (size_t b = 0; b < scene.reflectance.bands.size(); ++b) {
        const Matrix2Di& raw = scene.reflectance.bands[b];
        if (raw.rows() != grid.rows || raw.cols() != grid.cols) {
            throw GridMismatch("band " + scene.reflectance.band_names[b] + " of scene " +
                               scene.scene_id + " does not match the scene grid");
        }
        out.bands.push_back(scale_reflectance(raw, scaling));
    }

    return out;
}

} // namespace annual_mosaic::masking
