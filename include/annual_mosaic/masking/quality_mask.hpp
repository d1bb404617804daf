#pragma once

#include "annual_mosaic/core/types.hpp"

namespace annual_mosaic::masking {

// Bit positions of the cloud and cloud-shadow flags in the quality code.
struct QualityBits {
    int cloud_bit = 3;
    int shadow_bit = 4;
};

// physical = raw * scale + offset
struct ReflectanceScaling {
    double scale = 0.0000275;
    double offset = -0.2;
};

// true where neither the cloud nor the shadow bit is set.
MaskMatrix quality_mask(const QualityMatrix& codes, const QualityBits& bits);

Matrix2Df scale_reflectance(const Matrix2Di& raw, const ReflectanceScaling& scaling);

// Scales every band of `scene` and attaches the per-pixel mask derived from
// its quality band. Throws MissingAuxiliaryBand when the scene has no quality
// band and GridMismatch when quality and reflectance grids disagree.
MaskedScene mask_scene(const Scene& scene, const QualityBits& bits,
                       const ReflectanceScaling& scaling);

} // namespace annual_mosaic::masking
