#pragma once

#include "annual_mosaic/core/types.hpp"
#include <string>
#include <vector>

namespace annual_mosaic::compositing {

struct CompositeOptions {
    int parallel_workers = 1;
};

/**
 * Per-pixel, per-band median over every scene whose mask marks the pixel
 * valid. Pixels outside `region` and pixels without a valid observation are
 * kNoData. Scenes that are not on `region.grid` or lack a band of `band_list`
 * are listed in Composite::rejected and do not contribute.
 *
 * The result does not depend on the order of `scenes` or on the number of
 * workers.
 */
Composite composite(const std::vector<MaskedScene>& scenes, const ClipRegion& region,
                    const std::vector<std::string>& band_list,
                    const CompositeOptions& options = {});

} // namespace annual_mosaic::compositing
