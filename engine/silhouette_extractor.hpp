// === File: silhouette_extractor.hpp ===
#pragma once

#include <cstddef>
#include "shadow_types.hpp"

namespace silhouette {

    constexpr int kDefaultAlphaThreshold = 10;

    /**
     * Threshold the foreground alpha channel into a binary mask.
     * A pixel is opaque when alpha > alpha_threshold (strictly).
     */
    OpacityMask extract(const PixelBuffer& foreground,
                        int alpha_threshold = kDefaultAlphaThreshold);

    // White for 1, black for 0, always opaque.
    PixelBuffer mask_to_image(const OpacityMask& mask, int w, int h);

    std::size_t count_opaque(const OpacityMask& mask);

} // namespace silhouette
