// === File: silhouette_extractor.cpp ===
#include "silhouette_extractor.hpp"
#include "mask_utils.hpp"

namespace silhouette {

OpacityMask extract(const PixelBuffer& foreground, int alpha_threshold) {
    const int w = foreground.width;
    const int h = foreground.height;
    OpacityMask mask(foreground.pixel_count(), 0);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            Uint8 alpha = foreground.pixels[foreground.index(x, y) + 3];
            mask[y * w + x] = (alpha > alpha_threshold) ? 1 : 0;
        }
    }
    return mask;
}

PixelBuffer mask_to_image(const OpacityMask& mask, int w, int h) {
    PixelBuffer image(w, h);
    for (std::size_t i = 0; i < mask.size() && i < image.pixel_count(); ++i) {
        Uint8 v = mask[i] ? 255 : 0;
        image.pixels[i * 4]     = v;
        image.pixels[i * 4 + 1] = v;
        image.pixels[i * 4 + 2] = v;
        image.pixels[i * 4 + 3] = 255;
    }
    return image;
}

std::size_t count_opaque(const OpacityMask& mask) {
    return countMaskPixels(mask);
}

} // namespace silhouette
