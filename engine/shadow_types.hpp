// === File: shadow_types.hpp ===
#pragma once

#include <SDL.h>
#include <optional>
#include <vector>
#include "pixel_buffer.hpp"

// 1 = opaque / shadow, 0 = empty. Size is width * height of the foreground.
using OpacityMask = std::vector<Uint8>;
using ShadowMask  = std::vector<Uint8>;

struct LightVector {
    double dx = 0.0;
    double dy = 0.0;
    double dz = 0.0;   // informational, projection only uses dx/dy
};

// Lowest opaque pixel per column, in increasing x.
using ContactLine = std::vector<SDL_Point>;

struct DistanceMap {
    int width  = 0;
    int height = 0;
    std::vector<float> data;
};

struct ImageSet {
    PixelBuffer                foreground;
    PixelBuffer                background;
    std::optional<PixelBuffer> depth_map;   // red channel, 0 = near, 255 = far
};

struct ShadowResult {
    PixelBuffer shadow_only;
    PixelBuffer mask_debug;
    PixelBuffer composite;
};
