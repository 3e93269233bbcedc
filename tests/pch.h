#pragma once

#include <gtest/gtest.h>
#include <SDL.h>
#include <vector>
#include "pixel_buffer.hpp"
#include "shadow_types.hpp"

// -----------------------------------------------------------------------------
// Buffer builders shared by the test files
// -----------------------------------------------------------------------------
inline PixelBuffer MakeSolid(int w, int h, SDL_Color color) {
    PixelBuffer image(w, h);
    image.fill(color);
    return image;
}

// Transparent canvas with the listed pixels set to an opaque color.
inline PixelBuffer MakeCutout(int w, int h, const std::vector<SDL_Point>& opaque,
                              SDL_Color color = { 200, 60, 40, 255 }) {
    PixelBuffer image(w, h);
    for (const SDL_Point& p : opaque) image.set_pixel(p.x, p.y, color);
    return image;
}

inline OpacityMask MakeMask(int w, int h, const std::vector<SDL_Point>& opaque) {
    OpacityMask mask(static_cast<std::size_t>(w) * h, 0);
    for (const SDL_Point& p : opaque) mask[p.y * w + p.x] = 1;
    return mask;
}

inline std::size_t CountSet(const std::vector<Uint8>& mask) {
    std::size_t n = 0;
    for (Uint8 v : mask) n += v ? 1 : 0;
    return n;
}

inline void ExpectColor(SDL_Color actual, int r, int g, int b, int a) {
    EXPECT_EQ(actual.r, r);
    EXPECT_EQ(actual.g, g);
    EXPECT_EQ(actual.b, b);
    EXPECT_EQ(actual.a, a);
}

inline bool SamePixels(const PixelBuffer& a, const PixelBuffer& b) {
    return a.width == b.width && a.height == b.height && a.pixels == b.pixels;
}
