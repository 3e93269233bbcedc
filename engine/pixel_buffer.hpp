// === File: pixel_buffer.hpp ===
#pragma once

#include <SDL.h>
#include <cmath>
#include <cstddef>
#include <vector>

// Straight-alpha RGBA8 image, row-major, 4 bytes per pixel.
struct PixelBuffer {
    int width  = 0;
    int height = 0;
    std::vector<Uint8> pixels;

    PixelBuffer() = default;
    PixelBuffer(int w, int h);

    bool empty() const { return width <= 0 || height <= 0; }
    std::size_t pixel_count() const;
    std::size_t index(int x, int y) const {
        return (static_cast<std::size_t>(y) * width + x) * 4;
    }

    bool in_bounds(int x, int y) const;
    bool same_size(const PixelBuffer& other) const;

    SDL_Color get_pixel(int x, int y) const;
    void set_pixel(int x, int y, SDL_Color color);
    void fill(SDL_Color color);
};

// Half-up rounding, matching 8-bit canvas conversion (-0.5 rounds to 0).
inline int round_half_up(double v) {
    return static_cast<int>(std::floor(v + 0.5));
}

inline Uint8 to_channel(double v) {
    int r = round_half_up(v);
    if (r < 0)   r = 0;
    if (r > 255) r = 255;
    return static_cast<Uint8>(r);
}
