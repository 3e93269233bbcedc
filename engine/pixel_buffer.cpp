// === File: pixel_buffer.cpp ===
#include "pixel_buffer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

PixelBuffer::PixelBuffer(int w, int h)
    : width(w), height(h)
{
    if (w < 0 || h < 0) {
        throw std::invalid_argument("PixelBuffer: negative size " +
                                    std::to_string(w) + "x" + std::to_string(h));
    }
    pixels.assign(pixel_count() * 4, 0);
}

std::size_t PixelBuffer::pixel_count() const {
    if (empty()) return 0;
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
}

bool PixelBuffer::in_bounds(int x, int y) const {
    return x >= 0 && x < width && y >= 0 && y < height;
}

bool PixelBuffer::same_size(const PixelBuffer& other) const {
    return width == other.width && height == other.height;
}

SDL_Color PixelBuffer::get_pixel(int x, int y) const {
    const std::size_t i = index(x, y);
    return SDL_Color{ pixels[i], pixels[i + 1], pixels[i + 2], pixels[i + 3] };
}

void PixelBuffer::set_pixel(int x, int y, SDL_Color color) {
    const std::size_t i = index(x, y);
    pixels[i]     = color.r;
    pixels[i + 1] = color.g;
    pixels[i + 2] = color.b;
    pixels[i + 3] = color.a;
}

void PixelBuffer::fill(SDL_Color color) {
    for (std::size_t i = 0; i + 3 < pixels.size(); i += 4) {
        pixels[i]     = color.r;
        pixels[i + 1] = color.g;
        pixels[i + 2] = color.b;
        pixels[i + 3] = color.a;
    }
}
