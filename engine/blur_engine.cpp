// === File: blur_engine.cpp ===
#include "blur_engine.hpp"
#include <algorithm>
#include <cmath>

namespace blur {

double radius_for_distance(double distance, double min_blur, double max_blur, double max_distance) {
    double t = 0.0;
    if (max_distance > 0.0) {
        t = std::clamp(distance / max_distance, 0.0, 1.0);
    } else if (distance > 0.0) {
        t = 1.0;
    }
    return min_blur + (max_blur - min_blur) * t;
}

SDL_Color blur_at_pixel(const PixelBuffer& source, int cx, int cy, double radius) {
    if (radius < 0.5) return source.get_pixel(cx, cy);

    const int w = source.width;
    const int h = source.height;
    // Samples further out than the image size are never in bounds
    const double limit = static_cast<double>(std::max(w, h));
    const int reach = static_cast<int>(std::min(std::ceil(radius), limit));
    const double radius_sq = radius * radius;

    long r = 0, g = 0, b = 0, a = 0;
    long count = 0;

    for (int dy = -reach; dy <= reach; ++dy) {
        const int y = cy + dy;
        if (y < 0 || y >= h) continue;
        for (int dx = -reach; dx <= reach; ++dx) {
            const int x = cx + dx;
            if (x < 0 || x >= w) continue;
            if (dx * dx + dy * dy > radius_sq) continue;

            const Uint8* p = &source.pixels[source.index(x, y)];
            r += p[0]; g += p[1]; b += p[2]; a += p[3];
            ++count;
        }
    }

    if (count == 0) return source.get_pixel(cx, cy);

    const double n = static_cast<double>(count);
    return SDL_Color{ to_channel(r / n), to_channel(g / n), to_channel(b / n), to_channel(a / n) };
}

PixelBuffer apply_distance_weighted_blur(const PixelBuffer& layer,
                                         const DistanceMap& distance_map,
                                         double min_blur,
                                         double max_blur,
                                         double max_distance,
                                         const RowCallback& on_row)
{
    const int w = layer.width;
    const int h = layer.height;
    PixelBuffer result(w, h);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const double distance = distance_map.data[static_cast<std::size_t>(y) * w + x];
            const double radius = radius_for_distance(distance, min_blur, max_blur, max_distance);
            result.set_pixel(x, y, blur_at_pixel(layer, x, y, radius));
        }
        if (on_row) on_row(y + 1, h);
    }
    return result;
}

PixelBuffer uniform_blur(const PixelBuffer& layer, double radius) {
    PixelBuffer result(layer.width, layer.height);
    for (int y = 0; y < layer.height; ++y) {
        for (int x = 0; x < layer.width; ++x) {
            result.set_pixel(x, y, blur_at_pixel(layer, x, y, radius));
        }
    }
    return result;
}

} // namespace blur
