// === File: shadow_projector.cpp ===
#include "shadow_projector.hpp"
#include <cmath>
#include <cstdlib>

namespace projector {

// Longest ray in pixels. Far beyond any canvas, and small enough that the
// rounded endpoint and the Bresenham error terms stay inside int.
static constexpr double kMaxRayLength = 16777216.0;

ShadowMask project(const OpacityMask& mask,
                   int w,
                   int h,
                   const LightVector& light,
                   double max_distance,
                   const PixelBuffer* depth_map)
{
    ShadowMask shadow(mask.size(), 0);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const int idx = y * w + x;
            if (!mask[idx]) continue;

            double warp = 1.0;
            if (depth_map) {
                double depth = depth_map->pixels[static_cast<std::size_t>(idx) * 4] / 255.0;
                warp = 1.0 + depth * 0.5;
            }

            // Shorten along the ray itself so the slope is unchanged;
            // draw_line stops at the canvas edge either way
            double length = max_distance * warp;
            const double reach = std::hypot(light.dx, light.dy) * length;
            if (reach > kMaxRayLength) length *= kMaxRayLength / reach;

            // Shadow falls on the side facing away from the light
            const double proj_x = x - light.dx * length;
            const double proj_y = y - light.dy * length;

            draw_line(shadow, w, h, x, y, round_half_up(proj_x), round_half_up(proj_y));
        }
    }
    return shadow;
}

void draw_line(ShadowMask& buffer, int w, int h, int x0, int y0, int x1, int y1) {
    const int dx = std::abs(x1 - x0);
    const int dy = std::abs(y1 - y0);
    const int sx = x0 < x1 ? 1 : -1;
    const int sy = y0 < y1 ? 1 : -1;
    int err = dx - dy;

    int x = x0;
    int y = y0;
    bool entered = false;

    while (true) {
        if (x >= 0 && x < w && y >= 0 && y < h) {
            buffer[y * w + x] = 1;
            entered = true;
        } else if (entered) {
            // Both coordinates step monotonically, so the ray cannot come back
            break;
        }

        if (x == x1 && y == y1) break;

        const int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
}

ShadowMask remove_occlusions(const ShadowMask& shadow_mask, const OpacityMask& silhouette_mask) {
    ShadowMask result(shadow_mask.size(), 0);
    for (std::size_t i = 0; i < shadow_mask.size(); ++i) {
        if (shadow_mask[i] && !silhouette_mask[i]) result[i] = 1;
    }
    return result;
}

} // namespace projector
