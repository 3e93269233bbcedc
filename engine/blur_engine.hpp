// === File: blur_engine.hpp ===
#pragma once

#include <SDL.h>
#include <functional>
#include "shadow_types.hpp"

namespace blur {

    // Called after each finished row with (rows_done, rows_total).
    using RowCallback = std::function<void(int, int)>;

    // lerp(min_blur, max_blur, clamp(distance / max_distance, 0, 1))
    double radius_for_distance(double distance,
                               double min_blur,
                               double max_blur,
                               double max_distance);

    /**
     * Equal-weight average of every in-bounds sample with dx*dx + dy*dy <= radius^2.
     * Radii under 0.5 return the source pixel unchanged.
     */
    SDL_Color blur_at_pixel(const PixelBuffer& source, int cx, int cy, double radius);

    /**
     * Variable-radius blur: sharp at the contact line, soft far from it.
     * Samples are always read from the unblurred input.
     */
    PixelBuffer apply_distance_weighted_blur(const PixelBuffer& layer,
                                             const DistanceMap& distance_map,
                                             double min_blur,
                                             double max_blur,
                                             double max_distance,
                                             const RowCallback& on_row = nullptr);

    PixelBuffer uniform_blur(const PixelBuffer& layer, double radius);

} // namespace blur
