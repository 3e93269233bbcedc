// === File: shadow_projector.hpp ===
#pragma once

#include "shadow_types.hpp"

namespace projector {

    /**
     * Cast every opaque pixel away from the light and rasterize the ray into a
     * binary shadow mask. The ray from (x, y) ends at
     * (x - dx * max_distance * warp, y - dy * max_distance * warp), where
     * warp = 1 + 0.5 * depth.red / 255 when a depth map is given, else 1.
     * Rays are unioned; the mask carries no intensity.
     */
    ShadowMask project(const OpacityMask& mask,
                       int w,
                       int h,
                       const LightVector& light,
                       double max_distance,
                       const PixelBuffer* depth_map = nullptr);

    // Drops shadow pixels covered by the silhouette. Returns a new mask.
    ShadowMask remove_occlusions(const ShadowMask& shadow_mask,
                                 const OpacityMask& silhouette_mask);

    // Integer Bresenham from (x0, y0) to (x1, y1), marking in-bounds cells.
    void draw_line(ShadowMask& buffer, int w, int h,
                   int x0, int y0, int x1, int y1);

} // namespace projector
