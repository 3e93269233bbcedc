// === File: shadow_compositor.hpp ===
#pragma once

#include <SDL.h>
#include "shadow_types.hpp"
#include "shadow_config.hpp"

namespace compositor {

    // contact_opacity * exp(-falloff_rate * distance / max_shadow_distance), clamped to [0, 1]
    double shadow_opacity(double distance, const ShadowConfig& config);

    // Black shadow with falloff alpha on mask pixels, transparent black elsewhere.
    PixelBuffer create_shadow_layer(const ShadowMask& shadow_mask,
                                    const DistanceMap& distance_map,
                                    const ShadowConfig& config);

    // Straight-alpha Porter-Duff "over" of `source` on `backdrop`.
    SDL_Color alpha_blend(SDL_Color backdrop, SDL_Color source);

    // background, then shadow, then foreground.
    PixelBuffer composite(const PixelBuffer& background,
                          const PixelBuffer& shadow,
                          const PixelBuffer& foreground);

    // Same as composite() but the shadow is skipped wherever the silhouette is set.
    PixelBuffer composite_attached_shadow(const PixelBuffer& background,
                                          const PixelBuffer& shadow,
                                          const PixelBuffer& foreground,
                                          const OpacityMask& silhouette_mask);

} // namespace compositor
