// === File: shadow_compositor.cpp ===
#include "shadow_compositor.hpp"
#include <algorithm>
#include <cmath>

namespace compositor {

double shadow_opacity(double distance, const ShadowConfig& config) {
    double opacity = config.contact_opacity *
                     std::exp(-config.falloff_rate * distance / config.max_shadow_distance);
    return std::clamp(opacity, 0.0, 1.0);
}

PixelBuffer create_shadow_layer(const ShadowMask& shadow_mask,
                                const DistanceMap& distance_map,
                                const ShadowConfig& config)
{
    PixelBuffer layer(distance_map.width, distance_map.height);

    for (std::size_t i = 0; i < shadow_mask.size() && i < layer.pixel_count(); ++i) {
        if (!shadow_mask[i]) continue;
        // RGB stays black
        layer.pixels[i * 4 + 3] = to_channel(shadow_opacity(distance_map.data[i], config) * 255.0);
    }
    return layer;
}

SDL_Color alpha_blend(SDL_Color backdrop, SDL_Color source) {
    if (source.a == 0) return backdrop;

    const double src_a = source.a / 255.0;
    const double dst_a = backdrop.a / 255.0;
    const double out_a = src_a + dst_a * (1.0 - src_a);

    // out_a > 0 whenever source.a > 0
    auto channel = [&](Uint8 s, Uint8 d) {
        return to_channel((s * src_a + d * dst_a * (1.0 - src_a)) / out_a);
    };

    return SDL_Color{
        channel(source.r, backdrop.r),
        channel(source.g, backdrop.g),
        channel(source.b, backdrop.b),
        to_channel(out_a * 255.0)
    };
}

static PixelBuffer blend_layers(const PixelBuffer& background,
                                const PixelBuffer& shadow,
                                const PixelBuffer& foreground,
                                const OpacityMask* silhouette_mask)
{
    const int w = background.width;
    const int h = background.height;
    PixelBuffer result(w, h);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            SDL_Color out = background.get_pixel(x, y);

            const bool under_subject = silhouette_mask && (*silhouette_mask)[y * w + x];
            if (!under_subject) {
                out = alpha_blend(out, shadow.get_pixel(x, y));
            }
            out = alpha_blend(out, foreground.get_pixel(x, y));

            result.set_pixel(x, y, out);
        }
    }
    return result;
}

PixelBuffer composite(const PixelBuffer& background,
                      const PixelBuffer& shadow,
                      const PixelBuffer& foreground)
{
    return blend_layers(background, shadow, foreground, nullptr);
}

PixelBuffer composite_attached_shadow(const PixelBuffer& background,
                                      const PixelBuffer& shadow,
                                      const PixelBuffer& foreground,
                                      const OpacityMask& silhouette_mask)
{
    return blend_layers(background, shadow, foreground, &silhouette_mask);
}

} // namespace compositor
