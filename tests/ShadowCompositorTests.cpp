#include "pch.h"
#include "shadow_compositor.hpp"

// -----------------------------------------------------------------------------
// Opacity falloff
// -----------------------------------------------------------------------------
TEST(ShadowOpacity, ContactValueAtZeroDistance) {
    ShadowConfig config;
    EXPECT_DOUBLE_EQ(compositor::shadow_opacity(0.0, config), 0.75);
}

TEST(ShadowOpacity, DecaysMonotonically) {
    ShadowConfig config;
    double previous = compositor::shadow_opacity(0.0, config);
    for (double d = 5.0; d <= 300.0; d += 5.0) {
        double op = compositor::shadow_opacity(d, config);
        EXPECT_LT(op, previous);
        previous = op;
    }
}

TEST(ShadowOpacity, NoFalloffKeepsContactOpacity) {
    ShadowConfig config;
    config.falloff_rate = 0.0;
    EXPECT_DOUBLE_EQ(compositor::shadow_opacity(1000.0, config), config.contact_opacity);
}

// -----------------------------------------------------------------------------
// Shadow layer
// -----------------------------------------------------------------------------
TEST(ShadowLayer, AlphaFollowsDistance) {
    ShadowConfig config;
    DistanceMap map;
    map.width = 3; map.height = 1;
    map.data = { 0.0f, 1500.0f, 0.0f };
    ShadowMask mask = { 1, 1, 0 };

    PixelBuffer layer = compositor::create_shadow_layer(mask, map, config);
    ASSERT_EQ(layer.width, 3);
    ASSERT_EQ(layer.height, 1);
    ExpectColor(layer.get_pixel(0, 0), 0, 0, 0, 191);   // round(0.75 * 255)
    ExpectColor(layer.get_pixel(1, 0), 0, 0, 0, 0);     // far away fades out
    ExpectColor(layer.get_pixel(2, 0), 0, 0, 0, 0);     // not in shadow
}

// -----------------------------------------------------------------------------
// Alpha blending
// -----------------------------------------------------------------------------
TEST(AlphaBlend, TransparentSourceKeepsBackdrop) {
    SDL_Color out = compositor::alpha_blend({ 12, 34, 56, 78 }, { 255, 255, 255, 0 });
    ExpectColor(out, 12, 34, 56, 78);
}

TEST(AlphaBlend, OpaqueSourceReplacesBackdrop) {
    SDL_Color out = compositor::alpha_blend({ 12, 34, 56, 255 }, { 90, 80, 70, 255 });
    ExpectColor(out, 90, 80, 70, 255);
}

TEST(AlphaBlend, HalfBlackOverWhite) {
    SDL_Color out = compositor::alpha_blend({ 255, 255, 255, 255 }, { 0, 0, 0, 128 });
    ExpectColor(out, 127, 127, 127, 255);
}

TEST(AlphaBlend, OverTransparentBackdropKeepsSourceColor) {
    SDL_Color out = compositor::alpha_blend({ 0, 0, 0, 0 }, { 100, 150, 200, 128 });
    ExpectColor(out, 100, 150, 200, 128);
}

// -----------------------------------------------------------------------------
// Layer compositing
// -----------------------------------------------------------------------------
TEST(Composite, TransparentShadowIsIdentity) {
    PixelBuffer bg = MakeSolid(3, 3, { 30, 60, 90, 255 });
    PixelBuffer fg = MakeCutout(3, 3, { {1, 1} }, { 200, 10, 10, 255 });
    PixelBuffer out = compositor::composite(bg, PixelBuffer(3, 3), fg);

    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            SDL_Color expected = compositor::alpha_blend(bg.get_pixel(x, y), fg.get_pixel(x, y));
            SDL_Color actual = out.get_pixel(x, y);
            ExpectColor(actual, expected.r, expected.g, expected.b, expected.a);
        }
    }
    ExpectColor(out.get_pixel(1, 1), 200, 10, 10, 255);
    ExpectColor(out.get_pixel(0, 0), 30, 60, 90, 255);
}

TEST(Composite, ShadowDarkensBackground) {
    PixelBuffer bg = MakeSolid(2, 1, { 255, 255, 255, 255 });
    PixelBuffer shadow = MakeCutout(2, 1, { {1, 0} }, { 0, 0, 0, 255 });
    PixelBuffer out = compositor::composite(bg, shadow, PixelBuffer(2, 1));
    ExpectColor(out.get_pixel(0, 0), 255, 255, 255, 255);
    ExpectColor(out.get_pixel(1, 0), 0, 0, 0, 255);
}

TEST(Composite, AttachedSkipsShadowUnderSilhouette) {
    PixelBuffer bg = MakeSolid(2, 1, { 255, 255, 255, 255 });
    PixelBuffer shadow = MakeSolid(2, 1, { 0, 0, 0, 255 });
    PixelBuffer fg(2, 1);
    OpacityMask silhouette = { 1, 0 };

    PixelBuffer out = compositor::composite_attached_shadow(bg, shadow, fg, silhouette);
    ExpectColor(out.get_pixel(0, 0), 255, 255, 255, 255);
    ExpectColor(out.get_pixel(1, 0), 0, 0, 0, 255);

    PixelBuffer standard = compositor::composite(bg, shadow, fg);
    ExpectColor(standard.get_pixel(0, 0), 0, 0, 0, 255);
}
