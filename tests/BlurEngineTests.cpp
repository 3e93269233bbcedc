#include "pch.h"
#include "blur_engine.hpp"

namespace {
    // 5x5 transparent layer with a single opaque black pixel in the middle.
    PixelBuffer Dot() {
        return MakeCutout(5, 5, { {2, 2} }, { 0, 0, 0, 255 });
    }

    DistanceMap Flat(int w, int h, float value) {
        DistanceMap map;
        map.width = w;
        map.height = h;
        map.data.assign(static_cast<std::size_t>(w) * h, value);
        return map;
    }
}

// -----------------------------------------------------------------------------
// Radius mapping
// -----------------------------------------------------------------------------
TEST(BlurRadius, InterpolatesAndClamps) {
    EXPECT_DOUBLE_EQ(blur::radius_for_distance(0.0, 1.0, 10.0, 150.0), 1.0);
    EXPECT_DOUBLE_EQ(blur::radius_for_distance(75.0, 1.0, 10.0, 150.0), 5.5);
    EXPECT_DOUBLE_EQ(blur::radius_for_distance(150.0, 1.0, 10.0, 150.0), 10.0);
    EXPECT_DOUBLE_EQ(blur::radius_for_distance(900.0, 1.0, 10.0, 150.0), 10.0);
}

// -----------------------------------------------------------------------------
// Sampling
// -----------------------------------------------------------------------------
TEST(BlurAtPixel, SmallRadiusIsIdentity) {
    PixelBuffer layer = Dot();
    PixelBuffer out = blur::uniform_blur(layer, 0.49);
    EXPECT_TRUE(SamePixels(out, layer));
}

TEST(BlurAtPixel, RadiusOneAveragesPlusShape) {
    PixelBuffer layer = Dot();
    // centre plus four neighbours, 255 / 5
    EXPECT_EQ(blur::blur_at_pixel(layer, 2, 2, 1.0).a, 51);
    EXPECT_EQ(blur::blur_at_pixel(layer, 2, 1, 1.0).a, 51);
    // diagonal neighbour is outside the circle
    EXPECT_EQ(blur::blur_at_pixel(layer, 1, 1, 1.0).a, 0);
}

TEST(BlurAtPixel, OutOfBoundsSamplesAreExcluded) {
    PixelBuffer layer = MakeCutout(4, 4, { {0, 0} }, { 0, 0, 0, 255 });
    // (0,0), (1,0), (0,1) are the only in-bounds samples
    EXPECT_EQ(blur::blur_at_pixel(layer, 0, 0, 1.0).a, 85);
}

TEST(BlurAtPixel, UniformImageStaysUniform) {
    PixelBuffer layer = MakeSolid(6, 6, { 10, 20, 30, 40 });
    PixelBuffer out = blur::uniform_blur(layer, 3.0);
    EXPECT_TRUE(SamePixels(out, layer));
}

TEST(BlurAtPixel, HugeRadiusCoversWholeImage) {
    PixelBuffer layer(4, 4);
    for (int y = 0; y < 4; ++y)
        for (int x = 0; x < 4; ++x)
            layer.set_pixel(x, y, { Uint8(x * 60), Uint8(y * 60), Uint8(x * y * 10), Uint8(40 + x + y * 4) });

    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            SDL_Color wide = blur::blur_at_pixel(layer, x, y, 100.0);
            SDL_Color huge = blur::blur_at_pixel(layer, x, y, 1e12);
            ExpectColor(huge, wide.r, wide.g, wide.b, wide.a);
        }
    }
    EXPECT_EQ(blur::blur_at_pixel(PixelBuffer(4, 4), 0, 0, 3e9).a, 0);
}

// -----------------------------------------------------------------------------
// Distance-weighted pass
// -----------------------------------------------------------------------------
TEST(DistanceWeightedBlur, ConstantRadiusMatchesUniformBlur) {
    PixelBuffer layer = Dot();
    PixelBuffer weighted = blur::apply_distance_weighted_blur(layer, Flat(5, 5, 0.0f), 2.0, 2.0, 150.0);
    EXPECT_TRUE(SamePixels(weighted, blur::uniform_blur(layer, 2.0)));
}

TEST(DistanceWeightedBlur, OnlyFarPixelsSoften) {
    PixelBuffer layer = Dot();
    DistanceMap map = Flat(5, 5, 0.0f);
    map.data[2 * 5 + 2] = 10.0f;

    PixelBuffer out = blur::apply_distance_weighted_blur(layer, map, 0.0, 1.0, 10.0);
    EXPECT_EQ(out.get_pixel(2, 2).a, 51);   // radius 1
    EXPECT_EQ(out.get_pixel(2, 1).a, 0);    // radius 0, unchanged
}

TEST(DistanceWeightedBlur, ReadsFromUnblurredInput) {
    PixelBuffer layer = MakeCutout(3, 1, { {0, 0} }, { 0, 0, 0, 255 });
    PixelBuffer out = blur::apply_distance_weighted_blur(layer, Flat(3, 1, 0.0f), 1.0, 1.0, 10.0);
    EXPECT_EQ(out.get_pixel(0, 0).a, 128);  // (255 + 0) / 2
    EXPECT_EQ(out.get_pixel(1, 0).a, 85);   // (255 + 0 + 0) / 3
    EXPECT_EQ(out.get_pixel(2, 0).a, 0);
}

TEST(DistanceWeightedBlur, ReportsEveryRow) {
    std::vector<int> rows;
    blur::apply_distance_weighted_blur(Dot(), Flat(5, 5, 0.0f), 1.0, 1.0, 10.0,
        [&](int done, int total) {
            EXPECT_EQ(total, 5);
            rows.push_back(done);
        });
    EXPECT_EQ(rows, (std::vector<int>{ 1, 2, 3, 4, 5 }));
}
