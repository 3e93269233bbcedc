#include "pch.h"
#include "silhouette_extractor.hpp"
#include <random>

// -----------------------------------------------------------------------------
// Alpha thresholding
// -----------------------------------------------------------------------------
TEST(Silhouette, ThresholdIsStrict) {
    PixelBuffer fg(3, 1);
    fg.set_pixel(0, 0, { 0, 0, 0, 10 });   // equal to threshold -> background
    fg.set_pixel(1, 0, { 0, 0, 0, 11 });   // just above -> opaque
    fg.set_pixel(2, 0, { 0, 0, 0, 0 });

    OpacityMask mask = silhouette::extract(fg);
    ASSERT_EQ(mask.size(), 3u);
    EXPECT_EQ(mask[0], 0);
    EXPECT_EQ(mask[1], 1);
    EXPECT_EQ(mask[2], 0);
}

TEST(Silhouette, RaisingThresholdNeverAddsPixels) {
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> alpha(0, 255);
    PixelBuffer fg(32, 24);
    for (int y = 0; y < fg.height; ++y)
        for (int x = 0; x < fg.width; ++x)
            fg.set_pixel(x, y, { 10, 20, 30, static_cast<Uint8>(alpha(rng)) });

    std::size_t previous = silhouette::count_opaque(silhouette::extract(fg, 0));
    for (int t = 1; t <= 255; ++t) {
        std::size_t count = silhouette::count_opaque(silhouette::extract(fg, t));
        EXPECT_LE(count, previous) << "threshold " << t;
        previous = count;
    }
    EXPECT_EQ(previous, 0u); // nothing is above 255
}

TEST(Silhouette, FullyOpaqueInputGivesFullFrameMask) {
    PixelBuffer fg = MakeSolid(5, 4, { 1, 2, 3, 255 });
    OpacityMask mask = silhouette::extract(fg);
    EXPECT_EQ(silhouette::count_opaque(mask), 20u);
}

TEST(Silhouette, CountMatchesMask) {
    OpacityMask mask = MakeMask(4, 4, { {0, 0}, {3, 3}, {1, 2} });
    EXPECT_EQ(silhouette::count_opaque(mask), 3u);
    EXPECT_EQ(silhouette::count_opaque(OpacityMask{}), 0u);
}

// -----------------------------------------------------------------------------
// Debug visualization
// -----------------------------------------------------------------------------
TEST(Silhouette, MaskToImageIsBlackAndWhite) {
    OpacityMask mask = MakeMask(2, 2, { {1, 0} });
    PixelBuffer img = silhouette::mask_to_image(mask, 2, 2);

    ExpectColor(img.get_pixel(1, 0), 255, 255, 255, 255);
    ExpectColor(img.get_pixel(0, 0), 0, 0, 0, 255);
    ExpectColor(img.get_pixel(1, 1), 0, 0, 0, 255);
}
