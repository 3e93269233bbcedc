// === File: contact_line.hpp ===
#pragma once

#include "shadow_types.hpp"

struct ContactBounds {
    int min_x = 0;
    int max_x = 0;
    int min_y = 0;
    int max_y = 0;
};

namespace contact {

    // Lowest opaque pixel of every column that has one.
    ContactLine detect(const OpacityMask& mask, int w, int h);

    // All zeros for an empty line; check line.empty() before dividing by its extent.
    ContactBounds bounds(const ContactLine& line);

    // Mask in dim gray, contact points in red.
    PixelBuffer visualize(const OpacityMask& mask, const ContactLine& line, int w, int h);

} // namespace contact
