// === File: contact_line.cpp ===
#include "contact_line.hpp"
#include <algorithm>
#include <limits>

namespace contact {

ContactLine detect(const OpacityMask& mask, int w, int h) {
    ContactLine points;
    points.reserve(std::max(0, w));

    for (int x = 0; x < w; ++x) {
        for (int y = h - 1; y >= 0; --y) {
            if (mask[y * w + x]) {
                points.push_back({ x, y });
                break;
            }
        }
    }
    return points;
}

ContactBounds bounds(const ContactLine& line) {
    if (line.empty()) return {};

    ContactBounds b;
    b.min_x = std::numeric_limits<int>::max();
    b.min_y = std::numeric_limits<int>::max();
    b.max_x = std::numeric_limits<int>::min();
    b.max_y = std::numeric_limits<int>::min();

    for (const SDL_Point& p : line) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

PixelBuffer visualize(const OpacityMask& mask, const ContactLine& line, int w, int h) {
    PixelBuffer image(w, h);

    for (std::size_t i = 0; i < mask.size() && i < image.pixel_count(); ++i) {
        Uint8 v = mask[i] ? 128 : 0;
        image.pixels[i * 4]     = v;
        image.pixels[i * 4 + 1] = v;
        image.pixels[i * 4 + 2] = v;
        image.pixels[i * 4 + 3] = 255;
    }

    for (const SDL_Point& p : line) {
        if (!image.in_bounds(p.x, p.y)) continue;
        image.set_pixel(p.x, p.y, { 255, 0, 0, 255 });
    }
    return image;
}

} // namespace contact
