// distance_transform.hpp
#pragma once

#include <vector>
#include <cstdint>
#include "shadow_types.hpp"

struct DistanceStats {
    double min     = 0.0;
    double max     = 0.0;
    double average = 0.0;
};

namespace dt {
    /**
     * Exact squared Euclidean Distance Transform of a seed mask.
     * @param seeds A flat vector of size w*h: non-zero marks a seed pixel.
     * @param w Width of the mask (number of columns).
     * @param h Height of the mask (number of rows).
     * @return A vector<double> of size w*h holding the squared distance from each
     *         pixel to the nearest seed. Values are exact integers; pixels are
     *         left at a huge value when there is no seed at all.
     */
    std::vector<double>
    squared_distance_transform(const std::vector<uint8_t>& seeds,
                               int w,
                               int h);

    /**
     * Distance from every silhouette pixel to the nearest contact point.
     * Pixels outside the silhouette, and every pixel when the contact line is
     * empty, get 0. Matches a brute-force nearest-point search exactly.
     */
    DistanceMap compute(const OpacityMask& mask,
                        const ContactLine& contact_line,
                        int w,
                        int h);

    // Grayscale view: near = dark, max_distance and beyond = white.
    PixelBuffer visualize(const DistanceMap& map, double max_distance);

    // Min / max / mean over silhouette pixels only.
    DistanceStats statistics(const DistanceMap& map, const OpacityMask& mask);
} // namespace dt
