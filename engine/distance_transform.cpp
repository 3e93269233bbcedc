// distance_transform.cpp
#include "distance_transform.hpp"
#include <limits>
#include <cmath>
#include <algorithm>

namespace dt {

// Stand-in for "no seed". Finite so the envelope intersections stay ordered.
static constexpr double kFar = 1e20;

// 1D squared distance transform (Felzenszwalb & Huttenlocher)
static void edt_1d(const std::vector<double>& f, int n, std::vector<double>& d) {
    std::vector<int> v(n);
    std::vector<double> z(n + 1);
    int k = 0;
    v[0] = 0;
    z[0] = -std::numeric_limits<double>::infinity();
    z[1] = std::numeric_limits<double>::infinity();

    auto intersect = [&](int q, int p) {
        return ((f[q] + double(q) * q) - (f[p] + double(p) * p)) / (2.0 * (q - p));
    };

    for (int q = 1; q < n; q++) {
        // z[0] is -inf and every f is finite, so k never drops below 0
        double s = intersect(q, v[k]);
        while (s <= z[k]) {
            k--;
            s = intersect(q, v[k]);
        }
        k++;
        v[k] = q;
        z[k] = s;
        z[k+1] = std::numeric_limits<double>::infinity();
    }

    k = 0;
    for (int q = 0; q < n; q++) {
        while (z[k+1] < q) k++;
        double diff = q - v[k];
        d[q] = (diff * diff) + f[v[k]];
    }
}

std::vector<double> squared_distance_transform(const std::vector<uint8_t>& seeds, int w, int h) {
    int sz = w * h;
    std::vector<double> dist(sz);
    if (w <= 0 || h <= 0) return dist;

    // Initialize: f = 0 at seeds, kFar elsewhere
    std::vector<double> f(sz);
    for (int i = 0; i < sz; ++i) {
        f[i] = (seeds[i] ? 0.0 : kFar);
    }

    std::vector<double> tmp(sz);

    // Transform columns
    std::vector<double> col(h), dcol(h);
    for (int x = 0; x < w; ++x) {
        for (int y = 0; y < h; ++y) col[y] = f[y*w + x];
        edt_1d(col, h, dcol);
        for (int y = 0; y < h; ++y) tmp[y*w + x] = dcol[y];
    }

    // Transform rows
    std::vector<double> row(w), drow(w);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) row[x] = tmp[y*w + x];
        edt_1d(row, w, drow);
        for (int x = 0; x < w; ++x) dist[y*w + x] = drow[x];
    }

    return dist;
}

DistanceMap compute(const OpacityMask& mask, const ContactLine& contact_line, int w, int h) {
    DistanceMap map;
    map.width  = w;
    map.height = h;
    map.data.assign(static_cast<std::size_t>(std::max(0, w)) * std::max(0, h), 0.0f);

    if (contact_line.empty() || map.data.empty()) return map;

    std::vector<uint8_t> seeds(map.data.size(), 0);
    for (const SDL_Point& p : contact_line) {
        if (p.x < 0 || p.x >= w || p.y < 0 || p.y >= h) continue;
        seeds[p.y * w + p.x] = 1;
    }

    const std::vector<double> sq = squared_distance_transform(seeds, w, h);
    for (std::size_t i = 0; i < map.data.size(); ++i) {
        if (!mask[i]) continue;
        map.data[i] = static_cast<float>(std::sqrt(sq[i]));
    }
    return map;
}

PixelBuffer visualize(const DistanceMap& map, double max_distance) {
    PixelBuffer image(map.width, map.height);

    for (std::size_t i = 0; i < map.data.size(); ++i) {
        double norm = max_distance > 0.0 ? std::min(map.data[i] / max_distance, 1.0) : 1.0;
        Uint8 v = to_channel(norm * 255.0);
        image.pixels[i * 4]     = v;
        image.pixels[i * 4 + 1] = v;
        image.pixels[i * 4 + 2] = v;
        image.pixels[i * 4 + 3] = 255;
    }
    return image;
}

DistanceStats statistics(const DistanceMap& map, const OpacityMask& mask) {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    double sum = 0.0;
    std::size_t count = 0;

    for (std::size_t i = 0; i < map.data.size(); ++i) {
        if (!mask[i]) continue;
        double d = map.data[i];
        lo = std::min(lo, d);
        hi = std::max(hi, d);
        sum += d;
        ++count;
    }

    DistanceStats stats;
    if (count == 0) return stats;
    stats.min = lo;
    stats.max = hi;
    stats.average = sum / count;
    return stats;
}

} // namespace dt
