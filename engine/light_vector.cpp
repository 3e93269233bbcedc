// === File: light_vector.cpp ===
#include "light_vector.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace light {

double degrees_to_radians(double degrees) {
    return degrees * (M_PI / 180.0);
}

LightVector calculate(double angle_deg, double elevation_deg) {
    const double a = degrees_to_radians(angle_deg);
    const double e = degrees_to_radians(elevation_deg);

    LightVector v;
    v.dx = std::cos(a) * std::cos(e);
    v.dy = std::sin(a) * std::cos(e);
    v.dz = std::sin(e);
    return v;
}

double shadow_length_multiplier(double elevation_deg) {
    const double s = std::sin(degrees_to_radians(elevation_deg));
    return 1.0 / std::max(0.1, s);
}

SuggestedShadowParams suggested_shadow_params(double elevation_deg) {
    const double norm = elevation_deg / 90.0;
    return { 0.9 - norm * 0.3, 3.0 + norm * 2.0 };
}

} // namespace light
