// === File: light_vector.hpp ===
#pragma once

#include "shadow_types.hpp"

struct SuggestedShadowParams {
    double contact_opacity;
    double falloff_rate;
};

namespace light {

    double degrees_to_radians(double degrees);

    // 0 deg points along +x, angles grow toward +y (screen space, y down).
    LightVector calculate(double angle_deg, double elevation_deg);

    // 1 / max(0.1, sin(elevation)). Overhead light gives 1, grazing light caps at 10.
    double shadow_length_multiplier(double elevation_deg);

    // Starting values for the UI: low sun is darker at contact and fades slower.
    SuggestedShadowParams suggested_shadow_params(double elevation_deg);

} // namespace light
