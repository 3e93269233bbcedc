// === File: shadow_config.cpp ===
#include "shadow_config.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {
    void require(bool ok, const std::string& field, double value, const std::string& range) {
        if (ok) return;
        std::ostringstream oss;
        oss << "ShadowConfig: " << field << " = " << value << " is outside " << range;
        throw std::invalid_argument(oss.str());
    }
}

void validate_config(const ShadowConfig& c) {
    // NaN fails every comparison below, so it is rejected too
    require(c.light_angle >= 0.0 && c.light_angle < 360.0,
            "light_angle", c.light_angle, "[0, 360)");
    require(c.light_elevation >= 0.0 && c.light_elevation <= 90.0,
            "light_elevation", c.light_elevation, "[0, 90]");
    require(c.max_shadow_distance > 0.0 && std::isfinite(c.max_shadow_distance),
            "max_shadow_distance", c.max_shadow_distance, "(0, inf)");
    require(c.contact_opacity >= 0.0 && c.contact_opacity <= 1.0,
            "contact_opacity", c.contact_opacity, "[0, 1]");
    require(c.falloff_rate >= 0.0 && std::isfinite(c.falloff_rate),
            "falloff_rate", c.falloff_rate, "[0, inf)");
    require(c.min_blur_radius >= 0.0 && std::isfinite(c.min_blur_radius),
            "min_blur_radius", c.min_blur_radius, "[0, inf)");
    require(c.max_blur_radius >= c.min_blur_radius && std::isfinite(c.max_blur_radius),
            "max_blur_radius", c.max_blur_radius, "[min_blur_radius, inf)");
    require(c.alpha_threshold >= 0 && c.alpha_threshold <= 255,
            "alpha_threshold", c.alpha_threshold, "[0, 255]");
}

std::string composite_mode_name(CompositeMode mode) {
    return mode == CompositeMode::Attached ? "attached" : "standard";
}

CompositeMode parse_composite_mode(const std::string& name) {
    if (name == "standard") return CompositeMode::Standard;
    if (name == "attached") return CompositeMode::Attached;
    std::cerr << "[ShadowConfig] WARNING: unknown composite_mode '" << name
              << "', using 'standard'\n";
    return CompositeMode::Standard;
}

nlohmann::json config_to_json(const ShadowConfig& c) {
    nlohmann::json j;
    j["light_angle"]         = c.light_angle;
    j["light_elevation"]     = c.light_elevation;
    j["max_shadow_distance"] = c.max_shadow_distance;
    j["contact_opacity"]     = c.contact_opacity;
    j["falloff_rate"]        = c.falloff_rate;
    j["min_blur_radius"]     = c.min_blur_radius;
    j["max_blur_radius"]     = c.max_blur_radius;
    j["alpha_threshold"]     = c.alpha_threshold;
    j["composite_mode"]      = composite_mode_name(c.composite_mode);
    return j;
}

ShadowConfig config_from_json(const nlohmann::json& data, const ShadowConfig& defaults) {
    ShadowConfig c = defaults;
    if (!data.is_object()) {
        throw std::runtime_error("ShadowConfig: expected a JSON object");
    }

    c.light_angle         = data.value("light_angle",         defaults.light_angle);
    c.light_elevation     = data.value("light_elevation",     defaults.light_elevation);
    c.max_shadow_distance = data.value("max_shadow_distance", defaults.max_shadow_distance);
    c.contact_opacity     = data.value("contact_opacity",     defaults.contact_opacity);
    c.falloff_rate        = data.value("falloff_rate",        defaults.falloff_rate);
    c.min_blur_radius     = data.value("min_blur_radius",     defaults.min_blur_radius);
    c.max_blur_radius     = data.value("max_blur_radius",     defaults.max_blur_radius);

    // Read as double so 10.7 is rejected instead of truncated
    const double threshold = data.value("alpha_threshold", static_cast<double>(defaults.alpha_threshold));
    require(threshold >= 0.0 && threshold <= 255.0 && std::floor(threshold) == threshold,
            "alpha_threshold", threshold, "integers in [0, 255]");
    c.alpha_threshold = static_cast<int>(threshold);

    if (data.contains("composite_mode") && data["composite_mode"].is_string()) {
        c.composite_mode = parse_composite_mode(data["composite_mode"].get<std::string>());
    }
    return c;
}

ShadowConfig load_config(const std::string& path, const ShadowConfig& defaults) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open shadow config: " + path);
    }
    nlohmann::json data;
    in >> data;
    return config_from_json(data, defaults);
}
