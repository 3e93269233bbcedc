// === File: shadow_config.hpp ===
#pragma once

#include <string>
#include <nlohmann/json.hpp>

enum class CompositeMode {
    Standard,   // background, shadow, foreground
    Attached    // shadow suppressed under the silhouette
};

// Defaults are the suggested values for a 135 deg / 45 deg light.
struct ShadowConfig {
    double        light_angle         = 135.0;  // [0, 360)
    double        light_elevation     = 45.0;   // [0, 90]
    double        max_shadow_distance = 150.0;  // > 0, pixels
    double        contact_opacity     = 0.75;   // [0, 1]
    double        falloff_rate        = 4.0;    // >= 0
    double        min_blur_radius     = 1.0;    // >= 0
    double        max_blur_radius     = 10.0;   // >= min_blur_radius
    int           alpha_threshold     = 10;     // [0, 255]
    CompositeMode composite_mode      = CompositeMode::Standard;
};

// Throws std::invalid_argument naming the first field out of range.
void validate_config(const ShadowConfig& config);

std::string   composite_mode_name(CompositeMode mode);
CompositeMode parse_composite_mode(const std::string& name);

nlohmann::json config_to_json(const ShadowConfig& config);

// Keys absent from `data` keep the value from `defaults`.
ShadowConfig config_from_json(const nlohmann::json& data, const ShadowConfig& defaults);

// Reads and parses a JSON file. Throws std::runtime_error if it cannot be opened.
ShadowConfig load_config(const std::string& path, const ShadowConfig& defaults);
