// === File: shadow_generator.cpp ===
#include "shadow_generator.hpp"
#include "silhouette_extractor.hpp"
#include "light_vector.hpp"
#include "shadow_projector.hpp"
#include "blur_engine.hpp"
#include "shadow_compositor.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
    std::string size_str(const PixelBuffer& b) {
        return std::to_string(b.width) + "x" + std::to_string(b.height);
    }
}

ShadowGenerator::ShadowGenerator(bool debug)
    : debug_(debug)
{}

void ShadowGenerator::setDebug(bool debug) {
    debug_ = debug;
}

void ShadowGenerator::setProgressCallback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

void ShadowGenerator::report(const std::string& stage, float fraction) const {
    if (progress_) progress_(stage, fraction);
}

ShadowConfig ShadowGenerator::getDefaultConfig(double light_angle, double light_elevation) const {
    const SuggestedShadowParams suggested = light::suggested_shadow_params(light_elevation);

    ShadowConfig config;
    config.light_angle         = light_angle;
    config.light_elevation     = light_elevation;
    config.max_shadow_distance = 150.0;
    config.contact_opacity     = suggested.contact_opacity;
    config.falloff_rate        = suggested.falloff_rate;
    config.min_blur_radius     = 1.0;
    config.max_blur_radius     = 10.0;
    return config;
}

ValidationReport ShadowGenerator::validateImages(const ImageSet& images) const {
    if (images.foreground.empty()) {
        throw std::invalid_argument("Foreground image is required");
    }
    if (images.background.empty()) {
        throw std::invalid_argument("Background image is required");
    }

    ValidationReport report;
    if (!images.foreground.same_size(images.background)) {
        report.warnings.push_back("Image dimension mismatch: foreground " + size_str(images.foreground) +
                                  ", background " + size_str(images.background));
    }
    if (images.depth_map && !images.depth_map->same_size(images.foreground)) {
        report.warnings.push_back("Depth map dimension mismatch: " + size_str(*images.depth_map) +
                                  ", expected " + size_str(images.foreground));
    }

    for (const std::string& w : report.warnings) {
        std::cerr << "[ShadowGenerator] WARNING: " << w << "\n";
    }
    return report;
}

ShadowResult ShadowGenerator::generate(const ImageSet& images,
                                       const ShadowConfig& config,
                                       ShadowStats* stats) const
{
    validate_config(config);
    const ValidationReport validation = validateImages(images);
    if (!validation.dimensions_match()) {
        throw std::runtime_error("[ShadowGenerator] " + validation.warnings.front() +
                                 " (resize inputs to the foreground size first)");
    }

    const int width  = images.foreground.width;
    const int height = images.foreground.height;
    const PixelBuffer* depth_map = images.depth_map ? &*images.depth_map : nullptr;

    if (debug_) {
        std::cout << "[ShadowGenerator] Starting shadow generation pipeline\n"
                  << "[ShadowGenerator]   Image size: " << width << "x" << height << "\n"
                  << "[ShadowGenerator]   Light angle: " << config.light_angle << " deg\n"
                  << "[ShadowGenerator]   Light elevation: " << config.light_elevation << " deg\n"
                  << "[ShadowGenerator]   Depth map: " << (depth_map ? "yes" : "no") << "\n";
    }

    // === STEP 1: silhouette from alpha ===
    const OpacityMask silhouette = silhouette::extract(images.foreground, config.alpha_threshold);
    const std::size_t opaque = silhouette::count_opaque(silhouette);
    const std::size_t total  = silhouette.size();
    if (opaque == total) {
        std::cerr << "[ShadowGenerator] WARNING: entire foreground is opaque; "
                  << "the foreground needs a transparent background (PNG with alpha)\n";
    } else if (opaque == 0) {
        std::cerr << "[ShadowGenerator] WARNING: foreground has no opaque pixels; no shadow will be cast\n";
    }
    if (debug_) {
        std::cout << "[ShadowGenerator] Silhouette: " << opaque << " opaque ("
                  << std::fixed << std::setprecision(1) << (100.0 * opaque / total)
                  << "%), " << (total - opaque) << " transparent\n"
                  << std::defaultfloat;
    }
    report("silhouette", 1.0f);

    // === STEP 2: light vector and shadow length ===
    const LightVector lv = light::calculate(config.light_angle, config.light_elevation);
    const double shadow_length =
        light::shadow_length_multiplier(config.light_elevation) * config.max_shadow_distance;
    if (debug_) {
        std::cout << "[ShadowGenerator] Light vector: ("
                  << std::fixed << std::setprecision(3)
                  << lv.dx << ", " << lv.dy << ", " << lv.dz << ")\n"
                  << "[ShadowGenerator] Shadow length: " << std::setprecision(1)
                  << shadow_length << "px\n" << std::defaultfloat;
    }
    report("light_vector", 1.0f);

    // === STEP 3: contact line ===
    const ContactLine contact_line = contact::detect(silhouette, width, height);
    if (debug_) {
        std::cout << "[ShadowGenerator] Contact points: " << contact_line.size() << "\n";
    }
    report("contact_line", 1.0f);

    // === STEP 4: distance from contact line ===
    const DistanceMap distance_map = dt::compute(silhouette, contact_line, width, height);
    const DistanceStats dist_stats = dt::statistics(distance_map, silhouette);
    if (debug_) {
        std::cout << "[ShadowGenerator] Distance: min=" << dist_stats.min
                  << " max=" << dist_stats.max
                  << " avg=" << dist_stats.average << "\n";
    }
    report("distance_transform", 1.0f);

    // === STEP 5: projection and self-occlusion ===
    ShadowMask shadow_mask = projector::project(silhouette, width, height, lv, shadow_length, depth_map);
    shadow_mask = projector::remove_occlusions(shadow_mask, silhouette);
    const std::size_t shadow_pixels = countMaskPixels(shadow_mask);
    if (debug_) {
        std::cout << "[ShadowGenerator] Shadow pixels after occlusion: " << shadow_pixels << "\n";
    }
    report("projection", 1.0f);

    // === STEP 6: opacity falloff ===
    PixelBuffer shadow_layer = compositor::create_shadow_layer(shadow_mask, distance_map, config);
    report("falloff", 1.0f);

    // === STEP 7: distance-weighted blur ===
    if (debug_) {
        std::cout << "[ShadowGenerator] Blur range: " << config.min_blur_radius << "px - "
                  << config.max_blur_radius << "px\n";
    }
    shadow_layer = blur::apply_distance_weighted_blur(
        shadow_layer, distance_map,
        config.min_blur_radius, config.max_blur_radius, config.max_shadow_distance,
        [this](int done, int rows) {
            report("blur", static_cast<float>(done) / static_cast<float>(rows));
        });

    // === STEP 8: debug mask ===
    PixelBuffer mask_debug = silhouette::mask_to_image(silhouette, width, height);
    report("mask_debug", 1.0f);

    // === STEP 9: composite ===
    PixelBuffer composite = (config.composite_mode == CompositeMode::Attached)
        ? compositor::composite_attached_shadow(images.background, shadow_layer, images.foreground, silhouette)
        : compositor::composite(images.background, shadow_layer, images.foreground);
    report("composite", 1.0f);

    if (debug_) std::cout << "[ShadowGenerator] Shadow generation complete\n";

    if (stats) {
        stats->width             = width;
        stats->height            = height;
        stats->light             = lv;
        stats->shadow_length     = shadow_length;
        stats->opaque_pixels     = opaque;
        stats->contact_points    = contact_line.size();
        stats->shadow_pixels     = shadow_pixels;
        stats->contact_bounds    = contact::bounds(contact_line);
        stats->silhouette_bounds = computeMaskBounds(silhouette, width, height);
        stats->distance          = dist_stats;
    }

    ShadowResult result;
    result.shadow_only = std::move(shadow_layer);
    result.mask_debug  = std::move(mask_debug);
    result.composite   = std::move(composite);
    return result;
}
