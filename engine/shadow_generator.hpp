// === File: shadow_generator.hpp ===
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "shadow_types.hpp"
#include "shadow_config.hpp"
#include "contact_line.hpp"
#include "distance_transform.hpp"
#include "mask_utils.hpp"

// Diagnostics of one generate() run, written to the run report by the CLI.
struct ShadowStats {
    int           width  = 0;
    int           height = 0;
    LightVector   light;
    double        shadow_length   = 0.0;
    std::size_t   opaque_pixels   = 0;
    std::size_t   contact_points  = 0;
    std::size_t   shadow_pixels   = 0;
    ContactBounds contact_bounds;
    MaskBounds    silhouette_bounds;
    DistanceStats distance;
};

struct ValidationReport {
    std::vector<std::string> warnings;

    bool dimensions_match() const { return warnings.empty(); }
};

/**
 * Runs the full pipeline: silhouette, light vector, contact line, distance
 * transform, projection with occlusion removal, opacity falloff, blur,
 * debug mask and compositing. Holds no per-run state.
 */
class ShadowGenerator {
public:
    // (stage, fraction of that stage completed in [0, 1])
    using ProgressCallback = std::function<void(const std::string&, float)>;

    // If debug==true, prints stage diagnostics
    explicit ShadowGenerator(bool debug = false);

    void setDebug(bool debug);
    void setProgressCallback(ProgressCallback callback);

    // Throws std::invalid_argument for bad config or missing images, and
    // std::runtime_error when image dimensions disagree.
    ShadowResult generate(const ImageSet& images,
                          const ShadowConfig& config,
                          ShadowStats* stats = nullptr) const;

    ShadowConfig getDefaultConfig(double light_angle = 135.0,
                                  double light_elevation = 45.0) const;

    // Throws std::invalid_argument if foreground or background is missing.
    // Size mismatches are returned as warnings.
    ValidationReport validateImages(const ImageSet& images) const;

private:
    void report(const std::string& stage, float fraction) const;

    bool debug_ = false;
    ProgressCallback progress_;
};
