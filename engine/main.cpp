// === File: main.cpp ===

#include "shadow_generator.hpp"
#include "shadow_config.hpp"
#include "image_io.hpp"
#include "contact_line.hpp"
#include "distance_transform.hpp"
#include "silhouette_extractor.hpp"

#include <SDL.h>
#include <SDL_image.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    struct Options {
        std::string foreground;
        std::string background;
        std::string depth;
        std::string config;
        std::string out_dir = "out";
        std::optional<double> angle;
        std::optional<double> elevation;
        bool attached  = false;
        bool debug     = false;
        bool downscale = true;
    };

    void print_usage(const char* exe) {
        std::cerr << "Usage: " << exe << " <foreground> <background> [options]\n"
                  << "  --depth <file>      grayscale depth map (0 = near, 255 = far)\n"
                  << "  --config <file>     shadow config JSON\n"
                  << "  --angle <deg>       light angle, overrides config\n"
                  << "  --elevation <deg>   light elevation, overrides config\n"
                  << "  --attached          keep the shadow off the subject in the composite\n"
                  << "  --out <dir>         output directory (default: out)\n"
                  << "  --debug             print stage diagnostics and write debug images\n"
                  << "  --no-downscale      keep images larger than "
                  << ImageIO::kMaxDimension << "px\n";
    }

    double parse_number(const std::string& flag, const std::string& text) {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument("bad value for " + flag + ": " + text);
        }
        return v;
    }

    bool parse_args(int argc, char* argv[], Options& opt) {
        std::vector<std::string> positional;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--depth")             opt.depth = next();
            else if (arg == "--config")       opt.config = next();
            else if (arg == "--out")          opt.out_dir = next();
            else if (arg == "--angle")        opt.angle = parse_number(arg, next());
            else if (arg == "--elevation")    opt.elevation = parse_number(arg, next());
            else if (arg == "--attached")     opt.attached = true;
            else if (arg == "--debug")        opt.debug = true;
            else if (arg == "--no-downscale") opt.downscale = false;
            else if (arg == "-h" || arg == "--help") return false;
            else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("unknown option " + arg);
            }
            else positional.push_back(arg);
        }
        if (positional.size() != 2) return false;
        opt.foreground = positional[0];
        opt.background = positional[1];
        return true;
    }

    PixelBuffer load(const std::string& label, const std::string& path, bool downscale) {
        std::cout << "[Main] Loading " << label << ": " << path << "\n";
        PixelBuffer image = ImageIO::load_image(path);
        std::cout << "[Main]   " << image.width << "x" << image.height << "\n";
        return downscale ? ImageIO::downscale_to_fit(image) : image;
    }

    json build_report(const ShadowConfig& config, const ShadowStats& stats) {
        json report;
        report["config"] = config_to_json(config);
        report["size"]   = { stats.width, stats.height };
        report["light_vector"]   = { stats.light.dx, stats.light.dy, stats.light.dz };
        report["shadow_length"]  = stats.shadow_length;
        report["opaque_pixels"]  = stats.opaque_pixels;
        report["contact_points"] = stats.contact_points;
        report["shadow_pixels"]  = stats.shadow_pixels;
        report["contact_bounds"] = { stats.contact_bounds.min_x, stats.contact_bounds.min_y,
                                     stats.contact_bounds.max_x, stats.contact_bounds.max_y };
        if (!stats.silhouette_bounds.empty) {
            report["silhouette_bounds"] = { stats.silhouette_bounds.xMin, stats.silhouette_bounds.yMin,
                                            stats.silhouette_bounds.xMax, stats.silhouette_bounds.yMax };
        }
        report["distance"] = {
            { "min", stats.distance.min },
            { "max", stats.distance.max },
            { "average", stats.distance.average }
        };
        return report;
    }

    int run(const Options& opt) {
        ShadowGenerator generator(opt.debug);

        // === Inputs ===
        ImageSet images;
        images.foreground = load("foreground", opt.foreground, opt.downscale);
        images.background = load("background", opt.background, opt.downscale);
        if (!opt.depth.empty()) {
            images.depth_map = load("depth map", opt.depth, opt.downscale);
        }

        // Reconcile sizes before the pipeline; it refuses mismatched buffers
        const int w = images.foreground.width;
        const int h = images.foreground.height;
        if (!generator.validateImages(images).dimensions_match()) {
            std::cout << "[Main] Resizing inputs to " << w << "x" << h << "\n";
            images.background = ImageIO::resize(images.background, w, h);
            if (images.depth_map) images.depth_map = ImageIO::resize(*images.depth_map, w, h);
        }

        // === Config ===
        const double angle     = opt.angle.value_or(135.0);
        const double elevation = opt.elevation.value_or(45.0);
        ShadowConfig config = generator.getDefaultConfig(angle, elevation);
        if (!opt.config.empty()) {
            config = load_config(opt.config, config);
        }
        if (opt.angle)     config.light_angle = *opt.angle;
        if (opt.elevation) config.light_elevation = *opt.elevation;
        if (opt.attached)  config.composite_mode = CompositeMode::Attached;

        // === Generate ===
        std::string last_stage;
        generator.setProgressCallback([&last_stage](const std::string& stage, float fraction) {
            if (stage != last_stage) {
                if (!last_stage.empty()) std::cout << "\n";
                last_stage = stage;
            }
            std::cout << "[Main] " << std::left << std::setw(20) << stage
                      << " [" << std::right << std::setw(5) << std::fixed << std::setprecision(1)
                      << fraction * 100.0f << "%]\r" << std::flush;
        });

        ShadowStats stats;
        ShadowResult result = generator.generate(images, config, &stats);
        std::cout << std::defaultfloat << std::endl;

        // === Outputs ===
        fs::create_directories(opt.out_dir);
        const fs::path out(opt.out_dir);
        ImageIO::save_png(result.shadow_only, (out / "shadow_only.png").string());
        ImageIO::save_png(result.mask_debug,  (out / "mask_debug.png").string());
        ImageIO::save_png(result.composite,   (out / "composite.png").string());

        if (opt.debug) {
            const OpacityMask mask = silhouette::extract(images.foreground, config.alpha_threshold);
            const ContactLine line = contact::detect(mask, w, h);
            const DistanceMap dist = dt::compute(mask, line, w, h);
            ImageIO::save_png(contact::visualize(mask, line, w, h), (out / "contact_line.png").string());
            ImageIO::save_png(dt::visualize(dist, config.max_shadow_distance), (out / "distance_map.png").string());
        }

        ImageIO::save_metadata((out / "report.json").string(), build_report(config, stats));

        std::cout << "[Main] Wrote results to " << out.string() << "\n";
        return 0;
    }
}

int main(int argc, char* argv[]) {
    Options opt;
    try {
        if (!parse_args(argc, argv, opt)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Main] " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    // === SDL Subsystem Initialization ===
    if (SDL_Init(0) < 0) {
        std::cerr << "[Main] SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
    if ((IMG_Init(img_flags) & IMG_INIT_PNG) != IMG_INIT_PNG) {
        std::cerr << "[Main] IMG_Init failed: " << IMG_GetError() << "\n";
        SDL_Quit();
        return 1;
    }

    int code = 1;
    try {
        code = run(opt);
    } catch (const std::exception& e) {
        std::cerr << "\n[Main] " << e.what() << "\n";
        code = 1;
    }

    // === Cleanup ===
    IMG_Quit();
    SDL_Quit();
    return code;
}
