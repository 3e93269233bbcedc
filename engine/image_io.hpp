// === File: image_io.hpp ===
#pragma once

#include <SDL.h>
#include <string>
#include <nlohmann/json.hpp>
#include "pixel_buffer.hpp"

// Bridge between files, SDL surfaces and PixelBuffers. Everything throws
// std::runtime_error with the SDL / SDL_image error text on failure.
class ImageIO {
public:
    static constexpr int kMaxDimension = 1200;

    static PixelBuffer load_image(const std::string& path);
    static void save_png(const PixelBuffer& image, const std::string& path);

    // Caller owns the returned surface (SDL_FreeSurface).
    static SDL_Surface* to_surface(const PixelBuffer& image);
    static PixelBuffer from_surface(SDL_Surface* surface);

    static PixelBuffer resize(const PixelBuffer& image, int width, int height);

    // Shrinks so neither side exceeds max_dimension, keeping the aspect ratio.
    static PixelBuffer downscale_to_fit(const PixelBuffer& image, int max_dimension = kMaxDimension);

    static void save_metadata(const std::string& path, const nlohmann::json& data);
};
