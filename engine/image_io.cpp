// === File: image_io.cpp ===
#include "image_io.hpp"

#include <SDL_image.h>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

PixelBuffer ImageIO::load_image(const std::string& path) {
    SDL_Surface* loaded = IMG_Load(path.c_str());
    if (!loaded) {
        throw std::runtime_error("IMG_Load failed for " + path + ": " + IMG_GetError());
    }

    PixelBuffer image;
    try {
        image = from_surface(loaded);
    } catch (...) {
        SDL_FreeSurface(loaded);
        throw;
    }
    SDL_FreeSurface(loaded);
    return image;
}

void ImageIO::save_png(const PixelBuffer& image, const std::string& path) {
    SDL_Surface* surf = to_surface(image);
    if (IMG_SavePNG(surf, path.c_str()) != 0) {
        std::string err = IMG_GetError();
        SDL_FreeSurface(surf);
        throw std::runtime_error("IMG_SavePNG failed for " + path + ": " + err);
    }
    SDL_FreeSurface(surf);
}

SDL_Surface* ImageIO::to_surface(const PixelBuffer& image) {
    if (image.empty()) {
        throw std::runtime_error("[ImageIO] cannot create a surface from an empty image");
    }

    SDL_Surface* surf = SDL_CreateRGBSurfaceWithFormat(0, image.width, image.height, 32,
                                                       SDL_PIXELFORMAT_RGBA32);
    if (!surf) {
        throw std::runtime_error(std::string("SDL_CreateRGBSurfaceWithFormat failed: ") + SDL_GetError());
    }

    if (SDL_LockSurface(surf) != 0) {
        std::string err = SDL_GetError();
        SDL_FreeSurface(surf);
        throw std::runtime_error("SDL_LockSurface failed: " + err);
    }

    const std::size_t row_bytes = static_cast<std::size_t>(image.width) * 4;
    Uint8* dst = static_cast<Uint8*>(surf->pixels);
    for (int y = 0; y < image.height; ++y) {
        std::memcpy(dst + static_cast<std::size_t>(y) * surf->pitch,
                    &image.pixels[image.index(0, y)], row_bytes);
    }

    SDL_UnlockSurface(surf);
    return surf;
}

PixelBuffer ImageIO::from_surface(SDL_Surface* surface) {
    if (!surface) {
        throw std::runtime_error("[ImageIO] null surface");
    }

    // RGBA32 is byte order R, G, B, A regardless of endianness
    SDL_Surface* rgba = SDL_ConvertSurfaceFormat(surface, SDL_PIXELFORMAT_RGBA32, 0);
    if (!rgba) {
        throw std::runtime_error(std::string("SDL_ConvertSurfaceFormat failed: ") + SDL_GetError());
    }

    if (SDL_LockSurface(rgba) != 0) {
        std::string err = SDL_GetError();
        SDL_FreeSurface(rgba);
        throw std::runtime_error("SDL_LockSurface failed: " + err);
    }

    PixelBuffer image(rgba->w, rgba->h);
    const std::size_t row_bytes = static_cast<std::size_t>(rgba->w) * 4;
    const Uint8* src = static_cast<const Uint8*>(rgba->pixels);
    for (int y = 0; y < rgba->h; ++y) {
        std::memcpy(&image.pixels[image.index(0, y)],
                    src + static_cast<std::size_t>(y) * rgba->pitch, row_bytes);
    }

    SDL_UnlockSurface(rgba);
    SDL_FreeSurface(rgba);
    return image;
}

PixelBuffer ImageIO::resize(const PixelBuffer& image, int width, int height) {
    if (image.width == width && image.height == height) return image;
    if (width <= 0 || height <= 0) {
        throw std::runtime_error("[ImageIO] invalid resize target " +
                                 std::to_string(width) + "x" + std::to_string(height));
    }

    SDL_Surface* src = to_surface(image);
    SDL_Surface* dst = SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, SDL_PIXELFORMAT_RGBA32);
    if (!dst) {
        std::string err = SDL_GetError();
        SDL_FreeSurface(src);
        throw std::runtime_error("SDL_CreateRGBSurfaceWithFormat failed: " + err);
    }

    // Copy alpha instead of blending it onto the empty target
    SDL_SetSurfaceBlendMode(src, SDL_BLENDMODE_NONE);
    if (SDL_BlitScaled(src, nullptr, dst, nullptr) != 0) {
        std::string err = SDL_GetError();
        SDL_FreeSurface(src);
        SDL_FreeSurface(dst);
        throw std::runtime_error("SDL_BlitScaled failed: " + err);
    }
    SDL_FreeSurface(src);

    PixelBuffer result;
    try {
        result = from_surface(dst);
    } catch (...) {
        SDL_FreeSurface(dst);
        throw;
    }
    SDL_FreeSurface(dst);
    return result;
}

PixelBuffer ImageIO::downscale_to_fit(const PixelBuffer& image, int max_dimension) {
    if (image.width <= max_dimension && image.height <= max_dimension) return image;

    const double ratio = std::min(double(max_dimension) / image.width,
                                  double(max_dimension) / image.height);
    const int w = std::max(1, round_half_up(image.width * ratio));
    const int h = std::max(1, round_half_up(image.height * ratio));
    std::cout << "[ImageIO] Downscaled " << image.width << "x" << image.height
              << " to " << w << "x" << h << "\n";
    return resize(image, w, h);
}

void ImageIO::save_metadata(const std::string& path, const nlohmann::json& data) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("[ImageIO] Failed to open " + path + " for writing");
    }
    out << data.dump(4) << "\n";
    if (!out) {
        throw std::runtime_error("[ImageIO] Failed to write " + path);
    }
}
