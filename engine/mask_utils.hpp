// mask_utils.hpp
#pragma once

#include <SDL.h>
#include <cstddef>
#include <vector>
#include <opencv2/opencv.hpp>

// Tight bounding box of the non-zero region, inclusive. Empty masks give all zeros.
struct MaskBounds {
    int xMin = 0, yMin = 0, xMax = 0, yMax = 0;
    bool empty = true;
};

// Wraps a flat w*h byte mask without copying. The mask must outlive the Mat.
inline cv::Mat wrapMask(const std::vector<Uint8>& mask, int w, int h) {
    CV_Assert(w > 0 && h > 0 && mask.size() == static_cast<std::size_t>(w) * h);
    return cv::Mat(h, w, CV_8UC1, const_cast<Uint8*>(mask.data()));
}

inline std::size_t countMaskPixels(const std::vector<Uint8>& mask) {
    if (mask.empty()) return 0;
    cv::Mat row(1, static_cast<int>(mask.size()), CV_8UC1, const_cast<Uint8*>(mask.data()));
    return static_cast<std::size_t>(cv::countNonZero(row));
}

inline MaskBounds computeMaskBounds(const std::vector<Uint8>& mask, int w, int h) {
    if (w <= 0 || h <= 0) return {};
    cv::Rect bb = cv::boundingRect(wrapMask(mask, w, h));
    if (bb.width == 0 || bb.height == 0) return {};
    return { bb.x, bb.y, bb.x + bb.width - 1, bb.y + bb.height - 1, false };
}
