#include "Upscaler.h"

#include <algorithm>
#include <cstring>
#include <format>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "core/XcursorError.h"

namespace XcurScale {

uint32_t Upscaler::maxFactorFor(uint32_t width, uint32_t height) {
    const uint32_t largest = std::max(width, height);
    if (largest == 0) {
        return XCURSOR_IMAGE_MAX_SIZE;
    }
    return XCURSOR_IMAGE_MAX_SIZE / largest;
}

std::vector<uint32_t> Upscaler::replicate(const std::vector<uint32_t>& pixels,
                                          uint32_t width, uint32_t height, uint32_t factor) {
    const int outWidth = static_cast<int>(width * factor);
    const int outHeight = static_cast<int>(height * factor);
    std::vector<uint32_t> output(static_cast<size_t>(outWidth) * static_cast<size_t>(outHeight));
    if (output.empty()) {
        return output;
    }

    // Each ARGB word is one 4-channel pixel; nearest-neighbour never mixes
    // channels, so byte order does not matter. Both Mats wrap the vectors.
    const cv::Mat source(static_cast<int>(height), static_cast<int>(width), CV_8UC4,
                         const_cast<uint32_t*>(pixels.data()));
    cv::Mat scaled(outHeight, outWidth, CV_8UC4, output.data());

    // The exact variant samples pixel centres, so every source pixel maps to
    // a whole factor x factor block
    cv::resize(source, scaled, scaled.size(), 0, 0, cv::INTER_NEAREST_EXACT);
    if (scaled.data != reinterpret_cast<uchar*>(output.data())) {
        // resize reallocated the destination; copy the result back
        std::memcpy(output.data(), scaled.data, output.size() * sizeof(uint32_t));
    }

    return output;
}

XcursorImageChunk Upscaler::scale(const XcursorImageChunk& image, uint32_t factor) {
    if (factor == 0) {
        throw XcursorError(XcursorErrc::InvalidScaleFactor, "scale factor must be at least 1");
    }
    if (!image.hasConsistentPixels()) {
        throw XcursorError(XcursorErrc::PixelBufferMismatch,
                           std::format("image is {}x{} but holds {} pixels",
                                       image.width, image.height, image.pixels.size()));
    }
    if (image.xhot >= image.width || image.yhot >= image.height) {
        throw XcursorError(XcursorErrc::InvalidImageGeometry,
                           std::format("hotspot ({}, {}) lies outside {}x{}",
                                       image.xhot, image.yhot, image.width, image.height));
    }
    if (factor == 1) {
        return image;
    }

    const uint64_t newWidth = static_cast<uint64_t>(image.width) * factor;
    const uint64_t newHeight = static_cast<uint64_t>(image.height) * factor;
    if (newWidth > XCURSOR_IMAGE_MAX_SIZE || newHeight > XCURSOR_IMAGE_MAX_SIZE) {
        throw XcursorError(XcursorErrc::ScaledSizeOverflow,
                           std::format("{}x{} scaled by {} exceeds the {} pixel limit (largest factor is {})",
                                       image.width, image.height, factor, XCURSOR_IMAGE_MAX_SIZE,
                                       maxFactorFor(image.width, image.height)));
    }

    XcursorImageChunk scaled;
    scaled.version = image.version;
    scaled.width = static_cast<uint32_t>(newWidth);
    scaled.height = static_cast<uint32_t>(newHeight);
    scaled.xhot = image.xhot * factor;
    scaled.yhot = image.yhot * factor;
    scaled.delay = image.delay;
    scaled.pixels = replicate(image.pixels, image.width, image.height, factor);
    return scaled;
}

} // namespace XcurScale
