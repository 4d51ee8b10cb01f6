#ifndef UPSCALER_H
#define UPSCALER_H

#include <cstdint>
#include <vector>

#include "plugins/XCUR/XCURV1.hpp"

namespace XcurScale {

/**
 * @brief Pure image processing for cursor frames
 *
 * Integer nearest-neighbour upscaling: every source pixel becomes a solid
 * factor x factor block, so no colours are introduced and hard cursor edges
 * stay hard. Holds no state; safe to call from any number of threads.
 */
class Upscaler {
public:
    /**
     * @brief Scale one image chunk by an integer factor
     * @param image Source frame; its pixel buffer must hold width*height samples
     * @param factor Multiplier, at least 1 (1 returns an equal copy)
     * @return New frame with scaled dimensions, hotspot and pixels; delay
     * and version unchanged
     * @throws XcursorError InvalidScaleFactor, PixelBufferMismatch or
     * ScaledSizeOverflow
     */
    static XcursorImageChunk scale(const XcursorImageChunk& image, uint32_t factor);

    /**
     * @brief Block-replicate a raw ARGB buffer with OpenCV nearest-neighbour
     * @param pixels Row-major source, width*height samples
     * @return Row-major destination of (width*factor) x (height*factor)
     */
    static std::vector<uint32_t> replicate(const std::vector<uint32_t>& pixels,
                                           uint32_t width, uint32_t height, uint32_t factor);

    // Largest factor that keeps both dimensions within the format limit
    static uint32_t maxFactorFor(uint32_t width, uint32_t height);
};

} // namespace XcurScale

#endif // UPSCALER_H
