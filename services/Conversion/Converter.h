#pragma once

#include <cstdint>
#include <vector>

#include "plugins/XCUR/XCURV1.hpp"

namespace XcurScale {

struct ConversionOptions {
    // Multiply image subtypes (nominal sizes) by the factor as well. Off by
    // default: subtypes are selectors and stay as they are.
    bool scaleNominalSize = false;
};

/**
 * @brief Reader -> Upscaler -> Writer for one cursor held in memory
 *
 * Errors from each stage propagate unchanged as XcursorError. No file
 * access, no shared state; calls on separate threads are independent.
 */
class Converter {
public:
    static std::vector<uint8_t> convert(const std::vector<uint8_t>& input, uint32_t factor,
                                        const ConversionOptions& options = {});

    // Scale every image entry of an already parsed document in place
    static void scaleDocument(XcursorFile& file, uint32_t factor,
                              const ConversionOptions& options = {});
};

} // namespace XcurScale
