#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "XCURV1.hpp"

namespace XcurScale {

/**
 * @brief Parses an Xcursor byte buffer into an XcursorFile
 *
 * Performs structural validation only. Image chunks are decoded, every
 * other chunk type is kept as an opaque byte span. Throws XcursorError on
 * malformed input; no partial document is ever returned.
 */
class XcursorReader {
public:
    static XcursorFile parse(const std::vector<uint8_t>& data);
    static XcursorFile parse(const uint8_t* data, size_t size);

    // True when the buffer starts with the Xcursor signature
    static bool hasSignature(const uint8_t* data, size_t size);

private:
    static XcursorImageChunk readImage(const uint8_t* data, size_t size,
                                       const XcursorTocEntry& toc, size_t index);
    static XcursorOpaqueChunk readOpaque(const uint8_t* data, size_t size,
                                         const std::vector<XcursorTocEntry>& toc, size_t index);
};

} // namespace XcurScale
