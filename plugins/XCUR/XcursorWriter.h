#pragma once

#include <cstdint>
#include <vector>

#include "XCURV1.hpp"

namespace XcurScale {

/**
 * @brief Serializes an XcursorFile into the Xcursor container layout
 *
 * Chunk offsets are derived here in one forward pass; the positions the
 * reader recorded are ignored. Always returns a freshly allocated buffer.
 */
class XcursorWriter {
public:
    static std::vector<uint8_t> serialize(const XcursorFile& file);

    // Byte offset of every chunk in serialize() output, in entry order
    static std::vector<uint32_t> computeLayout(const XcursorFile& file);

    // Bytes a chunk occupies on disk, header included
    static uint64_t chunkByteLength(const XcursorChunk& chunk);
};

} // namespace XcurScale
