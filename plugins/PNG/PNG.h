#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace XcurScale {

namespace PNG {

// Xcursor pixels carry premultiplied alpha; PNG expects straight alpha.
uint32_t unpremultiplyARGB(uint32_t pixel);

/**
 * @brief Write straight-alpha ARGB pixels as an 8-bit RGBA PNG
 * @return false (and a logged error) when the file cannot be written
 */
bool savePNG(const std::string& filename, const std::vector<uint32_t>& pixels, int width, int height);

} // namespace PNG

} // namespace XcurScale
