#include "PNG.h"

#include <cstdio>

#include <png.h>

#include "core/Logging/Logging.h"

namespace XcurScale {

namespace PNG {

uint32_t unpremultiplyARGB(uint32_t pixel) {
    const uint32_t a = (pixel >> 24) & 0xFF;
    if (a == 0) {
        return 0;
    }
    if (a == 0xFF) {
        return pixel;
    }

    auto channel = [a](uint32_t premultiplied) -> uint32_t {
        uint32_t straight = (premultiplied * 255 + a / 2) / a;
        return straight > 255 ? 255 : straight;
    };
    const uint32_t r = channel((pixel >> 16) & 0xFF);
    const uint32_t g = channel((pixel >> 8) & 0xFF);
    const uint32_t b = channel(pixel & 0xFF);
    return (a << 24) | (r << 16) | (g << 8) | b;
}

bool savePNG(const std::string& filename, const std::vector<uint32_t>& pixels, int width, int height) {
    // libpng doesn't handle writing 0x0 files well
    if (width <= 0 || height <= 0) {
        Log(WARNING, "PNG", "Invalid image dimensions for saving: {}x{}", width, height);
        return false;
    }

    // Verify pixel data size matches dimensions
    size_t expectedPixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (pixels.size() != expectedPixels) {
        Log(ERROR, "PNG", "Pixel data size mismatch: expected {}, got {}", expectedPixels, pixels.size());
        return false;
    }

    FILE* file = fopen(filename.c_str(), "wb");
    if (!file) {
        Log(ERROR, "PNG", "Cannot create file: {}", filename);
        return false;
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        fclose(file);
        return false;
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        fclose(file);
        return false;
    }

    // Allocated before setjmp so a longjmp never skips its destructor
    std::vector<uint8_t> row_data(static_cast<size_t>(width) * 4);

    if (setjmp(png_jmpbuf(png_ptr))) {
        Log(ERROR, "PNG", "libpng failed while writing {}", filename);
        png_destroy_write_struct(&png_ptr, &info_ptr);
        fclose(file);
        return false;
    }

    png_init_io(png_ptr, file);

    png_set_IHDR(png_ptr, info_ptr, width, height, 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

    png_write_info(png_ptr, info_ptr);

    // Convert from ARGB to RGBA and write
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            uint32_t pixel = pixels[static_cast<size_t>(y) * width + x];
            row_data[x * 4 + 0] = (pixel >> 16) & 0xFF; // R
            row_data[x * 4 + 1] = (pixel >> 8) & 0xFF;  // G
            row_data[x * 4 + 2] = pixel & 0xFF;         // B
            row_data[x * 4 + 3] = (pixel >> 24) & 0xFF; // A
        }
        png_write_row(png_ptr, row_data.data());
    }

    png_write_end(png_ptr, nullptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);

    if (fclose(file) != 0) {
        Log(ERROR, "PNG", "Failed to finish writing {}", filename);
        return false;
    }
    return true;
}

} // namespace PNG

} // namespace XcurScale
