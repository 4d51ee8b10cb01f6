#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "plugins/XCUR/XCURV1.hpp"

namespace XcurScale::test {

// A chunk as it should appear on disk, TOC data included
struct RawChunk {
    uint32_t type;
    uint32_t subtype;
    std::vector<uint8_t> bytes;
};

inline std::vector<uint8_t> imageChunkBytes(uint32_t nominal, uint32_t width, uint32_t height,
                                            uint32_t xhot, uint32_t yhot, uint32_t delay,
                                            const std::vector<uint32_t>& pixels) {
    std::vector<uint8_t> out;
    appendLE32(out, XCURSOR_IMAGE_HEADER_LEN);
    appendLE32(out, XCURSOR_IMAGE_TYPE);
    appendLE32(out, nominal);
    appendLE32(out, XCURSOR_IMAGE_VERSION);
    appendLE32(out, width);
    appendLE32(out, height);
    appendLE32(out, xhot);
    appendLE32(out, yhot);
    appendLE32(out, delay);
    for (uint32_t pixel : pixels) {
        appendLE32(out, pixel);
    }
    return out;
}

inline RawChunk imageChunk(uint32_t nominal, uint32_t width, uint32_t height,
                           uint32_t xhot, uint32_t yhot, uint32_t delay,
                           const std::vector<uint32_t>& pixels) {
    return {XCURSOR_IMAGE_TYPE, nominal, imageChunkBytes(nominal, width, height, xhot, yhot, delay, pixels)};
}

inline RawChunk commentChunk(const std::string& text) {
    return {XCURSOR_COMMENT_TYPE, 1, std::vector<uint8_t>(text.begin(), text.end())};
}

// Header, TOC and chunks laid out back to back
inline std::vector<uint8_t> assembleFile(const std::vector<RawChunk>& chunks,
                                         uint32_t version = XCURSOR_FILE_VERSION) {
    std::vector<uint8_t> out;
    appendLE32(out, XCURSOR_MAGIC);
    appendLE32(out, XCURSOR_FILE_HEADER_LEN);
    appendLE32(out, version);
    appendLE32(out, static_cast<uint32_t>(chunks.size()));

    uint32_t position = XCURSOR_FILE_HEADER_LEN + XCURSOR_TOC_ENTRY_LEN * static_cast<uint32_t>(chunks.size());
    for (const auto& chunk : chunks) {
        appendLE32(out, chunk.type);
        appendLE32(out, chunk.subtype);
        appendLE32(out, position);
        position += static_cast<uint32_t>(chunk.bytes.size());
    }
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.bytes.begin(), chunk.bytes.end());
    }
    return out;
}

inline void overwriteLE32(std::vector<uint8_t>& data, size_t offset, uint32_t value) {
    data[offset] = static_cast<uint8_t>(value & 0xFF);
    data[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    data[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    data[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

inline XcursorImageChunk makeImage(uint32_t width, uint32_t height, uint32_t xhot, uint32_t yhot,
                                   uint32_t delay, const std::vector<uint32_t>& pixels) {
    XcursorImageChunk image;
    image.width = width;
    image.height = height;
    image.xhot = xhot;
    image.yhot = yhot;
    image.delay = delay;
    image.pixels = pixels;
    return image;
}

inline XcursorImageChunk solidImage(uint32_t width, uint32_t height, uint32_t argb) {
    return makeImage(width, height, 0, 0, 0,
                     std::vector<uint32_t>(static_cast<size_t>(width) * height, argb));
}

inline XcursorEntry imageEntry(uint32_t nominal, XcursorImageChunk image) {
    return XcursorEntry{XcursorTocEntry{XCURSOR_IMAGE_TYPE, nominal, 0}, std::move(image)};
}

inline XcursorEntry commentEntry(const std::string& text) {
    return XcursorEntry{XcursorTocEntry{XCURSOR_COMMENT_TYPE, 1, 0},
                        XcursorOpaqueChunk{std::vector<uint8_t>(text.begin(), text.end())}};
}

inline void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline std::vector<uint8_t> readBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Fresh directory per test, removed afterwards
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              (std::string("xcurscale_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

} // namespace XcurScale::test
