#include <gtest/gtest.h>

#include "core/XcursorError.h"
#include "plugins/XCUR/XcursorReader.h"
#include "XcursorTestUtil.h"

using namespace XcurScale;
using namespace XcurScale::test;

namespace {

XcursorErrc parseError(const std::vector<uint8_t>& data) {
    try {
        XcursorReader::parse(data);
    } catch (const XcursorError& e) {
        return e.code();
    }
    ADD_FAILURE() << "parse did not throw";
    return XcursorErrc::OutputTooLarge;
}

} // namespace

TEST(XcursorReaderTest, ParsesSingleImage) {
    auto data = assembleFile({imageChunk(24, 2, 1, 1, 0, 50, {0xFF102030, 0x80808080})});

    XcursorFile file = XcursorReader::parse(data);
    ASSERT_EQ(file.entryCount(), 1u);
    EXPECT_EQ(file.magic, XCURSOR_MAGIC);
    EXPECT_EQ(file.version, XCURSOR_FILE_VERSION);

    const auto& entry = file.entries[0];
    ASSERT_TRUE(entry.isImage());
    EXPECT_EQ(entry.toc.subtype, 24u);
    EXPECT_EQ(entry.toc.position, 28u);
    EXPECT_EQ(entry.image().width, 2u);
    EXPECT_EQ(entry.image().height, 1u);
    EXPECT_EQ(entry.image().xhot, 1u);
    EXPECT_EQ(entry.image().yhot, 0u);
    EXPECT_EQ(entry.image().delay, 50u);
    EXPECT_EQ(entry.image().pixels, (std::vector<uint32_t>{0xFF102030, 0x80808080}));
}

TEST(XcursorReaderTest, EmptyTableOfContents) {
    XcursorFile file = XcursorReader::parse(assembleFile({}));
    EXPECT_EQ(file.entryCount(), 0u);
}

TEST(XcursorReaderTest, RejectsMissingSignature) {
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A,
                                0, 0, 0, 0x0D, 'I', 'H', 'D', 'R'};
    EXPECT_EQ(parseError(png), XcursorErrc::NotAnXcursorFile);
    EXPECT_FALSE(XcursorReader::hasSignature(png.data(), png.size()));
}

TEST(XcursorReaderTest, RejectsShortBuffer) {
    std::vector<uint8_t> data = {'X', 'c', 'u', 'r', 16, 0, 0, 0};
    EXPECT_EQ(parseError(data), XcursorErrc::NotAnXcursorFile);
    EXPECT_EQ(parseError({}), XcursorErrc::NotAnXcursorFile);
}

TEST(XcursorReaderTest, RejectsOtherMajorVersion) {
    EXPECT_EQ(parseError(assembleFile({}, 0x00020000)), XcursorErrc::UnsupportedVersion);
    EXPECT_EQ(parseError(assembleFile({}, 0x00000001)), XcursorErrc::UnsupportedVersion);
}

TEST(XcursorReaderTest, AcceptsNewerMinorVersion) {
    XcursorFile file = XcursorReader::parse(assembleFile({}, 0x00010003));
    EXPECT_EQ(file.version, 0x00010003u);
}

TEST(XcursorReaderTest, RejectsShortFileHeader) {
    auto data = assembleFile({});
    overwriteLE32(data, 4, 8);
    EXPECT_EQ(parseError(data), XcursorErrc::InconsistentChunkHeader);
}

TEST(XcursorReaderTest, SkipsLongerFileHeader) {
    // 20 byte header: four unknown bytes between the header and the TOC
    auto image = imageChunkBytes(16, 1, 1, 0, 0, 0, {0xFFFFFFFF});
    std::vector<uint8_t> data;
    appendLE32(data, XCURSOR_MAGIC);
    appendLE32(data, 20);
    appendLE32(data, XCURSOR_FILE_VERSION);
    appendLE32(data, 1);
    appendLE32(data, 0xDEADBEEF);
    appendLE32(data, XCURSOR_IMAGE_TYPE);
    appendLE32(data, 16);
    appendLE32(data, 32);
    data.insert(data.end(), image.begin(), image.end());

    XcursorFile file = XcursorReader::parse(data);
    ASSERT_EQ(file.entryCount(), 1u);
    EXPECT_EQ(file.entries[0].image().pixels[0], 0xFFFFFFFFu);
}

TEST(XcursorReaderTest, RejectsTruncatedTableOfContents) {
    auto data = assembleFile({});
    overwriteLE32(data, 12, 3);
    appendLE32(data, XCURSOR_IMAGE_TYPE);
    appendLE32(data, 24);
    appendLE32(data, 100);
    EXPECT_EQ(parseError(data), XcursorErrc::TruncatedData);
}

TEST(XcursorReaderTest, RejectsPositionPastEnd) {
    auto data = assembleFile({commentChunk("hello")});
    overwriteLE32(data, 24, static_cast<uint32_t>(data.size()));
    EXPECT_EQ(parseError(data), XcursorErrc::TruncatedData);
}

TEST(XcursorReaderTest, RejectsTruncatedImageHeader) {
    auto data = assembleFile({imageChunk(24, 1, 1, 0, 0, 0, {0})});
    data.resize(28 + 20);
    EXPECT_EQ(parseError(data), XcursorErrc::TruncatedData);
}

TEST(XcursorReaderTest, RejectsMissingPixels) {
    // 4x4 image carrying only 8 of its 16 pixels
    auto data = assembleFile({imageChunk(32, 4, 4, 0, 0, 0, std::vector<uint32_t>(8, 0xFF000000))});
    EXPECT_EQ(parseError(data), XcursorErrc::TruncatedPixelData);
}

TEST(XcursorReaderTest, RejectsSubtypeMismatch) {
    auto chunk = imageChunk(24, 1, 1, 0, 0, 0, {0});
    chunk.subtype = 32;
    try {
        XcursorReader::parse(assembleFile({chunk}));
        FAIL() << "parse accepted a nominal size that differs from the TOC";
    } catch (const XcursorError& e) {
        EXPECT_EQ(e.code(), XcursorErrc::InconsistentChunkHeader);
        EXPECT_NE(std::string(e.what()).find("nominal size 24"), std::string::npos) << e.what();
    }
}

TEST(XcursorReaderTest, RejectsTypeMismatch) {
    auto data = assembleFile({imageChunk(24, 1, 1, 0, 0, 0, {0})});
    overwriteLE32(data, 28 + 4, XCURSOR_COMMENT_TYPE);
    EXPECT_EQ(parseError(data), XcursorErrc::InconsistentChunkHeader);
}

TEST(XcursorReaderTest, RejectsShortImageHeader) {
    auto data = assembleFile({imageChunk(24, 1, 1, 0, 0, 0, {0})});
    overwriteLE32(data, 28, 32);
    EXPECT_EQ(parseError(data), XcursorErrc::InconsistentChunkHeader);
}

TEST(XcursorReaderTest, RejectsNewerImageVersion) {
    auto data = assembleFile({imageChunk(24, 1, 1, 0, 0, 0, {0})});
    overwriteLE32(data, 28 + 12, 2);
    EXPECT_EQ(parseError(data), XcursorErrc::UnsupportedVersion);
}

TEST(XcursorReaderTest, RejectsInvalidGeometry) {
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 0, 1, 0, 0, 0, {})})),
              XcursorErrc::InvalidImageGeometry);
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 0x8000, 1, 0, 0, 0, {})})),
              XcursorErrc::InvalidImageGeometry);
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 2, 2, 2, 0, 0, std::vector<uint32_t>(4, 0))})),
              XcursorErrc::InvalidImageGeometry);
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 2, 2, 0, 5, 0, std::vector<uint32_t>(4, 0))})),
              XcursorErrc::InvalidImageGeometry);
}

TEST(XcursorReaderTest, RejectsHotspotOnImageEdge) {
    // xhot == width points one past the last column
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 3, 3, 3, 1, 0, std::vector<uint32_t>(9, 0))})),
              XcursorErrc::InvalidImageGeometry);
    EXPECT_EQ(parseError(assembleFile({imageChunk(24, 3, 3, 1, 3, 0, std::vector<uint32_t>(9, 0))})),
              XcursorErrc::InvalidImageGeometry);
    EXPECT_NO_THROW(XcursorReader::parse(assembleFile({imageChunk(24, 3, 3, 2, 2, 0, std::vector<uint32_t>(9, 0))})));
}

TEST(XcursorReaderTest, OpaqueChunkRunsToEndOfFile) {
    auto data = assembleFile({imageChunk(24, 1, 1, 0, 0, 0, {1}), commentChunk("made by hand")});

    XcursorFile file = XcursorReader::parse(data);
    ASSERT_EQ(file.entryCount(), 2u);
    ASSERT_FALSE(file.entries[1].isImage());
    const auto& bytes = file.entries[1].opaque().bytes;
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "made by hand");
}

TEST(XcursorReaderTest, OpaqueChunkStopsAtNextPosition) {
    // The comment is listed last but stored first; it ends where the image starts
    auto comment = commentChunk("abc");
    auto image = imageChunkBytes(24, 1, 1, 0, 0, 0, {7});
    const uint32_t commentAt = 16 + 2 * 12;
    const uint32_t imageAt = commentAt + 3;

    std::vector<uint8_t> data;
    appendLE32(data, XCURSOR_MAGIC);
    appendLE32(data, XCURSOR_FILE_HEADER_LEN);
    appendLE32(data, XCURSOR_FILE_VERSION);
    appendLE32(data, 2);
    appendLE32(data, XCURSOR_IMAGE_TYPE);
    appendLE32(data, 24);
    appendLE32(data, imageAt);
    appendLE32(data, XCURSOR_COMMENT_TYPE);
    appendLE32(data, 1);
    appendLE32(data, commentAt);
    data.insert(data.end(), comment.bytes.begin(), comment.bytes.end());
    data.insert(data.end(), image.begin(), image.end());

    XcursorFile file = XcursorReader::parse(data);
    ASSERT_EQ(file.entryCount(), 2u);
    EXPECT_TRUE(file.entries[0].isImage());
    EXPECT_EQ(file.entries[0].image().pixels[0], 7u);
    EXPECT_EQ(file.entries[1].opaque().bytes, comment.bytes);
}

TEST(XcursorReaderTest, KeepsUnknownChunkTypes) {
    RawChunk unknown{0x12345678, 9, {1, 2, 3, 4, 5}};
    XcursorFile file = XcursorReader::parse(assembleFile({unknown}));
    ASSERT_EQ(file.entryCount(), 1u);
    EXPECT_EQ(file.entries[0].toc.type, 0x12345678u);
    EXPECT_EQ(file.entries[0].toc.subtype, 9u);
    EXPECT_EQ(file.entries[0].opaque().bytes, unknown.bytes);
}
