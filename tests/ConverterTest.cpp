#include <gtest/gtest.h>

#include "core/XcursorError.h"
#include "plugins/XCUR/XcursorReader.h"
#include "plugins/XCUR/XcursorWriter.h"
#include "services/Conversion/Converter.h"
#include "XcursorTestUtil.h"

using namespace XcurScale;
using namespace XcurScale::test;

namespace {

XcursorErrc convertError(const std::vector<uint8_t>& data, uint32_t factor) {
    try {
        Converter::convert(data, factor);
    } catch (const XcursorError& e) {
        return e.code();
    }
    ADD_FAILURE() << "convert did not throw";
    return XcursorErrc::OutputTooLarge;
}

std::vector<uint8_t> animatedCursor() {
    return assembleFile({imageChunk(24, 2, 2, 1, 0, 50, {1, 2, 3, 4}),
                         imageChunk(24, 2, 2, 1, 0, 50, {5, 6, 7, 8}),
                         commentChunk("copyright nobody"),
                         imageChunk(32, 3, 3, 2, 2, 0, std::vector<uint32_t>(9, 0xFF000000))});
}

} // namespace

TEST(ConverterTest, ScalesEveryImage) {
    XcursorFile result = XcursorReader::parse(Converter::convert(animatedCursor(), 2));
    ASSERT_EQ(result.entryCount(), 4u);

    EXPECT_EQ(result.entries[0].image().width, 4u);
    EXPECT_EQ(result.entries[0].image().xhot, 2u);
    EXPECT_EQ(result.entries[0].image().delay, 50u);
    EXPECT_EQ(result.entries[1].image().pixels[0], 5u);
    EXPECT_EQ(result.entries[3].image().width, 6u);
    EXPECT_EQ(result.entries[3].image().yhot, 4u);

    const auto& comment = result.entries[2].opaque().bytes;
    EXPECT_EQ(std::string(comment.begin(), comment.end()), "copyright nobody");
}

TEST(ConverterTest, KeepsNominalSizesByDefault) {
    XcursorFile result = XcursorReader::parse(Converter::convert(animatedCursor(), 3));
    EXPECT_EQ(result.entries[0].toc.subtype, 24u);
    EXPECT_EQ(result.entries[2].toc.subtype, 1u);
    EXPECT_EQ(result.entries[3].toc.subtype, 32u);
}

TEST(ConverterTest, CanScaleNominalSizes) {
    ConversionOptions options;
    options.scaleNominalSize = true;
    XcursorFile result = XcursorReader::parse(Converter::convert(animatedCursor(), 3, options));
    EXPECT_EQ(result.entries[0].toc.subtype, 72u);
    EXPECT_EQ(result.entries[3].toc.subtype, 96u);
    // Only images have a nominal size
    EXPECT_EQ(result.entries[2].toc.subtype, 1u);
}

TEST(ConverterTest, FactorOneRewritesCanonicalFileUnchanged) {
    auto original = animatedCursor();
    EXPECT_EQ(Converter::convert(original, 1), original);
}

TEST(ConverterTest, ScalesComposeAcrossConversions) {
    auto original = animatedCursor();
    EXPECT_EQ(Converter::convert(Converter::convert(original, 2), 2), Converter::convert(original, 4));
}

TEST(ConverterTest, PropagatesReaderErrors) {
    std::vector<uint8_t> text = {'h', 'e', 'l', 'l', 'o', ' ', 'w', 'o', 'r', 'l', 'd', '!', '!', '!', '!', '\n'};
    EXPECT_EQ(convertError(text, 2), XcursorErrc::NotAnXcursorFile);

    auto truncated = assembleFile({imageChunk(32, 4, 4, 0, 0, 0, std::vector<uint32_t>(8, 0))});
    EXPECT_EQ(convertError(truncated, 2), XcursorErrc::TruncatedPixelData);
}

TEST(ConverterTest, PropagatesScalerErrors) {
    auto wide = assembleFile({imageChunk(24, 0x4000, 1, 0, 0, 0, std::vector<uint32_t>(0x4000, 0))});
    EXPECT_EQ(convertError(wide, 2), XcursorErrc::ScaledSizeOverflow);
}

TEST(ConverterTest, RejectsZeroFactorWithoutImages) {
    EXPECT_EQ(convertError(assembleFile({commentChunk("only a comment")}), 0), XcursorErrc::InvalidScaleFactor);
}

TEST(ConverterTest, ScaleDocumentInPlace) {
    XcursorFile file;
    file.entries.push_back(imageEntry(16, makeImage(1, 2, 0, 1, 0, {1, 2})));
    Converter::scaleDocument(file, 2);
    EXPECT_EQ(file.entries[0].image().pixels, (std::vector<uint32_t>{1, 1, 1, 1, 2, 2, 2, 2}));
    EXPECT_EQ(file.entries[0].image().yhot, 2u);
    EXPECT_EQ(file.entries[0].toc.subtype, 16u);
}
