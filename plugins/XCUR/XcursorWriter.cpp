#include "XcursorWriter.h"

#include <format>
#include <limits>

#include "core/XcursorError.h"

namespace XcurScale {

uint64_t XcursorWriter::chunkByteLength(const XcursorChunk& chunk) {
    if (const auto* image = std::get_if<XcursorImageChunk>(&chunk)) {
        return XCURSOR_IMAGE_HEADER_LEN + static_cast<uint64_t>(image->pixels.size()) * 4;
    }
    return std::get<XcursorOpaqueChunk>(chunk).bytes.size();
}

std::vector<uint32_t> XcursorWriter::computeLayout(const XcursorFile& file) {
    std::vector<uint32_t> positions;
    positions.reserve(file.entries.size());

    uint64_t next = XCURSOR_FILE_HEADER_LEN +
                    static_cast<uint64_t>(file.entries.size()) * XCURSOR_TOC_ENTRY_LEN;
    for (size_t i = 0; i < file.entries.size(); ++i) {
        if (next > std::numeric_limits<uint32_t>::max()) {
            throw XcursorError(XcursorErrc::OutputTooLarge,
                               std::format("entry {} would start at offset {}, beyond the 32-bit limit", i, next));
        }
        positions.push_back(static_cast<uint32_t>(next));
        next += chunkByteLength(file.entries[i].chunk);
    }
    return positions;
}

std::vector<uint8_t> XcursorWriter::serialize(const XcursorFile& file) {
    for (size_t i = 0; i < file.entries.size(); ++i) {
        const auto& entry = file.entries[i];
        if (entry.isImage() && !entry.image().hasConsistentPixels()) {
            const auto& image = entry.image();
            throw XcursorError(XcursorErrc::PixelBufferMismatch,
                               std::format("image {} is {}x{} but holds {} pixels",
                                           i, image.width, image.height, image.pixels.size()));
        }
    }

    const std::vector<uint32_t> positions = computeLayout(file);

    uint64_t total = XCURSOR_FILE_HEADER_LEN + static_cast<uint64_t>(file.entries.size()) * XCURSOR_TOC_ENTRY_LEN;
    for (const auto& entry : file.entries) {
        total += chunkByteLength(entry.chunk);
    }

    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(total));

    XcursorFileHeader header;
    header.magic = file.magic;
    header.version = file.version;
    header.ntoc = static_cast<uint32_t>(file.entries.size());
    header.encode(data);

    for (size_t i = 0; i < file.entries.size(); ++i) {
        const auto& toc = file.entries[i].toc;
        XcursorTocRecord{toc.type, toc.subtype, positions[i]}.encode(data);
    }

    for (const auto& entry : file.entries) {
        if (entry.isImage()) {
            const auto& image = entry.image();
            XcursorImageHeader imageHeader;
            imageHeader.header = XCURSOR_IMAGE_HEADER_LEN;
            imageHeader.type = entry.toc.type;
            imageHeader.subtype = entry.toc.subtype;
            imageHeader.version = image.version;
            imageHeader.width = image.width;
            imageHeader.height = image.height;
            imageHeader.xhot = image.xhot;
            imageHeader.yhot = image.yhot;
            imageHeader.delay = image.delay;
            imageHeader.encode(data);

            for (uint32_t pixel : image.pixels) {
                appendLE32(data, pixel);
            }
        } else {
            const auto& bytes = entry.opaque().bytes;
            data.insert(data.end(), bytes.begin(), bytes.end());
        }
    }

    return data;
}

} // namespace XcurScale
