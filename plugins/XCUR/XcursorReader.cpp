#include "XcursorReader.h"

#include <format>

#include "core/XcursorError.h"

namespace XcurScale {

bool XcursorReader::hasSignature(const uint8_t* data, size_t size) {
    return size >= 4 && readLE32(data) == XCURSOR_MAGIC;
}

XcursorFile XcursorReader::parse(const std::vector<uint8_t>& data) {
    return parse(data.data(), data.size());
}

XcursorFile XcursorReader::parse(const uint8_t* data, size_t size) {
    if (size < XCURSOR_FILE_HEADER_LEN || !hasSignature(data, size)) {
        throw XcursorError(XcursorErrc::NotAnXcursorFile, "missing Xcursor signature");
    }

    XcursorFileHeader header = XcursorFileHeader::decode(data);
    if (header.header < XCURSOR_FILE_HEADER_LEN) {
        throw XcursorError(XcursorErrc::InconsistentChunkHeader,
                           std::format("file header declares {} bytes, expected at least {}",
                                       header.header, XCURSOR_FILE_HEADER_LEN));
    }
    if ((header.version >> 16) != XCURSOR_FILE_MAJOR) {
        throw XcursorError(XcursorErrc::UnsupportedVersion,
                           std::format("unsupported file version 0x{:08X}", header.version));
    }

    // The declared header may be longer than the fields we know; skip the rest
    const uint64_t tocStart = header.header;
    const uint64_t tocEnd = tocStart + static_cast<uint64_t>(header.ntoc) * XCURSOR_TOC_ENTRY_LEN;
    if (tocEnd > size) {
        throw XcursorError(XcursorErrc::TruncatedData,
                           std::format("table of contents with {} entries runs past end of file ({} bytes)",
                                       header.ntoc, size));
    }

    std::vector<XcursorTocEntry> toc;
    toc.reserve(header.ntoc);
    for (uint32_t i = 0; i < header.ntoc; ++i) {
        XcursorTocRecord record = XcursorTocRecord::decode(data + tocStart + i * XCURSOR_TOC_ENTRY_LEN);
        toc.push_back(XcursorTocEntry{record.type, record.subtype, record.position});
    }

    XcursorFile file;
    file.magic = header.magic;
    file.version = header.version;
    file.entries.reserve(toc.size());

    for (size_t i = 0; i < toc.size(); ++i) {
        if (toc[i].position >= size) {
            throw XcursorError(XcursorErrc::TruncatedData,
                               std::format("entry {} points at offset {} past end of file ({} bytes)",
                                           i, toc[i].position, size));
        }
        if (toc[i].isImage()) {
            file.entries.push_back(XcursorEntry{toc[i], readImage(data, size, toc[i], i)});
        } else {
            file.entries.push_back(XcursorEntry{toc[i], readOpaque(data, size, toc, i)});
        }
    }

    return file;
}

XcursorImageChunk XcursorReader::readImage(const uint8_t* data, size_t size,
                                           const XcursorTocEntry& toc, size_t index) {
    const uint64_t start = toc.position;
    if (start + XCURSOR_IMAGE_HEADER_LEN > size) {
        throw XcursorError(XcursorErrc::TruncatedData,
                           std::format("image {} header at offset {} runs past end of file", index, start));
    }

    XcursorImageHeader header = XcursorImageHeader::decode(data + start);
    if (header.header < XCURSOR_IMAGE_HEADER_LEN) {
        throw XcursorError(XcursorErrc::InconsistentChunkHeader,
                           std::format("image {} declares a {} byte header, expected at least {}",
                                       index, header.header, XCURSOR_IMAGE_HEADER_LEN));
    }
    if (header.type != toc.type) {
        throw XcursorError(XcursorErrc::InconsistentChunkHeader,
                           std::format("image {} chunk type 0x{:08X} does not match toc type 0x{:08X}",
                                       index, header.type, toc.type));
    }
    if (header.subtype != toc.subtype) {
        throw XcursorError(XcursorErrc::InconsistentChunkHeader,
                           std::format("image {} chunk nominal size {} does not match toc nominal size {}",
                                       index, header.subtype, toc.subtype));
    }
    if (header.version > XCURSOR_IMAGE_VERSION) {
        throw XcursorError(XcursorErrc::UnsupportedVersion,
                           std::format("image {} has unsupported version {}", index, header.version));
    }
    if (header.width == 0 || header.height == 0 ||
        header.width > XCURSOR_IMAGE_MAX_SIZE || header.height > XCURSOR_IMAGE_MAX_SIZE) {
        throw XcursorError(XcursorErrc::InvalidImageGeometry,
                           std::format("image {} has invalid dimensions {}x{}", index, header.width, header.height));
    }
    if (header.xhot >= header.width || header.yhot >= header.height) {
        throw XcursorError(XcursorErrc::InvalidImageGeometry,
                           std::format("image {} hotspot ({}, {}) lies outside {}x{}",
                                       index, header.xhot, header.yhot, header.width, header.height));
    }

    XcursorImageChunk image;
    image.version = header.version;
    image.width = header.width;
    image.height = header.height;
    image.xhot = header.xhot;
    image.yhot = header.yhot;
    image.delay = header.delay;

    const uint64_t pixelStart = start + header.header;
    const uint64_t pixelCount = static_cast<uint64_t>(header.width) * header.height;
    if (pixelStart + pixelCount * 4 > size) {
        const uint64_t available = pixelStart < size ? (size - pixelStart) / 4 : 0;
        throw XcursorError(XcursorErrc::TruncatedPixelData,
                           std::format("image {} declares {}x{} pixels but only {} are present",
                                       index, header.width, header.height, available));
    }

    image.pixels.resize(static_cast<size_t>(pixelCount));
    const uint8_t* pixels = data + pixelStart;
    for (size_t i = 0; i < image.pixels.size(); ++i) {
        image.pixels[i] = readLE32(pixels + i * 4);
    }
    return image;
}

XcursorOpaqueChunk XcursorReader::readOpaque(const uint8_t* data, size_t size,
                                             const std::vector<XcursorTocEntry>& toc, size_t index) {
    // The chunk runs until the next chunk that starts after it, whatever its
    // place in the table of contents, or to the end of the file.
    const uint32_t start = toc[index].position;
    uint64_t end = size;
    for (const auto& other : toc) {
        if (other.position > start && other.position < end) {
            end = other.position;
        }
    }

    XcursorOpaqueChunk chunk;
    chunk.bytes.assign(data + start, data + end);
    return chunk;
}

} // namespace XcurScale
