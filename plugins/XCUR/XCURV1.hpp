#ifndef XCURV1_HPP
#define XCURV1_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <variant>
#include <vector>

namespace XcurScale {

// Xcursor file format, version 1.0 as written by libXcursor.
// All integers are little-endian regardless of the host.

constexpr uint32_t XCURSOR_MAGIC = 0x72756358;          // "Xcur"
constexpr uint32_t XCURSOR_FILE_VERSION = 0x00010000;   // major 1, minor 0
constexpr uint32_t XCURSOR_FILE_MAJOR = 1;
constexpr uint32_t XCURSOR_FILE_HEADER_LEN = 16;
constexpr uint32_t XCURSOR_TOC_ENTRY_LEN = 12;

constexpr uint32_t XCURSOR_IMAGE_TYPE = 0xFFFD0002;
constexpr uint32_t XCURSOR_IMAGE_VERSION = 1;
constexpr uint32_t XCURSOR_IMAGE_HEADER_LEN = 36;
constexpr uint32_t XCURSOR_IMAGE_MAX_SIZE = 0x7FFF;     // per dimension

constexpr uint32_t XCURSOR_COMMENT_TYPE = 0xFFFE0001;

inline uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void appendLE32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

// On-disk records. Field order matches the file; decode() reads them
// byte by byte so host endianness never matters.
#pragma pack(push, 1)

struct XcursorFileHeader {
    uint32_t magic;     // "Xcur"
    uint32_t header;    // bytes in this header (16)
    uint32_t version;   // file version
    uint32_t ntoc;      // number of toc entries

    XcursorFileHeader()
        : magic(XCURSOR_MAGIC), header(XCURSOR_FILE_HEADER_LEN),
          version(XCURSOR_FILE_VERSION), ntoc(0) {}

    static XcursorFileHeader decode(const uint8_t* p) {
        XcursorFileHeader h;
        h.magic = readLE32(p);
        h.header = readLE32(p + 4);
        h.version = readLE32(p + 8);
        h.ntoc = readLE32(p + 12);
        return h;
    }

    void encode(std::vector<uint8_t>& out) const {
        appendLE32(out, magic);
        appendLE32(out, header);
        appendLE32(out, version);
        appendLE32(out, ntoc);
    }
};

struct XcursorTocRecord {
    uint32_t type;      // chunk type
    uint32_t subtype;   // nominal size for images
    uint32_t position;  // absolute offset of the chunk

    static XcursorTocRecord decode(const uint8_t* p) {
        return XcursorTocRecord{readLE32(p), readLE32(p + 4), readLE32(p + 8)};
    }

    void encode(std::vector<uint8_t>& out) const {
        appendLE32(out, type);
        appendLE32(out, subtype);
        appendLE32(out, position);
    }
};

struct XcursorImageHeader {
    uint32_t header;    // bytes in this header (36)
    uint32_t type;      // repeats the toc type
    uint32_t subtype;   // repeats the toc subtype
    uint32_t version;   // image version (1)
    uint32_t width;
    uint32_t height;
    uint32_t xhot;
    uint32_t yhot;
    uint32_t delay;     // milliseconds

    static XcursorImageHeader decode(const uint8_t* p) {
        XcursorImageHeader h;
        h.header = readLE32(p);
        h.type = readLE32(p + 4);
        h.subtype = readLE32(p + 8);
        h.version = readLE32(p + 12);
        h.width = readLE32(p + 16);
        h.height = readLE32(p + 20);
        h.xhot = readLE32(p + 24);
        h.yhot = readLE32(p + 28);
        h.delay = readLE32(p + 32);
        return h;
    }

    void encode(std::vector<uint8_t>& out) const {
        appendLE32(out, header);
        appendLE32(out, type);
        appendLE32(out, subtype);
        appendLE32(out, version);
        appendLE32(out, width);
        appendLE32(out, height);
        appendLE32(out, xhot);
        appendLE32(out, yhot);
        appendLE32(out, delay);
    }
};

#pragma pack(pop)

static_assert(sizeof(XcursorFileHeader) == XCURSOR_FILE_HEADER_LEN, "file header layout");
static_assert(sizeof(XcursorTocRecord) == XCURSOR_TOC_ENTRY_LEN, "toc entry layout");
static_assert(sizeof(XcursorImageHeader) == XCURSOR_IMAGE_HEADER_LEN, "image header layout");

// In-memory document model

struct XcursorTocEntry {
    uint32_t type = 0;
    uint32_t subtype = 0;
    // Offset in the file this entry was read from. Layout only: the writer
    // recomputes it and equality ignores it.
    uint32_t position = 0;

    bool isImage() const { return type == XCURSOR_IMAGE_TYPE; }
};

struct XcursorImageChunk {
    uint32_t version = XCURSOR_IMAGE_VERSION;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t xhot = 0;
    uint32_t yhot = 0;
    uint32_t delay = 0;
    std::vector<uint32_t> pixels; // premultiplied ARGB, row-major

    size_t expectedPixelCount() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height);
    }
    bool hasConsistentPixels() const { return pixels.size() == expectedPixelCount(); }

    bool operator==(const XcursorImageChunk& other) const {
        return version == other.version && width == other.width &&
               height == other.height && xhot == other.xhot &&
               yhot == other.yhot && delay == other.delay &&
               pixels == other.pixels;
    }
    bool operator!=(const XcursorImageChunk& other) const { return !(*this == other); }
};

// Any chunk that is not an image: comments and types we do not know.
struct XcursorOpaqueChunk {
    std::vector<uint8_t> bytes;

    bool operator==(const XcursorOpaqueChunk& other) const { return bytes == other.bytes; }
    bool operator!=(const XcursorOpaqueChunk& other) const { return !(*this == other); }
};

using XcursorChunk = std::variant<XcursorImageChunk, XcursorOpaqueChunk>;

struct XcursorEntry {
    XcursorTocEntry toc;
    XcursorChunk chunk;

    bool isImage() const { return std::holds_alternative<XcursorImageChunk>(chunk); }
    XcursorImageChunk& image() { return std::get<XcursorImageChunk>(chunk); }
    const XcursorImageChunk& image() const { return std::get<XcursorImageChunk>(chunk); }
    const XcursorOpaqueChunk& opaque() const { return std::get<XcursorOpaqueChunk>(chunk); }

    bool operator==(const XcursorEntry& other) const {
        return toc.type == other.toc.type && toc.subtype == other.toc.subtype &&
               chunk == other.chunk;
    }
    bool operator!=(const XcursorEntry& other) const { return !(*this == other); }
};

// One parsed cursor file. Entries keep the order of the table of contents.
struct XcursorFile {
    uint32_t magic = XCURSOR_MAGIC;
    uint32_t version = XCURSOR_FILE_VERSION;
    std::vector<XcursorEntry> entries;

    size_t entryCount() const { return entries.size(); }

    size_t imageCount() const {
        size_t count = 0;
        for (const auto& entry : entries) {
            if (entry.isImage()) ++count;
        }
        return count;
    }

    bool operator==(const XcursorFile& other) const {
        return magic == other.magic && version == other.version && entries == other.entries;
    }
    bool operator!=(const XcursorFile& other) const { return !(*this == other); }
};

} // namespace XcurScale

#endif // XCURV1_HPP
