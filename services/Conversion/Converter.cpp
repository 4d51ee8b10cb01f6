#include "Converter.h"

#include <format>

#include "core/XcursorError.h"
#include "plugins/XCUR/XcursorReader.h"
#include "plugins/XCUR/XcursorWriter.h"
#include "services/Upscaler/Upscaler.h"

namespace XcurScale {

void Converter::scaleDocument(XcursorFile& file, uint32_t factor, const ConversionOptions& options) {
    if (factor == 0) {
        throw XcursorError(XcursorErrc::InvalidScaleFactor, "scale factor must be at least 1");
    }

    for (auto& entry : file.entries) {
        if (!entry.isImage()) {
            continue;
        }
        entry.image() = Upscaler::scale(entry.image(), factor);
        if (options.scaleNominalSize) {
            const uint64_t nominal = static_cast<uint64_t>(entry.toc.subtype) * factor;
            if (nominal > UINT32_MAX) {
                throw XcursorError(XcursorErrc::ScaledSizeOverflow,
                                   std::format("nominal size {} scaled by {} does not fit in 32 bits",
                                               entry.toc.subtype, factor));
            }
            entry.toc.subtype = static_cast<uint32_t>(nominal);
        }
    }
}

std::vector<uint8_t> Converter::convert(const std::vector<uint8_t>& input, uint32_t factor,
                                        const ConversionOptions& options) {
    XcursorFile file = XcursorReader::parse(input);
    scaleDocument(file, factor, options);
    return XcursorWriter::serialize(file);
}

} // namespace XcurScale
