#pragma once

#include <stdexcept>
#include <string>

namespace XcurScale {

// Every failure the cursor pipeline can report. Parse and scale errors share
// one enum so the conversion driver can pass them through untouched.
enum class XcursorErrc {
    // structural
    NotAnXcursorFile,
    UnsupportedVersion,
    TruncatedData,
    InconsistentChunkHeader,
    TruncatedPixelData,
    InvalidImageGeometry,
    // geometric
    PixelBufferMismatch,
    InvalidScaleFactor,
    ScaledSizeOverflow,
    // output
    OutputTooLarge
};

inline const char* toString(XcursorErrc code) {
    switch (code) {
        case XcursorErrc::NotAnXcursorFile: return "NotAnXcursorFile";
        case XcursorErrc::UnsupportedVersion: return "UnsupportedVersion";
        case XcursorErrc::TruncatedData: return "TruncatedData";
        case XcursorErrc::InconsistentChunkHeader: return "InconsistentChunkHeader";
        case XcursorErrc::TruncatedPixelData: return "TruncatedPixelData";
        case XcursorErrc::InvalidImageGeometry: return "InvalidImageGeometry";
        case XcursorErrc::PixelBufferMismatch: return "PixelBufferMismatch";
        case XcursorErrc::InvalidScaleFactor: return "InvalidScaleFactor";
        case XcursorErrc::ScaledSizeOverflow: return "ScaledSizeOverflow";
        case XcursorErrc::OutputTooLarge: return "OutputTooLarge";
    }
    return "Unknown";
}

/**
 * @brief Typed error raised by the reader, scaler, writer and converter.
 *
 * what() carries a human readable description, code() the kind callers
 * branch on (e.g. to skip files that are not cursors at all).
 */
class XcursorError : public std::runtime_error {
public:
    XcursorError(XcursorErrc code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    XcursorErrc code() const noexcept { return code_; }
    const char* kind() const noexcept { return toString(code_); }

private:
    XcursorErrc code_;
};

} // namespace XcurScale
