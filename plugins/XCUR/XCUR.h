#ifndef XCUR_H
#define XCUR_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/XcursorError.h"
#include "plugins/CommandRegistry.h"
#include "services/Conversion/Converter.h"
#include "XCURV1.hpp"

namespace XcurScale {

enum class ConversionStatus {
    Converted,
    Skipped,
    Failed
};

const char* toString(ConversionStatus status);

struct CursorResult {
    std::string input;
    std::string output;
    ConversionStatus status = ConversionStatus::Failed;
    // Set when the failure (or skip) came from the cursor pipeline
    std::optional<XcursorErrc> error;
    std::string message;
};

/**
 * @class XCUR
 * One Xcursor file on disk: loading, scaling to an output path, describing
 * its table of contents and dumping its frames as PNG.
 */
class XCUR {
public:
    explicit XCUR(const std::string& inputPath);
    ~XCUR() = default;

    // Read the file into memory; false (logged) on I/O failure
    bool load();
    bool isLoaded() const { return loaded_; }
    const std::string& getInputPath() const { return inputPath_; }
    const std::vector<uint8_t>& getFileData() const { return originalFileData; }

    /**
     * @brief Scale the cursor and write it to outputPath
     *
     * The output is written next to its destination and renamed into place,
     * so converting in place never leaves a half-written file behind.
     * With ignoreUnrecognized set, an input that is not an Xcursor file at
     * all yields Skipped instead of Failed.
     */
    CursorResult convert(const std::string& outputPath, uint32_t factor,
                         const ConversionOptions& options, bool ignoreUnrecognized);

    // JSON summary of the table of contents; error details when unparsable
    nlohmann::json describe();

    // Write every image as <stem>_<index>_<nominal>_<w>x<h>.png into outputDir
    CursorResult extract(const std::string& outputDir, bool ignoreUnrecognized);

    // Plugin metadata
    std::string getPluginName() const { return "XCUR"; }

    // Register plugin commands
    static void registerCommands(CommandTable& commandTable);

    // Write bytes to path through a temporary file in the same directory
    static bool writeFileAtomically(const std::string& path, const std::vector<uint8_t>& data);

private:
    std::string inputPath_;
    bool loaded_ = false;
    std::vector<uint8_t> originalFileData;

    CursorResult makeResult(const std::string& output) const;
    void recordError(CursorResult& result, const XcursorError& e, bool ignoreUnrecognized) const;
};

} // namespace XcurScale

#endif // XCUR_H
