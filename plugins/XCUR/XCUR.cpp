#include "XCUR.h"

#include <charconv>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <iterator>

#include "core/CFG.h"
#include "core/Logging/Logging.h"
#include "plugins/CursorManager.h"
#include "plugins/PNG/PNG.h"
#include "XcursorReader.h"

namespace fs = std::filesystem;

namespace XcurScale {

const char* toString(ConversionStatus status) {
    switch (status) {
        case ConversionStatus::Converted: return "converted";
        case ConversionStatus::Skipped: return "skipped";
        case ConversionStatus::Failed: return "failed";
    }
    return "unknown";
}

XCUR::XCUR(const std::string& inputPath) : inputPath_(inputPath) {}

bool XCUR::load() {
    if (loaded_) {
        return true;
    }

    std::ifstream file(inputPath_, std::ios::binary);
    if (!file.is_open()) {
        Log(ERROR, "XCUR", "Cannot open file: {}", inputPath_);
        return false;
    }

    originalFileData.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Log(ERROR, "XCUR", "Failed to read file: {}", inputPath_);
        originalFileData.clear();
        return false;
    }

    loaded_ = true;
    Log(DEBUG, "XCUR", "Loaded {} ({} bytes)", inputPath_, originalFileData.size());
    return true;
}

CursorResult XCUR::makeResult(const std::string& output) const {
    CursorResult result;
    result.input = inputPath_;
    result.output = output;
    return result;
}

void XCUR::recordError(CursorResult& result, const XcursorError& e, bool ignoreUnrecognized) const {
    result.error = e.code();
    result.message = e.what();

    if (e.code() == XcursorErrc::NotAnXcursorFile && ignoreUnrecognized) {
        Log(DEBUG, "XCUR", "Skipping {}: not an Xcursor file", inputPath_);
        result.status = ConversionStatus::Skipped;
        return;
    }

    if (e.code() == XcursorErrc::NotAnXcursorFile) {
        Log(ERROR, "XCUR", "{} doesn't seem to be a valid Xcursor file", inputPath_);
    } else {
        Log(ERROR, "XCUR", "{}: {} ({})", inputPath_, e.what(), e.kind());
    }
    result.status = ConversionStatus::Failed;
}

CursorResult XCUR::convert(const std::string& outputPath, uint32_t factor,
                           const ConversionOptions& options, bool ignoreUnrecognized) {
    CursorResult result = makeResult(outputPath);
    if (!load()) {
        result.message = "cannot read input";
        return result;
    }

    std::vector<uint8_t> scaled;
    try {
        scaled = Converter::convert(originalFileData, factor, options);
    } catch (const XcursorError& e) {
        recordError(result, e, ignoreUnrecognized);
        return result;
    }

    if (!writeFileAtomically(outputPath, scaled)) {
        result.message = "cannot write output";
        return result;
    }

    Log(DEBUG, "XCUR", "Scaled {} by {} into {} ({} -> {} bytes)",
        inputPath_, factor, outputPath, originalFileData.size(), scaled.size());
    result.status = ConversionStatus::Converted;
    return result;
}

nlohmann::json XCUR::describe() {
    nlohmann::json summary = {{"file", inputPath_}};
    if (!load()) {
        summary["error"] = "IOError";
        summary["message"] = "cannot read input";
        return summary;
    }

    XcursorFile file;
    try {
        file = XcursorReader::parse(originalFileData);
    } catch (const XcursorError& e) {
        summary["error"] = e.kind();
        summary["message"] = e.what();
        return summary;
    }

    summary["version"] = std::format("{}.{}", file.version >> 16, file.version & 0xFFFF);
    summary["bytes"] = originalFileData.size();

    nlohmann::json entries = nlohmann::json::array();
    for (size_t i = 0; i < file.entries.size(); ++i) {
        const auto& entry = file.entries[i];
        nlohmann::json item = {
            {"index", i},
            {"typeId", std::format("0x{:08X}", entry.toc.type)},
            {"subtype", entry.toc.subtype},
            {"position", entry.toc.position}
        };
        if (entry.isImage()) {
            const auto& image = entry.image();
            item["type"] = "image";
            item["width"] = image.width;
            item["height"] = image.height;
            item["xhot"] = image.xhot;
            item["yhot"] = image.yhot;
            item["delay"] = image.delay;
        } else {
            item["type"] = entry.toc.type == XCURSOR_COMMENT_TYPE ? "comment" : "unknown";
            item["bytes"] = entry.opaque().bytes.size();
        }
        entries.push_back(std::move(item));
    }
    summary["entries"] = std::move(entries);
    return summary;
}

CursorResult XCUR::extract(const std::string& outputDir, bool ignoreUnrecognized) {
    CursorResult result = makeResult(outputDir);
    if (!load()) {
        result.message = "cannot read input";
        return result;
    }

    XcursorFile file;
    try {
        file = XcursorReader::parse(originalFileData);
    } catch (const XcursorError& e) {
        recordError(result, e, ignoreUnrecognized);
        return result;
    }

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        Log(ERROR, "XCUR", "Failed to create directory {}: {}", outputDir, ec.message());
        result.message = ec.message();
        return result;
    }

    const std::string stem = fs::path(inputPath_).filename().string();
    size_t written = 0;
    for (size_t i = 0; i < file.entries.size(); ++i) {
        if (!file.entries[i].isImage()) {
            continue;
        }
        const auto& image = file.entries[i].image();

        std::vector<uint32_t> straight(image.pixels.size());
        for (size_t p = 0; p < image.pixels.size(); ++p) {
            straight[p] = PNG::unpremultiplyARGB(image.pixels[p]);
        }

        const std::string name = std::format("{}_{}_{}_{}x{}.png", stem, i, file.entries[i].toc.subtype,
                                             image.width, image.height);
        const std::string path = (fs::path(outputDir) / name).string();
        if (!PNG::savePNG(path, straight, static_cast<int>(image.width), static_cast<int>(image.height))) {
            result.message = std::format("cannot write {}", path);
            return result;
        }
        ++written;
    }

    Log(DEBUG, "XCUR", "Extracted {} image(s) from {} into {}", written, inputPath_, outputDir);
    result.status = ConversionStatus::Converted;
    return result;
}

bool XCUR::writeFileAtomically(const std::string& path, const std::vector<uint8_t>& data) {
    const fs::path target(path);
    fs::path temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            Log(ERROR, "XCUR", "Could not create file: {}", temp.string());
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.close();
        if (!out) {
            Log(ERROR, "XCUR", "Failed to write {}", temp.string());
            std::error_code ignored;
            fs::remove(temp, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        Log(ERROR, "XCUR", "Failed to move {} into place: {}", target.string(), ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return false;
    }
    return true;
}

// Command line

namespace {

bool parseCount(const char* text, uint32_t& value) {
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    return ec == std::errc() && ptr == end;
}

std::vector<std::string> remainingArguments(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = optind; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

const char* SCALE_USAGE = "scale -s <factor> [-i] [-n] [-j <jobs>] [-o <output>]... <input>...";
const char* INFO_USAGE = "info [-i] <input>...";
const char* EXTRACT_USAGE = "extract [-d <directory>] [-i] <input>...";

int runScale(int argc, char** argv) {
    static const option longOptions[] = {
        {"scale", required_argument, nullptr, 's'},
        {"ignore-unrecognized", no_argument, nullptr, 'i'},
        {"scale-nominal-size", no_argument, nullptr, 'n'},
        {"jobs", required_argument, nullptr, 'j'},
        {"output", required_argument, nullptr, 'o'},
        {nullptr, 0, nullptr, 0}
    };

    std::vector<std::string> outputs;
    optind = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "s:inj:o:", longOptions, nullptr)) != -1) {
        uint32_t value = 0;
        switch (opt) {
            case 's':
                if (!parseCount(optarg, value) || value == 0) {
                    Log(ERROR, "XCUR", "Invalid scale factor '{}': expected a positive integer", optarg);
                    return 1;
                }
                XCS_CFG.ScaleFactor = value;
                break;
            case 'i':
                XCS_CFG.IgnoreUnrecognized = true;
                break;
            case 'n':
                XCS_CFG.ScaleNominalSize = true;
                break;
            case 'j':
                if (!parseCount(optarg, value)) {
                    Log(ERROR, "XCUR", "Invalid job count '{}'", optarg);
                    return 1;
                }
                XCS_CFG.Jobs = static_cast<int>(value);
                break;
            case 'o':
                outputs.emplace_back(optarg);
                break;
            default:
                std::cerr << "Usage: xcurscale " << SCALE_USAGE << std::endl;
                return 1;
        }
    }

    if (XCS_CFG.ScaleFactor == 0) {
        Log(ERROR, "XCUR", "No scale factor given (use -s <factor> or ScaleFactor in the config file)");
        return 1;
    }
    if (!XCS_CFG.isScaleFactorValid()) {
        Log(ERROR, "XCUR", "Scale factor {} is larger than any cursor image can be", XCS_CFG.ScaleFactor);
        return 1;
    }

    std::vector<std::string> inputs = remainingArguments(argc, argv);
    if (inputs.empty()) {
        Log(ERROR, "XCUR", "No input files given");
        std::cerr << "Usage: xcurscale " << SCALE_USAGE << std::endl;
        return 1;
    }

    std::vector<CursorJob> jobs;
    if (!CursorManager::pairOutputs(inputs, outputs, jobs)) {
        return 1;
    }

    CursorManager manager(BatchSettings::fromConfig(XCS_CFG));
    return manager.scaleAll(jobs) ? 0 : 1;
}

int runInfo(int argc, char** argv) {
    static const option longOptions[] = {
        {"ignore-unrecognized", no_argument, nullptr, 'i'},
        {nullptr, 0, nullptr, 0}
    };

    optind = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "i", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'i':
                XCS_CFG.IgnoreUnrecognized = true;
                break;
            default:
                std::cerr << "Usage: xcurscale " << INFO_USAGE << std::endl;
                return 1;
        }
    }

    std::vector<std::string> inputs = remainingArguments(argc, argv);
    if (inputs.empty()) {
        std::cerr << "Usage: xcurscale " << INFO_USAGE << std::endl;
        return 1;
    }

    CursorManager manager(BatchSettings::fromConfig(XCS_CFG));
    nlohmann::json report = nlohmann::json::array();
    bool success = manager.describeAll(inputs, report);
    std::cout << report.dump(2) << std::endl;
    return success ? 0 : 1;
}

int runExtract(int argc, char** argv) {
    static const option longOptions[] = {
        {"directory", required_argument, nullptr, 'd'},
        {"ignore-unrecognized", no_argument, nullptr, 'i'},
        {nullptr, 0, nullptr, 0}
    };

    std::string directory = ".";
    optind = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "d:i", longOptions, nullptr)) != -1) {
        switch (opt) {
            case 'd':
                directory = optarg;
                break;
            case 'i':
                XCS_CFG.IgnoreUnrecognized = true;
                break;
            default:
                std::cerr << "Usage: xcurscale " << EXTRACT_USAGE << std::endl;
                return 1;
        }
    }

    std::vector<std::string> inputs = remainingArguments(argc, argv);
    if (inputs.empty()) {
        std::cerr << "Usage: xcurscale " << EXTRACT_USAGE << std::endl;
        return 1;
    }

    CursorManager manager(BatchSettings::fromConfig(XCS_CFG));
    return manager.extractAll(inputs, directory) ? 0 : 1;
}

} // namespace

void XCUR::registerCommands(CommandTable& commandTable) {
    commandTable["scale"] = {"Scale every image in Xcursor files by an integer factor", SCALE_USAGE, runScale};
    commandTable["info"] = {"Print the table of contents of Xcursor files as JSON", INFO_USAGE, runInfo};
    commandTable["extract"] = {"Write every image of Xcursor files as PNG", EXTRACT_USAGE, runExtract};
}

} // namespace XcurScale
