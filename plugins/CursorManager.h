#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "plugins/XCUR/XCUR.h"
#include "services/Conversion/Converter.h"

namespace XcurScale {

class CFG;

struct CursorJob {
    std::string input;
    std::string output;
};

struct BatchSettings {
    uint32_t scaleFactor = 0;
    ConversionOptions options;
    bool ignoreUnrecognized = false;
    // Files converted at the same time, at least 1
    unsigned int jobs = 1;

    static BatchSettings fromConfig(const CFG& config);
};

/**
 * @brief Runs the per-file operations of XCUR over a list of files
 *
 * Files are independent: each one is read, converted and written by its own
 * task, and a failure never stops the rest of the batch. Results are kept in
 * input order whatever order the tasks finish in.
 */
class CursorManager {
public:
    explicit CursorManager(const BatchSettings& settings);
    ~CursorManager() = default;

    // Match inputs with -o outputs. No outputs means convert in place;
    // otherwise the counts must be equal. Fails when two jobs would write
    // the same file or one job would overwrite another job's input.
    static bool pairOutputs(const std::vector<std::string>& inputs,
                            const std::vector<std::string>& outputs,
                            std::vector<CursorJob>& jobs);

    // True when every job was converted or skipped
    bool scaleAll(const std::vector<CursorJob>& jobs);
    // Appends one summary per input to report; false if any input failed
    bool describeAll(const std::vector<std::string>& inputs, nlohmann::json& report);
    bool extractAll(const std::vector<std::string>& inputs, const std::string& outputDir);

    struct BatchStats {
        int total = 0;
        int converted = 0;
        int skipped = 0;
        int failed = 0;
        std::chrono::milliseconds totalTime{0};
    };

    BatchStats getLastBatchStats() const { return lastBatchStats_; }
    const std::vector<CursorResult>& getLastResults() const { return lastResults_; }
    const BatchSettings& getSettings() const { return settings_; }

private:
    CursorManager(const CursorManager&) = delete;
    CursorManager& operator=(const CursorManager&) = delete;

    BatchSettings settings_;
    BatchStats lastBatchStats_;
    std::vector<CursorResult> lastResults_;

    template <typename Task>
    void runBatch(size_t count, Task task);
    void resetBatchStats();
    void collectStats();
    void logBatchResults(const std::string& operation, const BatchStats& stats);
};

} // namespace XcurScale
