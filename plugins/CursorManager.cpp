#include "CursorManager.h"

#include <algorithm>
#include <filesystem>
#include <future>
#include <map>

#include "core/CFG.h"
#include "core/Logging/Logging.h"

namespace fs = std::filesystem;

namespace XcurScale {

BatchSettings BatchSettings::fromConfig(const CFG& config) {
    BatchSettings settings;
    settings.scaleFactor = config.ScaleFactor;
    settings.options.scaleNominalSize = config.ScaleNominalSize;
    settings.ignoreUnrecognized = config.IgnoreUnrecognized;
    settings.jobs = config.effectiveJobs();
    return settings;
}

CursorManager::CursorManager(const BatchSettings& settings) : settings_(settings) {
    if (settings_.jobs == 0) {
        settings_.jobs = 1;
    }
}

namespace {

// Two spellings of the same file ("a.cur", "./a.cur", a symlink) share a key
std::string pathKey(const std::string& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        resolved = fs::absolute(path, ec);
        if (ec) {
            resolved = path;
        }
    }
    return resolved.lexically_normal().string();
}

} // namespace

bool CursorManager::pairOutputs(const std::vector<std::string>& inputs,
                                const std::vector<std::string>& outputs,
                                std::vector<CursorJob>& jobs) {
    jobs.clear();
    if (!outputs.empty() && outputs.size() != inputs.size()) {
        Log(ERROR, "CursorManager", "Got {} input file(s) but {} output file(s); give one -o per input or none",
            inputs.size(), outputs.size());
        return false;
    }

    std::vector<CursorJob> paired;
    paired.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        paired.push_back({inputs[i], outputs.empty() ? inputs[i] : outputs[i]});
    }

    // Jobs run concurrently, so no file may be written twice or be replaced
    // while another job still reads it
    std::map<std::string, size_t> writers;
    std::map<std::string, size_t> readers;
    for (const auto& job : paired) {
        readers[pathKey(job.input)]++;
    }
    for (size_t i = 0; i < paired.size(); ++i) {
        const std::string key = pathKey(paired[i].output);
        auto [it, inserted] = writers.emplace(key, i);
        if (!inserted) {
            Log(ERROR, "CursorManager", "{} would be written by both {} and {}",
                paired[i].output, paired[it->second].input, paired[i].input);
            return false;
        }
        auto reader = readers.find(key);
        const size_t ownRead = pathKey(paired[i].input) == key ? 1 : 0;
        if (reader != readers.end() && reader->second > ownRead) {
            Log(ERROR, "CursorManager", "{} is read by another job and would be overwritten by the result of {}",
                paired[i].output, paired[i].input);
            return false;
        }
    }

    jobs = std::move(paired);
    return true;
}

// Run task(i) for i in [0, count) with at most settings_.jobs tasks in
// flight. Each task fills lastResults_[i].
template <typename Task>
void CursorManager::runBatch(size_t count, Task task) {
    lastResults_.assign(count, CursorResult{});
    std::vector<std::future<CursorResult>> futures(count);

    auto collect = [this, &futures](size_t index) {
        try {
            lastResults_[index] = futures[index].get();
        } catch (const std::exception& e) {
            Log(ERROR, "CursorManager", "Task failed with exception: {}", e.what());
            lastResults_[index].status = ConversionStatus::Failed;
            lastResults_[index].message = e.what();
        }
    };

    const size_t window = settings_.jobs;
    for (size_t i = 0; i < count; ++i) {
        if (i >= window) {
            collect(i - window);
        }
        futures[i] = std::async(std::launch::async, task, i);
    }
    for (size_t i = count > window ? count - window : 0; i < count; ++i) {
        collect(i);
    }
}

bool CursorManager::scaleAll(const std::vector<CursorJob>& jobs) {
    Log(DEBUG, "CursorManager", "Scaling {} cursor(s) by {} with {} job(s)",
        jobs.size(), settings_.scaleFactor, settings_.jobs);
    resetBatchStats();
    auto startTime = std::chrono::high_resolution_clock::now();

    const BatchSettings settings = settings_;
    runBatch(jobs.size(), [&jobs, settings](size_t index) {
        const CursorJob& job = jobs[index];
        XCUR cursor(job.input);
        CursorResult result = cursor.convert(job.output, settings.scaleFactor, settings.options,
                                             settings.ignoreUnrecognized);
        result.input = job.input;
        return result;
    });

    auto endTime = std::chrono::high_resolution_clock::now();
    collectStats();
    lastBatchStats_.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    logBatchResults("Scaling", lastBatchStats_);
    return lastBatchStats_.failed == 0;
}

bool CursorManager::describeAll(const std::vector<std::string>& inputs, nlohmann::json& report) {
    resetBatchStats();
    lastResults_.clear();

    for (const auto& input : inputs) {
        XCUR cursor(input);
        nlohmann::json summary = cursor.describe();

        CursorResult result;
        result.input = input;
        if (!summary.contains("error")) {
            result.status = ConversionStatus::Converted;
            report.push_back(std::move(summary));
        } else if (settings_.ignoreUnrecognized && summary["error"].get<std::string>() == toString(XcursorErrc::NotAnXcursorFile)) {
            result.status = ConversionStatus::Skipped;
            result.error = XcursorErrc::NotAnXcursorFile;
            Log(DEBUG, "CursorManager", "Skipping {}: not an Xcursor file", input);
        } else {
            result.message = summary.value("message", "");
            Log(ERROR, "CursorManager", "Cannot describe {}: {}", input, result.message);
            report.push_back(std::move(summary));
        }
        lastResults_.push_back(std::move(result));
    }

    collectStats();
    // Stdout carries the report, so the summary stays out of it
    Log(DEBUG, "CursorManager", "Described {} file(s), {} failed", lastBatchStats_.total, lastBatchStats_.failed);
    return lastBatchStats_.failed == 0;
}

bool CursorManager::extractAll(const std::vector<std::string>& inputs, const std::string& outputDir) {
    resetBatchStats();
    auto startTime = std::chrono::high_resolution_clock::now();

    const bool ignoreUnrecognized = settings_.ignoreUnrecognized;
    runBatch(inputs.size(), [&inputs, &outputDir, ignoreUnrecognized](size_t index) {
        XCUR cursor(inputs[index]);
        return cursor.extract(outputDir, ignoreUnrecognized);
    });

    auto endTime = std::chrono::high_resolution_clock::now();
    collectStats();
    lastBatchStats_.totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    logBatchResults("Extraction", lastBatchStats_);
    return lastBatchStats_.failed == 0;
}

void CursorManager::resetBatchStats() {
    lastBatchStats_ = BatchStats{};
}

void CursorManager::collectStats() {
    lastBatchStats_.total = static_cast<int>(lastResults_.size());
    for (const auto& result : lastResults_) {
        switch (result.status) {
            case ConversionStatus::Converted: lastBatchStats_.converted++; break;
            case ConversionStatus::Skipped: lastBatchStats_.skipped++; break;
            case ConversionStatus::Failed: lastBatchStats_.failed++; break;
        }
    }
}

void CursorManager::logBatchResults(const std::string& operation, const BatchStats& stats) {
    Log(MESSAGE, "CursorManager", "{} complete: {} converted, {} skipped, {} failed, {} total files, {}ms",
        operation, stats.converted, stats.skipped, stats.failed, stats.total, stats.totalTime.count());
}

} // namespace XcurScale
