#include "Logging.h"
#include "Logger.h"
#include "FileLogWriter.h"
#include "ConsoleLogWriter.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <memory>

namespace XcurScale {

// Global logger instance
static std::unique_ptr<Logger> globalLogger;
static std::shared_ptr<ConsoleLogWriter> consoleWriter;
static std::atomic<bool> loggingEnabled{true};

void ToggleLogging(bool enabled) {
    loggingEnabled = enabled;
}

void AddLogWriter(std::shared_ptr<LogWriter> writer) {
    if (globalLogger) {
        globalLogger->AddLogWriter(std::move(writer));
    }
}

void SetConsoleWindowLogLevel(LogLevel level) {
    if (consoleWriter) {
        consoleWriter->level = level;
    }
}

void LogMsg(LogLevel level, const char* owner, std::string message) {
    if (!loggingEnabled || !globalLogger) {
        return;
    }

    globalLogger->LogMsg(LogMessage(level, owner, std::move(message)));
}

void FlushLogs() {
    if (globalLogger) {
        globalLogger->Flush();
    }
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case FATAL: return "FATAL";
        case ERROR: return "ERROR";
        case WARNING: return "WARNING";
        case MESSAGE: return "MESSAGE";
        case DEBUG: return "DEBUG";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (LogLevel level : {FATAL, ERROR, WARNING, MESSAGE, DEBUG}) {
        if (upper == LogLevelName(level)) {
            return level;
        }
    }
    return fallback;
}

// Initialize the logging system
void InitializeLogging(LogLevel consoleLevel, const std::string& logFile) {
    if (globalLogger) {
        return; // Already initialized
    }

    std::deque<Logger::WriterPtr> writers;
    if (!logFile.empty()) {
        // The file always gets everything
        writers.push_back(std::make_shared<FileLogWriter>(logFile, DEBUG));
    }
    consoleWriter = std::make_shared<ConsoleLogWriter>(consoleLevel);
    writers.push_back(consoleWriter);

    globalLogger = std::make_unique<Logger>(std::move(writers));
}

// Cleanup the logging system
void ShutdownLogging() {
    if (globalLogger) {
        FlushLogs();
        globalLogger.reset();
    }
    consoleWriter.reset();
}

} // namespace XcurScale
