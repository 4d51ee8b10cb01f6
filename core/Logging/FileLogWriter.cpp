#include "FileLogWriter.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace XcurScale {

FileLogWriter::FileLogWriter(const std::filesystem::path& path, LogLevel level)
    : LogWriter(level), logPath(path)
{
    logFile.open(logPath, std::ios::trunc); // Clear the file on startup

    if (logFile.is_open()) {
        logFile << "=== xcurscale log started " << formatTimestamp(std::chrono::system_clock::now()) << " ===" << std::endl;
    } else {
        // Logging is not up yet, so this is the one place we report directly
        std::cerr << "xcurscale: cannot open log file " << logPath.string() << std::endl;
    }
}

FileLogWriter::~FileLogWriter() {
    if (logFile.is_open()) {
        logFile << "=== xcurscale log ended ===" << std::endl;
        logFile.close();
    }
}

void FileLogWriter::WriteLogMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (!logFile.is_open()) {
        return;
    }

    logFile << formatTimestamp(msg.time) << " [" << LogLevelName(msg.level) << "]["
            << msg.owner << "] "
            << msg.message << '\n';
}

void FileLogWriter::Flush() {
    std::lock_guard<std::mutex> lock(fileMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

std::string FileLogWriter::formatTimestamp(std::chrono::system_clock::time_point now) {
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

} // namespace XcurScale
