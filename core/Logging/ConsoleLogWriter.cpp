#include "ConsoleLogWriter.h"

#include <cstdlib>
#include <string>
#include <unistd.h>

namespace XcurScale {

// ANSI color codes
namespace Colors {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* CYAN = "\033[36m";
    constexpr const char* WHITE = "\033[37m";
    constexpr const char* BOLD_RED = "\033[1;31m";
}

ConsoleLogWriter::ConsoleLogWriter(LogLevel level)
    : LogWriter(level), colorsEnabled(supportsColors())
{
}

void ConsoleLogWriter::WriteLogMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(streamMutex);
    std::ostream& output = getOutputStream(msg.level);

    // Progress messages read like plain program output
    if (msg.level == MESSAGE) {
        output << msg.message << '\n';
        return;
    }

    if (colorsEnabled) {
        output << getLevelColor(msg.level) << "[" << LogLevelName(msg.level) << "]" << Colors::RESET
               << Colors::CYAN << "[" << msg.owner << "]" << Colors::RESET
               << " " << msg.message << '\n';
    } else {
        output << "[" << LogLevelName(msg.level) << "]["
               << msg.owner << "] "
               << msg.message << '\n';
    }
}

void ConsoleLogWriter::Flush() {
    std::lock_guard<std::mutex> lock(streamMutex);
    std::cout.flush();
    std::cerr.flush();
}

std::ostream& ConsoleLogWriter::getOutputStream(LogLevel level) {
    // Diagnostics go to stderr so stdout stays clean for `info` output
    switch (level) {
        case MESSAGE:
            return std::cout;
        default:
            return std::cerr;
    }
}

const char* ConsoleLogWriter::getLevelColor(LogLevel level) {
    switch (level) {
        case FATAL: return Colors::BOLD_RED;
        case ERROR: return Colors::RED;
        case WARNING: return Colors::YELLOW;
        case MESSAGE: return Colors::GREEN;
        case DEBUG: return Colors::BLUE;
        default: return Colors::WHITE;
    }
}

bool ConsoleLogWriter::supportsColors() {
    if (!isatty(STDERR_FILENO)) return false;
    if (std::getenv("NO_COLOR")) return false;

    const char* term = std::getenv("TERM");
    if (!term) return false;

    std::string terminal(term);
    return (terminal.find("xterm") != std::string::npos ||
            terminal.find("linux") != std::string::npos ||
            terminal.find("screen") != std::string::npos ||
            terminal.find("tmux") != std::string::npos ||
            terminal.find("color") != std::string::npos);
}

} // namespace XcurScale
