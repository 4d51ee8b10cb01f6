/* GemRB - Infinity Engine Emulator
 * Copyright (C) 2003 The GemRB Project
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU General Public License
 * as published by the Free Software Foundation; either version 2
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301, USA.
 *
 *
 */

/**
 * @file Logging.h
 * @author The GemRB Project
 * @note modified for XcurScale
 */

#pragma once

#include <chrono>
#include <format>
#include <memory>
#include <string>

namespace XcurScale {

#if defined(ERROR)
#undef ERROR
#endif

// Lower values are more severe; a writer accepts every level up to its own
enum LogLevel {
    FATAL = 0,
    ERROR = 1,
    WARNING = 2,
    MESSAGE = 3,
    DEBUG = 4
};

const char* LogLevelName(LogLevel level);
// Parses FATAL, ERROR, WARNING, MESSAGE or DEBUG (any case); fallback otherwise
LogLevel LogLevelFromString(const std::string& name, LogLevel fallback);

class LogWriter;
class Logger;

// One formatted line. The time is taken when Log() is called, not when the
// background thread gets to it.
struct LogMessage {
    LogLevel level = DEBUG;
    std::string owner;
    std::string message;
    std::chrono::system_clock::time_point time;

    LogMessage(LogLevel level, std::string owner, std::string message)
        : level(level), owner(std::move(owner)), message(std::move(message)),
          time(std::chrono::system_clock::now()) {}
};

// Console writer at consoleLevel, plus a DEBUG file writer unless logFile is
// empty. Calls after the first are ignored.
void InitializeLogging(LogLevel consoleLevel = WARNING, const std::string& logFile = "xcurscale.log");
// Drains the queue, flushes and closes every writer
void ShutdownLogging();

void ToggleLogging(bool enabled);
void AddLogWriter(std::shared_ptr<LogWriter> writer);
void SetConsoleWindowLogLevel(LogLevel level);
void LogMsg(LogLevel level, const char* owner, std::string message);
// Blocks until everything logged so far has reached the writers
void FlushLogs();

template<typename... ARGS>
void Log(LogLevel level, const char* owner, std::format_string<ARGS...> format, ARGS&&... args)
{
    LogMsg(level, owner, std::format(format, std::forward<ARGS>(args)...));
}

} // namespace XcurScale
