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
 * @file FileLogWriter.h
 * @author The GemRB Project
 * @note modified for XcurScale
 */

#pragma once

#include "Logger.h"
#include <fstream>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace XcurScale {

class FileLogWriter : public LogWriter {
private:
    std::ofstream logFile;
    std::filesystem::path logPath;
    std::mutex fileMutex;

public:
    explicit FileLogWriter(const std::filesystem::path& path, LogLevel level = DEBUG);
    ~FileLogWriter() override;

    void WriteLogMessage(const LogMessage& msg) override;
    void Flush() override;

    bool isOpen() const { return logFile.is_open(); }
    const std::filesystem::path& path() const { return logPath; }

private:
    static std::string formatTimestamp(std::chrono::system_clock::time_point now);
};

} // namespace XcurScale
