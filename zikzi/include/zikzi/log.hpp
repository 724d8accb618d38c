/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace zikzi {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" / "info" / "warn" / "warning" / "error"; anything else => Info.
LogLevel parse_log_level(const std::string& s);

// Thread-safe leveled logger (to file + console). One instance is shared by
// all components of a server.
class Logger {
public:
    Logger() = default;
    explicit Logger(LogLevel level) : _level(level) {}

    void set_level(LogLevel level);
    LogLevel level() const;

    // Opens (append) the given file in addition to console output.
    bool set_log_file(const std::string& path);
    void set_console(bool enabled);

    void debug(const std::string& msg) { write(LogLevel::Debug, msg); }
    void info (const std::string& msg) { write(LogLevel::Info,  msg); }
    void warn (const std::string& msg) { write(LogLevel::Warn,  msg); }
    void error(const std::string& msg) { write(LogLevel::Error, msg); }

    // Logs at error level and terminates the process.
    [[noreturn]] void fatal(const std::string& msg);

    void write(LogLevel level, const std::string& msg);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    mutable std::mutex _mtx;
    LogLevel      _level = LogLevel::Info;
    bool          _console = true;
    std::ofstream _ofs;

    void emit_locked(const char* tag, bool to_stderr, const std::string& msg);
};

} // namespace zikzi
