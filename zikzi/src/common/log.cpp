/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/log.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

#include <cstdlib>
#include <iostream>

namespace zikzi {

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "[DEBUG]";
        case LogLevel::Info:  return "[INFO]";
        case LogLevel::Warn:  return "[WARN]";
        case LogLevel::Error: return "[ERROR]";
    }
    return "[INFO]";
}

LogLevel parse_log_level(const std::string& s) {
    const std::string v = internal::lower_copy(s);
    if (v == "debug") return LogLevel::Debug;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(_mtx);
    _level = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _level;
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (_ofs.is_open()) {
        _ofs.close();
    }
    _ofs.open(path, std::ios::out | std::ios::app);
    return _ofs.is_open();
}

void Logger::set_console(bool enabled) {
    std::lock_guard<std::mutex> lk(_mtx);
    _console = enabled;
}

void Logger::emit_locked(const char* tag, bool to_stderr, const std::string& msg) {
    const std::string line = utc_iso8601_now() + " " + tag + " " + msg;
    if (_ofs.is_open()) {
        _ofs << line << '\n';
        _ofs.flush();
    }
    if (_console) {
        (to_stderr ? std::cerr : std::cout) << line << '\n';
    }
}

void Logger::write(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(_mtx);
    if (static_cast<int>(level) < static_cast<int>(_level)) return;
    emit_locked(level_tag(level), level == LogLevel::Error, msg);
}

void Logger::fatal(const std::string& msg) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        emit_locked("[FATAL]", true, msg);
        std::cout.flush();
    }
    std::exit(1);
}

} // namespace zikzi
