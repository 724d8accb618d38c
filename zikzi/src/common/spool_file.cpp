/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/spool_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace zikzi::internal {

SpoolFile::~SpoolFile() {
    if (_fd >= 0) ::close(_fd);
}

bool SpoolFile::open(const std::string& path, std::string* err) {
    if (_fd >= 0) ::close(_fd);
    _failed = false;
    _fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (_fd < 0) {
        if (err) *err = std::strerror(errno);
        return false;
    }
    return true;
}

bool SpoolFile::write(const char* data, std::size_t len) {
    if (_fd < 0 || _failed) return false;
    while (len > 0) {
        ssize_t n = ::write(_fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            _failed = true;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool SpoolFile::close() {
    if (_fd < 0) return false;
    const int rc = ::close(_fd);
    _fd = -1;
    return rc == 0 && !_failed;
}

} // namespace zikzi::internal
