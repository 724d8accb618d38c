/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>

namespace zikzi::internal {

// Write-only document file opened close-on-exec, so converter children
// started while it is open do not inherit it.
class SpoolFile {
public:
    SpoolFile() = default;
    ~SpoolFile();

    // Create or truncate `path`. `err` receives strerror on failure.
    bool open(const std::string& path, std::string* err = nullptr);
    bool write(const char* data, std::size_t len);

    // Flushes and closes; false when any write or the close failed.
    bool close();

    bool is_open() const { return _fd >= 0; }

    SpoolFile(const SpoolFile&) = delete;
    SpoolFile& operator=(const SpoolFile&) = delete;

private:
    int  _fd = -1;
    bool _failed = false;
};

} // namespace zikzi::internal
