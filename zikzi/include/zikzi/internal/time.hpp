/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>

namespace zikzi {
// Return current UTC timestamp in strict ISO8601 "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_iso8601_now();

// Wall clock as unix seconds / milliseconds.
std::int64_t now_epoch();
std::int64_t now_epoch_ms();

// Local time as "YYYYmmdd_HHMMSS" (used in stored file names).
std::string local_file_stamp();
} // namespace zikzi
