/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace zikzi::internal {

struct ProcessResult {
    bool        started = false;   // fork/exec succeeded
    bool        timed_out = false;
    int         exit_code = -1;    // -1 when killed by a signal or not started
    std::string output;            // stdout and stderr interleaved
    std::string error;             // why it did not start / how it ended

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

/**
 * Run `program` (looked up in PATH) with `args`, stdin from /dev/null,
 * collecting combined output. The child is killed with SIGKILL once
 * `timeout` elapses (no limit when zero).
 */
ProcessResult run_process(const std::string& program, const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout);

} // namespace zikzi::internal
