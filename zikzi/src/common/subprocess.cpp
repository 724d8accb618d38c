/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zikzi::internal {

static constexpr std::size_t kMaxOutput = 64 * 1024;

ProcessResult run_process(const std::string& program, const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout)
{
    ProcessResult res;

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        return res;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return res;
    }

    if (pid == 0) {
        // Child: stdout+stderr into the pipe, stdin from /dev/null
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(program.c_str(), argv.data());
        // no allocation between fork and _exit
        static const char kExecFailed[] = "exec failed: ";
        (void)!::write(STDERR_FILENO, kExecFailed, sizeof(kExecFailed) - 1);
        (void)!::write(STDERR_FILENO, program.c_str(), program.size());
        (void)!::write(STDERR_FILENO, "\n", 1);
        ::_exit(127);
    }

    ::close(fds[1]);
    res.started = true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[4096];
    for (;;) {
        int wait_ms = -1;
        if (timeout.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                res.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(left);
        }

        pollfd p{fds[0], POLLIN, 0};
        int pr = ::poll(&p, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue; // deadline check on next turn

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break; // all writers closed
        if (res.output.size() < kMaxOutput) {
            res.output.append(buf, static_cast<size_t>(n));
        }
    }
    ::close(fds[0]);

    // The child may close its output and keep running: reap against the same deadline.
    int wstatus = 0;
    bool reaped = false;
    while (!res.timed_out) {
        const pid_t w = ::waitpid(pid, &wstatus, WNOHANG);
        if (w == pid) {
            reaped = true;
            break;
        }
        if (w < 0) {
            if (errno == EINTR) continue;
            res.error = std::string("waitpid failed: ") + std::strerror(errno);
            return res;
        }
        if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
            res.timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (!reaped) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &wstatus, 0) < 0) {
            if (errno != EINTR) {
                res.error = std::string("waitpid failed: ") + std::strerror(errno);
                return res;
            }
        }
    }

    if (res.timed_out) {
        res.error = "timed out after " + std::to_string(timeout.count() / 1000) + "s";
    } else if (WIFEXITED(wstatus)) {
        res.exit_code = WEXITSTATUS(wstatus);
        if (res.exit_code != 0) res.error = "exit status " + std::to_string(res.exit_code);
    } else if (WIFSIGNALED(wstatus)) {
        res.error = std::string("killed by signal ") + std::to_string(WTERMSIG(wstatus));
    }
    return res;
}

} // namespace zikzi::internal
