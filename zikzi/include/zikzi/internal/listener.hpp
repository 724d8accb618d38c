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
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <sys/socket.h>

namespace zikzi::internal {

// Bound, listening TCP socket on host:port. Throws std::runtime_error.
int create_listen_socket(const std::string& host, std::uint16_t port);

// Port actually bound (useful with port 0); 0 on error.
std::uint16_t local_port(int fd);

// Textual address; v4-mapped v6 addresses are reported as plain v4.
std::string sockaddr_to_ip(const sockaddr_storage& ss);

bool send_all(int fd, const char* d, std::size_t len);

// SO_RCVTIMEO / SO_SNDTIMEO; zero clears the timeout.
void set_socket_timeouts(int fd, int rcv_sec, int snd_sec);

/**
 * Open client sockets of one server. Used on shutdown to wait for
 * in-flight connections and then force the stragglers closed.
 */
class ConnectionSet {
public:
    void add(int fd);
    void remove(int fd);
    std::size_t size() const;

    // True once empty; false when `grace` elapsed first.
    bool wait_idle(std::chrono::milliseconds grace);

    // shutdown(2) every tracked socket; owners still close them.
    void shutdown_all();

    /**
     * shutdown(2) every tracked socket and block until all were removed.
     * Called by owners before destruction; connection threads must not
     * touch their owner after remove().
     */
    void shutdown_and_wait();

private:
    mutable std::mutex      _mtx;
    std::condition_variable _cv;
    std::unordered_set<int> _fds;
};

} // namespace zikzi::internal
