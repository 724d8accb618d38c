/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/listener.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/types.h>
#include <unistd.h>

namespace zikzi::internal {

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }

int create_listen_socket(const std::string& host, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const std::string svc = std::to_string(port);
    const int gai = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), svc.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        throw std::runtime_error("cannot resolve listen address " + host + ": " + ::gai_strerror(gai));
    }

    int srv = ::socket(res->ai_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (srv < 0) {
        const std::string err = std::strerror(errno);
        ::freeaddrinfo(res);
        throw std::runtime_error("socket() failed: " + err);
    }
    (void)set_reuseaddr(srv);

    if (::bind(srv, res->ai_addr, res->ai_addrlen) < 0) {
        const std::string err = std::strerror(errno);
        ::freeaddrinfo(res);
        ::close(srv);
        throw std::runtime_error("bind(" + host + ":" + svc + ") failed: " + err);
    }
    ::freeaddrinfo(res);

    if (::listen(srv, 512) < 0) {
        const std::string err = std::strerror(errno);
        ::close(srv);
        throw std::runtime_error("listen() failed: " + err);
    }
    return srv;
}

std::uint16_t local_port(int fd) {
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) return 0;
    if (ss.ss_family == AF_INET)  return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6) return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    return 0;
}

std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (IN6_IS_ADDR_V4MAPPED(&a->sin6_addr)) {
            inet_ntop(AF_INET, &a->sin6_addr.s6_addr[12], buf, sizeof(buf));
        } else {
            inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
        }
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

void set_socket_timeouts(int fd, int rcv_sec, int snd_sec) {
    timeval rtv{rcv_sec, 0};
    timeval stv{snd_sec, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &rtv, sizeof(rtv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &stv, sizeof(stv));
}

/* ---------------- ConnectionSet ---------------- */

void ConnectionSet::add(int fd) {
    std::lock_guard<std::mutex> lk(_mtx);
    _fds.insert(fd);
}

void ConnectionSet::remove(int fd) {
    // Notified under the lock: a waiter may destroy the set as soon as it wakes.
    std::lock_guard<std::mutex> lk(_mtx);
    _fds.erase(fd);
    _cv.notify_all();
}

std::size_t ConnectionSet::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _fds.size();
}

bool ConnectionSet::wait_idle(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lk(_mtx);
    return _cv.wait_for(lk, grace, [this]{ return _fds.empty(); });
}

void ConnectionSet::shutdown_all() {
    std::lock_guard<std::mutex> lk(_mtx);
    for (int fd : _fds) ::shutdown(fd, SHUT_RDWR);
}

void ConnectionSet::shutdown_and_wait() {
    std::unique_lock<std::mutex> lk(_mtx);
    for (int fd : _fds) ::shutdown(fd, SHUT_RDWR);
    _cv.wait(lk, [this]{ return _fds.empty(); });
}

} // namespace zikzi::internal
