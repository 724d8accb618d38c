/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "zikzi/log.hpp"
#include "zikzi/server_config.hpp"
#include "zikzi/store.hpp"
#include "zikzi/internal/listener.hpp"
#include "zikzi/internal/pipeline.hpp"
#include "zikzi/internal/trusted_proxy.hpp"

namespace zikzi {

// JetDirect-style raw socket: one PostScript document per connection, ended by EOF.
class RawServer {
public:
    RawServer(const ServerConfig& cfg,
              std::shared_ptr<Store> store,
              std::shared_ptr<internal::JobProcessor> jobs,
              std::shared_ptr<Logger> log);
    ~RawServer();

    // Bind the listening socket (throws std::runtime_error).
    void start();

    // Blocking accept loop until stop().
    void run();
    void stop();

    bool drain(std::chrono::milliseconds grace);

    /**
     * Receive one document from an accepted connection whose effective client
     * is `client_ip`. `leftover` holds payload bytes already consumed while
     * looking for a PROXY header. Does not close fd.
     */
    void handle_connection(int fd, const std::string& client_ip, const std::string& leftover = {});

    std::uint16_t port() const { return _port; }

    RawServer(const RawServer&) = delete;
    RawServer& operator=(const RawServer&) = delete;

private:
    ServerConfig _cfg;
    std::shared_ptr<Store> _store;
    std::shared_ptr<internal::JobProcessor> _jobs;
    std::shared_ptr<Logger> _log;

    internal::TrustedProxyMatcher _trusted;
    internal::ConnectionSet       _conns;

    std::uint16_t     _port = 0;
    std::atomic<int>  _listen_fd{-1};
    std::atomic<bool> _stop{false};

    void serve(int fd, const std::string& peer);
    void fail_job(PrintJob& job, const std::string& why);
};

} // namespace zikzi
