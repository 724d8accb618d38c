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
#include <condition_variable>
#include <memory>
#include <mutex>
#include "zikzi/ipp_server.hpp"
#include "zikzi/log.hpp"
#include "zikzi/raw_server.hpp"
#include "zikzi/server_config.hpp"
#include "zikzi/store.hpp"
#include "zikzi/internal/pipeline.hpp"

namespace zikzi {

// Print intake gateway: raw PostScript socket plus optional IPP endpoint.
class Server {
public:
    // Opens the store (throws std::runtime_error on failure).
    Server(const ServerConfig& cfg, std::shared_ptr<Logger> log);
    ~Server();

    // Blocking run: bind both listeners and serve until stop().
    void run();

    // Stop accepting; run() returns after the grace period.
    void stop();

private:
    ServerConfig _cfg;
    std::shared_ptr<Logger> _log;
    std::shared_ptr<Store> _store;
    std::shared_ptr<internal::JobProcessor> _jobs;
    std::unique_ptr<RawServer> _raw;
    std::unique_ptr<IppServer> _ipp;

    std::mutex              _mtx;
    std::condition_variable _cv;
    bool                    _stop = false;

    std::shared_ptr<Store> open_store();
};

} // namespace zikzi
