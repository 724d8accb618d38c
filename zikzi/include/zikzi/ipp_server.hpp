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
#include "zikzi/http_request.hpp"
#include "zikzi/log.hpp"
#include "zikzi/server_config.hpp"
#include "zikzi/store.hpp"
#include "zikzi/internal/auth.hpp"
#include "zikzi/internal/http_io.hpp"
#include "zikzi/internal/ipp.hpp"
#include "zikzi/internal/listener.hpp"
#include "zikzi/internal/nonce_cache.hpp"
#include "zikzi/internal/pipeline.hpp"
#include "zikzi/internal/trusted_proxy.hpp"

namespace zikzi {

// IPP over plain HTTP: Print-Job, Validate-Job, Get-Printer-Attributes,
// Get-Jobs, Get-Job-Attributes and Cancel-Job.
class IppServer {
public:
    IppServer(const ServerConfig& cfg,
              std::shared_ptr<Store> store,
              std::shared_ptr<internal::JobProcessor> jobs,
              std::shared_ptr<Logger> log);
    ~IppServer();

    // Bind the listening socket (throws std::runtime_error).
    void start();

    // Blocking accept loop until stop().
    void run();
    void stop();

    // Wait up to `grace` for open connections, then force them closed.
    bool drain(std::chrono::milliseconds grace);

    // One HTTP request; peer_ip is the physical peer of the connection.
    HttpResponse handle(const HttpRequest& req, const std::string& peer_ip);

    // Peer, or the forwarded client when the peer is a trusted proxy.
    std::string client_ip(const HttpRequest& req, const std::string& peer_ip) const;

    const std::string& printer_uri() const { return _printer_uri; }
    std::string job_uri(const std::string& job_id) const { return _printer_uri + "/jobs/" + job_id; }
    std::uint16_t port() const { return _port; }

    internal::NonceCache& nonces() { return _nonces; }

    IppServer(const IppServer&) = delete;
    IppServer& operator=(const IppServer&) = delete;

private:
    using Message = internal::ipp::Message;

    ServerConfig _cfg;
    std::shared_ptr<Store> _store;
    std::shared_ptr<internal::JobProcessor> _jobs;
    std::shared_ptr<Logger> _log;

    internal::NonceCache          _nonces;
    internal::AuthResolver        _auth;
    internal::TrustedProxyMatcher _trusted;
    internal::HttpLimits          _limits;
    internal::ConnectionSet       _conns;

    std::string       _printer_uri;
    std::uint16_t     _port = 0;
    std::atomic<int>  _listen_fd{-1};
    std::atomic<bool> _stop{false};

    static bool requires_auth(ipp_op_t op);
    std::vector<std::string> advertised_auth_methods() const;

    HttpResponse ipp_response(const Message& m) const;
    HttpResponse challenge();

    Message print_job(const Message& req, const std::string& body, const std::string& client_ip,
                      const AuthResult& auth);
    Message get_printer_attributes(const Message& req);
    Message get_jobs(const Message& req, const AuthResult& auth);
    Message get_job_attributes(const Message& req);
};

} // namespace zikzi
