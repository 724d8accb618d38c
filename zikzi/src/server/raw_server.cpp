/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/raw_server.hpp"
#include "zikzi/internal/dsc_parser.hpp"
#include "zikzi/internal/proxy_protocol.hpp"
#include "zikzi/internal/spool_file.hpp"
#include "zikzi/internal/time.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <sys/socket.h>
#include <unistd.h>

namespace zikzi {

RawServer::RawServer(const ServerConfig& cfg,
                     std::shared_ptr<Store> store,
                     std::shared_ptr<internal::JobProcessor> jobs,
                     std::shared_ptr<Logger> log)
    : _cfg(cfg),
      _store(std::move(store)),
      _jobs(std::move(jobs)),
      _log(std::move(log))
{
    std::vector<std::string> rejected;
    _trusted = internal::TrustedProxyMatcher(_cfg.printer.trusted_proxies, false, &rejected);
    for (const auto& r : rejected) {
        _log->warn("[RAW] ignoring unparseable trusted proxy entry: " + r);
    }
    _port = _cfg.printer.port;
}

RawServer::~RawServer() {
    stop();
    // Connection threads use this object until they leave the set.
    _conns.shutdown_and_wait();
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
}

void RawServer::start() {
    int fd = internal::create_listen_socket(_cfg.printer.host, _cfg.printer.port);
    _port = internal::local_port(fd);
    _listen_fd.store(fd);

    std::string mode = "off";
    if (_cfg.printer.proxy_protocol) {
        mode = _trusted.empty() ? "required" : "trusted=" + std::to_string(_trusted.size());
    }
    _log->info("[RAW] PostScript printer listening on " + _cfg.printer.host + ":" +
               std::to_string(_port) + " proxy_protocol=" + mode);
}

void RawServer::run() {
    const int srv = _listen_fd.load();
    if (srv < 0) throw std::runtime_error("RawServer::run() before start()");

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept4(srv, reinterpret_cast<sockaddr*>(&cli), &cl, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            _log->error(std::string("[RAW] accept failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        const std::string peer = internal::sockaddr_to_ip(cli);

        _conns.add(fd);
        std::thread([this, fd, peer]() {
            serve(fd, peer);
            _conns.remove(fd);
            ::close(fd);
        }).detach();
    }
    _log->info("[RAW] accept loop stopped");
}

void RawServer::stop() {
    if (_stop.exchange(true)) return;
    const int fd = _listen_fd.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

bool RawServer::drain(std::chrono::milliseconds grace) {
    if (_conns.wait_idle(grace)) return true;
    _log->warn("[RAW] closing " + std::to_string(_conns.size()) + " connection(s) after grace period");
    _conns.shutdown_all();
    return _conns.wait_idle(std::chrono::seconds(2));
}

void RawServer::serve(int fd, const std::string& peer) {
    const internal::ProxyPolicy policy =
        internal::select_proxy_policy(_cfg.printer.proxy_protocol, _trusted, peer);

    std::string client_ip, leftover, err;
    if (!internal::accept_proxied(fd, policy, peer, _cfg.printer.proxy_header_timeout_sec,
                                  client_ip, leftover, err))
    {
        _log->warn("[RAW] dropped connection from " + peer + " (proxy policy " +
                   internal::to_string(policy) + "): " + err);
        return;
    }
    handle_connection(fd, client_ip, leftover);
}

void RawServer::handle_connection(int fd, const std::string& client_ip, const std::string& leftover) {
    _log->debug("[RAW] new print job from " + client_ip);

    PrintJob job;
    job.source_ip = client_ip;
    job.status = JobStatus::Received;

    IPRegistration reg;
    if (_store->find_ip_registration(client_ip, now_epoch(), reg)) {
        job.user_id = reg.user_id;
    } else if (!_cfg.printer.allow_unregistered_ips) {
        _log->warn("[RAW] rejected print job from unregistered IP: " + client_ip);
        return;
    }

    if (!_store->create_job(job)) {
        _log->error("[RAW] failed to create print job for " + client_ip);
        return;
    }
    if (!_jobs->ensure_jobs_dir()) return;

    const std::string path = _jobs->jobs_dir() + "/" + job.id + "_" + local_file_stamp() + ".ps";
    internal::SpoolFile out;
    std::string oerr;
    if (!out.open(path, &oerr)) {
        _log->error("[RAW] failed to create file " + path + ": " + oerr);
        return;
    }

    // An idle sender must not hold the connection open forever
    internal::set_socket_timeouts(fd, _cfg.printer.read_timeout_sec, 0);

    // Stream to disk while scanning DSC comments
    internal::DscScanner dsc;
    std::int64_t written = 0;
    bool write_ok = true;
    if (!leftover.empty()) {
        write_ok = out.write(leftover.data(), leftover.size());
        dsc.feed(leftover.data(), leftover.size());
        written += static_cast<std::int64_t>(leftover.size());
    }

    std::string recv_err;
    char buf[65536];
    while (write_ok) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            recv_err = (errno == EAGAIN || errno == EWOULDBLOCK)
                ? "no data for " + std::to_string(_cfg.printer.read_timeout_sec) + "s"
                : std::string(std::strerror(errno));
            break;
        }
        if (n == 0) break;
        write_ok = out.write(buf, static_cast<std::size_t>(n));
        dsc.feed(buf, static_cast<std::size_t>(n));
        written += n;
    }
    dsc.finish();
    if (!out.close()) write_ok = false;

    const internal::DscMetadata& meta = dsc.metadata();
    job.original_file = path;
    job.document_name = meta.title;
    job.hostname = meta.for_whom;
    job.app_name = meta.creator;
    job.file_size = written;

    if (!write_ok || !recv_err.empty()) {
        const std::string why = write_ok ? "receive failed: " + recv_err : "failed to write " + path;
        _log->warn("[RAW] print job " + job.id + " from " + client_ip + " aborted: " + why);
        fail_job(job, why);
        return;
    }

    if (!advance(job, JobStatus::Processing) || !_store->save_job(job)) {
        _log->error("[RAW] failed to update print job " + job.id);
        return;
    }

    _log->info("[RAW] print job " + job.id + " received: \"" + job.document_name + "\" " +
               std::to_string(written) + " bytes from " + client_ip);
    _jobs->dispatch(job);
}

void RawServer::fail_job(PrintJob& job, const std::string& why) {
    // received -> processing -> failed; each step is persisted
    if (!advance(job, JobStatus::Processing) || !_store->save_job(job)) {
        _log->error("[RAW] failed to update print job " + job.id);
        return;
    }
    job.error = why;
    if (!advance(job, JobStatus::Failed) || !_store->save_job(job)) {
        _log->error("[RAW] failed to mark print job " + job.id + " failed");
    }
}

} // namespace zikzi
