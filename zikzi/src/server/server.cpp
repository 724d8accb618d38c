/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/server.hpp"
#include "zikzi/internal/memory_store.hpp"
#include "zikzi/internal/redis_store.hpp"

#include <stdexcept>
#include <string>
#include <thread>

namespace zikzi {

Server::Server(const ServerConfig& cfg, std::shared_ptr<Logger> log)
    : _cfg(cfg), _log(std::move(log))
{
    _store = open_store();

    auto pipeline = std::make_unique<internal::ConversionPipeline>(
        _cfg.storage.ghostscript_bin, std::chrono::seconds(_cfg.storage.convert_timeout_sec), _log);
    _jobs = std::make_shared<internal::JobProcessor>(_store, _cfg.storage.path, std::move(pipeline), _log);
    if (!_jobs->ensure_jobs_dir()) {
        throw std::runtime_error("cannot create storage directory " + _jobs->jobs_dir());
    }

    _raw = std::make_unique<RawServer>(_cfg, _store, _jobs, _log);
    if (_cfg.ipp.enabled) {
        _ipp = std::make_unique<IppServer>(_cfg, _store, _jobs, _log);
    }
}

Server::~Server() {
    stop();
}

std::shared_ptr<Store> Server::open_store() {
    if (_cfg.store == StoreBackend::Redis) {
        internal::RedisStore::Options ropt;
        ropt.host          = _cfg.redis.host;
        ropt.port          = _cfg.redis.port;
        ropt.db            = _cfg.redis.db;
        ropt.password      = _cfg.redis.password;
        ropt.key_prefix    = _cfg.redis.key_prefix;
        ropt.pool_size     = _cfg.redis.pool_size;
        ropt.timeout_ms    = _cfg.redis.timeout_ms;
        ropt.cache_ttl_sec = _cfg.redis.cache_ttl_sec;

        auto rs = std::make_shared<internal::RedisStore>(ropt, _log);
        if (!rs->init()) {
            throw std::runtime_error("Store: failed to init Redis backend");
        }
        return rs;
    }

    auto ms = std::make_shared<internal::MemoryStore>(_log);
    if (!_cfg.store_file.empty() && !ms->load_file(_cfg.store_file)) {
        throw std::runtime_error("Store: failed to load " + _cfg.store_file);
    }
    if (_cfg.store_file.empty()) {
        _log->warn("[STORE] memory backend without seed file: no users or IP registrations");
    }
    return ms;
}

void Server::run() {
    _log->info("[SERVER] Zikzi print gateway starting...");
    _log->info(std::string("[SERVER] Store: ") + (_cfg.store == StoreBackend::Redis ? "redis " + _cfg.redis.host + ":" + std::to_string(_cfg.redis.port) : "memory"));
    _log->info("[SERVER] Storage: " + _cfg.storage.path + " converter=" + _cfg.storage.ghostscript_bin +
               " timeout=" + std::to_string(_cfg.storage.convert_timeout_sec) + "s");
    _log->info(std::string("[SERVER] Auth: ip=") + (_cfg.auth.allow_ip ? "on" : "off") +
               " login=" + (_cfg.auth.allow_login ? "on" : "off") +
               " realm=" + _cfg.auth.realm +
               " unregistered=" + (_cfg.printer.allow_unregistered_ips ? "allowed" : "rejected"));

    _raw->start();
    if (_ipp) _ipp->start();

    std::thread raw_thread([this]{ _raw->run(); });
    std::thread ipp_thread;
    if (_ipp) ipp_thread = std::thread([this]{ _ipp->run(); });

    {
        std::unique_lock<std::mutex> lk(_mtx);
        _cv.wait(lk, [this]{ return _stop; });
    }
    _log->info("[SERVER] shutting down");

    _raw->stop();
    if (_ipp) _ipp->stop();
    raw_thread.join();
    if (ipp_thread.joinable()) ipp_thread.join();

    // In-flight connections get one shared grace period; conversions are not waited on.
    const auto grace = std::chrono::seconds(_cfg.shutdown_grace_sec);
    bool raw_idle = true;
    std::thread drain_raw([this, grace, &raw_idle]{ raw_idle = _raw->drain(grace); });
    const bool ipp_idle = _ipp ? _ipp->drain(grace) : true;
    drain_raw.join();
    if (!raw_idle || !ipp_idle) {
        // Destructors block until the remaining connection threads are gone
        _log->warn("[SERVER] connections still closing after forced shutdown");
    }

    const int pending = _jobs->in_flight();
    if (pending > 0) {
        _log->info("[SERVER] leaving " + std::to_string(pending) + " conversion(s) running");
    }
    _log->info("[SERVER] stopped");
}

void Server::stop() {
    std::lock_guard<std::mutex> lk(_mtx);
    _stop = true;
    _cv.notify_all();
}

} // namespace zikzi
