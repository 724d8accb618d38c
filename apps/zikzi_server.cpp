/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/log.hpp"
#include "zikzi/server.hpp"
#include "zikzi/server_config.hpp"
#include "zikzi/internal/utils.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0 << " [options]\n"
      "  Raw PostScript socket:\n"
      "    [--printer_host 0.0.0.0] [--printer_port 9100] [--allow_unregistered_ips 0|1]\n"
      "    [--external_hostname <name>] [--proxy_protocol 0|1] [--printer_trusted_proxies a,b/cidr]\n"
      "    [--proxy_header_timeout 10] [--read_timeout 60]\n"
      "  IPP:\n"
      "    [--ipp 0|1] [--ipp_host 0.0.0.0] [--ipp_port 631] [--trust_proxy 0|1]\n"
      "    [--ipp_trusted_proxies a,b/cidr] [--max_body <bytes>] [--ka_timeout 5] [--ka_max 100]\n"
      "  Auth:\n"
      "    [--auth_ip 0|1] [--auth_login 0|1] [--realm zikzi]\n"
      "  Storage:\n"
      "    [--storage ./data] [--gs gs] [--convert_timeout 300]\n"
      "  Store backend:\n"
      "    [--store memory|redis] [--store_file <seed file>]\n"
      "    [--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
      "    [--redis_password ****] [--redis_prefix zikzi:] [--redis_pool 8]\n"
      "    [--redis_timeout_ms 200] [--redis_cache_ttl 60]\n"
      "  Logging:\n"
      "    [--log_level debug|info|warn|error] [--log_file <path>] [--quiet 0|1]\n"
      "    [--shutdown_grace 5]\n";
}

static bool parse_args(int argc, char** argv, zikzi::ServerConfig& cfg) {
    using zikzi::internal::split_list;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--help" || a == "-h" || i + 1 >= argc) return false;
        const std::string v = argv[++i];

        if      (a == "--printer_host") cfg.printer.host = v;
        else if (a == "--printer_port") cfg.printer.port = (uint16_t)std::stoi(v);
        else if (a == "--allow_unregistered_ips") cfg.printer.allow_unregistered_ips = (std::stoi(v) != 0);
        else if (a == "--external_hostname") cfg.printer.external_hostname = v;
        else if (a == "--proxy_protocol") cfg.printer.proxy_protocol = (std::stoi(v) != 0);
        else if (a == "--printer_trusted_proxies") cfg.printer.trusted_proxies = split_list(v);
        else if (a == "--proxy_header_timeout") cfg.printer.proxy_header_timeout_sec = std::stoi(v);
        else if (a == "--read_timeout") cfg.printer.read_timeout_sec = std::stoi(v);

        else if (a == "--ipp") cfg.ipp.enabled = (std::stoi(v) != 0);
        else if (a == "--ipp_host") cfg.ipp.host = v;
        else if (a == "--ipp_port") cfg.ipp.port = (uint16_t)std::stoi(v);
        else if (a == "--trust_proxy") cfg.ipp.trust_proxy = (std::stoi(v) != 0);
        else if (a == "--ipp_trusted_proxies") cfg.ipp.trusted_proxies = split_list(v);
        else if (a == "--max_body") cfg.ipp.max_body = (size_t)std::stoull(v);
        else if (a == "--ka_timeout") cfg.ipp.ka_timeout_sec = std::stoi(v);
        else if (a == "--ka_max") cfg.ipp.ka_max = std::stoi(v);

        else if (a == "--auth_ip") cfg.auth.allow_ip = (std::stoi(v) != 0);
        else if (a == "--auth_login") cfg.auth.allow_login = (std::stoi(v) != 0);
        else if (a == "--realm") cfg.auth.realm = v;

        else if (a == "--storage") cfg.storage.path = v;
        else if (a == "--gs") cfg.storage.ghostscript_bin = v;
        else if (a == "--convert_timeout") cfg.storage.convert_timeout_sec = std::stoi(v);

        else if (a == "--store") {
            if (v == "memory") cfg.store = zikzi::StoreBackend::Memory;
            else if (v == "redis") cfg.store = zikzi::StoreBackend::Redis;
            else return false;
        }
        else if (a == "--store_file") cfg.store_file = v;
        else if (a == "--redis_host") cfg.redis.host = v;
        else if (a == "--redis_port") cfg.redis.port = std::stoi(v);
        else if (a == "--redis_db") cfg.redis.db = std::stoi(v);
        else if (a == "--redis_password") cfg.redis.password = v;
        else if (a == "--redis_prefix") cfg.redis.key_prefix = v;
        else if (a == "--redis_pool") cfg.redis.pool_size = std::stoi(v);
        else if (a == "--redis_timeout_ms") cfg.redis.timeout_ms = std::stoi(v);
        else if (a == "--redis_cache_ttl") cfg.redis.cache_ttl_sec = std::stoi(v);

        else if (a == "--log_level") cfg.log_level = v;
        else if (a == "--log_file") cfg.log_file = v;
        else if (a == "--quiet") cfg.quiet = (std::stoi(v) != 0);
        else if (a == "--shutdown_grace") cfg.shutdown_grace_sec = std::stoi(v);

        else return false;
    }
    return true;
}

int main(int argc, char** argv) {
    zikzi::ServerConfig cfg;
    try {
        if (!parse_args(argc, argv, cfg)) {
            usage(argv[0]);
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << "bad option value: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    auto log = std::make_shared<zikzi::Logger>(zikzi::parse_log_level(cfg.log_level));
    if (cfg.quiet) log->set_console(false);
    if (!cfg.log_file.empty() && !log->set_log_file(cfg.log_file)) {
        log->fatal("cannot open log file " + cfg.log_file);
    }

    // Signals are taken by a dedicated thread; every other thread inherits the mask.
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<zikzi::Server> srv;
    try {
        srv = std::make_unique<zikzi::Server>(cfg, log);
    } catch (const std::exception& e) {
        log->fatal(std::string("startup failed: ") + e.what());
    }

    std::thread([&srv, &log, sigs]() {
        int sig = 0;
        if (sigwait(&sigs, &sig) == 0) {
            log->info("[SERVER] received signal " + std::to_string(sig));
            srv->stop();
        }
    }).detach();

    try {
        srv->run();  // blocking
    } catch (const std::exception& e) {
        log->fatal(std::string("server error: ") + e.what());
    }
    return 0;
}
