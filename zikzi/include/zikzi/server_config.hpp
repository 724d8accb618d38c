/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace zikzi {

enum class StoreBackend { Memory, Redis };

struct ServerConfig {
    // Logging
    std::string log_level = "info";
    std::string log_file;           // empty => console only
    bool        quiet = false;

    // Raw PostScript socket (JetDirect style)
    struct {
        std::string host = "0.0.0.0";
        uint16_t    port = 9100;
        bool        allow_unregistered_ips = false;
        std::string external_hostname;
        bool        proxy_protocol = false;
        std::vector<std::string> trusted_proxies;
        int         proxy_header_timeout_sec = 10;
        int         read_timeout_sec = 60;   // idle limit while receiving a document
    } printer;

    // IPP over HTTP
    struct {
        bool        enabled = true;
        std::string host = "0.0.0.0";
        uint16_t    port = 631;
        bool        trust_proxy = false;
        std::vector<std::string> trusted_proxies;
        size_t      max_body = 256u * 1024u * 1024u;
        int         ka_timeout_sec = 5;
        int         ka_max = 100;
    } ipp;

    // IPP authentication
    struct {
        bool        allow_ip = true;
        bool        allow_login = false;
        std::string realm = "zikzi";
    } auth;

    // Document storage and conversion
    struct {
        std::string path = "./data";
        std::string ghostscript_bin = "gs";
        int         convert_timeout_sec = 300;
    } storage;

    // Repository backend
    StoreBackend store = StoreBackend::Memory;
    std::string  store_file;        // memory backend seed file (optional)
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "zikzi:";
        int         pool_size  = 8;
        int         timeout_ms = 200;
        int         cache_ttl_sec = 60;
    } redis;

    // Grace period for in-flight connections on shutdown
    int shutdown_grace_sec = 5;
};

} // namespace zikzi
