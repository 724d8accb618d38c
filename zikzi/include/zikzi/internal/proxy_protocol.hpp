/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include "zikzi/internal/trusted_proxy.hpp"

namespace zikzi::internal {

// What to do with a possible PROXY preamble on one accepted connection.
enum class ProxyPolicy {
    Use,      // parse the header if present and take its source address
    Ignore,   // leave the stream untouched, physical peer is the client
    Require   // a valid header is mandatory, otherwise reject
};

const char* to_string(ProxyPolicy p);

// Disabled => Ignore; enabled without trusted proxies => Require;
// trusted peer => Use; anyone else => Ignore.
ProxyPolicy select_proxy_policy(bool enabled, const TrustedProxyMatcher& trusted,
                                const std::string& peer_ip);

struct ProxyHeader {
    int           version = 0;     // 1 or 2
    bool          local = false;   // LOCAL command / UNKNOWN family: keep peer address
    std::string   src_ip;
    std::uint16_t src_port = 0;
    std::string   dst_ip;
    std::uint16_t dst_port = 0;
};

enum class ProxyRead {
    Header,    // header parsed
    NoHeader,  // stream does not start with a PROXY signature
    Invalid,   // signature seen but header malformed
    IoError    // timeout, reset or EOF inside the header
};

/**
 * Read a PROXY v1/v2 preamble from `fd` with a bounded receive timeout.
 * Bytes read past the header (or all bytes, on NoHeader) are returned in
 * `leftover` and belong to the payload.
 */
ProxyRead read_proxy_header(int fd, int timeout_sec, ProxyHeader& out,
                            std::string& leftover, std::string& err);

// Parse a complete header held in memory; `used` receives its length.
ProxyRead parse_proxy_header(const std::string& buf, ProxyHeader& out, std::size_t& used,
                             std::string& err);

/**
 * Apply `policy` to a freshly accepted connection. Returns false when the
 * connection must be dropped; otherwise `client_ip` is the effective client.
 */
bool accept_proxied(int fd, ProxyPolicy policy, const std::string& peer_ip, int timeout_sec,
                    std::string& client_ip, std::string& leftover, std::string& err);

} // namespace zikzi::internal
