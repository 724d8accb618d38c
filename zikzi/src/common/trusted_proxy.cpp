/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/trusted_proxy.hpp"
#include "zikzi/internal/utils.hpp"

#include <arpa/inet.h>
#include <cstdlib>

namespace zikzi::internal {

bool parse_ip(const std::string& s, IpAddr& out) {
    IpAddr a;
    if (s.find(':') == std::string::npos) {
        in_addr v4{};
        if (inet_pton(AF_INET, s.c_str(), &v4) != 1) return false;
        const auto* p = reinterpret_cast<const std::uint8_t*>(&v4.s_addr);
        for (int i = 0; i < 4; ++i) a.b[i] = p[i];
        a.v6 = false;
    } else {
        in6_addr v6{};
        if (inet_pton(AF_INET6, s.c_str(), &v6) != 1) return false;
        for (int i = 0; i < 16; ++i) a.b[i] = v6.s6_addr[i];
        a.v6 = true;

        // ::ffff:a.b.c.d compares as plain IPv4
        static const std::uint8_t mapped[12] = {0,0,0,0,0,0,0,0,0,0,0xff,0xff};
        bool is_mapped = true;
        for (int i = 0; i < 12; ++i) if (a.b[i] != mapped[i]) { is_mapped = false; break; }
        if (is_mapped) {
            for (int i = 0; i < 4; ++i) a.b[i] = a.b[12 + i];
            for (int i = 4; i < 16; ++i) a.b[i] = 0;
            a.v6 = false;
        }
    }
    out = a;
    return true;
}

TrustedProxyMatcher::TrustedProxyMatcher(const std::vector<std::string>& entries,
                                         bool trust_all_when_empty,
                                         std::vector<std::string>* rejected)
    : _trust_all_when_empty(trust_all_when_empty)
{
    for (std::string e : entries) {
        trim_inplace(e);
        if (e.empty()) continue;

        Net n;
        const std::size_t slash = e.find('/');
        const std::string host = (slash == std::string::npos) ? e : e.substr(0, slash);
        if (!parse_ip(host, n.addr)) {
            if (rejected) rejected->push_back(e);
            continue;
        }
        const int max_prefix = n.addr.v6 ? 128 : 32;
        if (slash == std::string::npos) {
            n.prefix = max_prefix;
        } else {
            const std::string bits = e.substr(slash + 1);
            char* end = nullptr;
            const long v = std::strtol(bits.c_str(), &end, 10);
            if (bits.empty() || *end != '\0' || v < 0 || v > max_prefix) {
                if (rejected) rejected->push_back(e);
                continue;
            }
            n.prefix = static_cast<int>(v);
        }
        _nets.push_back(n);
    }
}

bool TrustedProxyMatcher::contains(const Net& n, const IpAddr& ip) {
    if (n.addr.v6 != ip.v6) return false;
    int bits = n.prefix;
    for (int i = 0; bits > 0; ++i, bits -= 8) {
        const std::uint8_t mask = bits >= 8 ? 0xff : static_cast<std::uint8_t>(0xff << (8 - bits));
        if ((n.addr.b[i] & mask) != (ip.b[i] & mask)) return false;
    }
    return true;
}

bool TrustedProxyMatcher::is_trusted(const std::string& ip) const {
    if (_nets.empty()) return _trust_all_when_empty;

    IpAddr a;
    if (!parse_ip(ip, a)) return false;
    for (const auto& n : _nets) {
        if (contains(n, a)) return true;
    }
    return false;
}

} // namespace zikzi::internal
