/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zikzi::internal {

// Parsed textual address; v4 addresses live in the first 4 bytes.
struct IpAddr {
    bool v6 = false;
    std::array<std::uint8_t, 16> b{};
};

bool parse_ip(const std::string& s, IpAddr& out);

// Decides whether a peer may supply forwarded-IP or PROXY-protocol headers.
class TrustedProxyMatcher {
public:
    TrustedProxyMatcher() = default;

    // Entries are "10.0.0.0/8", "2001:db8::/32" or bare IPs (/32, /128).
    // Unparseable entries are skipped and reported via `rejected`.
    TrustedProxyMatcher(const std::vector<std::string>& entries, bool trust_all_when_empty,
                        std::vector<std::string>* rejected = nullptr);

    bool is_trusted(const std::string& ip) const;

    bool empty() const { return _nets.empty(); }
    std::size_t size() const { return _nets.size(); }

private:
    struct Net {
        IpAddr addr;
        int    prefix = 0;
    };
    std::vector<Net> _nets;
    bool _trust_all_when_empty = false;

    static bool contains(const Net& n, const IpAddr& ip);
};

} // namespace zikzi::internal
