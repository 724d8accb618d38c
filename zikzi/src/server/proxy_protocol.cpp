/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/proxy_protocol.hpp"
#include "zikzi/internal/listener.hpp"
#include "zikzi/internal/utils.hpp"

#include <cerrno>
#include <algorithm>
#include <cstring>
#include <sstream>
#include <vector>

#include <arpa/inet.h>
#include <sys/socket.h>

namespace zikzi::internal {

static const char kV2Sig[12] = {'\r', '\n', '\r', '\n', '\0', '\r', '\n', 'Q', 'U', 'I', 'T', '\n'};
static const char kV1Sig[6]  = {'P', 'R', 'O', 'X', 'Y', ' '};
static constexpr std::size_t kV1MaxLen = 107;
static constexpr std::size_t kV2HdrLen = 16;

const char* to_string(ProxyPolicy p) {
    switch (p) {
        case ProxyPolicy::Use:     return "use";
        case ProxyPolicy::Ignore:  return "ignore";
        case ProxyPolicy::Require: return "require";
    }
    return "ignore";
}

ProxyPolicy select_proxy_policy(bool enabled, const TrustedProxyMatcher& trusted,
                                const std::string& peer_ip)
{
    if (!enabled) return ProxyPolicy::Ignore;
    if (trusted.empty()) return ProxyPolicy::Require;
    return trusted.is_trusted(peer_ip) ? ProxyPolicy::Use : ProxyPolicy::Ignore;
}

// How `buf` relates to a signature: 1 full match, 0 still a prefix, -1 mismatch.
static int match_sig(const std::string& buf, const char* sig, std::size_t n) {
    const std::size_t k = std::min(buf.size(), n);
    if (std::memcmp(buf.data(), sig, k) != 0) return -1;
    return k == n ? 1 : 0;
}

static bool parse_port(const std::string& s, std::uint16_t& out) {
    if (s.empty() || s.size() > 5) return false;
    unsigned v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    if (v > 65535) return false;
    out = static_cast<std::uint16_t>(v);
    return true;
}

static std::string ntop(int af, const unsigned char* p) {
    char buf[INET6_ADDRSTRLEN] = {0};
    inet_ntop(af, p, buf, sizeof(buf));
    return buf;
}

static ProxyRead parse_v1(const std::string& buf, ProxyHeader& out, std::size_t& used,
                          std::string& err, bool& need_more)
{
    const std::size_t eol = buf.find("\r\n");
    if (eol == std::string::npos) {
        if (buf.size() >= kV1MaxLen) {
            err = "v1 header too long";
            return ProxyRead::Invalid;
        }
        need_more = true;
        return ProxyRead::Invalid;
    }
    if (eol + 2 > kV1MaxLen) {
        err = "v1 header too long";
        return ProxyRead::Invalid;
    }

    std::istringstream iss(buf.substr(0, eol));
    std::vector<std::string> f;
    for (std::string w; iss >> w; ) f.push_back(w);

    ProxyHeader h;
    h.version = 1;
    used = eol + 2;
    if (f.size() >= 2 && f[1] == "UNKNOWN") {
        h.local = true;
        out = h;
        return ProxyRead::Header;
    }
    if (f.size() != 6 || (f[1] != "TCP4" && f[1] != "TCP6")) {
        err = "v1 header malformed";
        return ProxyRead::Invalid;
    }

    IpAddr src, dst;
    if (!parse_ip(f[2], src) || !parse_ip(f[3], dst) ||
        !parse_port(f[4], h.src_port) || !parse_port(f[5], h.dst_port))
    {
        err = "v1 header has bad address";
        return ProxyRead::Invalid;
    }
    const bool tcp6 = f[1] == "TCP6";
    if ((f[2].find(':') != std::string::npos) != tcp6 || (f[3].find(':') != std::string::npos) != tcp6) {
        err = "v1 address family mismatch";
        return ProxyRead::Invalid;
    }
    h.src_ip = src.v6 ? f[2] : ntop(AF_INET, src.b.data());
    h.dst_ip = f[3];
    out = h;
    return ProxyRead::Header;
}

static ProxyRead parse_v2(const std::string& buf, ProxyHeader& out, std::size_t& used,
                          std::string& err, bool& need_more)
{
    if (buf.size() < kV2HdrLen) {
        need_more = true;
        return ProxyRead::Invalid;
    }
    const auto* p = reinterpret_cast<const unsigned char*>(buf.data());
    const unsigned ver = p[12] >> 4;
    const unsigned cmd = p[12] & 0x0F;
    const unsigned fam = p[13];
    const std::size_t len = (static_cast<std::size_t>(p[14]) << 8) | p[15];

    if (ver != 2) {
        err = "v2 bad version";
        return ProxyRead::Invalid;
    }
    if (cmd > 1) {
        err = "v2 bad command";
        return ProxyRead::Invalid;
    }
    if (buf.size() < kV2HdrLen + len) {
        need_more = true;
        return ProxyRead::Invalid;
    }
    used = kV2HdrLen + len;

    ProxyHeader h;
    h.version = 2;
    const unsigned char* a = p + kV2HdrLen;
    const unsigned af = fam >> 4;
    if (cmd == 0 || af == 0 || af == 3) {
        // LOCAL, AF_UNSPEC and AF_UNIX keep the physical peer
        h.local = true;
    } else if (af == 1) {
        if (len < 12) {
            err = "v2 short inet address block";
            return ProxyRead::Invalid;
        }
        h.src_ip = ntop(AF_INET, a);
        h.dst_ip = ntop(AF_INET, a + 4);
        h.src_port = static_cast<std::uint16_t>((a[8] << 8) | a[9]);
        h.dst_port = static_cast<std::uint16_t>((a[10] << 8) | a[11]);
    } else if (af == 2) {
        if (len < 36) {
            err = "v2 short inet6 address block";
            return ProxyRead::Invalid;
        }
        h.src_ip = ntop(AF_INET6, a);
        h.dst_ip = ntop(AF_INET6, a + 16);
        h.src_port = static_cast<std::uint16_t>((a[32] << 8) | a[33]);
        h.dst_port = static_cast<std::uint16_t>((a[34] << 8) | a[35]);
        IpAddr ip;
        if (parse_ip(h.src_ip, ip) && !ip.v6) {
            // v4-mapped source: report it as plain v4
            h.src_ip = ntop(AF_INET, ip.b.data());
        }
    } else {
        err = "v2 bad address family";
        return ProxyRead::Invalid;
    }
    out = h;
    return ProxyRead::Header;
}

// Header / NoHeader / Invalid; need_more when buf is a truncated header.
static ProxyRead try_parse(const std::string& buf, ProxyHeader& out, std::size_t& used,
                       std::string& err, bool& need_more)
{
    need_more = false;
    const int v2 = match_sig(buf, kV2Sig, sizeof(kV2Sig));
    const int v1 = match_sig(buf, kV1Sig, sizeof(kV1Sig));
    if (v2 == 1) return parse_v2(buf, out, used, err, need_more);
    if (v1 == 1) return parse_v1(buf, out, used, err, need_more);
    if (v1 < 0 && v2 < 0) return ProxyRead::NoHeader;
    need_more = true;
    return ProxyRead::Invalid;
}

ProxyRead parse_proxy_header(const std::string& buf, ProxyHeader& out, std::size_t& used,
                             std::string& err)
{
    bool need_more = false;
    ProxyRead r = try_parse(buf, out, used, err, need_more);
    if (need_more) {
        err = "truncated header";
        return ProxyRead::Invalid;
    }
    return r;
}

ProxyRead read_proxy_header(int fd, int timeout_sec, ProxyHeader& out,
                            std::string& leftover, std::string& err)
{
    set_socket_timeouts(fd, timeout_sec, timeout_sec);

    std::string buf;
    char chunk[512];
    ProxyRead r = ProxyRead::IoError;
    for (;;) {
        std::size_t used = 0;
        bool need_more = false;
        if (!buf.empty()) {
            r = try_parse(buf, out, used, err, need_more);
            if (!need_more) {
                if (r == ProxyRead::Header) buf.erase(0, used);
                break;
            }
        }

        ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            err = (errno == EAGAIN || errno == EWOULDBLOCK) ? "header read timed out"
                                                            : std::string(std::strerror(errno));
            r = ProxyRead::IoError;
            break;
        }
        if (n == 0) {
            if (buf.empty()) {
                // empty stream: nothing to strip
                r = ProxyRead::NoHeader;
            } else {
                err = "connection closed inside header";
                r = ProxyRead::IoError;
            }
            break;
        }
        buf.append(chunk, static_cast<std::size_t>(n));
    }

    set_socket_timeouts(fd, 0, 0);
    leftover = std::move(buf);
    return r;
}

bool accept_proxied(int fd, ProxyPolicy policy, const std::string& peer_ip, int timeout_sec,
                    std::string& client_ip, std::string& leftover, std::string& err)
{
    client_ip = peer_ip;
    leftover.clear();
    if (policy == ProxyPolicy::Ignore) return true;

    ProxyHeader h;
    const ProxyRead r = read_proxy_header(fd, timeout_sec, h, leftover, err);
    switch (r) {
        case ProxyRead::Header:
            if (!h.local && !h.src_ip.empty()) client_ip = h.src_ip;
            return true;
        case ProxyRead::NoHeader:
            if (policy == ProxyPolicy::Require) {
                err = "PROXY header required";
                return false;
            }
            return true;
        case ProxyRead::Invalid:
        case ProxyRead::IoError:
            return false;
    }
    return false;
}

} // namespace zikzi::internal
