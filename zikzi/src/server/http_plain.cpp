/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/http_io.hpp"
#include "zikzi/internal/http_parser.hpp"
#include "zikzi/internal/listener.hpp"
#include "zikzi/internal/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <sstream>

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace zikzi::internal {

static constexpr std::size_t kInitialBodyReserve = 64 * 1024;

// --- HTTP/1.1 keep-alive helpers ---

static bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

bool should_keep_alive(const zikzi::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- Buffered reader ---

bool HttpConnReader::fill() {
    if (_pos > 0 && _pos == _buf.size()) {
        _buf.clear();
        _pos = 0;
    } else if (_pos > 65536) {
        _buf.erase(0, _pos);
        _pos = 0;
    }
    char tmp[16384];
    for (;;) {
        ssize_t n = ::recv(_fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        _buf.append(tmp, static_cast<std::size_t>(n));
        return true;
    }
}

bool HttpConnReader::read_line(std::string& line, std::size_t max) {
    for (;;) {
        const std::size_t eol = _buf.find("\r\n", _pos);
        if (eol != std::string::npos) {
            if (eol - _pos > max) return false;
            line.assign(_buf, _pos, eol - _pos);
            _pos = eol + 2;
            return true;
        }
        if (_buf.size() - _pos > max) return false;
        if (!fill()) return false;
    }
}

bool HttpConnReader::read_exact(std::size_t n, std::string& out) {
    while (_buf.size() - _pos < n) {
        // large bodies: move what we have out of the buffer first
        const std::size_t have = _buf.size() - _pos;
        if (have > 0) {
            out.append(_buf, _pos, have);
            _pos += have;
            n -= have;
        }
        if (!fill()) return false;
    }
    out.append(_buf, _pos, n);
    _pos += n;
    return true;
}

bool HttpConnReader::read_chunked(std::size_t max_body, std::string& out, bool& too_large) {
    for (;;) {
        std::string line;
        if (!read_line(line, 1024)) return false;
        std::size_t sz = 0;
        if (!parse_chunk_size(line, sz)) return false;
        if (sz == 0) break;
        if (sz > max_body || out.size() > max_body - sz) {
            too_large = true;
            return false;
        }
        if (!read_exact(sz, out)) return false;
        if (!read_line(line, 2) || !line.empty()) return false;   // CRLF after chunk data
    }
    // trailer section
    for (;;) {
        std::string line;
        if (!read_line(line, 8192)) return false;
        if (line.empty()) return true;
    }
}

RecvStatus HttpConnReader::read_request(const HttpLimits& lim, zikzi::HttpRequest& R) {
    // Skip stray CRLFs between requests
    std::string first;
    do {
        if (_buf.size() == _pos && !fill()) return RecvStatus::Closed;
        if (!read_line(first, 8192)) return RecvStatus::Bad;
    } while (first.empty());

    if (!parse_request_line(first, R)) return RecvStatus::Bad;

    std::string block;
    for (;;) {
        std::string line;
        if (!read_line(line, lim.max_header)) return RecvStatus::Bad;
        if (line.empty()) break;
        block += line;
        block += "\r\n";
        if (block.size() > lim.max_header) return RecvStatus::Bad;
    }
    parse_header_block(block, R);

    R.body.clear();
    const std::string te = lower_copy(hdr_ci(R, "Transfer-Encoding"));
    const bool chunked = te.find("chunked") != std::string::npos;

    std::size_t content_len = 0;
    if (!chunked) {
        const std::string cl = hdr_ci(R, "Content-Length");
        if (!cl.empty()) {
            try {
                content_len = static_cast<std::size_t>(std::stoull(cl));
            } catch (const std::exception&) {
                return RecvStatus::Bad;
            }
            if (content_len > lim.max_body) return RecvStatus::TooLarge;
        }
    }

    if (lower_copy(hdr_ci(R, "Expect")) == "100-continue" && is_http11(R.httpver)) {
        static const char kContinue[] = "HTTP/1.1 100 Continue\r\n\r\n";
        if (!send_all(_fd, kContinue, sizeof(kContinue) - 1)) return RecvStatus::Closed;
    }

    if (chunked) {
        bool too_large = false;
        if (!read_chunked(lim.max_body, R.body, too_large)) {
            return too_large ? RecvStatus::TooLarge : RecvStatus::Bad;
        }
        return RecvStatus::Ok;
    }

    // Grows with the data actually received; Content-Length alone is not trusted
    R.body.reserve(std::min<std::size_t>(content_len, kInitialBodyReserve));
    if (!read_exact(content_len, R.body)) return RecvStatus::Bad;
    return RecvStatus::Ok;
}

// --- Responses ---

void send_http_response(int fd, const zikzi::HttpResponse& resp, bool keep_alive,
                        const HttpLimits& lim)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status << " " << resp.reason << "\r\n";
    if (!resp.content_type.empty()) {
        oss << "Content-Type: " << resp.content_type << "\r\n";
    }
    for (const auto& kv : resp.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << lim.ka_timeout_sec
            << ", max=" << lim.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!send_all(fd, h.data(), h.size())) return;
    (void)send_all(fd, resp.body.data(), resp.body.size());
}

static zikzi::HttpResponse plain_error(int status, const char* reason) {
    zikzi::HttpResponse r;
    r.status = status;
    r.reason = reason;
    r.content_type = "text/plain";
    r.body = std::string(reason) + "\n";
    return r;
}

// --- Connection loop ---

void handle_connection_plain(int fd, const HttpLimits& lim, const HttpHandler& handler,
                             zikzi::Logger& log, const std::string& peer_ip)
{
    // Per-connection kernel timeouts
    set_socket_timeouts(fd, lim.ka_timeout_sec, lim.ka_timeout_sec);

    HttpConnReader reader(fd);
    int served = 0;
    while (served < lim.ka_max) {
        zikzi::HttpRequest R;
        const RecvStatus st = reader.read_request(lim, R);
        if (st == RecvStatus::Closed) break;
        if (st == RecvStatus::TooLarge) {
            log.warn("[HTTP] 413 ip=" + peer_ip + " body exceeds " + std::to_string(lim.max_body) + " bytes");
            send_http_response(fd, plain_error(413, "Payload Too Large"), false, lim);
            break;
        }
        if (st == RecvStatus::Bad) {
            log.debug("[HTTP] 400 ip=" + peer_ip + " malformed request");
            send_http_response(fd, plain_error(400, "Bad Request"), false, lim);
            break;
        }

        ++served;
        const bool ka = should_keep_alive(R) && served < lim.ka_max;
        const zikzi::HttpResponse resp = handler(R);
        send_http_response(fd, resp, ka, lim);
        if (!ka) break;
    }
}

} // namespace zikzi::internal
