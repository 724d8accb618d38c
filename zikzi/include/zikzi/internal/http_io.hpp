/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include "zikzi/http_request.hpp"
#include "zikzi/log.hpp"

namespace zikzi::internal {

struct HttpLimits {
    std::size_t max_body = 256u * 1024u * 1024u;
    int         ka_timeout_sec = 5;
    int         ka_max = 100;
    std::size_t max_header = 64 * 1024;
};

enum class RecvStatus {
    Ok,
    Closed,     // EOF / timeout before a request started
    Bad,        // unparseable request
    TooLarge    // body exceeds max_body
};

// Buffered reader over a connected socket; keeps pipelined bytes between requests.
class HttpConnReader {
public:
    explicit HttpConnReader(int fd) : _fd(fd) {}

    RecvStatus read_request(const HttpLimits& lim, zikzi::HttpRequest& R);

private:
    int         _fd;
    std::string _buf;
    std::size_t _pos = 0;

    bool fill();
    bool read_line(std::string& line, std::size_t max);
    bool read_exact(std::size_t n, std::string& out);
    bool read_chunked(std::size_t max_body, std::string& out, bool& too_large);
};

bool should_keep_alive(const zikzi::HttpRequest& R);

void send_http_response(int fd, const zikzi::HttpResponse& resp, bool keep_alive,
                        const HttpLimits& lim);

using HttpHandler = std::function<zikzi::HttpResponse(const zikzi::HttpRequest&)>;

// Keep-alive request loop for one plain HTTP connection. Does not close fd.
void handle_connection_plain(int fd, const HttpLimits& lim, const HttpHandler& handler,
                             zikzi::Logger& log, const std::string& peer_ip);

} // namespace zikzi::internal
