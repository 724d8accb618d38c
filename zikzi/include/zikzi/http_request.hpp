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
#include <unordered_map>
#include <utility>
#include <vector>

namespace zikzi {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/ipp/print"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

// Response handed back to the connection loop. Headers may repeat
// (two WWW-Authenticate lines on a challenge).
struct HttpResponse {
    int         status = 200;
    std::string reason = "OK";
    std::string content_type = "application/ipp";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

} // namespace zikzi
