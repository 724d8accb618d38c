/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/http_parser.hpp"
#include "zikzi/internal/utils.hpp"
#include <strings.h> // strcasecmp

namespace zikzi::internal {

bool parse_request_line(const std::string& line, zikzi::HttpRequest& r) {
    const std::size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    const std::size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;

    r.method  = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    r.httpver = line.substr(sp2 + 1);
    if (!starts_with(r.httpver, "HTTP/")) return false;

    // Absolute-form targets ("http://host:631/ipp/print") keep only the path.
    if (starts_with(target, "http://") || starts_with(target, "https://")) {
        const std::size_t slash = target.find('/', target.find("//") + 2);
        target = (slash == std::string::npos) ? "/" : target.substr(slash);
    }

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return !r.path.empty() && r.path[0] == '/';
}

void parse_header_block(const std::string& block, zikzi::HttpRequest& r) {
    r.headers.clear();
    std::size_t pos = 0;
    while (pos < block.size()) {
        std::size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c != std::string::npos) {
            std::string k = line.substr(0, c), v = line.substr(c + 1);
            trim_inplace(k);
            trim_inplace(v);
            r.headers[k] = v;
        }
    }
}

std::string hdr_ci(const zikzi::HttpRequest& R, const char* name){
    auto it = R.headers.find(name);
    if (it != R.headers.end()) return it->second;
    for (const auto& kv : R.headers){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

bool parse_chunk_size(const std::string& line, std::size_t& out) {
    std::size_t v = 0;
    std::size_t i = 0;
    for (; i < line.size(); ++i) {
        const int h = hexval(line[i]);
        if (h < 0) break;
        if (v > (static_cast<std::size_t>(-1) >> 4)) return false;
        v = (v << 4) | static_cast<std::size_t>(h);
    }
    if (i == 0) return false;
    if (i < line.size() && line[i] != ';' && line[i] != ' ' && line[i] != '\t') return false;
    out = v;
    return true;
}

} // namespace zikzi::internal
