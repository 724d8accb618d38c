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
#include "zikzi/http_request.hpp"

namespace zikzi::internal {

// Parse "POST /ipp/print?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, zikzi::HttpRequest& r);

// Parse "Name: value" header lines (CRLF separated) into r.headers.
void parse_header_block(const std::string& block, zikzi::HttpRequest& r);

// Case-insensitive header lookup
std::string hdr_ci(const zikzi::HttpRequest& R, const char* name);

// Parse a chunk-size line ("1a3f;ext=1"); false on garbage.
bool parse_chunk_size(const std::string& line, std::size_t& out);

} // namespace zikzi::internal
