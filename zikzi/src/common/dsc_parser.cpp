/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/dsc_parser.hpp"
#include "zikzi/internal/utils.hpp"

#include <cctype>
#include <fstream>

namespace zikzi::internal {

static std::string strip_parens(std::string s) {
    size_t a = 0, b = s.size();
    while (a < b && (s[a] == '(' || s[a] == ')')) ++a;
    while (b > a && (s[b - 1] == '(' || s[b - 1] == ')')) --b;
    return s.substr(a, b - a);
}

// "%%Key:" followed by a non-empty value; true and the trimmed value on match.
// A bare key leaves earlier values alone.
static bool take_field(const std::string& line, const char* key, std::string& out) {
    if (!starts_with(line, key)) return false;
    std::string v = line.substr(std::char_traits<char>::length(key));
    trim_inplace(v);
    if (v.empty()) return false;
    out = std::move(v);
    return true;
}

void DscScanner::feed(const char* data, std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
        const char c = data[i];
        if (c == '\n') {
            end_line();
            continue;
        }
        if (_line.size() < kMaxLine) {
            _line.push_back(c);
        } else {
            _long = true;
        }
    }
}

void DscScanner::finish() {
    if (!_line.empty() || _long) end_line();
}

void DscScanner::end_line() {
    if (!_line.empty() && _line.back() == '\r') _line.pop_back();
    inspect(_line);
    _line.clear();
    _long = false;
}

void DscScanner::inspect(const std::string& line) {
    if (!starts_with(line, "%%") && !starts_with(line, "%!")) return;

    std::string v;
    if (take_field(line, "%%Title:", v)) {
        _meta.title = strip_parens(v);
    } else if (take_field(line, "%%Creator:", v)) {
        _meta.creator = v;
    } else if (take_field(line, "%%CreationDate:", v)) {
        _meta.creation_date = v;
    } else if (take_field(line, "%%For:", v)) {
        _meta.for_whom = strip_parens(v);
    } else if (take_field(line, "%%Pages:", v)) {
        int n = 0;
        std::size_t i = 0;
        while (i < v.size() && std::isdigit(static_cast<unsigned char>(v[i]))) {
            if (n < 1000000) n = n * 10 + (v[i] - '0');
            ++i;
        }
        if (i > 0) _meta.pages = n;
    } else if (take_field(line, "%%BoundingBox:", v)) {
        _meta.bounding_box = v;
    } else if (starts_with(line, "%%Page:")) {
        ++_meta.page_markers;
    }
}

int count_dsc_pages(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.good()) return -1;

    DscScanner sc;
    char buf[16384];
    while (in) {
        in.read(buf, sizeof(buf));
        const auto got = in.gcount();
        if (got > 0) sc.feed(buf, static_cast<std::size_t>(got));
    }
    sc.finish();
    return sc.metadata().page_markers;
}

} // namespace zikzi::internal
