/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/ipp.hpp"

#include <algorithm>
#include <cstring>

#include <cups/cups.h>

namespace zikzi::internal::ipp {

/* ---------------- Memory I/O for ippReadIO / ippWriteIO ---------------- */

namespace {

struct ReadSource {
    const std::string* data;
    std::size_t        pos;
};

ssize_t read_cb(void* ctx, ipp_uchar_t* buf, size_t bytes) {
    auto* src = static_cast<ReadSource*>(ctx);
    const std::size_t n = std::min(bytes, src->data->size() - src->pos);
    std::memcpy(buf, src->data->data() + src->pos, n);
    src->pos += n;
    return static_cast<ssize_t>(n);
}

ssize_t write_cb(void* ctx, ipp_uchar_t* buf, size_t bytes) {
    static_cast<std::string*>(ctx)->append(reinterpret_cast<const char*>(buf), bytes);
    return static_cast<ssize_t>(bytes);
}

ipp_attribute_t* find_in_group(ipp_t* m, const char* name, ipp_tag_t group) {
    for (ipp_attribute_t* a = ippFirstAttribute(m); a; a = ippNextAttribute(m)) {
        const char* n = ippGetName(a);
        if (n && ippGetGroupTag(a) == group && std::strcmp(n, name) == 0) return a;
    }
    return nullptr;
}

} // namespace

/* ---------------- Message ---------------- */

std::string Message::string_attr(const char* name, ipp_tag_t group) const {
    if (!_ipp) return {};
    ipp_attribute_t* a = find_in_group(_ipp.get(), name, group);
    if (!a) return {};
    const char* s = ippGetString(a, 0, nullptr);
    return s ? std::string(s) : std::string();
}

int Message::int_attr(const char* name, ipp_tag_t group, int def) const {
    if (!_ipp) return def;
    ipp_attribute_t* a = find_in_group(_ipp.get(), name, group);
    if (!a) return def;
    const ipp_tag_t vt = ippGetValueTag(a);
    if (vt != IPP_TAG_INTEGER && vt != IPP_TAG_ENUM) return def;
    return ippGetInteger(a, 0);
}

/* ---------------- Wire format ---------------- */

bool decode(const std::string& data, Message& out, std::size_t* consumed, std::string* err) {
    if (data.size() < 8) {
        if (err) *err = "short header";
        return false;
    }

    Message m(ippNew());
    if (!m) {
        if (err) *err = "out of memory";
        return false;
    }

    ReadSource src{&data, 0};
    ipp_state_t st;
    do {
        st = ippReadIO(&src, read_cb, 1, nullptr, m.get());
    } while (st != IPP_STATE_DATA && st != IPP_STATE_ERROR);

    if (st == IPP_STATE_ERROR) {
        if (err) *err = cupsLastErrorString() ? cupsLastErrorString() : "malformed request";
        return false;
    }
    if (consumed) *consumed = src.pos;
    out = std::move(m);
    return true;
}

std::string encode(const Message& m) {
    std::string out;
    if (!m) return out;
    out.reserve(256);

    ippSetState(m.get(), IPP_STATE_IDLE);
    ipp_state_t st;
    do {
        st = ippWriteIO(&out, write_cb, 1, nullptr, m.get());
    } while (st != IPP_STATE_DATA && st != IPP_STATE_ERROR);

    if (st == IPP_STATE_ERROR) out.clear();
    return out;
}

std::string extract_document(const std::string& body) {
    if (body.size() <= 8) return {};
    const auto end = body.find(static_cast<char>(IPP_TAG_END), 8);
    if (end == std::string::npos || end + 1 >= body.size()) return {};
    return body.substr(end + 1);
}

Message make_response(ipp_status_t status, int request_id) {
    Message m(ippNew());
    ippSetVersion(m.get(), 2, 0);
    ippSetStatusCode(m.get(), status);
    if (request_id > 0) ippSetRequestId(m.get(), request_id);
    ippAddString(m.get(), IPP_TAG_OPERATION, IPP_TAG_CHARSET, "attributes-charset", nullptr, "utf-8");
    ippAddString(m.get(), IPP_TAG_OPERATION, IPP_TAG_LANGUAGE, "attributes-natural-language", nullptr, "en");
    return m;
}

void add_strings(Message& m, ipp_tag_t group, ipp_tag_t value_tag, const char* name,
                 const std::vector<std::string>& values)
{
    std::vector<const char*> ptrs;
    ptrs.reserve(values.size());
    for (const auto& v : values) ptrs.push_back(v.c_str());
    ippAddStrings(m.get(), group, value_tag, name, static_cast<int>(ptrs.size()), nullptr, ptrs.data());
}

} // namespace zikzi::internal::ipp
