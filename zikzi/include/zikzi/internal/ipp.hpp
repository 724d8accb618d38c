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
#include <memory>
#include <string>
#include <vector>

#include <cups/ipp.h>

namespace zikzi::internal::ipp {

// Owns one ipp_t (request or response).
class Message {
public:
    Message() = default;
    explicit Message(ipp_t* p) : _ipp(p) {}

    ipp_t* get() const { return _ipp.get(); }
    explicit operator bool() const { return _ipp != nullptr; }

    ipp_op_t     operation() const { return ippGetOperation(_ipp.get()); }
    ipp_status_t status() const { return ippGetStatusCode(_ipp.get()); }
    int          request_id() const { return ippGetRequestId(_ipp.get()); }

    // First value of a text-like attribute in `group`; empty when absent.
    std::string string_attr(const char* name, ipp_tag_t group = IPP_TAG_OPERATION) const;

    // First integer value in `group`, or `def` when absent or not an integer.
    int int_attr(const char* name, ipp_tag_t group, int def) const;

private:
    struct Deleter {
        void operator()(ipp_t* p) const { ippDelete(p); }
    };
    std::unique_ptr<ipp_t, Deleter> _ipp;
};

/**
 * Decode header and attribute groups up to and including the
 * end-of-attributes tag. On success `consumed` (if given) receives the
 * offset of the first document byte. `err` receives the library's reason.
 */
bool decode(const std::string& data, Message& out, std::size_t* consumed = nullptr,
            std::string* err = nullptr);

// Header and attribute groups of `m`, ending with the end-of-attributes tag.
std::string encode(const Message& m);

// Everything after the first 0x03 byte at or beyond offset 8; empty if none.
std::string extract_document(const std::string& body);

// Version 2.0 response whose operation group carries
// attributes-charset=utf-8 and attributes-natural-language=en.
Message make_response(ipp_status_t status, int request_id);

// Adds one attribute with several text values.
void add_strings(Message& m, ipp_tag_t group, ipp_tag_t value_tag, const char* name,
                 const std::vector<std::string>& values);

} // namespace zikzi::internal::ipp
