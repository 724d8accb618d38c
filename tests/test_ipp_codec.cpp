/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "zikzi/internal/ipp.hpp"

using namespace zikzi::internal::ipp;

namespace {

Message sample_request() {
    Message m(ippNew());
    ipp_t* r = m.get();
    ippSetVersion(r, 1, 1);
    ippSetOperation(r, IPP_OP_PRINT_JOB);
    ippSetRequestId(r, 42);
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_CHARSET, "attributes-charset", nullptr, "utf-8");
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_LANGUAGE, "attributes-natural-language", nullptr, "en");
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_URI, "printer-uri", nullptr, "ipp://localhost:631/ipp/print");
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_NAME, "job-name", nullptr, "Invoice");
    ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_INTEGER, "copies", 2);
    ippAddBoolean(r, IPP_TAG_JOB, "ipp-attribute-fidelity", 1);
    add_strings(m, IPP_TAG_JOB, IPP_TAG_KEYWORD, "media-col-ready", {"iso_a4_210x297mm", "na_letter_8.5x11in"});
    return m;
}

const std::string kHeader("\x02\x00\x00\x0b\x00\x00\x00\x01", 8);

} // namespace

TEST(IppCodec, EncodesHeaderBigEndian) {
    const std::string wire = encode(sample_request());
    ASSERT_GE(wire.size(), 9u);
    EXPECT_EQ(static_cast<unsigned char>(wire[0]), 1);
    EXPECT_EQ(static_cast<unsigned char>(wire[1]), 1);
    EXPECT_EQ(static_cast<unsigned char>(wire[2]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(wire[3]), 0x02);
    EXPECT_EQ(static_cast<unsigned char>(wire[7]), 42);
    EXPECT_EQ(static_cast<unsigned char>(wire[8]), IPP_TAG_OPERATION);
    EXPECT_EQ(static_cast<unsigned char>(wire.back()), IPP_TAG_END);
}

TEST(IppCodec, DecodesGroupsAndAdditionalValues) {
    Message m;
    std::size_t consumed = 0;
    const std::string wire = encode(sample_request());
    ASSERT_TRUE(decode(wire + "%!PS-Adobe", m, &consumed));
    EXPECT_EQ(consumed, wire.size());
    EXPECT_EQ(m.operation(), IPP_OP_PRINT_JOB);
    EXPECT_EQ(m.request_id(), 42);
    int minor = 0;
    EXPECT_EQ(ippGetVersion(m.get(), &minor), 1);
    EXPECT_EQ(minor, 1);

    EXPECT_EQ(m.string_attr("job-name"), "Invoice");
    EXPECT_TRUE(m.string_attr("job-name", IPP_TAG_JOB).empty());
    EXPECT_EQ(m.int_attr("copies", IPP_TAG_JOB, 0), 2);
    EXPECT_EQ(m.int_attr("copies", IPP_TAG_OPERATION, -1), -1);
    EXPECT_EQ(m.int_attr("job-name", IPP_TAG_OPERATION, -1), -1);

    ipp_attribute_t* fidelity = ippFindAttribute(m.get(), "ipp-attribute-fidelity", IPP_TAG_BOOLEAN);
    ASSERT_NE(fidelity, nullptr);
    EXPECT_TRUE(ippGetBoolean(fidelity, 0));

    ipp_attribute_t* media = ippFindAttribute(m.get(), "media-col-ready", IPP_TAG_KEYWORD);
    ASSERT_NE(media, nullptr);
    ASSERT_EQ(ippGetCount(media), 2);
    EXPECT_STREQ(ippGetString(media, 1, nullptr), "na_letter_8.5x11in");
}

TEST(IppCodec, RejectsMalformedInput) {
    Message m;
    std::string err;
    EXPECT_FALSE(decode(std::string("\x02\x00\x00\x0b", 4), m, nullptr, &err));
    EXPECT_EQ(err, "short header");

    // truncated value
    err.clear();
    EXPECT_FALSE(decode(kHeader + std::string("\x01\x47\x00\x01" "a" "\x00\x09" "b", 8), m, nullptr, &err));
    EXPECT_FALSE(err.empty());

    // integer with the wrong width
    err.clear();
    EXPECT_FALSE(decode(kHeader + std::string("\x01\x21\x00\x01" "n" "\x00\x02\x00\x01\x03", 10), m, nullptr, &err));
    EXPECT_FALSE(err.empty());

    // no end-of-attributes tag
    err.clear();
    EXPECT_FALSE(decode(kHeader + std::string("\x01\x47\x00\x01" "a" "\x00\x01" "b", 8), m, nullptr, &err));
    EXPECT_FALSE(err.empty());

    // additional value with no attribute to attach to
    err.clear();
    EXPECT_FALSE(decode(kHeader + std::string("\x01\x44\x00\x00\x00\x01" "x" "\x03", 8), m, nullptr, &err));
    EXPECT_FALSE(err.empty());

    EXPECT_FALSE(m);
}

TEST(IppCodec, ExtractDocumentAfterEndTag) {
    const std::string head = encode(sample_request());
    EXPECT_EQ(extract_document(head + "%!PS\nshowpage\n"), "%!PS\nshowpage\n");
    EXPECT_TRUE(extract_document(head).empty());
    EXPECT_TRUE(extract_document(kHeader).empty());
}

TEST(IppCodec, ResponseCarriesCharsetAndLanguage) {
    Message back;
    ASSERT_TRUE(decode(encode(make_response(IPP_STATUS_ERROR_NOT_FOUND, 7)), back));
    int minor = -1;
    EXPECT_EQ(ippGetVersion(back.get(), &minor), 2);
    EXPECT_EQ(minor, 0);
    EXPECT_EQ(back.status(), IPP_STATUS_ERROR_NOT_FOUND);
    EXPECT_EQ(back.request_id(), 7);
    EXPECT_EQ(back.string_attr("attributes-charset"), "utf-8");
    EXPECT_EQ(back.string_attr("attributes-natural-language"), "en");
}

TEST(IppCodec, ResponseToUndecodableRequestHasZeroId) {
    const std::string wire = encode(make_response(IPP_STATUS_ERROR_BAD_REQUEST, 0));
    ASSERT_GE(wire.size(), 8u);
    EXPECT_EQ(wire.substr(0, 8), std::string("\x02\x00\x04\x00\x00\x00\x00\x00", 8));
}
