/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>
#include <thread>
#include "zikzi/ipp_server.hpp"
#include "zikzi/internal/memory_store.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using namespace zikzi;
using zikzi::internal::ipp::Message;
using zikzi::internal::ipp::decode;
using zikzi::internal::ipp::encode;

namespace {

const char* kPrinterUri = "ipp://localhost:631/ipp/print";

struct Attr {
    ipp_tag_t   tag;
    std::string name;
    std::string value;
};

Message request(ipp_op_t op, int rid, const std::vector<Attr>& extra = {}) {
    Message m(ippNew());
    ipp_t* r = m.get();
    ippSetVersion(r, 2, 0);
    ippSetOperation(r, op);
    ippSetRequestId(r, rid);
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_CHARSET, "attributes-charset", nullptr, "utf-8");
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_LANGUAGE, "attributes-natural-language", nullptr, "en");
    ippAddString(r, IPP_TAG_OPERATION, IPP_TAG_URI, "printer-uri", nullptr, kPrinterUri);
    for (const auto& a : extra) {
        ippAddString(r, IPP_TAG_OPERATION, a.tag, a.name.c_str(), nullptr, a.value.c_str());
    }
    return m;
}

HttpRequest post(const std::string& body, const std::string& authz = {}) {
    HttpRequest r;
    r.method = "POST";
    r.path = "/ipp/print";
    r.httpver = "HTTP/1.1";
    r.headers["Content-Type"] = "application/ipp";
    if (!authz.empty()) r.headers["Authorization"] = authz;
    r.body = body;
    return r;
}

Message reply(const HttpResponse& resp) {
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.content_type, "application/ipp");
    Message m;
    EXPECT_TRUE(decode(resp.body, m));
    return m;
}

// Attributes of each job group, in order.
using AttrGroup = std::vector<ipp_attribute_t*>;

std::vector<AttrGroup> job_groups(const Message& m) {
    std::vector<AttrGroup> out;
    ipp_tag_t prev = IPP_TAG_ZERO;
    for (ipp_attribute_t* a = ippFirstAttribute(m.get()); a; a = ippNextAttribute(m.get())) {
        const ipp_tag_t g = ippGetGroupTag(a);
        if (g == IPP_TAG_JOB) {
            if (prev != IPP_TAG_JOB) out.emplace_back();
            out.back().push_back(a);
        }
        prev = g;
    }
    return out;
}

ipp_attribute_t* member(const AttrGroup& g, const char* name) {
    for (ipp_attribute_t* a : g) {
        if (ippGetName(a) && std::string(ippGetName(a)) == name) return a;
    }
    return nullptr;
}

std::vector<std::string> strings(const Message& m, const char* name) {
    std::vector<std::string> out;
    if (ipp_attribute_t* a = ippFindAttribute(m.get(), name, IPP_TAG_ZERO)) {
        for (int i = 0; i < ippGetCount(a); ++i) out.push_back(ippGetString(a, i, nullptr));
    }
    return out;
}

class IppServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.storage.path = dir.path();
        cfg.storage.ghostscript_bin = test::write_fake_gs(dir.path(), {});
        cfg.ipp.host = "0.0.0.0";
        cfg.ipp.port = 631;

        User u;
        u.id = "u1";
        u.username = "alice";
        store->put_user(u);

        Token t;
        t.id = "t1";
        t.user_id = "u1";
        t.value = "tok-secret";
        store->put_token(t);

        IPRegistration r;
        r.ip_address = "10.0.0.5";
        r.user_id = "u1";
        store->put_ip_registration(r);
    }

    void TearDown() override {
        if (jobs) EXPECT_TRUE(jobs->wait_idle(10000ms));
    }

    std::unique_ptr<IppServer> make() {
        jobs = std::make_shared<internal::JobProcessor>(
            store, cfg.storage.path,
            std::make_unique<internal::ConversionPipeline>(cfg.storage.ghostscript_bin, 10s, log), log);
        return std::make_unique<IppServer>(cfg, store, jobs, log);
    }

    test::TempDir dir;
    ServerConfig cfg;
    std::shared_ptr<Logger> log = test::quiet_logger();
    std::shared_ptr<internal::MemoryStore> store = std::make_shared<internal::MemoryStore>();
    std::shared_ptr<internal::JobProcessor> jobs;
};

} // namespace

TEST_F(IppServerTest, NonPostIsMethodNotAllowed) {
    auto srv = make();
    HttpRequest r = post("");
    r.method = "GET";
    HttpResponse resp = srv->handle(r, "10.0.0.5");
    EXPECT_EQ(resp.status, 405);
    ASSERT_EQ(resp.headers.size(), 1u);
    EXPECT_EQ(resp.headers[0].first, "Allow");
    EXPECT_EQ(resp.headers[0].second, "POST");
}

TEST_F(IppServerTest, GarbageBodyIsBadRequest) {
    auto srv = make();
    Message m = reply(srv->handle(post("abc"), "10.0.0.5"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_BAD_REQUEST);
    EXPECT_EQ(m.request_id(), 0);

    m = reply(srv->handle(post(std::string("\x02\x00\x00\x0b\x00\x00\x00\x09\x01", 9)), "10.0.0.5"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_BAD_REQUEST);
}

TEST_F(IppServerTest, PrintJobWithoutDocumentCreatesNothing) {
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_PRINT_JOB, 5))), "10.0.0.5"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_BAD_REQUEST);
    EXPECT_EQ(m.request_id(), 5);
    EXPECT_EQ(store->job_count(), 0u);
}

TEST_F(IppServerTest, PrintJobFromRegisteredIp) {
    auto srv = make();
    const std::string doc = "%!PS\nshowpage\n";
    const std::string body = encode(request(IPP_OP_PRINT_JOB, 7, {
        {IPP_TAG_NAME, "requesting-user-name", "alice"},
        {IPP_TAG_NAME, "job-name", "Invoice"},
        {IPP_TAG_MIMETYPE, "document-format", "application/postscript"},
    })) + doc;

    Message m = reply(srv->handle(post(body), "10.0.0.5"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    EXPECT_EQ(m.request_id(), 7);
    EXPECT_EQ(m.int_attr("job-id", IPP_TAG_JOB, 0), 1);
    EXPECT_EQ(m.int_attr("job-state", IPP_TAG_JOB, 0), 5);
    EXPECT_EQ(m.string_attr("job-state-reasons", IPP_TAG_JOB), "job-printing");

    ASSERT_TRUE(jobs->wait_idle(10000ms));
    auto list = store->recent_jobs("", 10);
    ASSERT_EQ(list.size(), 1u);
    const PrintJob& j = list[0];
    EXPECT_EQ(m.string_attr("job-uri", IPP_TAG_JOB), std::string(kPrinterUri) + "/jobs/" + j.id);
    EXPECT_EQ(j.user_id, "u1");
    EXPECT_EQ(j.source_ip, "10.0.0.5");
    EXPECT_EQ(j.document_name, "Invoice");
    EXPECT_EQ(j.hostname, "alice");
    EXPECT_EQ(j.app_name, "IPP Client");
    EXPECT_EQ(j.file_size, static_cast<std::int64_t>(doc.size()));
    EXPECT_EQ(j.original_file.substr(j.original_file.size() - 3), ".ps");
    EXPECT_EQ(test::read_file(j.original_file), doc);
    EXPECT_EQ(j.status, JobStatus::Completed);
}

TEST_F(IppServerTest, PdfDocumentKeepsPdfExtension) {
    auto srv = make();
    const std::string body = encode(request(IPP_OP_PRINT_JOB, 1, {
        {IPP_TAG_MIMETYPE, "document-format", "application/pdf"},
    })) + "%PDF-1.4\n";
    Message m = reply(srv->handle(post(body), "10.0.0.5"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);

    ASSERT_TRUE(jobs->wait_idle(10000ms));
    auto list = store->recent_jobs("", 10);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].original_file.substr(list[0].original_file.size() - 4), ".pdf");
}

TEST_F(IppServerTest, UnknownClientIsNotAuthorized) {
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_PRINT_JOB, 9)) + "%!PS\n"), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_NOT_AUTHORIZED);
    EXPECT_EQ(m.request_id(), 9);
    EXPECT_EQ(store->job_count(), 0u);

    m = reply(srv->handle(post(encode(request(IPP_OP_CANCEL_JOB, 10))), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_NOT_AUTHORIZED);
}

TEST_F(IppServerTest, UnregisteredAllowedPrintsAnonymously) {
    cfg.printer.allow_unregistered_ips = true;
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_PRINT_JOB, 1)) + "%!PS\n"), "192.0.2.1"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    ASSERT_TRUE(jobs->wait_idle(10000ms));
    auto list = store->recent_jobs("", 10);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_TRUE(list[0].user_id.empty());
}

TEST_F(IppServerTest, LoginEnabledSendsBothChallenges) {
    cfg.auth.allow_login = true;
    auto srv = make();
    HttpResponse resp = srv->handle(post(encode(request(IPP_OP_PRINT_JOB, 1)) + "%!PS\n"), "192.0.2.1");
    EXPECT_EQ(resp.status, 401);
    ASSERT_EQ(resp.headers.size(), 2u);
    EXPECT_EQ(resp.headers[0].first, "WWW-Authenticate");
    EXPECT_EQ(resp.headers[0].second, "Basic realm=\"zikzi\"");
    EXPECT_EQ(resp.headers[1].first, "WWW-Authenticate");
    EXPECT_EQ(resp.headers[1].second.rfind("Digest realm=\"zikzi\", nonce=\"", 0), 0u);
    EXPECT_EQ(srv->nonces().size(), 1u);
}

TEST_F(IppServerTest, BasicTokenPrints) {
    cfg.auth.allow_login = true;
    auto srv = make();
    // alice:tok-secret
    Message m = reply(srv->handle(post(encode(request(IPP_OP_PRINT_JOB, 1)) + "%!PS\n",
                                       "Basic YWxpY2U6dG9rLXNlY3JldA=="), "192.0.2.1"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    ASSERT_TRUE(jobs->wait_idle(10000ms));
    auto list = store->recent_jobs("u1", 10);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0].source_ip, "192.0.2.1");
}

TEST_F(IppServerTest, PrinterAttributesWithoutAuthMethods) {
    cfg.auth.allow_ip = false;
    cfg.auth.allow_login = false;
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_GET_PRINTER_ATTRIBUTES, 3))), "192.0.2.1"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    EXPECT_EQ(strings(m, "uri-authentication-supported"), std::vector<std::string>{"none"});
    EXPECT_EQ(m.string_attr("printer-uri-supported", IPP_TAG_PRINTER), kPrinterUri);
    EXPECT_EQ(m.int_attr("queued-job-count", IPP_TAG_PRINTER, -1), 0);
    EXPECT_EQ(m.int_attr("printer-state", IPP_TAG_PRINTER, 0), 3);
    ipp_attribute_t* ops = ippFindAttribute(m.get(), "operations-supported", IPP_TAG_ENUM);
    ASSERT_NE(ops, nullptr);
    EXPECT_EQ(ippGetCount(ops), 6);
    EXPECT_EQ(ippGetInteger(ops, 0), IPP_OP_PRINT_JOB);
}

TEST_F(IppServerTest, PrinterAttributesListAuthMethods) {
    cfg.auth.allow_login = true;
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_GET_PRINTER_ATTRIBUTES, 3))), "192.0.2.1"));
    EXPECT_EQ(strings(m, "uri-authentication-supported"),
              (std::vector<std::string>{"requesting-user-name", "basic", "digest"}));
}

TEST_F(IppServerTest, GetJobsNumbersByPosition) {
    std::vector<std::string> ids;
    for (const char* name : {"first", "second", "third"}) {
        PrintJob j;
        j.user_id = "u1";
        j.document_name = name;
        ASSERT_TRUE(store->create_job(j));
        ids.push_back(j.id);
    }
    PrintJob other;
    other.user_id = "u2";
    ASSERT_TRUE(store->create_job(other));

    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_GET_JOBS, 4))), "10.0.0.5"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    auto groups = job_groups(m);
    ASSERT_EQ(groups.size(), 3u);
    for (std::size_t i = 0; i < groups.size(); ++i) {
        ASSERT_NE(member(groups[i], "job-id"), nullptr);
        EXPECT_EQ(ippGetInteger(member(groups[i], "job-id"), 0), static_cast<int>(i + 1));
        EXPECT_EQ(ippGetInteger(member(groups[i], "job-state"), 0), 3);
    }
    EXPECT_EQ(std::string(ippGetString(member(groups[0], "job-uri"), 0, nullptr)), srv->job_uri(ids[2]));
    EXPECT_STREQ(ippGetString(member(groups[0], "job-name"), 0, nullptr), "third");

    Message lim = request(IPP_OP_GET_JOBS, 5);
    ippAddInteger(lim.get(), IPP_TAG_OPERATION, IPP_TAG_INTEGER, "limit", 2);
    m = reply(srv->handle(post(encode(lim)), "10.0.0.5"));
    EXPECT_EQ(job_groups(m).size(), 2u);
}

TEST_F(IppServerTest, GetJobAttributesLookup) {
    PrintJob j;
    j.user_id = "u1";
    j.document_name = "Report";
    j.hostname = "alice";
    ASSERT_TRUE(store->create_job(j));
    ASSERT_TRUE(advance(j, JobStatus::Processing));
    ASSERT_TRUE(store->save_job(j));
    ASSERT_TRUE(advance(j, JobStatus::Completed));
    j.page_count = 4;
    ASSERT_TRUE(store->save_job(j));

    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_GET_JOB_ATTRIBUTES, 6, {
        {IPP_TAG_URI, "job-uri", srv->job_uri(j.id)},
    }))), "192.0.2.1"));
    ASSERT_EQ(m.status(), IPP_STATUS_OK);
    EXPECT_EQ(m.int_attr("job-state", IPP_TAG_JOB, 0), 9);
    EXPECT_EQ(m.string_attr("job-state-reasons", IPP_TAG_JOB), "job-completed-successfully");
    EXPECT_EQ(m.string_attr("job-name", IPP_TAG_JOB), "Report");
    EXPECT_EQ(m.string_attr("job-originating-user-name", IPP_TAG_JOB), "alice");
    EXPECT_EQ(m.int_attr("job-media-sheets-completed", IPP_TAG_JOB, 0), 4);

    m = reply(srv->handle(post(encode(request(IPP_OP_GET_JOB_ATTRIBUTES, 7, {
        {IPP_TAG_URI, "job-uri", srv->job_uri("missing")},
    }))), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_NOT_FOUND);

    m = reply(srv->handle(post(encode(request(IPP_OP_GET_JOB_ATTRIBUTES, 8))), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_BAD_REQUEST);
}

TEST_F(IppServerTest, ValidateAndUnknownOperations) {
    auto srv = make();
    Message m = reply(srv->handle(post(encode(request(IPP_OP_VALIDATE_JOB, 2))), "10.0.0.5"));
    EXPECT_EQ(m.status(), IPP_STATUS_OK);

    // authenticated caller: the operation itself is unsupported
    m = reply(srv->handle(post(encode(request(static_cast<ipp_op_t>(0x0010), 11))), "10.0.0.5"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_OPERATION_NOT_SUPPORTED);
    EXPECT_EQ(m.request_id(), 11);

    // unauthenticated caller never learns whether the operation exists
    m = reply(srv->handle(post(encode(request(static_cast<ipp_op_t>(0x0010), 12))), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_NOT_AUTHORIZED);
    EXPECT_EQ(m.request_id(), 12);
}

TEST_F(IppServerTest, UnknownOperationIsChallengedWhenLoginEnabled) {
    cfg.auth.allow_login = true;
    auto srv = make();
    HttpResponse resp = srv->handle(post(encode(request(static_cast<ipp_op_t>(0x4001), 13))), "192.0.2.1");
    EXPECT_EQ(resp.status, 401);
    ASSERT_EQ(resp.headers.size(), 2u);
    EXPECT_EQ(resp.headers[0].second, "Basic realm=\"zikzi\"");

    // with credentials it reaches dispatch
    Message m = reply(srv->handle(post(encode(request(static_cast<ipp_op_t>(0x4001), 14)),
                                       "Basic YWxpY2U6dG9rLXNlY3JldA=="), "192.0.2.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_ERROR_OPERATION_NOT_SUPPORTED);
}

TEST_F(IppServerTest, ForwardedClientOnlyFromTrustedPeers) {
    cfg.ipp.trusted_proxies = {"127.0.0.1", "bogus"};
    auto srv = make();
    HttpRequest r = post("");
    r.headers["X-Forwarded-For"] = "198.51.100.7, 10.0.0.1";
    EXPECT_EQ(srv->client_ip(r, "127.0.0.1"), "198.51.100.7");
    EXPECT_EQ(srv->client_ip(r, "192.0.2.1"), "192.0.2.1");

    HttpRequest x = post("");
    x.headers["X-Real-IP"] = " 198.51.100.8 ";
    EXPECT_EQ(srv->client_ip(x, "127.0.0.1"), "198.51.100.8");
    EXPECT_EQ(srv->client_ip(post(""), "127.0.0.1"), "127.0.0.1");
}

TEST_F(IppServerTest, TrustProxyWithoutListTrustsEveryone) {
    cfg.ipp.trust_proxy = true;
    auto srv = make();
    HttpRequest r = post("");
    r.headers["X-Forwarded-For"] = "10.0.0.5";
    EXPECT_EQ(srv->client_ip(r, "203.0.113.1"), "10.0.0.5");

    // the forwarded address is what IP registration sees
    r.body = encode(request(IPP_OP_VALIDATE_JOB, 1));
    Message m = reply(srv->handle(r, "203.0.113.1"));
    EXPECT_EQ(m.status(), IPP_STATUS_OK);
}

TEST_F(IppServerTest, PrinterUriUsesExternalHostname) {
    cfg.printer.external_hostname = "print.example.org";
    cfg.ipp.port = 8631;
    auto srv = make();
    EXPECT_EQ(srv->printer_uri(), "ipp://print.example.org:8631/ipp/print");
    EXPECT_EQ(srv->job_uri("abc"), "ipp://print.example.org:8631/ipp/print/jobs/abc");
}

TEST_F(IppServerTest, ServesHttpOverTcp) {
    cfg.ipp.host = "127.0.0.1";
    cfg.ipp.port = 0;
    auto srv = make();
    srv->start();
    ASSERT_NE(srv->port(), 0);
    std::thread loop([&srv]{ srv->run(); });

    const std::string body = encode(request(IPP_OP_GET_PRINTER_ATTRIBUTES, 12));
    int fd = test::connect_loopback(srv->port());
    ASSERT_GE(fd, 0);
    ASSERT_TRUE(test::send_string(fd,
        "POST /ipp/print HTTP/1.1\r\nHost: localhost\r\nContent-Type: application/ipp\r\n"
        "Connection: close\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body));
    const std::string raw = test::recv_all(fd);
    ::close(fd);

    srv->stop();
    loop.join();
    EXPECT_TRUE(srv->drain(2000ms));

    ASSERT_EQ(raw.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Type: application/ipp\r\n"), std::string::npos);
    const auto hdr_end = raw.find("\r\n\r\n");
    ASSERT_NE(hdr_end, std::string::npos);
    Message m;
    ASSERT_TRUE(decode(raw.substr(hdr_end + 4), m));
    EXPECT_EQ(m.request_id(), 12);
    EXPECT_EQ(m.status(), IPP_STATUS_OK);
}
