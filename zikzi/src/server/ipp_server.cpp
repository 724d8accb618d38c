/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/ipp_server.hpp"
#include "zikzi/internal/http_parser.hpp"
#include "zikzi/internal/spool_file.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zikzi {

using internal::ipp::Message;
using internal::ipp::make_response;

static constexpr std::size_t kMaxJobsListed = 100;

static int set_nodelay(int s) { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static internal::AuthResolver::Options auth_options(const ServerConfig& cfg) {
    internal::AuthResolver::Options o;
    o.allow_ip = cfg.auth.allow_ip;
    o.allow_login = cfg.auth.allow_login;
    o.realm = cfg.auth.realm;
    return o;
}

IppServer::IppServer(const ServerConfig& cfg,
                     std::shared_ptr<Store> store,
                     std::shared_ptr<internal::JobProcessor> jobs,
                     std::shared_ptr<Logger> log)
    : _cfg(cfg),
      _store(std::move(store)),
      _jobs(std::move(jobs)),
      _log(std::move(log)),
      _auth(auth_options(_cfg), *_store, _nonces, _log)
{
    std::vector<std::string> rejected;
    _trusted = internal::TrustedProxyMatcher(_cfg.ipp.trusted_proxies, _cfg.ipp.trust_proxy, &rejected);
    for (const auto& r : rejected) {
        _log->warn("[IPP] ignoring unparseable trusted proxy entry: " + r);
    }

    _limits.max_body = _cfg.ipp.max_body;
    _limits.ka_timeout_sec = _cfg.ipp.ka_timeout_sec;
    _limits.ka_max = _cfg.ipp.ka_max;

    std::string host = _cfg.printer.external_hostname;
    if (host.empty()) host = _cfg.ipp.host;
    if (host.empty() || host == "0.0.0.0" || host == "::") host = "localhost";
    _printer_uri = "ipp://" + host + ":" + std::to_string(_cfg.ipp.port) + "/ipp/print";
    _port = _cfg.ipp.port;

    _nonces.start_sweeper();
}

IppServer::~IppServer() {
    stop();
    // Connection threads use this object until they leave the set.
    _conns.shutdown_and_wait();
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::close(fd);
    _nonces.stop_sweeper();
}

/* ---------------- Lifecycle ---------------- */

void IppServer::start() {
    int fd = internal::create_listen_socket(_cfg.ipp.host, _cfg.ipp.port);
    _port = internal::local_port(fd);
    _listen_fd.store(fd);
    _log->info("[IPP] listening on " + _cfg.ipp.host + ":" + std::to_string(_port) +
               " (URI: " + _printer_uri + ")");
}

void IppServer::run() {
    const int srv = _listen_fd.load();
    if (srv < 0) throw std::runtime_error("IppServer::run() before start()");

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept4(srv, reinterpret_cast<sockaddr*>(&cli), &cl, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            _log->error(std::string("[IPP] accept failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        (void)set_nodelay(fd);
        const std::string peer = internal::sockaddr_to_ip(cli);

        _conns.add(fd);
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, _limits,
                [this, &peer](const HttpRequest& R) { return handle(R, peer); },
                *_log, peer);
            _conns.remove(fd);
            ::close(fd);
        }).detach();
    }
    _log->info("[IPP] accept loop stopped");
}

void IppServer::stop() {
    if (_stop.exchange(true)) return;
    // Wakes the blocking accept()
    const int fd = _listen_fd.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

bool IppServer::drain(std::chrono::milliseconds grace) {
    if (_conns.wait_idle(grace)) return true;
    _log->warn("[IPP] closing " + std::to_string(_conns.size()) + " connection(s) after grace period");
    _conns.shutdown_all();
    return _conns.wait_idle(std::chrono::seconds(2));
}

/* ---------------- Request handling ---------------- */

std::string IppServer::client_ip(const HttpRequest& req, const std::string& peer_ip) const {
    if (!_trusted.is_trusted(peer_ip)) return peer_ip;

    const std::string xff = internal::hdr_ci(req, "X-Forwarded-For");
    if (!xff.empty()) {
        std::string first = xff.substr(0, xff.find(','));
        internal::trim_inplace(first);
        if (!first.empty()) return first;
    }
    std::string xri = internal::hdr_ci(req, "X-Real-IP");
    internal::trim_inplace(xri);
    if (!xri.empty()) return xri;
    return peer_ip;
}

bool IppServer::requires_auth(ipp_op_t op) {
    switch (op) {
        case IPP_OP_GET_PRINTER_ATTRIBUTES:
        case IPP_OP_GET_JOB_ATTRIBUTES:
            return false;
        default:
            // Print-Job, Validate-Job, Get-Jobs, Cancel-Job and anything unknown
            return true;
    }
}

std::vector<std::string> IppServer::advertised_auth_methods() const {
    std::vector<std::string> m;
    if (_cfg.auth.allow_ip) m.push_back("requesting-user-name");
    if (_cfg.auth.allow_login) {
        m.push_back("basic");
        m.push_back("digest");
    }
    if (m.empty()) m.push_back("none");
    return m;
}

HttpResponse IppServer::ipp_response(const Message& m) const {
    HttpResponse r;
    r.status = 200;
    r.reason = "OK";
    r.content_type = "application/ipp";
    r.body = internal::ipp::encode(m);
    if (r.body.empty()) {
        _log->error("[IPP] failed to encode response");
        r.status = 500;
        r.reason = "Internal Server Error";
        r.content_type = "text/plain";
        r.body = "Internal Server Error\n";
    }
    return r;
}

HttpResponse IppServer::challenge() {
    HttpResponse r;
    r.status = 401;
    r.reason = "Unauthorized";
    r.content_type = "text/plain";
    for (auto& h : _auth.challenge_headers()) {
        r.headers.emplace_back("WWW-Authenticate", std::move(h));
    }
    r.body = "Unauthorized\n";
    return r;
}

HttpResponse IppServer::handle(const HttpRequest& req, const std::string& peer_ip) {
    if (req.method != "POST") {
        HttpResponse r;
        r.status = 405;
        r.reason = "Method Not Allowed";
        r.content_type = "text/plain";
        r.headers.emplace_back("Allow", "POST");
        r.body = "Method not allowed\n";
        return r;
    }

    if (req.body.size() < 8) {
        _log->debug("[IPP] request too short: " + std::to_string(req.body.size()) + " bytes");
        return ipp_response(make_response(IPP_STATUS_ERROR_BAD_REQUEST, 0));
    }

    Message msg;
    std::string derr;
    if (!internal::ipp::decode(req.body, msg, nullptr, &derr)) {
        _log->debug("[IPP] failed to decode message: " + derr);
        return ipp_response(make_response(IPP_STATUS_ERROR_BAD_REQUEST, 0));
    }

    const std::string ip = client_ip(req, peer_ip);
    const ipp_op_t op = msg.operation();
    const std::string opname = ippOpString(op);
    _log->debug("[IPP] " + opname + " from " + ip);

    AuthResult auth;
    if (requires_auth(op)) {
        auth = _auth.resolve(req, ip);
        if (!auth.authenticated) {
            if (auth.must_challenge) {
                _log->debug("[IPP] sending auth challenge for " + opname + " to " + ip);
                return challenge();
            }
            if (!_cfg.printer.allow_unregistered_ips) {
                _log->warn("[IPP] rejected " + opname + " from unauthenticated client " + ip);
                return ipp_response(make_response(IPP_STATUS_ERROR_NOT_AUTHORIZED, msg.request_id()));
            }
            // anonymous submission permitted
        } else {
            _log->debug(std::string("[IPP] authenticated via ") + to_string(auth.method) +
                        " as user " + auth.user_id);
        }
    }

    switch (op) {
        case IPP_OP_PRINT_JOB:
            return ipp_response(print_job(msg, req.body, ip, auth));
        case IPP_OP_VALIDATE_JOB:
        case IPP_OP_CANCEL_JOB:
            return ipp_response(make_response(IPP_STATUS_OK, msg.request_id()));
        case IPP_OP_GET_PRINTER_ATTRIBUTES:
            return ipp_response(get_printer_attributes(msg));
        case IPP_OP_GET_JOBS:
            return ipp_response(get_jobs(msg, auth));
        case IPP_OP_GET_JOB_ATTRIBUTES:
            return ipp_response(get_job_attributes(msg));
        default:
            break;
    }

    _log->debug("[IPP] unsupported operation " + opname);
    return ipp_response(make_response(IPP_STATUS_ERROR_OPERATION_NOT_SUPPORTED, msg.request_id()));
}

/* ---------------- Operations ---------------- */

Message IppServer::print_job(const Message& req, const std::string& body, const std::string& client_ip,
                             const AuthResult& auth)
{
    const std::string doc = internal::ipp::extract_document(body);
    if (doc.empty()) {
        _log->debug("[IPP] Print-Job without document data");
        return make_response(IPP_STATUS_ERROR_BAD_REQUEST, req.request_id());
    }

    PrintJob job;
    job.source_ip = client_ip;
    job.status = JobStatus::Received;
    job.document_name = req.string_attr("job-name");
    job.hostname = req.string_attr("requesting-user-name");
    if (auth.authenticated) job.user_id = auth.user_id;

    if (!_store->create_job(job)) {
        _log->error("[IPP] failed to create print job");
        return make_response(IPP_STATUS_ERROR_INTERNAL, req.request_id());
    }
    if (!_jobs->ensure_jobs_dir()) {
        return make_response(IPP_STATUS_ERROR_INTERNAL, req.request_id());
    }

    const bool pdf = req.string_attr("document-format").find("pdf") != std::string::npos;
    const std::string path = _jobs->jobs_dir() + "/" + job.id + "_" + local_file_stamp() + (pdf ? ".pdf" : ".ps");
    {
        internal::SpoolFile out;
        std::string oerr;
        const bool ok = out.open(path, &oerr) && out.write(doc.data(), doc.size());
        if (!out.close() || !ok) {
            _log->error("[IPP] failed to write document " + path + (oerr.empty() ? "" : ": " + oerr));
            return make_response(IPP_STATUS_ERROR_INTERNAL, req.request_id());
        }
    }

    job.original_file = path;
    job.file_size = static_cast<std::int64_t>(doc.size());
    job.app_name = "IPP Client";
    if (!advance(job, JobStatus::Processing) || !_store->save_job(job)) {
        _log->error("[IPP] failed to update print job " + job.id);
        return make_response(IPP_STATUS_ERROR_INTERNAL, req.request_id());
    }

    _jobs->dispatch(job);

    Message resp = make_response(IPP_STATUS_OK, req.request_id());
    ipp_t* r = resp.get();
    ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_INTEGER, "job-id", 1);
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_URI, "job-uri", nullptr, job_uri(job.id).c_str());
    ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_ENUM, "job-state", ipp_job_state(JobStatus::Processing));
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_KEYWORD, "job-state-reasons", nullptr,
                 ipp_job_state_reason(JobStatus::Processing));

    _log->info("[IPP] print job " + job.id + " created (" + std::to_string(job.file_size) +
               " bytes from " + client_ip + ")");
    return resp;
}

Message IppServer::get_printer_attributes(const Message& req) {
    Message resp = make_response(IPP_STATUS_OK, req.request_id());
    ipp_t* r = resp.get();

    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_URI, "printer-uri-supported", nullptr, _printer_uri.c_str());
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "uri-security-supported", nullptr, "none");
    internal::ipp::add_strings(resp, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "uri-authentication-supported",
                               advertised_auth_methods());
    ippAddBoolean(r, IPP_TAG_PRINTER, "requesting-user-name-supported", 1);
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_NAME, "printer-name", nullptr, "Zikzi Printer");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_TEXT, "printer-info", nullptr, "Zikzi Multi-User Printing Server");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_TEXT, "printer-make-and-model", nullptr, "Zikzi Virtual Printer");
    ippAddInteger(r, IPP_TAG_PRINTER, IPP_TAG_ENUM, "printer-state", IPP_PSTATE_IDLE);
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "printer-state-reasons", nullptr, "none");
    ippAddBoolean(r, IPP_TAG_PRINTER, "printer-is-accepting-jobs", 1);

    static const int ops[] = {
        IPP_OP_PRINT_JOB, IPP_OP_VALIDATE_JOB, IPP_OP_GET_PRINTER_ATTRIBUTES,
        IPP_OP_GET_JOBS, IPP_OP_GET_JOB_ATTRIBUTES, IPP_OP_CANCEL_JOB
    };
    ippAddIntegers(r, IPP_TAG_PRINTER, IPP_TAG_ENUM, "operations-supported",
                   static_cast<int>(sizeof(ops) / sizeof(ops[0])), ops);

    internal::ipp::add_strings(resp, IPP_TAG_PRINTER, IPP_TAG_MIMETYPE, "document-format-supported",
                               {"application/postscript", "application/pdf", "application/octet-stream"});
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_MIMETYPE, "document-format-default", nullptr, "application/postscript");
    ippAddBoolean(r, IPP_TAG_PRINTER, "color-supported", 1);
    internal::ipp::add_strings(resp, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "print-color-mode-supported",
                               {"auto", "color", "monochrome"});
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "print-color-mode-default", nullptr, "auto");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_CHARSET, "charset-configured", nullptr, "utf-8");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_CHARSET, "charset-supported", nullptr, "utf-8");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_LANGUAGE, "natural-language-configured", nullptr, "en");
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_LANGUAGE, "generated-natural-language-supported", nullptr, "en");
    internal::ipp::add_strings(resp, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "ipp-versions-supported",
                               {"1.0", "1.1", "2.0"});
    ippAddString(r, IPP_TAG_PRINTER, IPP_TAG_KEYWORD, "pdl-override-supported", nullptr, "attempted");
    ippAddBoolean(r, IPP_TAG_PRINTER, "multiple-document-jobs-supported", 0);
    ippAddInteger(r, IPP_TAG_PRINTER, IPP_TAG_INTEGER, "multiple-operation-time-out", 120);
    ippAddInteger(r, IPP_TAG_PRINTER, IPP_TAG_INTEGER, "queued-job-count",
                  static_cast<int>(_store->queued_job_count()));
    return resp;
}

Message IppServer::get_jobs(const Message& req, const AuthResult& auth) {
    std::size_t limit = kMaxJobsListed;
    const int v = req.int_attr("limit", IPP_TAG_OPERATION, 0);
    if (v > 0 && static_cast<std::size_t>(v) < limit) limit = static_cast<std::size_t>(v);

    const std::string user = auth.authenticated ? auth.user_id : std::string();
    const auto jobs = _store->recent_jobs(user, limit);

    Message resp = make_response(IPP_STATUS_OK, req.request_id());
    ipp_t* r = resp.get();
    int seq = 0;
    for (const auto& j : jobs) {
        if (seq > 0) ippAddSeparator(r);
        // job-id is the position in this list; job-uri carries the real id
        ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_INTEGER, "job-id", ++seq);
        ippAddString(r, IPP_TAG_JOB, IPP_TAG_URI, "job-uri", nullptr, job_uri(j.id).c_str());
        ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_ENUM, "job-state", ipp_job_state(j.status));
        ippAddString(r, IPP_TAG_JOB, IPP_TAG_NAME, "job-name", nullptr, j.document_name.c_str());
    }
    return resp;
}

Message IppServer::get_job_attributes(const Message& req) {
    const std::string uri = req.string_attr("job-uri");
    const auto slash = uri.rfind('/');
    const std::string id = (slash == std::string::npos) ? std::string() : uri.substr(slash + 1);
    if (id.empty()) {
        return make_response(IPP_STATUS_ERROR_BAD_REQUEST, req.request_id());
    }

    PrintJob job;
    if (!_store->find_job(id, job)) {
        return make_response(IPP_STATUS_ERROR_NOT_FOUND, req.request_id());
    }

    Message resp = make_response(IPP_STATUS_OK, req.request_id());
    ipp_t* r = resp.get();
    ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_INTEGER, "job-id", 1);
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_URI, "job-uri", nullptr, job_uri(job.id).c_str());
    ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_ENUM, "job-state", ipp_job_state(job.status));
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_KEYWORD, "job-state-reasons", nullptr,
                 ipp_job_state_reason(job.status));
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_NAME, "job-name", nullptr, job.document_name.c_str());
    ippAddString(r, IPP_TAG_JOB, IPP_TAG_NAME, "job-originating-user-name", nullptr, job.hostname.c_str());
    if (job.page_count > 0) {
        ippAddInteger(r, IPP_TAG_JOB, IPP_TAG_INTEGER, "job-media-sheets-completed", job.page_count);
    }
    return resp;
}

} // namespace zikzi
