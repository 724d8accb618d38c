/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/memory_store.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace zikzi::internal {

MemoryStore::MemoryStore(std::shared_ptr<zikzi::Logger> log)
    : _log(std::move(log))
{
}

static bool parse_flag(const std::string& s, bool& out) {
    if (s == "1") { out = true;  return true; }
    if (s == "0") { out = false; return true; }
    return false;
}

static bool parse_epoch(const std::string& s, std::int64_t& out) {
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
    try {
        out = std::stoll(s);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool MemoryStore::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        if (_log) _log->error("[STORE] failed to open seed file: " + path);
        return false;
    }

    std::vector<User> users;
    std::vector<Token> tokens;
    std::vector<IPRegistration> ips;

    std::size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::vector<std::string> f;
        for (std::string w; iss >> w; ) f.push_back(w);

        bool ok = false;
        if (f[0] == "user" && f.size() == 6) {
            User u;
            u.id = f[1];
            u.username = f[2];
            u.password_hash = f[3] == "-" ? "" : f[3];
            u.digest_ha1    = f[4] == "-" ? "" : f[4];
            ok = parse_flag(f[5], u.allow_ipp_password);
            if (ok) users.push_back(u);
        } else if (f[0] == "token" && (f.size() == 5 || f.size() == 6)) {
            Token t;
            t.id = f[1];
            t.user_id = f[2];
            t.value = f[3];
            ok = parse_flag(f[4], t.is_active);
            if (ok && f.size() == 6) ok = parse_epoch(f[5], t.expires_at);
            if (ok) tokens.push_back(t);
        } else if (f[0] == "ip" && (f.size() == 4 || f.size() == 5)) {
            IPRegistration r;
            r.ip_address = f[1];
            r.user_id = f[2];
            ok = parse_flag(f[3], r.is_active);
            if (ok && f.size() == 5) ok = parse_epoch(f[4], r.expires_at);
            if (ok) ips.push_back(r);
        }
        if (!ok) {
            if (_log) _log->error("[STORE] bad seed line " + std::to_string(line_no) + " in " + path);
            return false;
        }
    }

    for (const auto& u : users)  put_user(u);
    for (const auto& t : tokens) put_token(t);
    for (const auto& r : ips)    put_ip_registration(r);
    if (_log) {
        _log->info("[STORE] memory backend seeded: users=" + std::to_string(users.size()) +
                   " tokens=" + std::to_string(tokens.size()) +
                   " ips=" + std::to_string(ips.size()));
    }
    return true;
}

void MemoryStore::put_user(const User& u) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _users.find(u.id);
    if (it != _users.end()) _user_names.erase(it->second.username);
    _users[u.id] = u;
    _user_names[u.username] = u.id;
}

void MemoryStore::put_token(const Token& t) {
    std::lock_guard<std::mutex> lk(_mtx);
    _tokens[t.id] = t;
}

void MemoryStore::put_ip_registration(const IPRegistration& r) {
    std::lock_guard<std::mutex> lk(_mtx);
    _ips[r.ip_address] = r;
}

bool MemoryStore::token(const std::string& id, Token& out) const {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _tokens.find(id);
    if (it == _tokens.end()) return false;
    out = it->second;
    return true;
}

bool MemoryStore::find_ip_registration(const std::string& ip, std::int64_t now,
                                       IPRegistration& out)
{
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _ips.find(ip);
    if (it == _ips.end() || !it->second.is_valid(now)) return false;
    out = it->second;
    return true;
}

bool MemoryStore::find_user_by_name(const std::string& username, User& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _user_names.find(username);
    if (it == _user_names.end()) return false;
    auto u = _users.find(it->second);
    if (u == _users.end()) return false;
    out = u->second;
    return true;
}

std::vector<Token> MemoryStore::active_tokens(const std::string& user_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<Token> out;
    for (const auto& kv : _tokens) {
        if (kv.second.user_id == user_id && kv.second.is_active) out.push_back(kv.second);
    }
    return out;
}

bool MemoryStore::touch_token(const std::string& token_id, std::int64_t when) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _tokens.find(token_id);
    if (it == _tokens.end()) return false;
    it->second.last_used_at = when;
    return true;
}

bool MemoryStore::create_job(PrintJob& job) {
    if (job.id.empty()) job.id = generate_short_id();
    if (job.created_at_ms == 0) job.created_at_ms = now_epoch_ms();

    std::lock_guard<std::mutex> lk(_mtx);
    if (_jobs.count(job.id)) return false;
    _jobs[job.id] = job;
    _job_order.push_back(job.id);
    return true;
}

bool MemoryStore::save_job(const PrintJob& job) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _jobs.find(job.id);
    if (it == _jobs.end()) return false;

    const JobStatus cur = it->second.status;
    if (is_terminal(cur)) return false;
    if (job.status != cur && !can_advance(cur, job.status)) return false;

    PrintJob next = job;
    next.created_at_ms = it->second.created_at_ms;
    it->second = next;
    return true;
}

bool MemoryStore::find_job(const std::string& id, PrintJob& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _jobs.find(id);
    if (it == _jobs.end()) return false;
    out = it->second;
    return true;
}

std::vector<PrintJob> MemoryStore::recent_jobs(const std::string& user_id, std::size_t limit) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<PrintJob> out;
    for (auto it = _job_order.rbegin(); it != _job_order.rend() && out.size() < limit; ++it) {
        auto j = _jobs.find(*it);
        if (j == _jobs.end()) continue;
        if (!user_id.empty() && j->second.user_id != user_id) continue;
        out.push_back(j->second);
    }
    return out;
}

std::size_t MemoryStore::queued_job_count() {
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t n = 0;
    for (const auto& kv : _jobs) {
        if (!is_terminal(kv.second.status)) ++n;
    }
    return n;
}

std::size_t MemoryStore::job_count() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _jobs.size();
}

} // namespace zikzi::internal
