/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "zikzi/log.hpp"
#include "zikzi/store.hpp"

namespace zikzi::internal {

// In-process Store. Contents vanish on restart.
class MemoryStore : public zikzi::Store {
public:
    explicit MemoryStore(std::shared_ptr<zikzi::Logger> log = nullptr);

    /**
     * Seed from a text file, one record per line ('#' starts a comment):
     *   user  <id> <username> <bcrypt-hash|-> <digest-ha1|-> <allow-password 0|1>
     *   token <id> <user-id> <value> <active 0|1> [expires-epoch]
     *   ip    <address> <user-id> <active 0|1> [expires-epoch]
     * Nothing is applied when any line is malformed.
     */
    bool load_file(const std::string& path);

    void put_user(const User& u);
    void put_token(const Token& t);
    void put_ip_registration(const IPRegistration& r);
    bool token(const std::string& id, Token& out) const;

    bool find_ip_registration(const std::string& ip, std::int64_t now,
                              IPRegistration& out) override;
    bool find_user_by_name(const std::string& username, User& out) override;
    std::vector<Token> active_tokens(const std::string& user_id) override;
    bool touch_token(const std::string& token_id, std::int64_t when) override;
    bool create_job(PrintJob& job) override;
    bool save_job(const PrintJob& job) override;
    bool find_job(const std::string& id, PrintJob& out) override;
    std::vector<PrintJob> recent_jobs(const std::string& user_id, std::size_t limit) override;
    std::size_t queued_job_count() override;

    std::size_t job_count() const;

private:
    std::shared_ptr<zikzi::Logger> _log;

    mutable std::mutex _mtx;
    std::unordered_map<std::string, User>           _users;      // id -> user
    std::unordered_map<std::string, std::string>    _user_names; // username -> id
    std::unordered_map<std::string, Token>          _tokens;     // id -> token
    std::unordered_map<std::string, IPRegistration> _ips;        // address -> registration
    std::unordered_map<std::string, PrintJob>       _jobs;       // id -> job
    std::vector<std::string>                        _job_order;  // creation order
};

} // namespace zikzi::internal
