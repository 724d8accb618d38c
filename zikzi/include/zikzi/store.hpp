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
#include <cstdint>
#include <string>
#include <vector>
#include "zikzi/types.hpp"

namespace zikzi {

/**
 * Repository of users, tokens, IP registrations and print jobs.
 * Implementations serialize their own writes; all methods are thread-safe.
 * Lookups return false when nothing matches or the backend failed.
 */
class Store {
public:
    virtual ~Store() = default;

    // Active, non-expired registration for this exact address.
    virtual bool find_ip_registration(const std::string& ip, std::int64_t now,
                                      IPRegistration& out) = 0;

    virtual bool find_user_by_name(const std::string& username, User& out) = 0;

    // Tokens with is_active set (expiry is checked by the caller).
    virtual std::vector<Token> active_tokens(const std::string& user_id) = 0;

    virtual bool touch_token(const std::string& token_id, std::int64_t when) = 0;

    // Assigns id and created_at_ms when empty, then persists.
    virtual bool create_job(PrintJob& job) = 0;

    // Rejects status regressions and any change to a terminal job.
    virtual bool save_job(const PrintJob& job) = 0;

    virtual bool find_job(const std::string& id, PrintJob& out) = 0;

    // Newest first; empty user_id means all users.
    virtual std::vector<PrintJob> recent_jobs(const std::string& user_id, std::size_t limit) = 0;

    // Jobs in received or processing.
    virtual std::size_t queued_job_count() = 0;
};

} // namespace zikzi
