/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>

namespace zikzi {

// Job lifecycle: received -> processing -> {completed, failed}.
enum class JobStatus {
    Received,
    Processing,
    Completed,
    Failed
};

enum class AuthMethod {
    None,
    Ip,
    Basic,
    Digest
};

// Timestamps are unix epoch seconds; 0 means "unset" / "never".
struct PrintJob {
    std::string id;
    std::string user_id;          // empty => orphaned
    std::string source_ip;
    std::string hostname;
    std::string document_name;
    std::string app_name;
    std::string os_version;
    std::string original_file;
    std::string pdf_file;
    std::string thumbnail_file;
    int          page_count = 0;
    std::int64_t file_size  = 0;
    JobStatus    status     = JobStatus::Received;
    std::int64_t created_at_ms = 0;
    std::int64_t processed_at  = 0;
    std::string error;
};

struct User {
    std::string id;
    std::string username;
    std::string password_hash;      // bcrypt, may be empty
    std::string digest_ha1;         // MD5(username:realm:password), may be empty
    bool allow_ipp_password = true;
};

struct Token {
    std::string id;
    std::string user_id;
    std::string value;
    bool         is_active    = true;
    std::int64_t expires_at   = 0;
    std::int64_t last_used_at = 0;
    std::string  last_used_ip;

    bool is_valid(std::int64_t now) const {
        return is_active && (expires_at == 0 || now < expires_at);
    }
};

struct IPRegistration {
    std::string  ip_address;
    std::string  user_id;
    bool         is_active  = true;
    std::int64_t expires_at = 0;

    bool is_valid(std::int64_t now) const {
        return is_active && (expires_at == 0 || now < expires_at);
    }
};

struct AuthResult {
    bool authenticated = false;
    std::string user_id;
    AuthMethod method = AuthMethod::None;
    bool must_challenge = false;
    std::string reason;   // diagnostic only
};

// ---- job status helpers (job.cpp) ----
const char* to_string(JobStatus s);
bool parse_job_status(const std::string& s, JobStatus& out);
const char* to_string(AuthMethod m);

bool is_terminal(JobStatus s);

// True only for received->processing and processing->{completed,failed}.
bool can_advance(JobStatus from, JobStatus to);

// Applies the transition; returns false (job untouched) when illegal.
bool advance(PrintJob& job, JobStatus to);

// IPP job-state enum value and job-state-reasons keyword.
int         ipp_job_state(JobStatus s);
const char* ipp_job_state_reason(JobStatus s);

} // namespace zikzi
