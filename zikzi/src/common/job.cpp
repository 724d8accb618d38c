/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/types.hpp"

namespace zikzi {

const char* to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Received:   return "received";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
    }
    return "received";
}

bool parse_job_status(const std::string& s, JobStatus& out) {
    if (s == "received")   { out = JobStatus::Received;   return true; }
    if (s == "processing") { out = JobStatus::Processing; return true; }
    if (s == "completed")  { out = JobStatus::Completed;  return true; }
    if (s == "failed")     { out = JobStatus::Failed;     return true; }
    return false;
}

const char* to_string(AuthMethod m) {
    switch (m) {
        case AuthMethod::Ip:     return "ip";
        case AuthMethod::Basic:  return "basic";
        case AuthMethod::Digest: return "digest";
        case AuthMethod::None:   break;
    }
    return "none";
}

bool is_terminal(JobStatus s) {
    return s == JobStatus::Completed || s == JobStatus::Failed;
}

bool can_advance(JobStatus from, JobStatus to) {
    if (from == JobStatus::Received)   return to == JobStatus::Processing;
    if (from == JobStatus::Processing) return is_terminal(to);
    return false;
}

bool advance(PrintJob& job, JobStatus to) {
    if (!can_advance(job.status, to)) return false;
    job.status = to;
    return true;
}

int ipp_job_state(JobStatus s) {
    switch (s) {
        case JobStatus::Received:   return 3; // pending
        case JobStatus::Processing: return 5; // processing
        case JobStatus::Completed:  return 9; // completed
        case JobStatus::Failed:     return 8; // aborted
    }
    return 3;
}

const char* ipp_job_state_reason(JobStatus s) {
    switch (s) {
        case JobStatus::Received:   return "job-incoming";
        case JobStatus::Processing: return "job-printing";
        case JobStatus::Completed:  return "job-completed-successfully";
        case JobStatus::Failed:     return "job-aborted-by-system";
    }
    return "none";
}

} // namespace zikzi
