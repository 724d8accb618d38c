/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "zikzi/log.hpp"
#include "zikzi/store.hpp"
#include "zikzi/types.hpp"

namespace zikzi::internal {

struct ConversionResult {
    std::string pdf_path;        // empty => conversion failed
    std::string thumbnail_path;  // may be empty even on success
    int         page_count = 0;
    std::string error;           // set on PDF failure, and on thumbnail failure
};

/**
 * Ghostscript driver: PDF conversion, first-page PNG thumbnail, page count.
 * Only the PDF step can fail a conversion.
 */
class ConversionPipeline {
public:
    ConversionPipeline(std::string gs_bin, std::chrono::seconds timeout,
                       std::shared_ptr<zikzi::Logger> log);

    ConversionResult run(const std::string& original, const std::string& out_dir,
                         const std::string& job_id) const;

    bool convert_to_pdf(const std::string& in, const std::string& out, std::string& err) const;
    bool render_thumbnail(const std::string& pdf, const std::string& out, std::string& err) const;
    bool pdf_page_count(const std::string& pdf, int& out) const;

private:
    std::string _gs;
    std::chrono::seconds _timeout;
    std::shared_ptr<zikzi::Logger> _log;

    bool run_gs(const std::vector<std::string>& args, std::string& output, std::string& err) const;
};

/**
 * Applies conversion results to jobs. dispatch() never blocks: each job is
 * converted on its own detached thread which keeps the processor alive.
 */
class JobProcessor : public std::enable_shared_from_this<JobProcessor> {
public:
    JobProcessor(std::shared_ptr<zikzi::Store> store, std::string storage_root,
                 std::unique_ptr<ConversionPipeline> pipeline,
                 std::shared_ptr<zikzi::Logger> log);

    // <storage>/jobs
    const std::string& jobs_dir() const { return _jobs_dir; }
    bool ensure_jobs_dir() const;

    // Job must already be in processing.
    void dispatch(const PrintJob& job);

    // Convert synchronously and persist the outcome.
    void process(PrintJob job);

    // processed_at, status and outputs from `r`; then saved.
    bool finish(PrintJob& job, const ConversionResult& r);

    // Waits until no conversion is running; false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout);
    int in_flight() const { return _in_flight.load(); }

private:
    std::shared_ptr<zikzi::Store> _store;
    std::string _jobs_dir;
    std::unique_ptr<ConversionPipeline> _pipeline;
    std::shared_ptr<zikzi::Logger> _log;

    std::atomic<int>        _in_flight{0};
    std::mutex              _idle_mtx;
    std::condition_variable _idle_cv;
};

} // namespace zikzi::internal
