/*
 * Part of the Zikzi project.
 *
 * SPDX-FileCopyrightText: 2025 Zikzi contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of Zikzi. See LICENSE for details.
 */

#include "zikzi/internal/pipeline.hpp"
#include "zikzi/internal/dsc_parser.hpp"
#include "zikzi/internal/subprocess.hpp"
#include "zikzi/internal/time.hpp"
#include "zikzi/internal/utils.hpp"

#include <filesystem>
#include <thread>

namespace zikzi::internal {

// Quote a path as a PostScript string literal body.
static std::string ps_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '(' || c == ')' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

ConversionPipeline::ConversionPipeline(std::string gs_bin, std::chrono::seconds timeout,
                                       std::shared_ptr<zikzi::Logger> log)
    : _gs(std::move(gs_bin)), _timeout(timeout), _log(std::move(log))
{
    if (_gs.empty()) _gs = "gs";
}

bool ConversionPipeline::run_gs(const std::vector<std::string>& args, std::string& output,
                                std::string& err) const
{
    ProcessResult pr = run_process(_gs, args, std::chrono::duration_cast<std::chrono::milliseconds>(_timeout));
    output = pr.output;
    if (pr.ok()) return true;

    std::string out = pr.output;
    trim_inplace(out);
    err = "ghostscript error: " + pr.error;
    if (!out.empty()) err += ", output: " + out;
    return false;
}

bool ConversionPipeline::convert_to_pdf(const std::string& in, const std::string& out,
                                        std::string& err) const
{
    std::string output;
    return run_gs({
        "-dNOPAUSE",
        "-dBATCH",
        "-dSAFER",
        "-sDEVICE=pdfwrite",
        "-dCompatibilityLevel=1.4",
        "-dPDFSETTINGS=/prepress",
        "-dColorConversionStrategy=/LeaveColorUnchanged",
        "-dDownsampleMonoImages=false",
        "-dDownsampleGrayImages=false",
        "-dDownsampleColorImages=false",
        "-dAutoFilterColorImages=false",
        "-dAutoFilterGrayImages=false",
        "-sOutputFile=" + out,
        in,
    }, output, err);
}

bool ConversionPipeline::render_thumbnail(const std::string& pdf, const std::string& out,
                                          std::string& err) const
{
    std::string output;
    return run_gs({
        "-dNOPAUSE",
        "-dBATCH",
        "-dSAFER",
        "-sDEVICE=png16m",
        "-r150",
        "-dFirstPage=1",
        "-dLastPage=1",
        "-sOutputFile=" + out,
        pdf,
    }, output, err);
}

bool ConversionPipeline::pdf_page_count(const std::string& pdf, int& out) const {
    std::string output, err;
    if (!run_gs({
            "-dNODISPLAY",
            "-dQUIET",
            "-dNOPAUSE",
            "-dBATCH",
            "--permit-file-read=" + pdf,
            "-c",
            "(" + ps_escape(pdf) + ") (r) file runpdfbegin pdfpagecount == quit",
        }, output, err))
    {
        _log->debug("[CONVERT] page count failed: " + err);
        return false;
    }

    trim_inplace(output);
    if (output.empty()) return false;
    int n = 0;
    for (char c : output) {
        if (c < '0' || c > '9') return false;
        if (n > 1000000) return false;
        n = n * 10 + (c - '0');
    }
    if (n <= 0) return false;
    out = n;
    return true;
}

ConversionResult ConversionPipeline::run(const std::string& original, const std::string& out_dir,
                                         const std::string& job_id) const
{
    ConversionResult r;
    const std::string pdf   = out_dir + "/" + job_id + ".pdf";
    const std::string thumb = out_dir + "/" + job_id + "_thumb.png";

    std::string err;
    if (!convert_to_pdf(original, pdf, err)) {
        r.error = "PDF conversion failed: " + err;
        return r;
    }
    r.pdf_path = pdf;

    if (render_thumbnail(pdf, thumb, err)) {
        r.thumbnail_path = thumb;
    } else {
        r.error = "thumbnail generation failed: " + err;
        _log->warn("[CONVERT] job " + job_id + ": " + r.error);
    }

    int pages = 0;
    if (!pdf_page_count(pdf, pages)) {
        pages = count_dsc_pages(original);
        if (pages <= 0) pages = 1;
    }
    r.page_count = pages;
    return r;
}

/* ---------------- JobProcessor ---------------- */

JobProcessor::JobProcessor(std::shared_ptr<zikzi::Store> store, std::string storage_root,
                           std::unique_ptr<ConversionPipeline> pipeline,
                           std::shared_ptr<zikzi::Logger> log)
    : _store(std::move(store)),
      _jobs_dir(std::move(storage_root) + "/jobs"),
      _pipeline(std::move(pipeline)),
      _log(std::move(log))
{
}

bool JobProcessor::ensure_jobs_dir() const {
    std::error_code ec;
    std::filesystem::create_directories(_jobs_dir, ec);
    if (ec) {
        _log->error("[JOB] failed to create " + _jobs_dir + ": " + ec.message());
        return false;
    }
    return true;
}

void JobProcessor::dispatch(const PrintJob& job) {
    ++_in_flight;
    auto self = shared_from_this();
    std::thread([self, job]() {
        self->process(job);
        if (--self->_in_flight == 0) {
            std::lock_guard<std::mutex> lk(self->_idle_mtx);
            self->_idle_cv.notify_all();
        }
    }).detach();
}

void JobProcessor::process(PrintJob job) {
    _log->debug("[JOB] converting " + job.id + " from " + job.original_file);
    const ConversionResult r = _pipeline->run(job.original_file, _jobs_dir, job.id);
    finish(job, r);
}

bool JobProcessor::finish(PrintJob& job, const ConversionResult& r) {
    job.processed_at = now_epoch();
    if (r.pdf_path.empty()) {
        job.status = JobStatus::Failed;
        job.error = r.error;
        _log->error("[JOB] " + job.id + " failed: " + r.error);
    } else {
        job.status = JobStatus::Completed;
        job.pdf_file = r.pdf_path;
        job.thumbnail_file = r.thumbnail_path;
        job.page_count = r.page_count;
        _log->info("[JOB] " + job.id + " completed: " + std::to_string(r.page_count) + " pages");
    }

    if (!_store->save_job(job)) {
        _log->error("[JOB] failed to save " + job.id + " as " + to_string(job.status));
        return false;
    }
    return true;
}

bool JobProcessor::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(_idle_mtx);
    return _idle_cv.wait_for(lk, timeout, [this]{ return _in_flight.load() == 0; });
}

} // namespace zikzi::internal
