#include "worker_pool.hpp"
#include "log.hpp"
#include "output_path.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <utility>

static std::string format_fixed(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

std::size_t default_worker_count(unsigned cores) {
    long n = (long)cores - 2;
    return n < 1 ? 1 : (std::size_t)n;
}

const char* link_outcome_name(LinkOutcome o) {
    switch (o) {
        case LinkOutcome::Downloaded: return "downloaded";
        case LinkOutcome::SkippedExisting: return "skipped";
        case LinkOutcome::DownloadFailed: return "download_failed";
        case LinkOutcome::PersistFailed: return "persist_failed";
        case LinkOutcome::Rejected: return "rejected";
    }
    return "rejected";
}

WorkerPool::WorkerPool(JobQueue& queue, const SubscriptionTable& subs, Downloader& downloader,
                       std::string default_dir, std::size_t workers)
    : queue_(queue), subs_(subs), downloader_(downloader),
      default_dir_(std::move(default_dir)), workers_(workers < 1 ? 1 : workers) {}

WorkerPool::~WorkerPool() {
    queue_.close();
    join();
}

void WorkerPool::start() {
    if (!threads_.empty()) return;
    threads_.reserve(workers_);
    for (std::size_t i = 0; i < workers_; ++i) {
        threads_.emplace_back([this]{ run(); });
    }
    log_info("Started " + std::to_string(workers_) + " download workers");
}

void WorkerPool::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::run() {
    while (auto job = queue_.pop()) {
        log_debug("Messages in queue: " + std::to_string(queue_.size()));
        process(*job);
    }
}

std::vector<LinkReport> WorkerPool::process(const Job& job) {
    std::vector<LinkReport> reports;
    jobs_processed_++;

    // Resolved once per job: a later add/delete only affects future jobs.
    auto out = resolve_output_path(subs_, job, default_dir_, std::chrono::system_clock::now());
    if (!out) {
        rejected_jobs_++;
        log_error("Rejecting data_id '" + job.data_id + "' on topic " + job.topic + ": not a usable relative path");
        return reports;
    }

    for (const auto& link : job.links) {
        if (link.rel != "canonical") continue;
        try {
            reports.push_back(process_link(job, link, *out));
        } catch (const std::exception& e) {
            // Anything unexpected stays confined to this link.
            log_error("Error processing " + link.href + ": " + e.what());
            reports.push_back(LinkReport{link.href, *out, LinkOutcome::PersistFailed, IntegrityResult::Skipped});
            persist_failures_++;
        }
    }
    return reports;
}

LinkReport WorkerPool::process_link(const Job& job, const Link& link, const std::filesystem::path& out) {
    LinkReport rep;
    rep.url = link.href;
    rep.path = out;
    std::string filename = url_filename(link.href);
    log_info("Attempting to download " + filename);

    if (output_exists(out)) {
        log_info("File " + filename + " already downloaded. Skipping.");
        rep.outcome = LinkOutcome::SkippedExisting;
        files_skipped_++;
        return rep;
    }

    FetchResult fetched = downloader_.fetch(link.href);
    if (!fetched.ok) {
        log_error("Error downloading " + link.href + ": " + fetched.error);
        rep.outcome = LinkOutcome::DownloadFailed;
        download_failures_++;
        return rep;
    }
    bytes_downloaded_ += fetched.body.size();

    try {
        rep.integrity = verify_integrity(fetched.body, job.integrity);
    } catch (const std::runtime_error& e) {
        log_error("Hash check for " + filename + " failed: " + e.what());
        rep.integrity = IntegrityResult::Skipped;
    }
    switch (rep.integrity) {
        case IntegrityResult::Match: integrity_matches_++; break;
        case IntegrityResult::Mismatch: integrity_mismatches_++; break;
        case IntegrityResult::Skipped: integrity_skipped_++; break;
    }

    try {
        ensure_parent_dirs(out);
        write_file(out, fetched.body);
    } catch (const std::runtime_error& e) {
        log_error("Error saving to disk: " + out.string() + ": " + e.what());
        rep.outcome = LinkOutcome::PersistFailed;
        persist_failures_++;
        return rep;
    }

    double kb = (double)fetched.body.size() / 1024.0;
    log_info("Downloaded " + filename + " of size " + format_fixed(kb) + "KB in " +
             format_fixed(fetched.seconds) + " seconds");
    rep.outcome = LinkOutcome::Downloaded;
    files_downloaded_++;
    return rep;
}

WorkerStats WorkerPool::stats() const {
    WorkerStats s;
    s.jobs_processed = jobs_processed_.load();
    s.files_downloaded = files_downloaded_.load();
    s.files_skipped = files_skipped_.load();
    s.download_failures = download_failures_.load();
    s.persist_failures = persist_failures_.load();
    s.rejected_jobs = rejected_jobs_.load();
    s.integrity_matches = integrity_matches_.load();
    s.integrity_mismatches = integrity_mismatches_.load();
    s.integrity_skipped = integrity_skipped_.load();
    s.bytes_downloaded = bytes_downloaded_.load();
    return s;
}
