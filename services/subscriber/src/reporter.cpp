#include "reporter.hpp"
#include "log.hpp"
#include <sstream>

std::string format_stats(std::size_t queued, const WorkerStats& s) {
    std::ostringstream os;
    os << "Current queue size: " << queued
       << " (jobs=" << s.jobs_processed
       << " downloaded=" << s.files_downloaded
       << " skipped=" << s.files_skipped
       << " download_failures=" << s.download_failures
       << " persist_failures=" << s.persist_failures
       << " rejected=" << s.rejected_jobs
       << " hash_match=" << s.integrity_matches
       << " hash_mismatch=" << s.integrity_mismatches
       << " hash_skipped=" << s.integrity_skipped
       << " bytes=" << s.bytes_downloaded << ")";
    return os.str();
}

QueueReporter::QueueReporter(const JobQueue& queue, const WorkerPool& pool, std::chrono::seconds interval)
    : queue_(queue), pool_(pool), interval_(interval) {}

QueueReporter::~QueueReporter() {
    stop();
}

void QueueReporter::start() {
    if (thread_.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = false;
    }
    thread_ = std::thread([this]{ run(); });
}

void QueueReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void QueueReporter::run() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        log_info(format_stats(queue_.size(), pool_.stats()));
        cv_.wait_for(lock, interval_, [&]{ return stopping_; });
    }
}
