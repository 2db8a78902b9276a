#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include "concurrent_queue.hpp"
#include "downloader.hpp"
#include "integrity.hpp"
#include "job.hpp"
#include "subscription_table.hpp"

enum class LinkOutcome { Downloaded, SkippedExisting, DownloadFailed, PersistFailed, Rejected };

struct LinkReport {
    std::string url;
    std::filesystem::path path;
    LinkOutcome outcome{LinkOutcome::Rejected};
    IntegrityResult integrity{IntegrityResult::Skipped};
};

struct WorkerStats {
    std::uint64_t jobs_processed{0};
    std::uint64_t files_downloaded{0};
    std::uint64_t files_skipped{0};
    std::uint64_t download_failures{0};
    std::uint64_t persist_failures{0};
    std::uint64_t rejected_jobs{0};
    std::uint64_t integrity_matches{0};
    std::uint64_t integrity_mismatches{0};
    std::uint64_t integrity_skipped{0};
    std::uint64_t bytes_downloaded{0};
};

// max(cores - 2, 1); a reported core count of 0 means unknown.
std::size_t default_worker_count(unsigned cores = std::thread::hardware_concurrency());

const char* link_outcome_name(LinkOutcome o);

class WorkerPool {
public:
    WorkerPool(JobQueue& queue, const SubscriptionTable& subs, Downloader& downloader,
               std::string default_dir, std::size_t workers);
    // Closes the queue and joins the workers.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();
    // Returns once every worker has seen the queue closed and drained.
    void join();

    // Resolve -> exists check -> fetch -> verify -> persist for each
    // canonical link. Never throws.
    std::vector<LinkReport> process(const Job& job);

    WorkerStats stats() const;
    std::size_t size() const { return workers_; }

private:
    void run();
    LinkReport process_link(const Job& job, const Link& link, const std::filesystem::path& out);

    JobQueue& queue_;
    const SubscriptionTable& subs_;
    Downloader& downloader_;
    std::string default_dir_;
    std::size_t workers_;
    std::vector<std::thread> threads_;

    std::atomic<std::uint64_t> jobs_processed_{0};
    std::atomic<std::uint64_t> files_downloaded_{0};
    std::atomic<std::uint64_t> files_skipped_{0};
    std::atomic<std::uint64_t> download_failures_{0};
    std::atomic<std::uint64_t> persist_failures_{0};
    std::atomic<std::uint64_t> rejected_jobs_{0};
    std::atomic<std::uint64_t> integrity_matches_{0};
    std::atomic<std::uint64_t> integrity_mismatches_{0};
    std::atomic<std::uint64_t> integrity_skipped_{0};
    std::atomic<std::uint64_t> bytes_downloaded_{0};
};
