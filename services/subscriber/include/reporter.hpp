#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "concurrent_queue.hpp"
#include "worker_pool.hpp"

std::string format_stats(std::size_t queued, const WorkerStats& s);

// Logs the job queue size and worker counters every interval.
class QueueReporter {
public:
    QueueReporter(const JobQueue& queue, const WorkerPool& pool, std::chrono::seconds interval);
    ~QueueReporter();

    void start();
    void stop();

private:
    void run();

    const JobQueue& queue_;
    const WorkerPool& pool_;
    std::chrono::seconds interval_;
    std::thread thread_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_{false};
};
