#include <gtest/gtest.h>
#include "reporter.hpp"
#include "test_support.hpp"
#include <chrono>

TEST(ReporterTest, FormatsQueueSizeAndCounters) {
    WorkerStats s;
    s.files_downloaded = 3;
    s.integrity_mismatches = 1;
    auto line = format_stats(7, s);
    EXPECT_NE(line.find("Current queue size: 7"), std::string::npos);
    EXPECT_NE(line.find("downloaded=3"), std::string::npos);
    EXPECT_NE(line.find("hash_mismatch=1"), std::string::npos);
}

TEST(ReporterTest, StopsWithoutWaitingForInterval) {
    SubscriptionTable subs;
    JobQueue queue;
    FakeDownloader downloader;
    WorkerPool pool(queue, subs, downloader, "/tmp", 1);
    QueueReporter reporter(queue, pool, std::chrono::seconds(3600));

    auto start = std::chrono::steady_clock::now();
    reporter.start();
    reporter.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
