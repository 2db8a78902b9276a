#include <gtest/gtest.h>
#include "output_path.hpp"
#include "test_support.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <csignal>
#include <sys/resource.h>
#include <fstream>
#include <sstream>

namespace {
const std::string kBody = "payload-bytes";
const std::string kBodySha256 = "gItZZktq25J047vQdm567JZZeGwi/bglxJyn/aHGI24=";

std::string read_file(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}
}

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = make_temp_dir("wis2_worker_pool");
        data_dir_ = (root_ / "data").string();
        default_dir_ = (root_ / "default").string();
        subs_.add("a", data_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(root_);
    }

    Job canonical_job(const std::string& href, std::optional<Integrity> integrity = std::nullopt) {
        Job job;
        job.topic = "a";
        job.data_id = "urn:x:1";
        job.links.push_back({"canonical", href});
        job.integrity = std::move(integrity);
        return job;
    }

    std::filesystem::path expected_path(const std::string& dir, const std::string& name) {
        return std::filesystem::path(dir) / date_partition(std::chrono::system_clock::now()) / name;
    }

    std::filesystem::path root_;
    std::string data_dir_;
    std::string default_dir_;
    SubscriptionTable subs_;
    JobQueue queue_;
    FakeDownloader downloader_;
};

TEST_F(WorkerPoolTest, DownloadsVerifiesAndPersists) {
    downloader_.serve("http://h/f.bin", kBody);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);

    auto reports = pool.process(canonical_job("http://h/f.bin", Integrity{"sha256", kBodySha256}));
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, LinkOutcome::Downloaded);
    EXPECT_EQ(reports[0].integrity, IntegrityResult::Match);
    EXPECT_EQ(reports[0].path, expected_path(data_dir_, "urnx1"));
    EXPECT_EQ(read_file(reports[0].path), kBody);

    auto s = pool.stats();
    EXPECT_EQ(s.files_downloaded, 1u);
    EXPECT_EQ(s.integrity_matches, 1u);
    EXPECT_EQ(s.bytes_downloaded, kBody.size());
}

TEST_F(WorkerPoolTest, MismatchStillPersists) {
    downloader_.serve("http://h/f.bin", kBody);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);

    auto reports = pool.process(canonical_job("http://h/f.bin", Integrity{"sha256", "AAAA"}));
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, LinkOutcome::Downloaded);
    EXPECT_EQ(reports[0].integrity, IntegrityResult::Mismatch);
    EXPECT_TRUE(output_exists(reports[0].path));
    EXPECT_EQ(pool.stats().integrity_mismatches, 1u);
}

TEST_F(WorkerPoolTest, NoCanonicalLinkMeansNoFetchAndNoFile) {
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    Job job = canonical_job("http://h/f.bin");
    job.links[0].rel = "via";

    EXPECT_TRUE(pool.process(job).empty());
    EXPECT_EQ(downloader_.calls(), 0);
    EXPECT_FALSE(std::filesystem::exists(data_dir_));
}

TEST_F(WorkerPoolTest, ExistingFileIsNotFetchedAgain) {
    downloader_.serve("http://h/f.bin", kBody);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    auto path = expected_path(data_dir_, "urnx1");
    ensure_parent_dirs(path);
    write_file(path, "corrupt");

    auto reports = pool.process(canonical_job("http://h/f.bin"));
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, LinkOutcome::SkippedExisting);
    EXPECT_EQ(downloader_.calls(), 0);
    EXPECT_EQ(read_file(path), "corrupt");
}

TEST_F(WorkerPoolTest, EveryCanonicalLinkIsTried) {
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    downloader_.serve("http://h/second.bin", kBody);
    Job job = canonical_job("http://unreachable/first.bin");
    job.links.push_back({"canonical", "http://h/second.bin"});

    auto reports = pool.process(job);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_EQ(reports[0].outcome, LinkOutcome::DownloadFailed);
    EXPECT_EQ(reports[1].outcome, LinkOutcome::Downloaded);
    EXPECT_EQ(downloader_.calls(), 2);
}

TEST_F(WorkerPoolTest, UnknownTopicLandsInDefaultDirectory) {
    downloader_.serve("http://h/f.bin", kBody);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    Job job = canonical_job("http://h/f.bin");
    job.topic = "unsubscribed";

    auto reports = pool.process(job);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].path, expected_path(default_dir_, "urnx1"));
}

TEST_F(WorkerPoolTest, PersistFailureIsContained) {
    downloader_.serve("http://h/f.bin", kBody);
    // A regular file where the date directory should go.
    std::filesystem::create_directories(data_dir_);
    write_file(std::filesystem::path(data_dir_) / date_partition(std::chrono::system_clock::now()).substr(0, 4), "x");
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);

    auto reports = pool.process(canonical_job("http://h/f.bin"));
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].outcome, LinkOutcome::PersistFailed);
    EXPECT_EQ(pool.stats().persist_failures, 1u);
}

TEST_F(WorkerPoolTest, TruncatedWriteLeavesNothingBehind) {
    const std::string big(64 * 1024, 'x');
    downloader_.serve("http://h/big.bin", big);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    Job job = canonical_job("http://h/big.bin");

    struct rlimit old_limit{};
    ASSERT_EQ(getrlimit(RLIMIT_FSIZE, &old_limit), 0);
    auto old_handler = std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit small = old_limit;
    small.rlim_cur = 4096;
    ASSERT_EQ(setrlimit(RLIMIT_FSIZE, &small), 0);
    auto first = pool.process(job);
    setrlimit(RLIMIT_FSIZE, &old_limit);
    std::signal(SIGXFSZ, old_handler);

    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].outcome, LinkOutcome::PersistFailed);
    EXPECT_FALSE(std::filesystem::exists(first[0].path));
    for (const auto& entry : std::filesystem::directory_iterator(first[0].path.parent_path())) {
        ADD_FAILURE() << "left behind " << entry.path();
    }

    auto retry = pool.process(job);
    ASSERT_EQ(retry.size(), 1u);
    EXPECT_EQ(retry[0].outcome, LinkOutcome::Downloaded);
    EXPECT_EQ(downloader_.calls(), 2);
    EXPECT_EQ(read_file(retry[0].path), big);
}

TEST_F(WorkerPoolTest, RejectedDataIdMakesNoNetworkCall) {
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 1);
    Job job = canonical_job("http://h/f.bin");
    job.data_id = "../../escape";

    EXPECT_TRUE(pool.process(job).empty());
    EXPECT_EQ(downloader_.calls(), 0);
    EXPECT_EQ(pool.stats().rejected_jobs, 1u);
}

TEST_F(WorkerPoolTest, WorkersDrainQueuePastFailures) {
    downloader_.serve("http://h/ok.bin", kBody);
    WorkerPool pool(queue_, subs_, downloader_, default_dir_, 3);
    pool.start();

    Job bad = canonical_job("http://unreachable/f.bin");
    bad.data_id = "bad";
    queue_.push(bad);
    for (int i = 0; i < 10; ++i) {
        Job ok = canonical_job("http://h/ok.bin");
        ok.data_id = "ok-" + std::to_string(i);
        queue_.push(ok);
    }
    queue_.close();
    pool.join();

    auto s = pool.stats();
    EXPECT_EQ(s.jobs_processed, 11u);
    EXPECT_EQ(s.download_failures, 1u);
    EXPECT_EQ(s.files_downloaded, 10u);
    EXPECT_FALSE(output_exists(expected_path(data_dir_, "bad")));
    EXPECT_TRUE(output_exists(expected_path(data_dir_, "ok-9")));
}

TEST(WorkerCountTest, NeverBelowOne) {
    EXPECT_EQ(default_worker_count(0), 1u);
    EXPECT_EQ(default_worker_count(1), 1u);
    EXPECT_EQ(default_worker_count(2), 1u);
    EXPECT_EQ(default_worker_count(3), 1u);
    EXPECT_EQ(default_worker_count(8), 6u);
}

TEST(WorkerCountTest, PoolClampsZeroWorkers) {
    SubscriptionTable subs;
    JobQueue queue;
    FakeDownloader downloader;
    WorkerPool pool(queue, subs, downloader, "/tmp", 0);
    EXPECT_EQ(pool.size(), 1u);
}
