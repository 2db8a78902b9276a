#include <csignal>
#include <cstring>
#include <iostream>
#include <map>
#include <pthread.h>
#include <string>
#include <thread>
#include <curl/curl.h>

#include "concurrent_queue.hpp"
#include "config.hpp"
#include "control_server.hpp"
#include "downloader.hpp"
#include "ingest.hpp"
#include "log.hpp"
#include "mqtt_transport.hpp"
#include "reporter.hpp"
#include "subscription_table.hpp"
#include "worker_pool.hpp"

static void usage() {
    std::cerr << "wis2_subscriber usage:\n"
              << "  wis2_subscriber [--config <path>]\n"
              << "Without --config, config.json next to the executable is used.\n";
}

static int run(const Config& cfg) {
    std::map<std::string, std::string> initial;
    for (const auto& t : cfg.topics) initial.emplace(t, cfg.download_directory);
    SubscriptionTable subs(std::move(initial));
    JobQueue jobs;
    NotificationQueue notifications;

    MqttTransport transport(cfg.mqtt, notifications);
    transport.connect();
    for (const auto& kv : subs.snapshot()) {
        transport.subscribe(kv.first);
        log_info("Subscribed to " + kv.first);
    }

    IngestionAdapter adapter(subs, jobs, transport, cfg.download_directory);

    CurlDownloader downloader(cfg.download_timeout_ms);
    std::size_t workers = cfg.workers > 0 ? (std::size_t)cfg.workers : default_worker_count();
    WorkerPool pool(jobs, subs, downloader, cfg.download_directory, workers);
    pool.start();

    QueueReporter reporter(jobs, pool, std::chrono::seconds(cfg.queue_report_interval_s));
    reporter.start();

    ControlServer server(adapter);
    try {
        server.start(cfg.control_port);
    } catch (const std::runtime_error& e) {
        log_error(e.what());
        return 1;
    }

    // Started last so a failed start above never leaves it joinable;
    // notifications received so far wait in the queue.
    std::thread ingest_thread([&]{ adapter.run(notifications); });

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    int sig = 0;
    sigwait(&set, &sig);
    log_info(std::string("Received ") + strsignal(sig) + ", shutting down");

    server.stop();
    transport.disconnect();
    notifications.close();
    ingest_thread.join();
    std::size_t dropped = jobs.clear();
    if (dropped) log_warning("Dropped " + std::to_string(dropped) + " queued jobs");
    jobs.close();
    pool.join();
    reporter.stop();
    log_info(format_stats(jobs.size(), pool.stats()));
    return 0;
}

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) config_path = argv[++i];
        else if (a == "--help" || a == "-h") { usage(); return 0; }
        else { usage(); return 2; }
    }
    if (config_path.empty()) config_path = default_config_path(argv[0]);

    // Every thread started from here on inherits the blocked mask, so the
    // signals are only ever delivered through sigwait in run().
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    Config cfg;
    try {
        cfg = load_config(config_path);
        apply_env_overrides(cfg);
    } catch (const ConfigError& e) {
        log_error(std::string("Error starting subscriber: ") + e.what());
        return 1;
    }
    set_log_level(cfg.log_level);
    log_info("Loaded configuration from " + config_path);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        log_error("curl_global_init failed");
        return 1;
    }
    int rc = 1;
    try {
        rc = run(cfg);
    } catch (const std::runtime_error& e) {
        log_error(std::string("Error starting subscriber: ") + e.what());
    }
    curl_global_cleanup();
    return rc;
}
