#include "ingest.hpp"
#include "log.hpp"
#include "output_path.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

IngestionAdapter::IngestionAdapter(SubscriptionTable& subs, JobQueue& jobs, Transport& transport, std::string default_dir)
    : subs_(subs), jobs_(jobs), transport_(transport), default_dir_(std::move(default_dir)) {}

bool IngestionAdapter::on_message(const std::string& topic, const std::string& payload) {
    log_debug("Message received on " + topic);
    Job job;
    try {
        job = parse_notification(topic, payload);
    } catch (const nlohmann::json::exception& e) {
        log_error("Malformed notification on " + topic + ": " + e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        log_error("Malformed notification on " + topic + ": " + e.what());
        return false;
    }
    if (!jobs_.push(std::move(job))) {
        log_warning("Job queue closed, dropping notification on " + topic);
        return false;
    }
    return true;
}

void IngestionAdapter::run(NotificationQueue& notifications) {
    while (auto n = notifications.pop()) {
        on_message(n->topic, n->payload);
    }
    log_debug("Notification queue closed, ingestion stopped");
}

SubscribeStatus IngestionAdapter::add_subscription(const std::string& topic, const std::string& directory) {
    const std::string& dir = directory.empty() ? default_dir_ : directory;
    if (!directory.empty() && !directory_writable(directory)) {
        log_error("Directory " + directory + " does not exist or is not writable, not subscribing to " + topic);
        return SubscribeStatus::InvalidDirectory;
    }
    if (!subs_.add(topic, dir)) {
        log_info("Topic " + topic + " already subscribed");
        return SubscribeStatus::AlreadySubscribed;
    }
    transport_.subscribe(topic);
    log_info("Subscribed to " + topic + " -> " + dir);
    return SubscribeStatus::Added;
}

bool IngestionAdapter::delete_subscription(const std::string& topic) {
    transport_.unsubscribe(topic);
    log_info("Unsubscribed from " + topic);
    if (!subs_.remove(topic)) {
        log_info("Topic " + topic + " not found");
        return false;
    }
    return true;
}

std::map<std::string, std::string> IngestionAdapter::list_subscriptions() const {
    return subs_.snapshot();
}
