#pragma once
#include <map>
#include <string>

#include "concurrent_queue.hpp"
#include "subscription_table.hpp"
#include "transport.hpp"

enum class SubscribeStatus { Added, AlreadySubscribed, InvalidDirectory };

class IngestionAdapter {
public:
    IngestionAdapter(SubscriptionTable& subs, JobQueue& jobs, Transport& transport, std::string default_dir);

    // Parses one raw message and enqueues the resulting job. Malformed
    // payloads are logged and dropped; returns whether a job was enqueued.
    bool on_message(const std::string& topic, const std::string& payload);

    // Drains notifications until the queue is closed.
    void run(NotificationQueue& notifications);

    // Empty directory means the default download directory.
    SubscribeStatus add_subscription(const std::string& topic, const std::string& directory = {});
    // Unsubscribes at the transport even if the topic is unknown locally.
    bool delete_subscription(const std::string& topic);
    std::map<std::string, std::string> list_subscriptions() const;

    const std::string& default_directory() const { return default_dir_; }

private:
    SubscriptionTable& subs_;
    JobQueue& jobs_;
    Transport& transport_;
    std::string default_dir_;
};
