#pragma once
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <MQTTClient.h>

#include "concurrent_queue.hpp"
#include "config.hpp"
#include "transport.hpp"

// Paho MQTT client in asynchronous callback mode. Incoming messages are
// copied into Notification values and pushed onto the supplied queue.
// After a connection loss a background thread reconnects with backoff and
// subscribes again to every topic currently held.
class MqttTransport : public Transport {
public:
    MqttTransport(MqttConfig cfg, NotificationQueue& out);
    ~MqttTransport() override;

    MqttTransport(const MqttTransport&) = delete;
    MqttTransport& operator=(const MqttTransport&) = delete;

    // Throws std::runtime_error when the broker cannot be reached.
    void connect();
    void disconnect();

    void subscribe(const std::string& topic) override;
    void unsubscribe(const std::string& topic) override;

    std::string server_uri() const;

private:
    int connect_once();
    void reconnect_loop();

    static int on_message(void* context, char* topic_name, int topic_len, MQTTClient_message* message);
    static void on_connection_lost(void* context, char* cause);

    MqttConfig cfg_;
    NotificationQueue& out_;
    MQTTClient client_{nullptr};
    bool connected_{false};

    std::mutex mtx_;
    std::condition_variable cv_;
    std::set<std::string> topics_;
    bool lost_{false};
    bool stopping_{false};
    std::thread reconnect_thread_;
};
