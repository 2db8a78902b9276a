#include "mqtt_transport.hpp"
#include "log.hpp"
#include <cstdio>
#include <random>
#include <stdexcept>
#include <utility>

static std::string gen_client_id() {
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<uint64_t> dist;
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)dist(rng));
    return std::string("wis2-subscriber-") + buf;
}

MqttTransport::MqttTransport(MqttConfig cfg, NotificationQueue& out)
    : cfg_(std::move(cfg)), out_(out) {
    int rc = MQTTClient_create(&client_, server_uri().c_str(), gen_client_id().c_str(),
                               MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTCLIENT_SUCCESS) {
        throw std::runtime_error("MQTTClient_create failed: " + std::string(MQTTClient_strerror(rc)));
    }
    rc = MQTTClient_setCallbacks(client_, this, &MqttTransport::on_connection_lost,
                                 &MqttTransport::on_message, nullptr);
    if (rc != MQTTCLIENT_SUCCESS) {
        MQTTClient_destroy(&client_);
        throw std::runtime_error("MQTTClient_setCallbacks failed: " + std::string(MQTTClient_strerror(rc)));
    }
}

MqttTransport::~MqttTransport() {
    disconnect();
    if (client_) MQTTClient_destroy(&client_);
}

std::string MqttTransport::server_uri() const {
    std::string scheme = cfg_.transport == "websockets" ? "wss://" : "ssl://";
    return scheme + cfg_.broker + ":" + std::to_string(cfg_.port);
}

int MqttTransport::connect_once() {
    MQTTClient_connectOptions opts = MQTTClient_connectOptions_initializer;
    MQTTClient_SSLOptions ssl = MQTTClient_SSLOptions_initializer;
    ssl.enableServerCertAuth = 1;
    ssl.verify = 1;
    opts.keepAliveInterval = 60;
    opts.cleansession = 1;
    opts.username = cfg_.username.c_str();
    opts.password = cfg_.password.c_str();
    opts.ssl = &ssl;
    return MQTTClient_connect(client_, &opts);
}

void MqttTransport::connect() {
    log_info("Connecting to " + server_uri() + "...");
    int rc = connect_once();
    if (rc != MQTTCLIENT_SUCCESS) {
        throw std::runtime_error("MQTT connect to " + server_uri() + " failed: " + MQTTClient_strerror(rc));
    }
    connected_ = true;
    log_info("Connected");
    if (!reconnect_thread_.joinable()) {
        reconnect_thread_ = std::thread([this]{ reconnect_loop(); });
    }
}

void MqttTransport::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (reconnect_thread_.joinable()) reconnect_thread_.join();

    if (!connected_) return;
    if (MQTTClient_isConnected(client_)) {
        int rc = MQTTClient_disconnect(client_, 2000);
        if (rc != MQTTCLIENT_SUCCESS) {
            log_warning(std::string("MQTT disconnect failed: ") + MQTTClient_strerror(rc));
        }
    }
    connected_ = false;
}

void MqttTransport::reconnect_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        cv_.wait(lock, [&]{ return lost_ || stopping_; });
        for (int attempt = 0; lost_ && !stopping_; ++attempt) {
            auto delay = reconnect_backoff(attempt);
            if (cv_.wait_for(lock, delay, [&]{ return stopping_; })) break;

            lock.unlock();
            log_info("Reconnecting to " + server_uri() + " (attempt " + std::to_string(attempt + 1) + ")");
            int rc = connect_once();
            lock.lock();
            if (rc != MQTTCLIENT_SUCCESS) {
                log_error("MQTT reconnect failed: " + std::string(MQTTClient_strerror(rc)));
                continue;
            }
            lost_ = false;
            std::set<std::string> topics = topics_;
            lock.unlock();
            log_info("Reconnected, subscribing to " + std::to_string(topics.size()) + " topics");
            for (const auto& t : topics) {
                int src = MQTTClient_subscribe(client_, t.c_str(), cfg_.qos);
                if (src != MQTTCLIENT_SUCCESS) {
                    log_error("Subscribe to " + t + " failed: " + MQTTClient_strerror(src));
                }
            }
            lock.lock();
        }
    }
}

void MqttTransport::subscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        topics_.insert(topic);
    }
    int rc = MQTTClient_subscribe(client_, topic.c_str(), cfg_.qos);
    if (rc != MQTTCLIENT_SUCCESS) {
        log_error("Subscribe to " + topic + " failed: " + MQTTClient_strerror(rc));
        return;
    }
    log_debug("On subscribe " + topic);
}

void MqttTransport::unsubscribe(const std::string& topic) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        topics_.erase(topic);
    }
    int rc = MQTTClient_unsubscribe(client_, topic.c_str());
    if (rc != MQTTCLIENT_SUCCESS) {
        log_error("Unsubscribe from " + topic + " failed: " + MQTTClient_strerror(rc));
    }
}

int MqttTransport::on_message(void* context, char* topic_name, int topic_len, MQTTClient_message* message) {
    auto* self = static_cast<MqttTransport*>(context);
    Notification n;
    n.topic = topic_len > 0 ? std::string(topic_name, (size_t)topic_len) : std::string(topic_name);
    n.payload.assign(static_cast<const char*>(message->payload), (size_t)message->payloadlen);
    MQTTClient_freeMessage(&message);
    MQTTClient_free(topic_name);

    log_debug("Message received");
    if (!self->out_.push(std::move(n))) {
        log_warning("Notification queue closed, dropping message");
    }
    return 1;
}

void MqttTransport::on_connection_lost(void* context, char* cause) {
    auto* self = static_cast<MqttTransport*>(context);
    log_error("Connection to " + self->server_uri() + " lost: " + (cause ? cause : "unknown cause"));
    {
        std::lock_guard<std::mutex> lock(self->mtx_);
        self->lost_ = true;
    }
    self->cv_.notify_all();
}
