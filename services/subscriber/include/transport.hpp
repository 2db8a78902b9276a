#pragma once
#include <chrono>
#include <string>

// Pub/sub side of the pipeline. Both calls are fire-and-forget; messages
// flow back through a NotificationQueue rather than through this interface.
class Transport {
public:
    virtual ~Transport() = default;
    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;
};

// Delay before reconnect attempt n (0-based): 1s doubling, capped at 60s.
std::chrono::seconds reconnect_backoff(int attempt);
