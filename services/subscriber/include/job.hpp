#pragma once
#include <string>
#include <optional>
#include <vector>

struct Link {
    std::string rel;   // "canonical" is the only relation that gets downloaded
    std::string href;
};

struct Integrity {
    std::string method; // hash name as sent by the publisher, e.g. "sha512"
    std::string value;  // base64 digest
};

struct Job {
    std::string topic;
    std::string data_id;
    std::vector<Link> links;
    std::optional<Integrity> integrity;
};

// Raw message as delivered by the transport, before parsing.
struct Notification {
    std::string topic;
    std::string payload;
};

// Parses a WIS2 notification payload. Throws nlohmann::json::exception on
// invalid JSON and std::invalid_argument on schema violations.
Job parse_notification(const std::string& topic, const std::string& payload);
