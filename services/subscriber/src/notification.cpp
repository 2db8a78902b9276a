#include "job.hpp"
#include "log.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

Job parse_notification(const std::string& topic, const std::string& payload) {
    auto j = json::parse(payload);
    if (!j.is_object()) throw std::invalid_argument("notification is not a JSON object");

    auto props = j.find("properties");
    if (props == j.end() || !props->is_object()) {
        throw std::invalid_argument("notification has no properties object");
    }
    auto data_id = props->find("data_id");
    if (data_id == props->end() || !data_id->is_string()) {
        throw std::invalid_argument("properties.data_id missing or not a string");
    }

    Job job;
    job.topic = topic;
    job.data_id = data_id->get<std::string>();

    auto integrity = props->find("integrity");
    if (integrity != props->end() && !integrity->is_null()) {
        if (!integrity->is_object() ||
            !integrity->contains("method") || !(*integrity)["method"].is_string() ||
            !integrity->contains("value") || !(*integrity)["value"].is_string()) {
            // Unusable integrity metadata only disables the hash check.
            log_notice("Ignoring unusable integrity block for " + job.data_id + " on " + topic);
        } else {
            job.integrity = Integrity{(*integrity)["method"].get<std::string>(),
                                      (*integrity)["value"].get<std::string>()};
        }
    }

    auto links = j.find("links");
    if (links != j.end()) {
        if (!links->is_array()) throw std::invalid_argument("links is not an array");
        for (const auto& l : *links) {
            if (!l.is_object()) throw std::invalid_argument("link entry is not an object");
            auto href = l.find("href");
            if (href == l.end() || !href->is_string()) {
                throw std::invalid_argument("link entry has no string href");
            }
            Link link;
            link.rel = l.value("rel", std::string());
            link.href = href->get<std::string>();
            job.links.push_back(std::move(link));
        }
    }
    return job;
}
