#pragma once
#include <map>
#include <string>
#include <shared_mutex>
#include <cstddef>

// topic -> download directory. Many concurrent readers (workers), writers
// take the lock exclusively for a single insert or erase.
class SubscriptionTable {
public:
    SubscriptionTable() = default;
    explicit SubscriptionTable(std::map<std::string, std::string> initial);

    std::string get(const std::string& topic, const std::string& default_dir) const;
    bool contains(const std::string& topic) const;
    // Returns false and leaves the existing entry alone if the topic is present.
    bool add(const std::string& topic, const std::string& directory);
    bool remove(const std::string& topic);
    std::map<std::string, std::string> snapshot() const;
    std::size_t size() const;

private:
    mutable std::shared_mutex mtx_;
    std::map<std::string, std::string> subs_;
};
