#include "subscription_table.hpp"
#include <mutex>
#include <utility>

SubscriptionTable::SubscriptionTable(std::map<std::string, std::string> initial)
    : subs_(std::move(initial)) {}

std::string SubscriptionTable::get(const std::string& topic, const std::string& default_dir) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = subs_.find(topic);
    if (it == subs_.end()) return default_dir;
    return it->second;
}

bool SubscriptionTable::contains(const std::string& topic) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return subs_.count(topic) > 0;
}

bool SubscriptionTable::add(const std::string& topic, const std::string& directory) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return subs_.emplace(topic, directory).second;
}

bool SubscriptionTable::remove(const std::string& topic) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return subs_.erase(topic) > 0;
}

std::map<std::string, std::string> SubscriptionTable::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return subs_;
}

std::size_t SubscriptionTable::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return subs_.size();
}
