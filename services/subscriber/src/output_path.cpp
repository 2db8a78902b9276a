#include "output_path.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

std::string normalize_data_id(const std::string& data_id) {
    std::string out;
    out.reserve(data_id.size());
    std::copy_if(data_id.begin(), data_id.end(), std::back_inserter(out), [](char c){ return c != ':'; });
    return out;
}

std::string date_partition(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y/%m/%d", &tm);
    return buf;
}

std::optional<std::filesystem::path> resolve_output_path(const SubscriptionTable& subs, const Job& job,
                                                         const std::string& default_dir,
                                                         std::chrono::system_clock::time_point when) {
    std::string id = normalize_data_id(job.data_id);
    auto first = id.find_first_not_of('/');
    if (first == std::string::npos) return std::nullopt;
    std::filesystem::path rel(id.substr(first));
    for (const auto& part : rel) {
        if (part == "..") return std::nullopt;
    }
    std::filesystem::path dir(subs.get(job.topic, default_dir));
    return dir / date_partition(when) / rel;
}

bool output_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

void ensure_parent_dirs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (parent.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    // A concurrent worker may have created it between the check and mkdir.
    std::error_code probe;
    if (ec && !std::filesystem::is_directory(parent, probe)) {
        throw std::runtime_error("cannot create " + parent.string() + ": " + ec.message());
    }
}

bool directory_writable(const std::string& dir) {
    std::error_code ec;
    if (dir.empty() || !std::filesystem::is_directory(dir, ec)) return false;
    return ::access(dir.c_str(), W_OK) == 0;
}

void write_file(const std::filesystem::path& path, const std::string& bytes) {
    // Unique per process and call, so duplicate jobs never share a temp file.
    static std::atomic<unsigned long> counter{0};
    std::filesystem::path tmp = path.string() + ".part." + std::to_string((long)::getpid()) + "." +
                                std::to_string(counter++);
    std::error_code ec;
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        f.write(bytes.data(), (std::streamsize)bytes.size());
        f.close();
        if (!f) {
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("write to " + tmp.string() + " failed");
        }
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("cannot move " + tmp.string() + " to " + path.string() + ": " + ec.message());
    }
}

std::string url_filename(const std::string& url) {
    std::string path = url;
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? std::string() : path.substr(slash);
    }
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) path.resize(cut);
    auto last = path.find_last_of('/');
    return last == std::string::npos ? path : path.substr(last + 1);
}
