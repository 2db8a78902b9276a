#include "downloader.hpp"
#include "http.hpp"
#include <chrono>
#include <stdexcept>

FetchResult CurlDownloader::fetch(const std::string& url) {
    FetchResult r;
    auto start = std::chrono::steady_clock::now();
    try {
        auto resp = http_get(url, timeout_ms_);
        r.status = resp.status;
        if (resp.status < 200 || resp.status >= 300) {
            r.error = "HTTP status " + std::to_string(resp.status);
        } else {
            r.ok = true;
            r.body = std::move(resp.body);
        }
    } catch (const std::runtime_error& e) {
        r.error = e.what();
    }
    r.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return r;
}
