#pragma once
#include <string>

struct FetchResult {
    bool ok{false};
    long status{0};
    std::string body;
    std::string error;  // set when !ok
    double seconds{0.0};
};

class Downloader {
public:
    virtual ~Downloader() = default;
    // Single attempt. Must be safe to call from several workers at once.
    virtual FetchResult fetch(const std::string& url) = 0;
};

// libcurl-backed downloader; one easy handle per call.
class CurlDownloader : public Downloader {
public:
    explicit CurlDownloader(long timeout_ms = 0) : timeout_ms_(timeout_ms) {}
    FetchResult fetch(const std::string& url) override;

private:
    long timeout_ms_;
};
