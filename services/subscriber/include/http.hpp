#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// timeout_ms <= 0 keeps libcurl's default. Throws std::runtime_error on
// transport errors; any HTTP status is returned as-is.
HttpResponse http_get(const std::string& url, long timeout_ms = 0);
