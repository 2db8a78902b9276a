#include "transport.hpp"

std::chrono::seconds reconnect_backoff(int attempt) {
    if (attempt < 0) attempt = 0;
    if (attempt >= 6) return std::chrono::seconds(60);
    return std::chrono::seconds(1L << attempt);
}
