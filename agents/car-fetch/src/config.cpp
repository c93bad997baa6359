#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cstdlib>

std::chrono::seconds PollPolicy::interval_after(int completed) const {
    auto next = initial + step * completed;
    return std::min(next, std::max(initial, ceiling));
}

long parse_non_negative(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    long v = 0;
    try {
        v = std::stol(value, &used);
    } catch (const std::exception&) {
        throw FetchError(ErrorKind::usage, name + " must be a whole number, got '" + value + "'");
    }
    if (used != value.size() || v < 0) {
        throw FetchError(ErrorKind::usage, name + " must be a non-negative whole number, got '" + value + "'");
    }
    return v;
}

bool parse_flag(const std::string& value) {
    return value == "1" || value == "true" || value == "yes";
}

FetchConfig config_from_env() {
    FetchConfig cfg;
    cfg.api_base = getenv_or("API_BASE", cfg.api_base);
    auto secs = [](const char* key, std::chrono::seconds def) {
        const char* v = std::getenv(key);
        if (!v || !*v) return def;
        return std::chrono::seconds(parse_non_negative(key, v));
    };
    cfg.poll.initial = secs("POLL_INTERVAL", cfg.poll.initial);
    cfg.poll.ceiling = secs("POLL_MAX_INTERVAL", cfg.poll.ceiling);
    cfg.job_timeout = secs("POLL_TIMEOUT", cfg.job_timeout);
    cfg.sync_timeout = secs("SYNC_TIMEOUT", cfg.sync_timeout);
    if (const char* v = std::getenv("HTTP_TIMEOUT_MS"); v && *v) {
        cfg.http_timeout_ms = parse_non_negative("HTTP_TIMEOUT_MS", v);
    }
    if (const char* v = std::getenv("DOWNLOAD_ATTEMPTS"); v && *v) {
        cfg.download_attempts = (int)parse_non_negative("DOWNLOAD_ATTEMPTS", v);
    }
    cfg.allow_copy = parse_flag(getenv_or("ALLOW_COPY", "0"));
    cfg.prefer_ipfs_car = parse_flag(getenv_or("PREFER_IPFS_CAR", "0"));
    cfg.os_family = getenv_or("OS_FAMILY", "");
    return cfg;
}
