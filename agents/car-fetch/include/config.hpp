#pragma once
#include <string>
#include <chrono>

struct PollPolicy {
    std::chrono::seconds initial{2};
    std::chrono::seconds step{1};
    std::chrono::seconds ceiling{15};

    // Interval to sleep after `completed` iterations: min(initial + completed*step, ceiling).
    std::chrono::seconds interval_after(int completed) const;
};

struct FetchConfig {
    std::string api_base{"https://api.sp-tool.allocator.tech"};
    PollPolicy poll;
    std::chrono::seconds job_timeout{900};
    std::chrono::seconds sync_timeout{900};
    long http_timeout_ms{30000};
    int download_attempts{0}; // 0 = retry refused connections forever
    bool allow_copy{false};
    bool prefer_ipfs_car{false};
    std::string os_family; // empty = detect
};

// Reads API_BASE, POLL_INTERVAL, POLL_MAX_INTERVAL, POLL_TIMEOUT, SYNC_TIMEOUT,
// HTTP_TIMEOUT_MS, DOWNLOAD_ATTEMPTS, ALLOW_COPY, PREFER_IPFS_CAR and OS_FAMILY.
// Throws FetchError(usage) on malformed numbers.
FetchConfig config_from_env();

long parse_non_negative(const std::string& name, const std::string& value);
bool parse_flag(const std::string& value);
