#pragma once
#include <string>
#include <filesystem>

struct DownloadOptions {
    long connect_timeout_s{10};
    long stall_timeout_s{20};  // abort when no bytes arrive for this long
    int attempts{0};           // connect attempts; 0 = unlimited
    long retry_pause_ms{1000};
};

// Streams `url` into `out`, resuming from the bytes already present.
// Only refused/unreachable connections are retried. Throws FetchError(network, io).
void download_to_file(const std::string& url, const std::filesystem::path& out, const DownloadOptions& opts = {});
