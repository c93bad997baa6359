#include "../include/download.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <curl/curl.h>
#include <cstdio>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

namespace {
struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw FetchError(ErrorKind::network, "curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct OutFile {
    std::FILE* f{nullptr};
    ~OutFile() { if (f) std::fclose(f); }
};

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<std::FILE*>(userp)) * size;
}

struct Attempt {
    CURLcode code{CURLE_OK};
    long status{0};
};

static Attempt transfer(const std::string& url, const fs::path& out, curl_off_t resume_from,
                        const DownloadOptions& opts) {
    OutFile file;
    file.f = std::fopen(out.c_str(), resume_from > 0 ? "ab" : "wb");
    if (!file.f) throw FetchError(ErrorKind::io, "cannot open " + out.string() + " for writing");

    CurlHandle c;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, file.f);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(c.h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT, opts.connect_timeout_s);
    curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(c.h, CURLOPT_LOW_SPEED_TIME, opts.stall_timeout_s);
    if (resume_from > 0) curl_easy_setopt(c.h, CURLOPT_RESUME_FROM_LARGE, resume_from);

    Attempt a;
    a.code = curl_easy_perform(c.h);
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &a.status);
    if (std::fflush(file.f) != 0) throw FetchError(ErrorKind::io, "write to " + out.string() + " failed");
    return a;
}
}

void download_to_file(const std::string& url, const fs::path& out, const DownloadOptions& opts) {
    bool restarted = false;
    for (int attempt = 1;; ++attempt) {
        std::error_code ec;
        curl_off_t have = fs::is_regular_file(out, ec) ? (curl_off_t)fs::file_size(out, ec) : 0;
        if (ec) have = 0;
        if (have > 0) log_info("Resuming " + out.filename().string() + " at byte " + std::to_string(have));

        Attempt a = transfer(url, out, have, opts);
        if (a.code == CURLE_OK) return;
        if (have > 0 && a.status == 416) {
            log_info("Server reports " + out.filename().string() + " already complete.");
            return;
        }
        if (a.code == CURLE_RANGE_ERROR && !restarted) {
            log_info("Server does not support resuming; restarting download from the beginning.");
            fs::resize_file(out, 0);
            restarted = true;
            continue;
        }
        if (a.code == CURLE_COULDNT_CONNECT && (opts.attempts == 0 || attempt < opts.attempts)) {
            log_info("Connection refused; retrying...");
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.retry_pause_ms));
            continue;
        }
        std::string msg = std::string("download of ") + url + " failed: " + curl_easy_strerror(a.code);
        if (a.status >= 400) msg += " (HTTP " + std::to_string(a.status) + ")";
        throw FetchError(ErrorKind::network, msg);
    }
}
