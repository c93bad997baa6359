#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <functional>
#include "config.hpp"
#include "../../../shared/cpp/job_sdk/include/job_client.hpp"

// Time source and blocking wait used by the polling loops.
struct PollClock {
    std::function<std::chrono::steady_clock::time_point()> now;
    std::function<void(std::chrono::seconds)> sleep;

    static PollClock system();
};

class JobCoordinator {
public:
    JobCoordinator(JobApi& api, FetchConfig cfg, PollClock clock = PollClock::system());

    // POST /job. Empty optional when the service answered but gave no usable
    // identifier (non-2xx or unrecognised body): the caller should use poll_sync.
    std::optional<std::string> create_job(const std::string& client, const std::string& provider);

    // Polls GET /jobs/{id} until done with a URL. Throws FetchError
    // (job_failure, timeout, network).
    std::string poll_job(const std::string& id, std::chrono::seconds timeout);

    // Polls GET /url/client/{client} until a URL appears. Throws FetchError (timeout, network).
    std::string poll_sync(const std::string& client, std::chrono::seconds timeout);

    // create_job, then poll_job or the synchronous fallback. Result is an http(s) URL.
    std::string acquire_url(const std::string& client, const std::string& provider);

private:
    template <typename F>
    ApiResponse call(const std::string& what, F&& fn);

    JobApi& api_;
    FetchConfig cfg_;
    PollClock clock_;
};
