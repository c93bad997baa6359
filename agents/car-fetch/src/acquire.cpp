#include "../include/acquire.hpp"
#include "../include/errors.hpp"
#include "../include/json_paths.hpp"
#include "../include/util.hpp"
#include <iostream>
#include <thread>

PollClock PollClock::system() {
    PollClock c;
    c.now = [] { return std::chrono::steady_clock::now(); };
    c.sleep = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    return c;
}

JobCoordinator::JobCoordinator(JobApi& api, FetchConfig cfg, PollClock clock)
    : api_(api), cfg_(std::move(cfg)), clock_(std::move(clock)) {}

template <typename F>
ApiResponse JobCoordinator::call(const std::string& what, F&& fn) {
    try {
        return fn();
    } catch (const ApiTransportError& e) {
        throw FetchError(ErrorKind::network, what + ": " + e.what());
    }
}

std::optional<std::string> JobCoordinator::create_job(const std::string& client, const std::string& provider) {
    log_info("Creating job for client=" + client + (provider.empty() ? "" : ", provider=" + provider) + " ...");
    auto resp = call("POST /job", [&] { return api_.create_job(client, provider); });
    log_info("POST /job -> HTTP " + std::to_string(resp.status));
    if (!resp.ok()) {
        log_info("Job creation was not accepted. Response body follows:");
        std::cerr << resp.body << std::endl;
        return std::nullopt;
    }
    auto id = extract_job_id(resp.body);
    if (!id) {
        log_info("Could not extract job ID. Response body follows:");
        std::cerr << resp.body << std::endl;
        return std::nullopt;
    }
    log_info("Job created: " + *id);
    return id;
}

std::string JobCoordinator::poll_job(const std::string& id, std::chrono::seconds timeout) {
    log_info("Polling job status until done (timeout " + std::to_string(timeout.count()) + "s)...");
    const auto start = clock_.now();
    for (int iteration = 0;; ++iteration) {
        auto resp = call("GET /jobs/" + id, [&] { return api_.get_job(id); });
        auto doc = parse_document(resp.body);
        std::string status = extract_status(doc);
        if (status == "done") {
            if (auto url = doc ? extract_url(*doc) : std::nullopt) {
                log_info("Job done.");
                return *url;
            }
            log_info("Job done but URL not found yet; retrying...");
        } else if (status == "error" || status == "failed" || status == "cancelled") {
            throw FetchError(ErrorKind::job_failure, "Job ended with status: " + status, resp.body);
        }
        if (clock_.now() - start >= timeout) {
            throw FetchError(ErrorKind::timeout,
                             "Timed out after " + std::to_string(timeout.count()) + "s", resp.body);
        }
        clock_.sleep(cfg_.poll.interval_after(iteration));
    }
}

std::string JobCoordinator::poll_sync(const std::string& client, std::chrono::seconds timeout) {
    log_info("Falling back to sync endpoint: GET " + cfg_.api_base + "/url/client/" + client +
             " (poll up to " + std::to_string(timeout.count()) + "s)...");
    const auto start = clock_.now();
    for (int iteration = 0;; ++iteration) {
        auto resp = call("GET /url/client/" + client, [&] { return api_.get_client_url(client); });
        if (!resp.ok()) {
            log_info("Sync GET -> HTTP " + std::to_string(resp.status) + " (continuing)");
        }
        if (auto url = extract_url(resp.body)) {
            log_info("URL ready from sync endpoint.");
            return *url;
        }
        if (clock_.now() - start >= timeout) {
            throw FetchError(ErrorKind::timeout,
                             "Timed out after " + std::to_string(timeout.count()) + "s waiting for a URL",
                             resp.body);
        }
        clock_.sleep(cfg_.poll.interval_after(iteration));
    }
}

std::string JobCoordinator::acquire_url(const std::string& client, const std::string& provider) {
    std::string url;
    if (auto id = create_job(client, provider)) {
        url = poll_job(*id, cfg_.job_timeout);
    } else {
        url = poll_sync(client, cfg_.sync_timeout);
    }
    if (!is_http_url(url)) {
        throw FetchError(ErrorKind::schema, "Extracted value is not a valid URL: " + url);
    }
    return url;
}
