#include "../include/job_client.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw ApiTransportError("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    curl_slist* list{nullptr};
    void add(const char* h) { list = curl_slist_append(list, h); }
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};

static std::string escape_segment(CURL* h, const std::string& s) {
    char* out = curl_easy_escape(h, s.c_str(), (int)s.size());
    if (!out) throw ApiTransportError("curl_easy_escape failed");
    std::string r(out);
    curl_free(out);
    return r;
}

static ApiResponse perform(CurlHandle& c, const std::string& url, const std::string& what) {
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw ApiTransportError(what + " failed: " + curl_easy_strerror(code));
    }
    ApiResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
}

JobClient::JobClient(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
}

ApiResponse JobClient::create_job(const std::string& client, const std::string& provider) {
    CurlHandle c;
    json body = {{"client", client}};
    if (!provider.empty()) body["provider"] = provider;
    std::string body_str = body.dump();

    HeaderList headers;
    headers.add("Content-Type: application/json");
    headers.add("Accept: application/json");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body_str.size());
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    return perform(c, base_ + "/job", "POST /job");
}

ApiResponse JobClient::get_job(const std::string& id) {
    CurlHandle c;
    return get("/jobs/" + escape_segment(c.h, id));
}

ApiResponse JobClient::get_client_url(const std::string& client) {
    CurlHandle c;
    return get("/url/client/" + escape_segment(c.h, client));
}

ApiResponse JobClient::get(const std::string& path) {
    CurlHandle c;
    HeaderList headers;
    headers.add("Accept: application/json");
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    return perform(c, base_ + path, "GET " + path);
}
