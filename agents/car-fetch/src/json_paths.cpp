#include "../include/json_paths.hpp"
#include "../include/util.hpp"
#include <regex>

const std::vector<std::string> kJobIdPaths = {
    "/jobID", "/jobId", "/id",
    "/data/jobID", "/data/jobId", "/data/id",
    "/job/id", "/job/jobID", "/job/jobId",
    "/result/jobID", "/result/jobId", "/result/id",
};

const std::vector<std::string> kStatusPaths = {
    "/status", "/data/status", "/job/status",
};

std::optional<ojson> parse_document(const std::string& body) {
    auto doc = ojson::parse(body, nullptr, false);
    if (doc.is_discarded()) return std::nullopt;
    return doc;
}

const ojson* find_path(const ojson& doc, const std::string& path) {
    const ojson* cur = &doc;
    std::size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] != '/') return nullptr;
        auto next = path.find('/', pos + 1);
        std::string key = path.substr(pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1);
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(key);
        if (it == cur->end()) return nullptr;
        cur = &*it;
        pos = next == std::string::npos ? path.size() : next;
    }
    return cur;
}

std::optional<std::string> first_scalar_at(const ojson& doc, const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        const ojson* v = find_path(doc, p);
        if (!v) continue;
        if (v->is_string()) {
            auto s = v->get<std::string>();
            if (!s.empty() && s != "null") return s;
        } else if (v->is_number_integer()) {
            return v->dump();
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_job_id(const std::string& body) {
    auto doc = parse_document(body);
    if (doc) {
        if (auto id = first_scalar_at(*doc, kJobIdPaths)) return id;
        if (doc->is_object() || doc->is_array()) return std::nullopt;
    }
    static const std::regex bare_id("^[A-Za-z0-9._:-]+$");
    std::string candidate = trim(body);
    if (doc && doc->is_string()) candidate = doc->get<std::string>();
    if (candidate.empty() || candidate == "null") return std::nullopt;
    if (std::regex_match(candidate, bare_id)) return candidate;
    return std::nullopt;
}

std::string extract_status(const std::optional<ojson>& doc) {
    if (!doc) return "unknown";
    auto s = first_scalar_at(*doc, kStatusPaths);
    return s ? *s : "unknown";
}

static void walk_strings(const ojson& node, std::vector<std::string>& out) {
    if (node.is_string()) {
        const auto& s = node.get_ref<const std::string&>();
        if (is_http_url(s)) out.push_back(s);
        return;
    }
    if (node.is_structured()) {
        for (const auto& child : node) walk_strings(child, out);
    }
}

std::vector<std::string> collect_urls(const ojson& doc) {
    std::vector<std::string> out;
    walk_strings(doc, out);
    return out;
}

bool looks_like_car_url(const std::string& url) {
    static const std::regex car_suffix(R"(\.car($|[?&]|[^A-Za-z0-9._-]))", std::regex::icase);
    return std::regex_search(url, car_suffix);
}

std::optional<std::string> pick_url(const std::vector<std::string>& urls) {
    for (const auto& u : urls) {
        if (looks_like_car_url(u)) return u;
    }
    if (!urls.empty()) return urls.front();
    return std::nullopt;
}

std::optional<std::string> extract_url(const ojson& doc) {
    return pick_url(collect_urls(doc));
}

std::optional<std::string> extract_url(const std::string& body) {
    auto doc = parse_document(body);
    if (!doc) return std::nullopt;
    return extract_url(*doc);
}
