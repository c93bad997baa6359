#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

// Response documents keep key order: URL selection depends on encounter order.
using ojson = nlohmann::ordered_json;

extern const std::vector<std::string> kJobIdPaths;
extern const std::vector<std::string> kStatusPaths;

std::optional<ojson> parse_document(const std::string& body);

// Value at a "/a/b" style path, walking objects only. nullptr when absent.
const ojson* find_path(const ojson& doc, const std::string& path);

// First path holding a usable scalar: non-empty string other than "null",
// or an integer rendered as decimal text.
std::optional<std::string> first_scalar_at(const ojson& doc, const std::vector<std::string>& paths);

// Job identifier from a POST /job body. Falls back to the bare body when it is
// not a JSON object/array and looks like an identifier.
std::optional<std::string> extract_job_id(const std::string& body);

// Status from a job document; "unknown" when no status path matches.
std::string extract_status(const std::optional<ojson>& doc);

// Every string value starting with http:// or https://, pre-order.
std::vector<std::string> collect_urls(const ojson& doc);

bool looks_like_car_url(const std::string& url);

// First .car URL, else first URL, else nullopt.
std::optional<std::string> pick_url(const std::vector<std::string>& urls);
std::optional<std::string> extract_url(const ojson& doc);
std::optional<std::string> extract_url(const std::string& body);
