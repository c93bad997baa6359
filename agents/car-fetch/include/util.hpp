#pragma once
#include <string>

std::string getenv_or(const char* key, const std::string& def);

// One timestamped line on stderr: "[YYYY-mm-dd HH:MM:SS] msg".
void log_info(const std::string& msg);
void log_error(const std::string& msg);

std::string trim(const std::string& s);
bool is_http_url(const std::string& s);

// Last path segment of `url` with any query or fragment removed; empty when none.
std::string file_name_from_url(const std::string& url);
