#pragma once
#include <string>
#include <filesystem>
#include "config.hpp"

enum class RunMode { help, install_deps, fetch, unpack };

struct CliOptions {
    RunMode mode{RunMode::help};
    std::string client;
    std::string provider;
    std::filesystem::path dir;
    std::filesystem::path unpack_path;
    FetchConfig config;
};

void print_usage(const char* argv0);

// Applies flags on top of `base` (normally config_from_env()).
// Throws FetchError(usage) on unknown flags, missing values or conflicting modes.
CliOptions parse_cli(int argc, const char* const* argv, FetchConfig base);

// Runs the selected mode. Throws FetchError on any fatal condition.
void run_cli(const CliOptions& opts);
