#pragma once
#include <string>
#include <vector>
#include "process.hpp"

enum class OsFamily { macos, debian, fedora, arch, windows, unknown };

const char* os_family_name(OsFamily f);
// Accepts the names os_family_name produces; anything else is unknown.
OsFamily parse_os_family(const std::string& name);
// Classifies /etc/os-release content by ID_LIKE, falling back to ID.
OsFamily os_family_from_release(const std::string& os_release);
OsFamily detect_os_family();

struct InstallStep {
    std::vector<std::string> argv;
    bool privileged{false}; // system package manager: may need sudo
};

// Package-manager commands providing Go and Node.js for the extractor builds.
std::vector<InstallStep> system_package_plan(OsFamily family, bool have_dnf);

// Installs system packages, then car-pad (built from the tolerant go-car fork)
// and car or ipfs-car in user space. Throws FetchError(process) when no
// extractor is available afterwards.
void install_deps(OsFamily family, ProcessRunner& runner);
