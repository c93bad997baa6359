#include "../include/deps.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <sys/utsname.h>
#include <unistd.h>

namespace fs = std::filesystem;

static const char* kCarPadRepo = "https://github.com/kacperzuk-neti/go-car";
static const char* kGoCarModule = "github.com/ipld/go-car/cmd/car@latest";

const char* os_family_name(OsFamily f) {
    switch (f) {
        case OsFamily::macos: return "macos";
        case OsFamily::debian: return "debian";
        case OsFamily::fedora: return "fedora";
        case OsFamily::arch: return "arch";
        case OsFamily::windows: return "windows";
        case OsFamily::unknown: return "unknown";
    }
    return "unknown";
}

OsFamily parse_os_family(const std::string& name) {
    for (auto f : {OsFamily::macos, OsFamily::debian, OsFamily::fedora, OsFamily::arch, OsFamily::windows}) {
        if (name == os_family_name(f)) return f;
    }
    return OsFamily::unknown;
}

OsFamily os_family_from_release(const std::string& os_release) {
    std::string id, id_like;
    std::istringstream in(os_release);
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        if (key == "ID") id = val;
        else if (key == "ID_LIKE") id_like = val;
    }
    const std::string v = id_like.empty() ? id : id_like;
    auto has = [&](const char* s) { return v.find(s) != std::string::npos; };
    if (has("debian") || has("ubuntu")) return OsFamily::debian;
    if (has("rhel") || has("fedora") || has("centos") || v == "rocky" || v == "alma") return OsFamily::fedora;
    if (has("arch")) return OsFamily::arch;
    return OsFamily::unknown;
}

OsFamily detect_os_family() {
    utsname u{};
    if (::uname(&u) != 0) return OsFamily::unknown;
    std::string sys = u.sysname;
    if (sys == "Darwin") return OsFamily::macos;
    if (sys.rfind("MINGW", 0) == 0 || sys.rfind("MSYS", 0) == 0 || sys.rfind("CYGWIN", 0) == 0) {
        return OsFamily::windows;
    }
    if (sys == "Linux") {
        std::ifstream f("/etc/os-release");
        if (!f) return OsFamily::unknown;
        std::ostringstream ss;
        ss << f.rdbuf();
        return os_family_from_release(ss.str());
    }
    return OsFamily::unknown;
}

std::vector<InstallStep> system_package_plan(OsFamily family, bool have_dnf) {
    switch (family) {
        case OsFamily::macos:
            return {{{"brew", "update"}, false}, {{"brew", "install", "go", "node", "git"}, false}};
        case OsFamily::debian:
            return {{{"apt-get", "update", "-y"}, true},
                    {{"apt-get", "install", "-y", "git", "nodejs", "npm", "golang-go"}, true}};
        case OsFamily::fedora:
            return {{{have_dnf ? "dnf" : "yum", "install", "-y", "git", "nodejs", "npm", "golang"}, true}};
        case OsFamily::arch:
            return {{{"pacman", "-Sy", "--noconfirm", "git", "nodejs", "npm", "go"}, true}};
        case OsFamily::windows:
        case OsFamily::unknown:
            break;
    }
    return {};
}

static bool run_step(ProcessRunner& runner, std::vector<std::string> argv, bool privileged) {
    if (privileged && ::geteuid() != 0 && have_executable("sudo")) argv.insert(argv.begin(), "sudo");
    std::string line;
    for (const auto& a : argv) line += (line.empty() ? "" : " ") + a;
    log_info("Running: " + line);
    auto r = runner.run(argv, {});
    if (!r.ok()) log_info("Command exited with " + std::to_string(r.exit_code) + ": " + line);
    return r.ok();
}

static void prepend_path(const fs::path& dir) {
    std::string path = getenv_or("PATH", "");
    ::setenv("PATH", (dir.string() + (path.empty() ? "" : ":" + path)).c_str(), 1);
}

static bool ensure_car_pad(ProcessRunner& runner) {
    if (have_executable("car-pad")) return true;
    if (!have_executable("go") || !have_executable("git")) {
        log_info("Go and git are required to build car-pad; skipping.");
        return false;
    }
    fs::path bin = fs::path(getenv_or("HOME", ".")) / ".local" / "bin";
    std::error_code ec;
    fs::create_directories(bin, ec);
    std::string tmpl = (fs::temp_directory_path() / "car-pad-XXXXXX").string();
    if (!::mkdtemp(tmpl.data())) {
        log_info("Cannot create a temporary directory for the car-pad build.");
        return false;
    }
    fs::path tmp(tmpl);
    log_info("Building car-pad from fork (no sudo)...");
    bool ok = run_step(runner, {"git", "clone", "--depth", "1", kCarPadRepo, (tmp / "go-car").string()}, false);
    if (ok) {
        auto r = runner.run({"go", "build", "-trimpath", "-ldflags", "-s -w", "-o", (bin / "car-pad").string(), "."},
                            tmp / "go-car" / "cmd" / "car");
        ok = r.ok();
        if (!ok) std::cerr << r.output;
    }
    fs::remove_all(tmp, ec);
    if (!ok) return false;
    prepend_path(bin);
    log_info("Installed car-pad -> " + (bin / "car-pad").string());
    return true;
}

static bool ensure_extractor(ProcessRunner& runner) {
    if (have_executable("car") || have_executable("ipfs-car")) return true;
    if (have_executable("go")) {
        auto gobin = runner.run({"go", "env", "GOBIN"}, {});
        std::string dir = trim(gobin.output);
        if (dir.empty()) {
            auto gopath = runner.run({"go", "env", "GOPATH"}, {});
            dir = trim(gopath.output);
            dir = dir.empty() ? (fs::path(getenv_or("HOME", ".")) / "go" / "bin").string() : dir + "/bin";
        }
        log_info("Installing 'car' via Go (user space)...");
        ::setenv("GOBIN", dir.c_str(), 1);
        if (run_step(runner, {"go", "install", kGoCarModule}, false) && fs::exists(fs::path(dir) / "car")) {
            prepend_path(dir);
            return true;
        }
    }
    if (have_executable("npm")) {
        log_info("Installing 'ipfs-car' via npm (user space)...");
        if (run_step(runner, {"npm", "i", "-g", "ipfs-car"}, false)) return true;
        fs::path prefix = getenv_or("NPM_PREFIX", (fs::path(getenv_or("HOME", ".")) / ".npm-global").string());
        log_info("npm global install failed; using user prefix: " + prefix.string());
        std::error_code ec;
        fs::create_directories(prefix / "bin", ec);
        if (run_step(runner, {"npm", "config", "set", "prefix", prefix.string()}, false) &&
            run_step(runner, {"npm", "i", "-g", "ipfs-car"}, false)) {
            prepend_path(prefix / "bin");
            return true;
        }
    }
    return false;
}

void install_deps(OsFamily family, ProcessRunner& runner) {
    log_info(std::string("Installing dependencies for: ") + os_family_name(family));
    auto plan = system_package_plan(family, have_executable("dnf"));
    if (plan.empty()) {
        log_info("No package manager recipe for this platform. Please ensure git and either Go (car, car-pad) "
                 "or Node.js (ipfs-car) are installed.");
    }
    if (family == OsFamily::macos && !have_executable("brew")) {
        throw FetchError(ErrorKind::process,
                         "Homebrew not found. Install from https://brew.sh (no sudo) and re-run --install-deps.");
    }
    for (const auto& step : plan) {
        if (!run_step(runner, step.argv, step.privileged)) {
            log_info("Package installation incomplete; continuing with user-space installs.");
        }
    }

    bool have_pad = ensure_car_pad(runner);
    bool have_other = ensure_extractor(runner);
    if (!have_pad && !have_other) {
        throw FetchError(ErrorKind::process,
                         "Could not install a CAR extractor (car-pad, car or ipfs-car). "
                         "Install Go and re-run --install-deps.");
    }
    log_info("Dependency setup complete.");
}
