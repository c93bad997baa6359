#include "../include/cli.hpp"
#include "../include/acquire.hpp"
#include "../include/deps.hpp"
#include "../include/download.hpp"
#include "../include/errors.hpp"
#include "../include/unpack.hpp"
#include "../include/util.hpp"
#include <iostream>

namespace fs = std::filesystem;

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " --install-deps [--os macos|debian|fedora|arch|windows]\n"
              << "  " << argv0 << " --client CLIENT_ID [--provider PROVIDER_ID] --dir DIR [--api-base URL]"
                                 " [--timeout S] [--sync-timeout S]\n"
              << "  " << argv0 << " --unpack-only /path/to/file[.car] [--dir DIR]\n"
              << "  [--allow-copy]       allow a real copy if fast clone/reflink is unsupported\n"
              << "  [--prefer-ipfs-car]  try ipfs-car before car-pad and car\n"
              << "\n"
              << "Unpacking clones a padded/zero-length CARv1 and fixes the clone; the original is never touched.\n";
}

CliOptions parse_cli(int argc, const char* const* argv, FetchConfig base) {
    CliOptions o;
    o.config = std::move(base);
    bool install = false, unpack = false, help = false;

    auto value = [&](int& i) -> std::string {
        if (i + 1 >= argc) throw FetchError(ErrorKind::usage, std::string("Missing value for ") + argv[i]);
        return argv[++i];
    };
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--client") o.client = value(i);
        else if (a == "--provider") o.provider = value(i);
        else if (a == "--dir") o.dir = value(i);
        else if (a == "--api-base") o.config.api_base = value(i);
        else if (a == "--timeout") o.config.job_timeout = std::chrono::seconds(parse_non_negative(a, value(i)));
        else if (a == "--sync-timeout") o.config.sync_timeout = std::chrono::seconds(parse_non_negative(a, value(i)));
        else if (a == "--os") o.config.os_family = value(i);
        else if (a == "--install-deps" || a == "--install-deps-only") install = true;
        else if (a == "--unpack-only") { o.unpack_path = value(i); unpack = true; }
        else if (a == "--allow-copy") o.config.allow_copy = true;
        else if (a == "--prefer-ipfs-car") o.config.prefer_ipfs_car = true;
        else if (a == "-h" || a == "--help") help = true;
        else throw FetchError(ErrorKind::usage, "Unknown argument: " + a);
    }

    if (help) return o;
    const bool fetch = !o.client.empty();
    if ((int)install + (int)unpack + (int)fetch > 1) {
        throw FetchError(ErrorKind::usage, "--install-deps, --client and --unpack-only are mutually exclusive");
    }
    if (install) {
        o.mode = RunMode::install_deps;
    } else if (unpack) {
        o.mode = RunMode::unpack;
        if (o.dir.empty()) o.dir = ".";
    } else {
        if (!fetch) throw FetchError(ErrorKind::usage, "Missing --client (or use --unpack-only)");
        if (o.dir.empty()) throw FetchError(ErrorKind::usage, "Missing --dir (or use --unpack-only)");
        o.mode = RunMode::fetch;
    }
    return o;
}

static void ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw FetchError(ErrorKind::io, "cannot create " + dir.string() + ": " + ec.message());
}

static Unpacker make_unpacker(const FetchConfig& cfg, ProcessRunner& runner) {
    return Unpacker(available_extractors(default_extractors(runner, cfg.prefer_ipfs_car)), cfg.allow_copy);
}

void run_cli(const CliOptions& o) {
    const FetchConfig& cfg = o.config;
    PosixProcessRunner runner(true);

    switch (o.mode) {
        case RunMode::help:
            return;
        case RunMode::install_deps: {
            OsFamily family = cfg.os_family.empty() ? detect_os_family() : parse_os_family(cfg.os_family);
            install_deps(family, runner);
            return;
        }
        case RunMode::unpack: {
            ensure_dir(o.dir);
            auto unpacker = make_unpacker(cfg, runner);
            auto done = unpacker.unpack(o.unpack_path, o.dir);
            log_info("Success. CAR unpacked with " + done.backend + " in: " + fs::absolute(o.dir).string());
            return;
        }
        case RunMode::fetch: {
            ensure_dir(o.dir);
            auto unpacker = make_unpacker(cfg, runner);
            if (unpacker.extractors().empty()) {
                throw FetchError(ErrorKind::extraction_exhausted, "No car/ipfs-car. Run --install-deps first.");
            }
            JobClient api(cfg.api_base, cfg.http_timeout_ms);
            JobCoordinator coordinator(api, cfg);
            std::string url = coordinator.acquire_url(o.client, o.provider);

            std::string name = file_name_from_url(url);
            if (name.empty()) throw FetchError(ErrorKind::schema, "Could not derive filename from URL: " + url);
            fs::path target = o.dir / name;
            log_info("Downloading: " + name);
            DownloadOptions dl;
            dl.attempts = cfg.download_attempts;
            download_to_file(url, target, dl);

            auto done = unpacker.unpack(target, o.dir);
            log_info("Success. File downloaded and unpacked with " + done.backend + " in: " +
                     fs::absolute(o.dir).string());
            return;
        }
    }
}
