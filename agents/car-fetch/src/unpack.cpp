#include "../include/unpack.hpp"
#include "../include/car_repair.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <iostream>

namespace fs = std::filesystem;

fs::path resolve_container_path(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) return path;
    const std::string s = path.string();
    const std::string suffix = ".car";
    if (s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        fs::path bare(s.substr(0, s.size() - suffix.size()));
        if (fs::is_regular_file(bare, ec)) return bare;
    }
    fs::path with(s + suffix);
    if (fs::is_regular_file(with, ec)) return with;
    throw FetchError(ErrorKind::not_found, "CAR file not found: " + s);
}

Unpacker::Unpacker(ExtractorList extractors, bool allow_copy)
    : extractors_(std::move(extractors)), allow_copy_(allow_copy) {}

static void dump_output(const std::string& output) {
    if (!output.empty()) std::cerr << output << (output.back() == '\n' ? "" : "\n");
}

UnpackOutcome Unpacker::unpack(const fs::path& path, const fs::path& out_dir) {
    const fs::path car = resolve_container_path(path);
    if (extractors_.empty()) {
        throw FetchError(ErrorKind::extraction_exhausted,
                         "No CAR extractor available (car-pad, car or ipfs-car). Run --install-deps first.");
    }
    log_info("Unpacking CAR: " + car.string());

    std::string tried;
    for (auto& ex : extractors_) {
        tried += (tried.empty() ? "" : ", ") + ex->name();
        auto r = ex->extract(car, out_dir);
        if (r.ok) return UnpackOutcome{ex->name(), car, false};

        if (!is_zero_length_signature(r.output)) {
            log_info(ex->name() + " failed (exit " + std::to_string(r.exit_code) + "); trying other extractors...");
            dump_output(r.output);
            continue;
        }

        log_info("Detected zero-length section/padding. Fixing safely (clone + truncate)...");
        auto fix = repair_container(car, allow_copy_);
        auto retry = ex->extract(fix.fixed, out_dir);
        if (retry.ok) return UnpackOutcome{ex->name(), fix.fixed, true};
        log_info(ex->name() + " failed after fix (exit " + std::to_string(retry.exit_code) + "); trying other extractors...");
        dump_output(retry.output);
    }
    throw FetchError(ErrorKind::extraction_exhausted, "No working extractor available (tried " + tried + ").");
}
