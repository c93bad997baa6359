#pragma once
#include <string>
#include <filesystem>
#include "extractor.hpp"

// `path` if it is a file, else the same path without / with a ".car" suffix.
// Throws FetchError(not_found).
std::filesystem::path resolve_container_path(const std::filesystem::path& path);

struct UnpackOutcome {
    std::string backend;
    std::filesystem::path source; // the original, or the repaired clone
    bool repaired{false};
};

class Unpacker {
public:
    Unpacker(ExtractorList extractors, bool allow_copy);

    // Tries each extractor in order. A zero-length-section failure gets one
    // repair (clone + truncate) and one retry with the same extractor.
    // Throws FetchError(extraction_exhausted), or the scan/repair error.
    UnpackOutcome unpack(const std::filesystem::path& car, const std::filesystem::path& out_dir);

    const ExtractorList& extractors() const { return extractors_; }

private:
    ExtractorList extractors_;
    bool allow_copy_;
};
