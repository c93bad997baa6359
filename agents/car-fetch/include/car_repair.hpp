#pragma once
#include <cstdint>
#include <filesystem>

enum class CloneMethod { reflink, copy };

// Copy-on-write duplicate of `src` at `dst` (FICLONE on Linux, clonefile on macOS).
// Falls back to a full copy only when `allow_copy`; otherwise throws
// FetchError(unsupported_filesystem). Any existing `dst` is replaced.
// `src` is opened read-only on every path.
CloneMethod clone_file(const std::filesystem::path& src, const std::filesystem::path& dst, bool allow_copy);

// Shrinks `path` to exactly `size` bytes. Never grows a file.
void truncate_file(const std::filesystem::path& path, std::uint64_t size);

struct RepairResult {
    std::filesystem::path fixed;
    std::uint64_t offset{0};
    CloneMethod method{CloneMethod::reflink};
};

std::filesystem::path repaired_path_for(const std::filesystem::path& car);

// Locates the zero-length marker in `car`, clones it to repaired_path_for(car)
// and truncates the clone there.
RepairResult repair_container(const std::filesystem::path& car, bool allow_copy);
