#pragma once
#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "process.hpp"

struct ExtractResult {
    bool ok{false};
    int exit_code{-1};
    std::string output;
};

class Extractor {
public:
    virtual ~Extractor() = default;
    virtual const std::string& name() const = 0;
    // True when the backend can run on this machine.
    virtual bool probe() const = 0;
    // Unpacks `car` into `out_dir`.
    virtual ExtractResult extract(const std::filesystem::path& car, const std::filesystem::path& out_dir) = 0;
};

// External CLI: `program` followed by `args`, where the literal "{car}" is replaced by the file.
class CommandExtractor : public Extractor {
public:
    CommandExtractor(std::string program, std::vector<std::string> args, ProcessRunner& runner);

    const std::string& name() const override { return program_; }
    bool probe() const override;
    ExtractResult extract(const std::filesystem::path& car, const std::filesystem::path& out_dir) override;

private:
    std::string program_;
    std::vector<std::string> args_;
    ProcessRunner& runner_;
};

// The go-car style failure on a CAR padded after its zero-length end marker.
bool is_zero_length_signature(const std::string& output);

using ExtractorList = std::vector<std::unique_ptr<Extractor>>;

// car-pad (tolerant fork), car (go-car), ipfs-car, in that order, or with
// ipfs-car first when `prefer_ipfs_car`.
ExtractorList default_extractors(ProcessRunner& runner, bool prefer_ipfs_car);

// Keeps the extractors whose probe() succeeds, preserving order.
ExtractorList available_extractors(ExtractorList all);
