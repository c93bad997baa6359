#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

struct ProcessResult {
    int exit_code{-1};  // -1 when terminated by a signal
    std::string output; // stdout and stderr, interleaved

    bool ok() const { return exit_code == 0; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    // argv[0] is looked up on PATH; exit code 127 when it cannot be executed.
    // Throws FetchError(process) when no child could be created.
    virtual ProcessResult run(const std::vector<std::string>& argv, const std::filesystem::path& workdir) = 0;
};

class PosixProcessRunner : public ProcessRunner {
public:
    // When true, captured output is also copied to stderr as it arrives.
    explicit PosixProcessRunner(bool echo = false) : echo_(echo) {}
    ProcessResult run(const std::vector<std::string>& argv, const std::filesystem::path& workdir) override;

private:
    bool echo_;
};

std::optional<std::filesystem::path> find_executable(const std::string& name);
bool have_executable(const std::string& name);
