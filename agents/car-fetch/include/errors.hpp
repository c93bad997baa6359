#pragma once
#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
    network,                // request/transport failure
    schema,                 // expected field absent from a response
    job_failure,            // remote job reported a terminal failure status
    timeout,                // poll deadline passed
    unsupported_filesystem, // no clone/reflink and copy not authorized
    no_header,
    truncated_section,
    extraction_exhausted,
    not_found,
    usage,
    process,
    io
};

const char* error_kind_name(ErrorKind kind);

class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message, std::string context = {})
        : std::runtime_error(message), kind_(kind), context_(std::move(context)) {}

    ErrorKind kind() const noexcept { return kind_; }
    // Last response body or tool output, for operator triage. May be empty.
    const std::string& context() const noexcept { return context_; }

private:
    ErrorKind kind_;
    std::string context_;
};
