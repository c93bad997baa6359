#include "../include/errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::network: return "NetworkError";
        case ErrorKind::schema: return "SchemaError";
        case ErrorKind::job_failure: return "JobFailure";
        case ErrorKind::timeout: return "Timeout";
        case ErrorKind::unsupported_filesystem: return "UnsupportedFilesystem";
        case ErrorKind::no_header: return "NoHeader";
        case ErrorKind::truncated_section: return "TruncatedSection";
        case ErrorKind::extraction_exhausted: return "ExtractionExhausted";
        case ErrorKind::not_found: return "NotFound";
        case ErrorKind::usage: return "UsageError";
        case ErrorKind::process: return "ProcessError";
        case ErrorKind::io: return "IoError";
    }
    return "Error";
}
