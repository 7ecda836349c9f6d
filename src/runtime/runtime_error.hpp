#pragma once

#include <stdexcept>
#include <string>

namespace codejoin::runtime {

enum class ErrorKind {
    // Socket missing, refused or timed out.
    kUnavailable,
    kPermissionDenied,
    kNotFound,
    kConflict,
    kServer,
    // Unexpected status or malformed response.
    kProtocol
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kUnavailable: return "unavailable";
        case ErrorKind::kPermissionDenied: return "permission-denied";
        case ErrorKind::kNotFound: return "not-found";
        case ErrorKind::kConflict: return "conflict";
        case ErrorKind::kServer: return "server";
        case ErrorKind::kProtocol: return "protocol";
    }
    return "unknown";
}

class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorKind kind, const std::string& message, int status = 0)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    ErrorKind Kind() const { return kind_; }
    // HTTP status of the failed call; 0 when the request never completed.
    int Status() const { return status_; }

private:
    ErrorKind kind_;
    int status_;
};

// Message shown to end users when a sandbox cannot be provisioned.
inline std::string DescribeForUser(const RuntimeError& error, const std::string& image) {
    switch (error.Kind()) {
        case ErrorKind::kUnavailable:
            return "Container runtime is not running or not accessible";
        case ErrorKind::kPermissionDenied:
            return "Permission denied accessing the container runtime socket";
        case ErrorKind::kNotFound:
            return "Image '" + image + "' not found. Please pull the required images.";
        default:
            return std::string("Failed to create sandbox: ") + error.what();
    }
}

}  // namespace codejoin::runtime
