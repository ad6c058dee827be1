#pragma once

#include <exception>
#include <string>

namespace imuskel {

enum class ErrorCode {
    ConfigError,    // YAML session config parsing error
    SkeletonError,  // Skeleton definition violates the tree invariants
    InvalidMessage, // Ingress payload is not a usable sample
    IOError,        // Local filesystem error
    InvalidState    // Operation not allowed in the current session state
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigError:    return "ConfigError";
        case ErrorCode::SkeletonError:  return "SkeletonError";
        case ErrorCode::InvalidMessage: return "InvalidMessage";
        case ErrorCode::IOError:        return "IOError";
        case ErrorCode::InvalidState:   return "InvalidState";
        default:                        return "Unknown";
    }
}

class Error : public std::exception {
public:
    Error(ErrorCode code, const std::string& message)
        : code_(code), message_(message), source_() {
        build_what();
    }

    // source: file path or sensor label the error refers to
    Error(ErrorCode code, const std::string& source, const std::string& message)
        : code_(code), message_(message), source_(source) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& source() const noexcept { return source_; }

private:
    void build_what() {
        what_ = std::string("[imuskel::") + error_code_to_string(code_) + "] " + message_;
        if (!source_.empty()) {
            what_ += " (source: " + source_ + ")";
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string source_;
    std::string what_;
};

} // namespace imuskel
