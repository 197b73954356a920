#pragma once
#include <stdexcept>
#include <string>

namespace pcapfin {

enum class ErrorCode {
    Ok = 0,
    ConfigurationError,
    ReadError,
    WriteError,
    CleanupError,
};

const char* error_code_name(ErrorCode code);

// Job-level failure. The only error type a caller of the finalizer ever sees.
class JobException : public std::runtime_error {
public:
    JobException(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Raised by FileSystem implementations; translated into JobException by the components.
class IoException : public std::runtime_error {
public:
    explicit IoException(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace pcapfin
