#include "pcapfin/errors.h"

namespace pcapfin {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "ok";
        case ErrorCode::ConfigurationError: return "configuration_error";
        case ErrorCode::ReadError: return "read_error";
        case ErrorCode::WriteError: return "write_error";
        case ErrorCode::CleanupError: return "cleanup_error";
    }
    return "unknown";
}

} // namespace pcapfin
