#include "core/result.hpp"

namespace airpath {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::Generic:                return "Generic";
    case ErrorCode::InvalidConfiguration:   return "InvalidConfiguration";
    case ErrorCode::Uninitialized:          return "Uninitialized";
    case ErrorCode::OutOfBounds:            return "OutOfBounds";
    case ErrorCode::NoPathFound:            return "NoPathFound";
    case ErrorCode::IterationLimitExceeded: return "IterationLimitExceeded";
    case ErrorCode::Busy:                   return "Busy";
    case ErrorCode::ScriptError:            return "ScriptError";
    }
    return "Unknown";
}

} // namespace airpath
