#include "path/path_types.hpp"

namespace airpath::path {

const char* path_status_name(PathStatus status) {
    switch (status) {
    case PathStatus::Success:                return "Success";
    case PathStatus::NoPathFound:            return "NoPathFound";
    case PathStatus::IterationLimitExceeded: return "IterationLimitExceeded";
    case PathStatus::Uninitialized:          return "Uninitialized";
    case PathStatus::OutOfBounds:            return "OutOfBounds";
    case PathStatus::Busy:                   return "Busy";
    }
    return "Unknown";
}

} // namespace airpath::path
