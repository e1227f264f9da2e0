// src/core/errors.cpp
#include "tmpltool/core/errors.h"

namespace tmpltool {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SECURITY: return "security";
        case ErrorKind::CAPABILITY_DENIED: return "capability_denied";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::SPAWN: return "spawn";
        case ErrorKind::IO: return "io";
        case ErrorKind::NON_ZERO_EXIT: return "non_zero_exit";
        case ErrorKind::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorKind::RENDER: return "render";
    }
    return "unknown";
}

} // namespace tmpltool
