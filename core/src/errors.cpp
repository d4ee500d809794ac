#include "capsule/errors.h"

namespace capsule {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:       return "None";
        case ErrorKind::VALIDATION: return "ValidationError";
        case ErrorKind::RESOURCE:   return "ResourceError";
        case ErrorKind::TIMEOUT:    return "Timeout";
        case ErrorKind::RUNTIME:    return "RuntimeError";
        case ErrorKind::CHANNEL:    return "ChannelError";
    }
    return "RuntimeError";
}

ErrorKind error_kind_from_name(const std::string& s) {
    if (s == "None") return ErrorKind::NONE;
    if (s == "ValidationError") return ErrorKind::VALIDATION;
    if (s == "ResourceError") return ErrorKind::RESOURCE;
    if (s == "Timeout") return ErrorKind::TIMEOUT;
    if (s == "ChannelError") return ErrorKind::CHANNEL;
    return ErrorKind::RUNTIME;
}

std::string format_error(ErrorKind k, const std::string& message) {
    return std::string(error_kind_name(k)) + ": " + message;
}

} // namespace capsule
