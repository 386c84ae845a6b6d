#include "errors.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientNetwork: return "TransientNetworkError";
        case ErrorKind::RateLimited:      return "RateLimited";
        case ErrorKind::AmbiguousState:   return "AmbiguousState";
        case ErrorKind::Integrity:        return "IntegrityError";
        case ErrorKind::UnsupportedEntry: return "UnsupportedEntry";
        case ErrorKind::Timeout:          return "Timeout";
        case ErrorKind::Permanent:        return "PermanentError";
        case ErrorKind::SequenceGap:      return "SequenceGap";
        case ErrorKind::Consistency:      return "ConsistencyError";
        case ErrorKind::Cancelled:        return "Cancelled";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = fmt::format("[{}] ", error_kind_name(kind));
    if (!subject.empty()) out += subject + ": ";
    out += message;

    std::string extra;
    if (attempts > 1) extra = fmt::format("after {} attempts", attempts);
    if (http_status > 0) {
        if (!extra.empty()) extra += ", ";
        extra += fmt::format("HTTP {}", http_status);
    }
    if (!cause.empty() && cause != message) {
        if (!extra.empty()) extra += ", ";
        extra += cause;
    }
    if (!extra.empty()) out += " (" + extra + ")";
    return out;
}
