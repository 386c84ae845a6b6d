#include "api_transport.hpp"
#include <fmt/format.h>

bool is_idempotent_method(const std::string& method) {
    return method == "GET" || method == "PUT" || method == "DELETE" || method == "HEAD";
}

ErrorKind classify_http_status(const std::string& method, long status) {
    if (status == 429) return ErrorKind::RateLimited;
    if (status == 503) return ErrorKind::TransientNetwork;
    if (status >= 500) {
        return is_idempotent_method(method) ? ErrorKind::TransientNetwork
                                            : ErrorKind::AmbiguousState;
    }
    return ErrorKind::Permanent;
}

Error http_error(const std::string& method, const std::string& path,
                 long status, const std::string& body) {
    Error e;
    e.kind = classify_http_status(method, status);
    e.http_status = static_cast<int>(status);
    e.message = fmt::format("{} {} returned HTTP {}", method, path, status);
    e.cause = body.size() > 300 ? body.substr(0, 300) : body;
    return e;
}
