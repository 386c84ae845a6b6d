#pragma once

#include <string>
#include <memory>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// Pull-based byte stream returned by ApiTransport::open_stream().
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Ok(true) with the next chunk in `chunk`, Ok(false) at a clean end of
    // stream, Err on a broken or refused stream.
    virtual Result<bool> read(std::string& chunk) = 0;

    // Abort the stream; pending and later read() calls return Cancelled.
    virtual void close() = 0;
};

// Authenticated request/response and streaming primitives over the remote
// API. Implementations add credentials; callers never see them.
//
// Errors are already classified:
//   * failure before the request left the client -> TransientNetwork
//   * failure after it may have reached the server -> TransientNetwork for
//     idempotent methods, AmbiguousState for POST
//   * HTTP statuses via classify_http_status()
//   * cancellation -> Cancelled (AmbiguousState for a POST already sent)
class ApiTransport {
public:
    virtual ~ApiTransport() = default;

    // path is relative to the transport's base URL and may carry a query.
    // A response with a non-2xx status is returned as an Err whose
    // http_status is set and whose cause holds the response body.
    virtual Result<HttpResponse> request(const std::string& method,
                                         const std::string& path,
                                         const std::string& body = "",
                                         CancelToken cancel = {}) = 0;

    virtual Result<std::unique_ptr<ByteStream>> open_stream(const std::string& path,
                                                            CancelToken cancel = {}) = 0;
};

// GET, PUT, DELETE and HEAD may be replayed safely.
bool is_idempotent_method(const std::string& method);

// Map a non-2xx HTTP status to the error taxonomy.
//   429 -> RateLimited; 503 -> TransientNetwork (request refused unprocessed)
//   other 5xx -> TransientNetwork, or AmbiguousState for POST
//   4xx -> Permanent
ErrorKind classify_http_status(const std::string& method, long status);

// Build the Err for a non-2xx response.
Error http_error(const std::string& method, const std::string& path,
                 long status, const std::string& body);
