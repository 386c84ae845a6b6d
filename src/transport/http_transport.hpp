#pragma once

#include <string>
#include "api_transport.hpp"

// libcurl implementation of ApiTransport. One easy handle per call; streams
// run their transfer on a reader thread feeding a bounded channel so the
// consumer's pace throttles the socket.
class HttpTransport : public ApiTransport {
public:
    HttpTransport(std::string base_url, std::string token, int timeout_secs);

    Result<HttpResponse> request(const std::string& method,
                                 const std::string& path,
                                 const std::string& body = "",
                                 CancelToken cancel = {}) override;

    Result<std::unique_ptr<ByteStream>> open_stream(const std::string& path,
                                                    CancelToken cancel = {}) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::string token_;
    int timeout_secs_;

    std::string url_for(const std::string& path) const;
};
