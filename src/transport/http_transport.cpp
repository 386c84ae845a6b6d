#include "http_transport.hpp"
#include <core/channel.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

namespace {

std::once_flag g_curl_init;

void ensure_curl_global() {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t append_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

int cancel_progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<CancelToken*>(clientp);
    return cancel->is_cancelled() ? 1 : 0;
}

bool connect_phase_failure(CURLcode code) {
    return code == CURLE_COULDNT_RESOLVE_HOST || code == CURLE_COULDNT_RESOLVE_PROXY ||
           code == CURLE_COULDNT_CONNECT || code == CURLE_SSL_CONNECT_ERROR;
}

// Turn a failed curl_easy_perform into a classified Error.
Error curl_error(const std::string& method, const std::string& path,
                 CURLcode code, bool sent) {
    Error e;
    e.message = fmt::format("{} {} failed", method, path);
    e.cause = curl_easy_strerror(code);

    if (code == CURLE_URL_MALFORMAT || code == CURLE_UNSUPPORTED_PROTOCOL) {
        e.kind = ErrorKind::Permanent;
    } else if (code == CURLE_ABORTED_BY_CALLBACK) {
        e.kind = (sent && !is_idempotent_method(method)) ? ErrorKind::AmbiguousState
                                                         : ErrorKind::Cancelled;
        e.cause = "cancelled";
    } else if (connect_phase_failure(code) || !sent) {
        e.kind = ErrorKind::TransientNetwork;
    } else {
        e.kind = is_idempotent_method(method) ? ErrorKind::TransientNetwork
                                              : ErrorKind::AmbiguousState;
    }
    return e;
}

CurlHeaders auth_headers(const std::string& token, bool json_body, bool stream) {
    curl_slist* h = nullptr;
    if (!token.empty()) {
        h = curl_slist_append(h, ("Authorization: Bearer " + token).c_str());
    }
    if (json_body) h = curl_slist_append(h, "Content-Type: application/json");
    if (stream) h = curl_slist_append(h, "Accept-Encoding: identity");
    return CurlHeaders(h, &curl_slist_free_all);
}

// ── Streaming ──────────────────────────────────────────────

class CurlByteStream : public ByteStream {
public:
    CurlByteStream(std::string url, std::string path, const std::string& token,
                   int connect_timeout, CancelToken cancel)
        : url_(std::move(url)), path_(std::move(path)),
          headers_(auth_headers(token, false, true)),
          connect_timeout_(connect_timeout), cancel_(std::move(cancel)),
          chunks_(STREAM_CHANNEL_CAPACITY),
          on_cancel_(cancel_, [this] { abort(); }) {
        reader_ = std::thread(&CurlByteStream::reader_thread, this);
    }

    ~CurlByteStream() override {
        close();
    }

    Result<bool> read(std::string& chunk) override {
        auto item = chunks_.pop();
        if (item) {
            chunk = std::move(*item);
            return Result<bool>::Ok(true);
        }

        join();
        if (aborted_.load()) {
            return Result<bool>::Err(Error::make(ErrorKind::Cancelled, "stream closed", path_));
        }
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (error_) return Result<bool>::Err(*error_);
        return Result<bool>::Ok(false);
    }

    void close() override {
        abort();
        join();
    }

private:
    std::string url_;
    std::string path_;
    CurlHeaders headers_;
    int connect_timeout_;
    CancelToken cancel_;
    BoundedChannel<std::string> chunks_;
    std::atomic<bool> aborted_{false};
    long status_ = 0;
    std::string error_body_;
    std::mutex error_mutex_;
    std::optional<Error> error_;
    std::thread reader_;
    std::mutex join_mutex_;
    CancelRegistration on_cancel_;

    void abort() {
        aborted_.store(true);
        chunks_.close();
    }

    void join() {
        std::lock_guard<std::mutex> lock(join_mutex_);
        if (reader_.joinable()) reader_.join();
    }

    static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
        auto* self = static_cast<CurlByteStream*>(userp);
        size_t total = size * nmemb;
        return self->on_data(static_cast<char*>(contents), total);
    }

    size_t on_data(const char* data, size_t len) {
        if (status_ == 0) {
            curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status_);
        }
        if (status_ >= 300) {
            error_body_.append(data, len);
            return len;
        }
        // Blocks while the consumer is behind; returns false once closed.
        if (!chunks_.push(std::string(data, len))) return 0;
        return len;
    }

    static int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        auto* self = static_cast<CurlByteStream*>(clientp);
        return self->aborted_.load() ? 1 : 0;
    }

    CURL* handle_ = nullptr;

    void reader_thread() {
        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            set_error(Error::make(ErrorKind::TransientNetwork, "curl_easy_init failed", path_));
            chunks_.close();
            return;
        }
        handle_ = curl.get();

        curl_easy_setopt(handle_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, headers_.get());
        curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION, &CurlByteStream::write_cb);
        curl_easy_setopt(handle_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(handle_, CURLOPT_XFERINFOFUNCTION, &CurlByteStream::progress_cb);
        curl_easy_setopt(handle_, CURLOPT_XFERINFODATA, this);
        curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout_));
        curl_easy_setopt(handle_, CURLOPT_TCP_KEEPALIVE, 1L);

        CURLcode code = curl_easy_perform(handle_);
        if (status_ == 0) curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &status_);

        if (code != CURLE_OK && !aborted_.load()) {
            long request_size = 0;
            curl_easy_getinfo(handle_, CURLINFO_REQUEST_SIZE, &request_size);
            Error e = curl_error("GET", path_, code, request_size > 0);
            e.subject = path_;
            set_error(e);
            neuro_log(fmt::format("stream {} broke: {}", path_, e.cause));
        } else if (status_ >= 300) {
            set_error(http_error("GET", path_, status_, error_body_));
        }
        handle_ = nullptr;
        chunks_.close();
    }

    void set_error(Error e) {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = std::move(e);
    }
};

} // namespace

// ── HttpTransport ──────────────────────────────────────────

HttpTransport::HttpTransport(std::string base_url, std::string token, int timeout_secs)
    : base_url_(std::move(base_url)), token_(std::move(token)), timeout_secs_(timeout_secs) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    ensure_curl_global();
}

std::string HttpTransport::url_for(const std::string& path) const {
    if (path.empty()) return base_url_;
    if (path.front() == '/') return base_url_ + path;
    return base_url_ + "/" + path;
}

Result<HttpResponse> HttpTransport::request(const std::string& method,
                                            const std::string& path,
                                            const std::string& body,
                                            CancelToken cancel) {
    if (cancel.is_cancelled()) {
        return Result<HttpResponse>::Err(Error::make(ErrorKind::Cancelled, "cancelled before send", path));
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Result<HttpResponse>::Err(Error::make(
            ErrorKind::TransientNetwork, "curl_easy_init failed", path));
    }

    bool has_body = method == "POST" || method == "PUT";
    CurlHeaders headers = auth_headers(token_, method == "POST", false);
    std::string url = url_for(path);
    std::string buf;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (has_body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, cancel_progress_cb);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &cancel);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout_secs_));
    if (method == "PUT") {
        // Large uploads: stall detection instead of a wall-clock limit
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeout_secs_));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_secs_));
    }

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        long request_size = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_REQUEST_SIZE, &request_size);
        Error e = curl_error(method, path, code, request_size > 0);
        neuro_log(fmt::format("http {} {} -> {} ({})", method, path,
                              error_kind_name(e.kind), e.cause));
        return Result<HttpResponse>::Err(e);
    }

    HttpResponse resp;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    neuro_log(fmt::format("http {} {} -> {} ({} bytes)", method, path, resp.status, resp.body.size()));

    if (!resp.ok()) {
        return Result<HttpResponse>::Err(http_error(method, path, resp.status, resp.body));
    }
    return Result<HttpResponse>::Ok(std::move(resp));
}

Result<std::unique_ptr<ByteStream>> HttpTransport::open_stream(const std::string& path,
                                                               CancelToken cancel) {
    if (cancel.is_cancelled()) {
        return Result<std::unique_ptr<ByteStream>>::Err(
            Error::make(ErrorKind::Cancelled, "cancelled before open", path));
    }
    std::unique_ptr<ByteStream> stream = std::make_unique<CurlByteStream>(
        url_for(path), path, token_, timeout_secs_, std::move(cancel));
    return Result<std::unique_ptr<ByteStream>>::Ok(std::move(stream));
}
