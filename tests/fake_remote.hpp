#pragma once

// In-memory stand-ins for the job API and the storage service, with
// injectable faults. Shared by the controller, log stream and sync tests.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/hash.hpp>
#include <managers/retry_policy.hpp>
#include <transport/api_transport.hpp>

using json = nlohmann::json;

// ── Helpers ──────────────────────────────────────────────────

inline std::string path_part(const std::string& path) {
    auto q = path.find('?');
    return q == std::string::npos ? path : path.substr(0, q);
}

inline std::string query_param(const std::string& path, const std::string& key) {
    auto q = path.find('?');
    if (q == std::string::npos) return "";
    std::string query = path.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string kv = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = kv.find('=');
        if (eq != std::string::npos && kv.substr(0, eq) == key) return kv.substr(eq + 1);
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return "";
}

inline Error transient_error(const std::string& msg = "connection reset") {
    return Error::make(ErrorKind::TransientNetwork, msg);
}

// Records every requested delay and never sleeps. Returns false once the
// token is cancelled, like the real sleeper.
class RecordingSleeper {
public:
    Sleeper make(CancelToken cancel) {
        return [this, cancel](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lock(mutex_);
            delays_.push_back(d);
            return !cancel.is_cancelled();
        };
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

inline RetryConfig fast_retry_config(int max_attempts = 5) {
    RetryConfig c;
    c.max_attempts = max_attempts;
    c.base_delay_ms = 10;
    c.max_delay_ms = 100;
    c.max_elapsed = 60.0;
    c.rate_limit_multiplier = 4.0;
    return c;
}

// Byte stream over a fixed list of chunks, optionally ending in an error.
class FakeByteStream : public ByteStream {
public:
    FakeByteStream(std::vector<std::string> chunks, std::optional<Error> end_error)
        : chunks_(std::move(chunks)), end_error_(std::move(end_error)) {}

    Result<bool> read(std::string& chunk) override {
        if (closed_) return Result<bool>::Err(Error::make(ErrorKind::Cancelled, "stream closed"));
        if (next_ < chunks_.size()) {
            chunk = chunks_[next_++];
            return Result<bool>::Ok(true);
        }
        if (end_error_) return Result<bool>::Err(*end_error_);
        return Result<bool>::Ok(false);
    }

    void close() override { closed_ = true; }

private:
    std::vector<std::string> chunks_;
    std::optional<Error> end_error_;
    size_t next_ = 0;
    bool closed_ = false;
};

// ── Job service ──────────────────────────────────────────────

class FakeJobService : public ApiTransport {
public:
    // How the next POST /jobs misbehaves.
    enum class PostFault {
        BeforeSend,    // connect failure, nothing reached the server
        Status429,
        Status503,
        AfterCommit,   // job created, response lost
    };

    struct FakeJob {
        std::string id;
        std::string request_id;
        std::string image;
        std::string command;
        std::string description;
        int http_port = 0;
        int ssh_port = 0;
        std::deque<std::string> script;   // statuses returned by successive GETs
        std::string status = "pending";
        std::vector<json> logs;           // {"seq","stream","data"}
    };

    // ── Setup ────────────────────────────────────────────────

    std::string add_job(const std::string& status, std::deque<std::string> script = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        FakeJob job;
        job.id = "job-" + std::to_string(++next_id_);
        job.status = status;
        job.script = std::move(script);
        jobs_[job.id] = job;
        return job.id;
    }

    void add_log(const std::string& id, uint64_t seq, const std::string& data,
                 const std::string& stream = "stdout") {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[id].logs.push_back(json{{"seq", seq}, {"stream", stream}, {"data", data}});
    }

    void set_status(const std::string& id, const std::string& status) {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[id].status = status;
        jobs_[id].script.clear();
    }

    void set_description(const std::string& id, const std::string& description) {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[id].description = description;
    }

    // Statuses the next GETs of an existing job return, in order.
    void script_job(const std::string& id, std::deque<std::string> script) {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_[id].script = std::move(script);
    }

    std::string status_of(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_[id].status;
    }

    void push_post_fault(PostFault f) {
        std::lock_guard<std::mutex> lock(mutex_);
        post_faults_.push_back(f);
    }

    // Errors returned by the next requests of a method, before any effect.
    void push_fault(const std::string& method, Error e) {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_[method].push_back(std::move(e));
    }

    // DELETE takes effect on the server, then the response is lost.
    void lose_delete_responses(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        lost_delete_responses_ = n;
    }

    // Per log connection: number of chunks served before a transient drop.
    void push_log_break(size_t after_lines) {
        std::lock_guard<std::mutex> lock(mutex_);
        log_breaks_.push_back(after_lines);
    }

    // Replayed records below the requested cursor on reconnect.
    void set_log_replay_overlap(uint64_t n) { replay_overlap_ = n; }

    // Split every record across two chunks (tests line reassembly).
    void set_split_records(bool split) { split_records_ = split; }

    int calls(const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_[method];
    }

    size_t job_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    std::vector<std::string> log_cursors() {
        std::lock_guard<std::mutex> lock(mutex_);
        return log_cursors_;
    }

    json last_post_body() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_post_body_;
    }

    // ── ApiTransport ─────────────────────────────────────────

    Result<HttpResponse> request(const std::string& method, const std::string& path,
                                 const std::string& body, CancelToken cancel) override {
        (void)cancel;
        std::lock_guard<std::mutex> lock(mutex_);
        calls_[method]++;

        auto& pending = faults_[method];
        if (!pending.empty()) {
            Error e = pending.front();
            pending.pop_front();
            return Result<HttpResponse>::Err(e);
        }

        std::string p = path_part(path);
        if (method == "POST" && p == "/jobs") return post_job(body);
        if (method == "GET" && p == "/jobs") return list_jobs(path);
        if (p.compare(0, 6, "/jobs/") == 0) {
            std::string id = p.substr(6);
            auto it = jobs_.find(id);
            if (it == jobs_.end()) return Result<HttpResponse>::Err(http_error(method, path, 404, "no such job"));
            if (method == "GET") return ok(render(advance(it->second)));
            if (method == "DELETE") {
                if (it->second.status == "pending" || it->second.status == "running") {
                    it->second.status = "cancelled";
                    it->second.script.clear();
                }
                if (lost_delete_responses_ > 0) {
                    lost_delete_responses_--;
                    return Result<HttpResponse>::Err(transient_error("response lost"));
                }
                return ok(render(it->second));
            }
        }
        return Result<HttpResponse>::Err(http_error(method, path, 404, "not found"));
    }

    Result<std::unique_ptr<ByteStream>> open_stream(const std::string& path,
                                                    CancelToken cancel) override {
        (void)cancel;
        using R = Result<std::unique_ptr<ByteStream>>;
        std::lock_guard<std::mutex> lock(mutex_);
        calls_["STREAM"]++;

        auto& pending = faults_["STREAM"];
        if (!pending.empty()) {
            Error e = pending.front();
            pending.pop_front();
            return R::Err(e);
        }

        std::string p = path_part(path);
        const std::string suffix = "/log";
        if (p.compare(0, 6, "/jobs/") != 0 || p.size() <= 10
            || p.compare(p.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return R::Err(http_error("GET", path, 404, "not found"));
        }
        std::string id = p.substr(6, p.size() - 6 - suffix.size());
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return R::Err(http_error("GET", path, 404, "no such job"));

        std::string since_s = query_param(path, "since");
        uint64_t since = since_s.empty() ? 0 : std::stoull(since_s);
        log_cursors_.push_back(since_s);
        uint64_t from = since > replay_overlap_ ? since - replay_overlap_ : 0;

        std::vector<std::string> chunks;
        for (const auto& rec : it->second.logs) {
            if (rec["seq"].get<uint64_t>() <= from) continue;
            std::string line = rec.dump() + "\n";
            if (split_records_) {
                chunks.push_back(line.substr(0, line.size() / 2));
                chunks.push_back(line.substr(line.size() / 2));
            } else {
                chunks.push_back(line);
            }
        }

        std::optional<Error> end_error;
        if (!log_breaks_.empty()) {
            size_t after = log_breaks_.front();
            log_breaks_.pop_front();
            size_t keep = split_records_ ? after * 2 : after;
            if (keep < chunks.size()) chunks.resize(keep);
            end_error = transient_error("stream dropped");
        }
        return R::Ok(std::make_unique<FakeByteStream>(std::move(chunks), end_error));
    }

private:
    std::mutex mutex_;
    std::map<std::string, FakeJob> jobs_;
    int next_id_ = 0;
    std::map<std::string, int> calls_;
    std::map<std::string, std::deque<Error>> faults_;
    std::deque<PostFault> post_faults_;
    std::deque<size_t> log_breaks_;
    std::vector<std::string> log_cursors_;
    std::atomic<uint64_t> replay_overlap_{0};
    std::atomic<bool> split_records_{false};
    int lost_delete_responses_ = 0;
    json last_post_body_;

    static Result<HttpResponse> ok(const json& j) {
        HttpResponse r;
        r.status = 200;
        r.body = j.dump();
        return Result<HttpResponse>::Ok(r);
    }

    FakeJob& advance(FakeJob& job) {
        if (!job.script.empty()) {
            job.status = job.script.front();
            job.script.pop_front();
        }
        return job;
    }

    static json render(const FakeJob& job) {
        json history = {
            {"status", job.status},
            {"reason", ""},
            {"description", ""},
            {"created_at", "2025-01-15T10:00:00Z"},
        };
        if (job.status != "pending") history["started_at"] = "2025-01-15T10:00:05Z";
        if (job.status == "succeeded" || job.status == "failed" || job.status == "cancelled") {
            history["finished_at"] = "2025-01-15T10:05:00Z";
            history["exit_code"] = job.status == "succeeded" ? 0 : 1;
        }
        json out = {
            {"id", job.id},
            {"status", job.status},
            {"description", job.description},
            {"history", history},
            {"container", {
                {"image", job.image},
                {"command", job.command},
                {"resources", {{"cpu", 1.0}, {"memory_mb", "4096"}}},
            }},
        };
        if (job.http_port > 0) {
            out["container"]["http"] = {{"port", job.http_port}};
            out["http_url"] = "https://" + job.id + ".jobs.example.com";
        }
        if (job.ssh_port > 0) out["container"]["ssh"] = {{"port", job.ssh_port}};
        return out;
    }

    Result<HttpResponse> post_job(const std::string& body) {
        json req = json::parse(body);
        last_post_body_ = req;

        std::optional<PostFault> fault;
        if (!post_faults_.empty()) {
            fault = post_faults_.front();
            post_faults_.pop_front();
        }
        if (fault == PostFault::BeforeSend) {
            return Result<HttpResponse>::Err(transient_error("could not connect"));
        }
        if (fault == PostFault::Status429) {
            return Result<HttpResponse>::Err(http_error("POST", "/jobs", 429, "slow down"));
        }
        if (fault == PostFault::Status503) {
            return Result<HttpResponse>::Err(http_error("POST", "/jobs", 503, "unavailable"));
        }

        FakeJob job;
        job.id = "job-" + std::to_string(++next_id_);
        job.request_id = req.value("client_request_id", "");
        job.image = req["container"].value("image", "");
        job.command = req["container"].value("command", "");
        job.description = req.value("description", "");
        if (req["container"].contains("http")) job.http_port = req["container"]["http"].value("port", 0);
        if (req["container"].contains("ssh")) job.ssh_port = req["container"]["ssh"].value("port", 0);
        jobs_[job.id] = job;

        if (fault == PostFault::AfterCommit) {
            return Result<HttpResponse>::Err(Error::make(ErrorKind::AmbiguousState,
                "timed out waiting for response"));
        }
        return ok(render(job));
    }

    Result<HttpResponse> list_jobs(const std::string& path) {
        std::string request_id = query_param(path, "client_request_id");
        std::string status = query_param(path, "status");
        json out = json::array();
        for (const auto& [id, job] : jobs_) {
            if (!request_id.empty() && job.request_id != request_id) continue;
            if (!status.empty() && job.status != status) continue;
            out.push_back(render(job));
        }
        return ok({{"jobs", out}});
    }
};

// ── Storage service ──────────────────────────────────────────

class FakeStorage : public ApiTransport {
public:
    struct Entry {
        std::string content;
        std::string type = "FILE";
    };

    void put_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = {content, "FILE"};
    }

    void put_entry(const std::string& path, const std::string& type) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = {"", type};
    }

    bool has_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_.count(path) > 0;
    }

    std::string content(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return files_[path].content;
    }

    // Errors returned by the next PUTs of a path, before anything is stored.
    void push_put_fault(const std::string& path, Error e) {
        std::lock_guard<std::mutex> lock(mutex_);
        put_faults_[path].push_back(std::move(e));
    }

    // The next n PUTs of a path store corrupted bytes.
    void corrupt_uploads(const std::string& path, int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        corrupt_uploads_[path] = n;
    }

    // The next n downloads of a path serve corrupted bytes.
    void corrupt_downloads(const std::string& path, int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        corrupt_downloads_[path] = n;
    }

    // PUTs sleep this long while counted as in flight.
    void set_put_delay(std::chrono::milliseconds d) { put_delay_ = d; }

    // PUTs block until their cancel token fires, then report Cancelled.
    void block_puts(bool block) { block_puts_ = block; }

    int puts(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return put_counts_[path];
    }

    int total_puts() {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& [p, c] : put_counts_) n += c;
        return n;
    }

    int peak_in_flight() const { return peak_.load(); }
    int started_puts() const { return started_.load(); }

    Result<HttpResponse> request(const std::string& method, const std::string& path,
                                 const std::string& body, CancelToken cancel) override {
        std::string p = strip(path_part(path));
        std::string op = query_param(path, "op");

        if (method == "PUT") return put(p, body, cancel);

        std::lock_guard<std::mutex> lock(mutex_);
        if (method == "GET" && op == "LISTSTATUS") {
            json files = json::array();
            std::string prefix = p.empty() ? "" : p + "/";
            for (const auto& [fp, e] : files_) {
                if (fp.compare(0, prefix.size(), prefix) != 0) continue;
                files.push_back(describe(fp.substr(prefix.size()), e));
            }
            if (files.empty() && !p.empty()) {
                return Result<HttpResponse>::Err(http_error(method, path, 404, "not found"));
            }
            return ok({{"files", files}});
        }
        if (method == "GET" && op == "GETFILESTATUS") {
            auto it = files_.find(p);
            if (it == files_.end()) return Result<HttpResponse>::Err(http_error(method, path, 404, "not found"));
            return ok(describe(p, it->second));
        }
        return Result<HttpResponse>::Err(http_error(method, path, 400, "bad request"));
    }

    Result<std::unique_ptr<ByteStream>> open_stream(const std::string& path,
                                                    CancelToken cancel) override {
        (void)cancel;
        using R = Result<std::unique_ptr<ByteStream>>;
        std::string p = strip(path_part(path));
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(p);
        if (it == files_.end()) return R::Err(http_error("GET", path, 404, "not found"));

        std::string data = it->second.content;
        if (corrupt_downloads_[p] > 0) {
            corrupt_downloads_[p]--;
            data += "garbage";
        }
        // Two chunks to exercise incremental hashing
        std::vector<std::string> chunks;
        chunks.push_back(data.substr(0, data.size() / 2));
        chunks.push_back(data.substr(data.size() / 2));
        return R::Ok(std::make_unique<FakeByteStream>(std::move(chunks), std::nullopt));
    }

private:
    std::mutex mutex_;
    std::map<std::string, Entry> files_;
    std::map<std::string, std::deque<Error>> put_faults_;
    std::map<std::string, int> corrupt_uploads_;
    std::map<std::string, int> corrupt_downloads_;
    std::map<std::string, int> put_counts_;
    std::chrono::milliseconds put_delay_{0};
    std::atomic<bool> block_puts_{false};
    std::atomic<int> in_flight_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> started_{0};

    static std::string strip(const std::string& p) {
        size_t start = p.find_first_not_of('/');
        return start == std::string::npos ? "" : p.substr(start);
    }

    static json describe(const std::string& path, const Entry& e) {
        return {
            {"path", path},
            {"type", e.type},
            {"size", static_cast<int64_t>(e.content.size())},
            {"sha256", e.type == "FILE" ? sha256_hex(e.content) : ""},
        };
    }

    static Result<HttpResponse> ok(const json& j) {
        HttpResponse r;
        r.status = 200;
        r.body = j.dump();
        return Result<HttpResponse>::Ok(r);
    }

    Result<HttpResponse> put(const std::string& p, const std::string& body, CancelToken cancel) {
        started_++;
        int now = ++in_flight_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {}

        if (block_puts_) {
            cancel.wait_for(std::chrono::milliseconds(5000));
            in_flight_--;
            return Result<HttpResponse>::Err(Error::make(ErrorKind::Cancelled, "request aborted"));
        }
        if (put_delay_.count() > 0) std::this_thread::sleep_for(put_delay_);

        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_--;
        put_counts_[p]++;
        auto& faults = put_faults_[p];
        if (!faults.empty()) {
            Error e = faults.front();
            faults.pop_front();
            return Result<HttpResponse>::Err(e);
        }
        std::string stored = body;
        if (corrupt_uploads_[p] > 0) {
            corrupt_uploads_[p]--;
            stored += "garbage";
        }
        files_[p] = {stored, "FILE"};
        HttpResponse r;
        r.status = 201;
        return Result<HttpResponse>::Ok(r);
    }
};
