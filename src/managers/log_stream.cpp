#include "log_stream.hpp"
#include "event_reporter.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

LogStream::LogStream(ApiTransport& api, const RetryPolicy& policy, std::string job_id,
                     StatusFetch fetch_status, std::chrono::milliseconds reopen_delay,
                     Sleeper sleep, CancelToken cancel, EventReporter* reporter,
                     uint64_t since)
    : api_(api),
      policy_(policy),
      job_id_(std::move(job_id)),
      fetch_status_(std::move(fetch_status)),
      reopen_delay_(reopen_delay),
      sleep_(std::move(sleep)),
      cancel_(std::move(cancel)),
      reporter_(reporter),
      last_seq_(since) {}

LogStream::~LogStream() {
    close();
}

void LogStream::close() {
    if (stream_) {
        stream_->close();
        stream_.reset();
    }
    ready_.clear();
    finished_ = true;
}

Result<std::optional<LogChunk>> LogStream::next() {
    using R = Result<std::optional<LogChunk>>;

    while (true) {
        if (!ready_.empty()) {
            Pending& front = ready_.front();
            if (front.gap) {
                Error gap = *front.gap;
                front.gap.reset();
                return R::Err(gap);
            }
            LogChunk chunk = std::move(front.chunk);
            ready_.pop_front();
            return R::Ok(std::move(chunk));
        }
        if (finished_) return R::Ok(std::nullopt);
        if (cancel_.is_cancelled()) {
            return fail(Error::make(ErrorKind::Cancelled, "log streaming cancelled", job_id_));
        }

        if (!stream_) {
            auto opened = open();
            if (opened.is_err()) {
                if (opened.error.kind == ErrorKind::Cancelled) return fail(opened.error);
                auto retry = on_failure(opened.error);
                if (retry.is_err()) return fail(retry.error);
                continue;
            }
        }

        std::string bytes;
        auto r = stream_->read(bytes);
        if (r.is_err()) {
            stream_.reset();
            // Partial line is replayed by the server after since=<last seq>
            line_buf_.clear();
            if (r.error.kind == ErrorKind::Cancelled) return fail(r.error);
            auto retry = on_failure(r.error);
            if (retry.is_err()) return fail(retry.error);
            continue;
        }

        if (r.value) {
            failures_ = 0;
            auto c = consume(bytes, false);
            if (c.is_err()) return fail(c.error);
            continue;
        }

        // Clean end of this connection
        stream_.reset();
        auto c = consume("", true);
        if (c.is_err()) return fail(c.error);
        auto closed = on_clean_close();
        if (closed.is_err()) return fail(closed.error);
    }
}

Result<void> LogStream::open() {
    std::string path = fmt::format("/jobs/{}/log?since={}", url_encode(job_id_), last_seq_);
    auto r = api_.open_stream(path, cancel_);
    if (r.is_err()) {
        if (r.error.subject.empty()) r.error.subject = job_id_;
        return Result<void>::Err(r.error);
    }
    stream_ = std::move(r.value);
    return Result<void>::Ok();
}

Result<void> LogStream::consume(const std::string& bytes, bool flush) {
    line_buf_ += bytes;

    size_t pos;
    while ((pos = line_buf_.find('\n')) != std::string::npos) {
        std::string line = line_buf_.substr(0, pos);
        line_buf_.erase(0, pos + 1);
        auto r = accept_line(line);
        if (r.is_err()) return r;
    }

    if (flush && !line_buf_.empty()) {
        std::string line;
        line.swap(line_buf_);
        return accept_line(line);
    }
    return Result<void>::Ok();
}

Result<void> LogStream::accept_line(const std::string& raw) {
    std::string line = raw;
    trim(line);
    if (line.empty()) return Result<void>::Ok();

    Pending p;
    try {
        auto j = nlohmann::json::parse(line);
        p.chunk.seq = j.at("seq").get<uint64_t>();
        p.chunk.stream = j.value("stream", std::string("stdout")) == "stderr"
            ? LogStreamKind::Stderr : LogStreamKind::Stdout;
        p.chunk.data = j.value("data", std::string());
    } catch (const nlohmann::json::exception& e) {
        return Result<void>::Err(Error::make(ErrorKind::Permanent,
            fmt::format("malformed log record: {}", e.what()), job_id_));
    }

    if (p.chunk.seq <= last_seq_) {
        duplicates_++;
        return Result<void>::Ok();
    }
    if (p.chunk.seq > last_seq_ + 1) {
        p.gap = Error::make(ErrorKind::SequenceGap,
            fmt::format("log sequence jumped from {} to {}", last_seq_, p.chunk.seq), job_id_);
        neuro_log(fmt::format("log {}: gap {} -> {}", job_id_, last_seq_, p.chunk.seq));
    }
    last_seq_ = p.chunk.seq;
    ready_.push_back(std::move(p));
    return Result<void>::Ok();
}

Result<void> LogStream::on_failure(const Error& err) {
    if (!err.is_transient()) return Result<void>::Err(err);

    auto now = std::chrono::steady_clock::now();
    if (failures_ == 0) first_failure_ = now;
    failures_++;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - first_failure_);
    RetryDecision d = policy_.decide(err.kind, failures_, elapsed, policy_.sample_jitter());
    if (d.give_up) {
        Error e = err;
        e.attempts = failures_;
        if (e.subject.empty()) e.subject = job_id_;
        return Result<void>::Err(e);
    }

    reconnects_++;
    neuro_log(fmt::format("log {}: reconnecting after '{}' (since={}, delay={}ms)",
                          job_id_, err.message, last_seq_, d.delay.count()));
    if (reporter_) {
        reporter_->emit("logs:" + job_id_, EventKind::LogReconnect, job_id_,
                        fmt::format("reconnecting from seq {}", last_seq_));
    }
    if (!sleep_(d.delay)) {
        return Result<void>::Err(Error::make(ErrorKind::Cancelled, "log streaming cancelled", job_id_));
    }
    return Result<void>::Ok();
}

Result<void> LogStream::on_clean_close() {
    if (terminal_seen_) {
        finished_ = true;
        return Result<void>::Ok();
    }

    auto status = fetch_status_();
    if (status.is_err()) return Result<void>::Err(status.error);

    if (is_terminal(status.value)) {
        // One more pass picks up output written before the job finished
        terminal_seen_ = true;
        return Result<void>::Ok();
    }

    if (!sleep_(reopen_delay_)) {
        return Result<void>::Err(Error::make(ErrorKind::Cancelled, "log streaming cancelled", job_id_));
    }
    return Result<void>::Ok();
}

Result<std::optional<LogChunk>> LogStream::fail(Error err) {
    close();
    if (err.subject.empty()) err.subject = job_id_;
    return Result<std::optional<LogChunk>>::Err(err);
}
