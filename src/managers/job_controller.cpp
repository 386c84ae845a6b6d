#include "job_controller.hpp"
#include "state_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

using std::chrono::milliseconds;

std::string job_filter_query(const JobFilter& filter) {
    std::vector<std::string> params;
    for (auto s : filter.statuses) {
        params.push_back(std::string("status=") + job_status_name(s));
    }
    if (!filter.name.empty()) params.push_back("name=" + url_encode(filter.name));
    if (!filter.client_request_id.empty()) {
        params.push_back("client_request_id=" + url_encode(filter.client_request_id));
    }
    if (params.empty()) return "";

    std::string q = "?";
    for (size_t i = 0; i < params.size(); ++i) {
        if (i) q += "&";
        q += params[i];
    }
    return q;
}

static std::string job_path(const std::string& job_id) {
    return "/jobs/" + url_encode(job_id);
}

JobController::JobController(ApiTransport& api, const RetryPolicy& policy,
                             ConcurrencyLimiter& limiter, const JobsConfig& config,
                             EventReporter* reporter, StateStore* state)
    : api_(api),
      policy_(policy),
      limiter_(limiter),
      config_(config),
      reporter_(reporter),
      state_(state),
      sleeper_factory_(cancellable_sleeper) {}

WaitOptions JobController::default_wait_options() const {
    WaitOptions opts;
    opts.poll_interval = milliseconds(static_cast<long long>(config_.poll_interval * 1000));
    opts.poll_interval_max = milliseconds(static_cast<long long>(config_.poll_interval_max * 1000));
    return opts;
}

// ── Plumbing ───────────────────────────────────────────────

Result<HttpResponse> JobController::call(const std::string& method, const std::string& path,
                                         const std::string& body, const std::string& subject,
                                         CancelToken cancel) {
    Sleeper sleep = sleeper_factory_(cancel);
    return retry_call(policy_, subject, [&](int attempt) {
        auto permit = limiter_.acquire(cancel);
        if (!permit) {
            return Result<HttpResponse>::Err(Error::make(ErrorKind::Cancelled,
                "cancelled while waiting for a connection slot", subject));
        }
        auto r = api_.request(method, path, body, cancel);
        if (r.is_err() && attempt > 1) {
            neuro_log(fmt::format("{} {} attempt {} failed: {}", method, path, attempt,
                                  r.error.message));
        }
        return r;
    }, sleep);
}

void JobController::emit(const std::string& job_id, EventKind kind, const std::string& message) {
    if (reporter_) reporter_->emit("job:" + job_id, kind, job_id, message);
}

void JobController::record(const Job& job) {
    if (!state_) return;
    JobState js;
    js.job_id = job.id;
    js.job_name = job.spec.name;
    js.status = job_status_name(job.status);
    js.submit_time = job.created_at;
    js.start_time = job.started_at;
    js.end_time = job.finished_at;
    js.exit_code = job.exit_code.value_or(-1);
    state_->record_job(js);
}

Result<void> JobController::observe(const Job& job) {
    std::optional<JobStatus> previous;
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        auto it = known_.find(job.id);
        if (it != known_.end()) {
            auto check = check_transition(it->second, job.status);
            if (check.is_err()) {
                check.error.subject = job.id;
                neuro_log(fmt::format("job {}: {}", job.id, check.error.message));
                return check;
            }
            if (it->second == job.status) return Result<void>::Ok();
            previous = it->second;
            it->second = job.status;
        } else {
            known_[job.id] = job.status;
        }
    }

    std::string msg = previous
        ? fmt::format("status {} -> {}", job_status_name(*previous), job_status_name(job.status))
        : fmt::format("status {}", job_status_name(job.status));
    if (!job.reason.empty()) msg += fmt::format(" ({})", job.reason);
    if (job.exit_code && is_terminal(job.status)) msg += fmt::format(", exit code {}", *job.exit_code);

    append_job_log(job.id, msg);
    emit(job.id, EventKind::JobStatusChanged, msg);
    record(job);
    return Result<void>::Ok();
}

// ── Submit ─────────────────────────────────────────────────

Result<Job> JobController::submit(const JobSpec& spec, CancelToken cancel) {
    auto valid = validate_job_spec(spec);
    if (valid.is_err()) return Result<Job>::Err(valid.error);

    std::string request_id = random_hex(16);
    std::string body = job_request_body(spec, request_id);
    neuro_log(fmt::format("submitting job (request {}, image {})", request_id, spec.image));
    return post_submission(request_id, body, cancel);
}

Result<Job> JobController::post_submission(const std::string& request_id, const std::string& body,
                                           CancelToken cancel) {
    auto r = call("POST", "/jobs", body, request_id, cancel);

    if (r.is_err()) {
        Error err = r.error;
        if (err.kind == ErrorKind::AmbiguousState) {
            err.subject = request_id;
            err.message = fmt::format(
                "submission outcome unknown ({}); confirm with 'neuro job confirm {}'",
                err.message, request_id);
            if (state_) {
                PendingSubmission p;
                p.request_id = request_id;
                p.request_body = body;
                p.submit_time = now_iso();
                p.last_error = r.error.message;
                state_->record_pending(p);
            }
            neuro_log(fmt::format("submission {} ambiguous: {}", request_id, r.error.describe()));
            if (reporter_) {
                reporter_->emit("submit:" + request_id, EventKind::JobAmbiguous, request_id, err.message);
            }
        }
        return Result<Job>::Err(err);
    }

    auto job = parse_job(r.value.body);
    if (job.is_err()) {
        // Accepted by the server but unreadable: the job exists somewhere
        Error err = Error::make(ErrorKind::AmbiguousState,
            fmt::format("job accepted but response unreadable: {}", job.error.message), request_id);
        if (state_) {
            PendingSubmission p;
            p.request_id = request_id;
            p.request_body = body;
            p.submit_time = now_iso();
            p.last_error = job.error.message;
            state_->record_pending(p);
        }
        return Result<Job>::Err(err);
    }

    if (state_) state_->drop_pending(request_id);
    append_job_log(job.value.id, fmt::format("submitted (request {})", request_id));
    emit(job.value.id, EventKind::JobSubmitted,
         fmt::format("submitted, status {}", job_status_name(job.value.status)));
    auto seen = observe(job.value);
    if (seen.is_err()) return Result<Job>::Err(seen.error);
    return job;
}

Result<Job> JobController::confirm_submission(const std::string& request_id, bool resubmit,
                                              CancelToken cancel) {
    JobFilter filter;
    filter.client_request_id = request_id;
    auto found = list(filter, cancel);
    if (found.is_err()) return Result<Job>::Err(found.error);

    if (!found.value.empty()) {
        const Job& job = found.value.front();
        if (state_) state_->drop_pending(request_id);
        append_job_log(job.id, fmt::format("confirmed submission (request {})", request_id));
        auto seen = observe(job);
        if (seen.is_err()) return Result<Job>::Err(seen.error);
        return Result<Job>::Ok(job);
    }

    if (!resubmit) {
        return Result<Job>::Err(Error::make(ErrorKind::Permanent,
            "no job was created for this request; resubmit to send it again", request_id));
    }

    std::optional<PendingSubmission> pending;
    if (state_) pending = state_->find_pending(request_id);
    if (!pending) {
        return Result<Job>::Err(Error::make(ErrorKind::Permanent,
            "no stored submission for this request id", request_id));
    }

    neuro_log(fmt::format("resubmitting request {}", request_id));
    return post_submission(request_id, pending->request_body, cancel);
}

// ── Status / wait ──────────────────────────────────────────

Result<Job> JobController::status(const std::string& job_id, CancelToken cancel) {
    auto r = call("GET", job_path(job_id), "", job_id, cancel);
    if (r.is_err()) return Result<Job>::Err(r.error);

    auto job = parse_job(r.value.body);
    if (job.is_err()) {
        job.error.subject = job_id;
        return job;
    }
    auto seen = observe(job.value);
    if (seen.is_err()) return Result<Job>::Err(seen.error);
    return job;
}

Result<Job> JobController::wait(const std::string& job_id, const WaitOptions& opts,
                                CancelToken cancel,
                                const std::function<void(const Job&)>& on_change) {
    Sleeper sleep = sleeper_factory_(cancel);
    auto start = std::chrono::steady_clock::now();
    milliseconds slept{0};
    milliseconds interval = opts.poll_interval;
    std::optional<JobStatus> last;

    while (true) {
        auto r = status(job_id, cancel);
        if (r.is_err()) return r;
        const Job& job = r.value;

        if (!last || *last != job.status) {
            if (on_change) on_change(job);
            if (last) interval = opts.poll_interval;
            last = job.status;
        } else {
            auto grown = milliseconds(static_cast<long long>(interval.count() * POLL_BACKOFF_FACTOR));
            interval = std::min(grown, opts.poll_interval_max);
        }

        if (is_terminal(job.status)) return r;

        // Real time in production; slept time when the sleeper is simulated
        auto real = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start);
        milliseconds elapsed = std::max(real, slept);
        milliseconds delay = interval;
        if (opts.timeout) {
            if (elapsed >= *opts.timeout) {
                return Result<Job>::Err(Error::make(ErrorKind::Timeout,
                    fmt::format("still {} after {}ms", job_status_name(job.status),
                                opts.timeout->count()), job_id));
            }
            delay = std::min(delay, *opts.timeout - elapsed);
        }

        if (!sleep(delay)) {
            return Result<Job>::Err(Error::make(ErrorKind::Cancelled, "wait cancelled", job_id));
        }
        slept += delay;
    }
}

std::vector<JobOutcome> JobController::wait_all(const std::vector<std::string>& job_ids,
                                                const WaitOptions& opts, CancelToken cancel) {
    std::vector<JobOutcome> outcomes;
    for (const auto& id : job_ids) {
        outcomes.push_back({id, Result<Job>::Err(Error::make(ErrorKind::Cancelled, "not waited", id))});
    }
    if (job_ids.empty()) return outcomes;

    {
        WorkerPool pool(std::min(job_ids.size(), limiter_.limit()));
        for (size_t i = 0; i < job_ids.size(); ++i) {
            pool.submit([this, &outcomes, &opts, cancel, i] {
                outcomes[i].result = wait(outcomes[i].job_id, opts, cancel);
            });
        }
        pool.wait_idle();
    }
    return outcomes;
}

// ── Cancel ─────────────────────────────────────────────────

Result<void> JobController::cancel(const std::string& job_id, CancelToken cancel) {
    auto before = status(job_id, cancel);
    if (before.is_err()) return Result<void>::Err(before.error);
    if (is_terminal(before.value.status)) {
        neuro_log(fmt::format("cancel {}: already {}", job_id, job_status_name(before.value.status)));
        return Result<void>::Ok();
    }

    emit(job_id, EventKind::JobCancelRequested, "cancel requested");
    append_job_log(job_id, "cancel requested");

    auto del = call("DELETE", job_path(job_id), "", job_id, cancel);
    if (del.is_ok()) {
        // Best-effort refresh so the history log sees the cancelled state
        auto after = status(job_id, cancel);
        if (after.is_err()) {
            neuro_log(fmt::format("cancel {}: accepted, status refresh failed: {}",
                                  job_id, after.error.message));
        }
        return Result<void>::Ok();
    }

    if (del.error.kind == ErrorKind::Permanent || del.error.kind == ErrorKind::Cancelled) {
        return Result<void>::Err(del.error);
    }

    // Retries exhausted: find out whether the cancel landed anyway
    auto after = status(job_id, cancel);
    if (after.is_err()) {
        Error err = Error::make(ErrorKind::AmbiguousState,
            "cancellation could not be confirmed", job_id);
        err.attempts = del.error.attempts;
        err.cause = del.error.message;
        return Result<void>::Err(err);
    }
    if (is_terminal(after.value.status)) return Result<void>::Ok();
    return Result<void>::Err(del.error);
}

std::vector<CancelOutcome> JobController::cancel_many(const std::vector<std::string>& job_ids,
                                                      CancelToken cancel) {
    std::vector<CancelOutcome> outcomes;
    for (const auto& id : job_ids) {
        outcomes.push_back({id, Result<void>::Err(Error::make(ErrorKind::Cancelled, "not attempted", id))});
    }
    if (job_ids.empty()) return outcomes;

    {
        WorkerPool pool(std::min(job_ids.size(), limiter_.limit()));
        for (size_t i = 0; i < job_ids.size(); ++i) {
            pool.submit([this, &outcomes, cancel, i] {
                outcomes[i].result = this->cancel(outcomes[i].job_id, cancel);
            });
        }
        pool.wait_idle();
    }
    return outcomes;
}

// ── List / logs ────────────────────────────────────────────

Result<std::vector<Job>> JobController::list(const JobFilter& filter, CancelToken cancel) {
    auto r = call("GET", "/jobs" + job_filter_query(filter), "", "jobs", cancel);
    if (r.is_err()) return Result<std::vector<Job>>::Err(r.error);
    auto jobs = parse_job_list(r.value.body);
    if (jobs.is_err() || filter.description.empty()) return jobs;

    auto& list = jobs.value;
    list.erase(std::remove_if(list.begin(), list.end(), [&filter](const Job& job) {
        return job.spec.description != filter.description;
    }), list.end());
    return jobs;
}

std::unique_ptr<LogStream> JobController::stream_logs(const std::string& job_id,
                                                      CancelToken cancel, uint64_t since) {
    auto fetch = [this, job_id, cancel]() -> Result<JobStatus> {
        auto r = status(job_id, cancel);
        if (r.is_err()) return Result<JobStatus>::Err(r.error);
        return Result<JobStatus>::Ok(r.value.status);
    };
    return std::make_unique<LogStream>(api_, policy_, job_id, fetch,
                                       default_wait_options().poll_interval,
                                       sleeper_factory_(cancel), cancel, reporter_, since);
}
