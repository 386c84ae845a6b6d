#include "storage_sync.hpp"
#include <core/constants.hpp>
#include <core/hash.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

const char* direction_name(Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

int64_t TransferPlan::total_bytes() const {
    int64_t total = 0;
    for (const auto& item : items) total += item.size;
    return total;
}

// ── TransferRun ────────────────────────────────────────────

TransferRun::TransferRun(SyncEngine& engine, const TransferPlan& plan, size_t concurrency,
                         CancelToken cancel)
    : engine_(engine),
      link_(cancel, [this] { cancel_.cancel(); }),
      results_(STREAM_CHANNEL_CAPACITY),
      remaining_(plan.items.size()),
      total_(plan.items.size()),
      source_(fmt::format("sync:{}", ++engine.run_counter_)) {
    if (total_ == 0) {
        results_.close();
        return;
    }

    size_t workers = std::min<size_t>(std::max<size_t>(concurrency, 1), total_);
    pool_ = std::make_unique<WorkerPool>(workers);
    for (const auto& item : plan.items) {
        pool_->submit([this, item] {
            finish_one(engine_.transfer(item, source_, cancel_));
        });
    }
}

TransferRun::~TransferRun() {
    cancel_.cancel();
    results_.close();
    pool_.reset();
}

void TransferRun::finish_one(TransferResult result) {
    // Closed only when the run is being torn down
    results_.push(std::move(result));
    if (remaining_.fetch_sub(1) == 1) results_.close();
}

std::optional<TransferResult> TransferRun::next() {
    return results_.pop();
}

void TransferRun::cancel() {
    cancel_.cancel();
}

// ── SyncEngine ─────────────────────────────────────────────

SyncEngine::SyncEngine(ApiTransport& storage_api, const RetryPolicy& policy,
                       ConcurrencyLimiter& limiter, EventReporter* reporter)
    : storage_(storage_api),
      policy_(policy),
      limiter_(limiter),
      reporter_(reporter),
      sleeper_factory_(cancellable_sleeper) {}

void SyncEngine::emit(const std::string& source, EventKind kind, const std::string& subject,
                      const std::string& message) {
    if (reporter_) reporter_->emit(source, kind, subject, message);
}

Result<std::vector<RemoteEntry>> SyncEngine::list_remote(const std::string& root, bool missing_ok,
                                                         CancelToken cancel) {
    using R = Result<std::vector<RemoteEntry>>;
    auto r = retry_call(policy_, root, [&](int) {
        auto permit = limiter_.acquire(cancel);
        if (!permit) {
            return R::Err(Error::make(ErrorKind::Cancelled, "cancelled", root));
        }
        return storage_.list_recursive(root, cancel);
    }, sleeper_factory_(cancel));

    if (r.is_err() && r.error.http_status == 404) {
        if (missing_ok) return R::Ok({});
        r.error.message = "remote path not found";
    }
    return r;
}

static bool unsafe_rel_path(const std::string& rel) {
    if (rel.empty() || rel[0] == '/') return true;
    for (const auto& part : fs::path(rel)) {
        if (part == "..") return true;
    }
    return false;
}

Result<TransferPlan> SyncEngine::plan(const fs::path& local_root, const std::string& remote_root,
                                      Direction direction, CancelToken cancel) {
    TransferPlan p;
    p.local_root = local_root;
    p.remote_root = normalize_storage_path(remote_root);
    p.direction = direction;

    auto r = direction == Direction::Upload ? plan_upload(std::move(p), cancel)
                                            : plan_download(std::move(p), cancel);
    if (r.is_ok()) {
        const auto& plan = r.value;
        neuro_log(fmt::format("plan {} {} <-> {}: {} items ({}), {} skipped, {} rejected",
                              direction_name(direction), local_root.string(), remote_root,
                              plan.items.size(), format_bytes(plan.total_bytes()),
                              plan.skipped.size(), plan.rejected.size()));
        emit("plan", EventKind::TransferPlanned, remote_root,
             fmt::format("{} to transfer, {} up to date, {} rejected",
                         plan.items.size(), plan.skipped.size(), plan.rejected.size()));
    }
    return r;
}

Result<TransferPlan> SyncEngine::plan_upload(TransferPlan plan, CancelToken cancel) {
    using R = Result<TransferPlan>;
    std::error_code ec;
    const fs::path& root = plan.local_root;

    auto root_status = fs::symlink_status(root, ec);
    if (ec || !fs::exists(root_status)) {
        return R::Err(Error::make(ErrorKind::Permanent, "local path not found", root.string()));
    }
    if (fs::is_symlink(root_status)) {
        plan.rejected.push_back({root.string(), Error::make(ErrorKind::UnsupportedEntry,
            "symbolic links are not followed", root.string())});
        return R::Ok(std::move(plan));
    }

    // (absolute path, path relative to the plan roots)
    std::vector<std::pair<fs::path, std::string>> files;
    if (fs::is_regular_file(root_status)) {
        files.emplace_back(root, root.filename().generic_string());
    } else if (fs::is_directory(root_status)) {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            return R::Err(Error::make(ErrorKind::Permanent,
                fmt::format("cannot read directory: {}", ec.message()), root.string()));
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            auto st = it->symlink_status(ec);
            if (ec) break;
            std::string rel = fs::relative(it->path(), root, ec).generic_string();
            if (fs::is_symlink(st)) {
                plan.rejected.push_back({rel, Error::make(ErrorKind::UnsupportedEntry,
                    "symbolic links are not followed", rel)});
            } else if (fs::is_directory(st)) {
                continue;
            } else if (fs::is_regular_file(st)) {
                files.emplace_back(it->path(), rel);
            } else {
                plan.rejected.push_back({rel, Error::make(ErrorKind::UnsupportedEntry,
                    "special files are not transferred", rel)});
            }
        }
        if (ec) {
            return R::Err(Error::make(ErrorKind::Permanent,
                fmt::format("directory walk failed: {}", ec.message()), root.string()));
        }
    } else {
        plan.rejected.push_back({root.string(), Error::make(ErrorKind::UnsupportedEntry,
            "special files are not transferred", root.string())});
        return R::Ok(std::move(plan));
    }

    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });

    auto remote = list_remote(plan.remote_root, true, cancel);
    if (remote.is_err()) return R::Err(remote.error);
    std::map<std::string, RemoteEntry> by_path;
    for (auto& e : remote.value) by_path[e.path] = e;

    for (const auto& [abs, rel] : files) {
        if (cancel.is_cancelled()) {
            return R::Err(Error::make(ErrorKind::Cancelled, "planning cancelled", root.string()));
        }
        auto hash = sha256_file(abs);
        if (hash.is_err()) {
            plan.rejected.push_back({rel, hash.error});
            continue;
        }

        TransferItem item;
        item.local_path = abs;
        item.rel_path = rel;
        item.remote_key = join_remote(plan.remote_root, rel);
        item.size = static_cast<int64_t>(fs::file_size(abs, ec));
        item.sha256 = hash.value;
        item.direction = Direction::Upload;

        auto it = by_path.find(rel);
        if (it != by_path.end() && it->second.type == RemoteEntryType::File
            && it->second.size == item.size && it->second.sha256 == item.sha256) {
            plan.skipped.push_back(rel);
            continue;
        }
        plan.items.push_back(item);
    }
    return R::Ok(std::move(plan));
}

Result<TransferPlan> SyncEngine::plan_download(TransferPlan plan, CancelToken cancel) {
    using R = Result<TransferPlan>;
    std::error_code ec;
    const fs::path& root = plan.local_root;

    auto root_status = fs::symlink_status(root, ec);
    if (fs::exists(root_status) && !fs::is_directory(root_status)) {
        return R::Err(Error::make(ErrorKind::Permanent,
            "local destination is not a directory", root.string()));
    }

    auto remote = list_remote(plan.remote_root, false, cancel);
    if (remote.is_err()) return R::Err(remote.error);

    auto entries = remote.value;
    std::sort(entries.begin(), entries.end(),
              [](const RemoteEntry& a, const RemoteEntry& b) { return a.path < b.path; });

    for (const auto& e : entries) {
        if (cancel.is_cancelled()) {
            return R::Err(Error::make(ErrorKind::Cancelled, "planning cancelled", plan.remote_root));
        }
        if (e.type == RemoteEntryType::Directory) continue;
        if (e.type == RemoteEntryType::Other) {
            plan.rejected.push_back({e.path, Error::make(ErrorKind::UnsupportedEntry,
                fmt::format("unsupported remote entry type {}", e.type_name), e.path)});
            continue;
        }
        if (unsafe_rel_path(e.path)) {
            plan.rejected.push_back({e.path, Error::make(ErrorKind::UnsupportedEntry,
                "path escapes the destination directory", e.path)});
            continue;
        }

        TransferItem item;
        item.local_path = root / fs::path(e.path);
        item.rel_path = e.path;
        item.remote_key = join_remote(plan.remote_root, e.path);
        item.size = e.size;
        item.sha256 = e.sha256;
        item.direction = Direction::Download;

        auto st = fs::symlink_status(item.local_path, ec);
        if (fs::is_symlink(st)) {
            plan.rejected.push_back({e.path, Error::make(ErrorKind::UnsupportedEntry,
                "local destination is a symbolic link", e.path)});
            continue;
        }
        if (fs::exists(st) && !fs::is_regular_file(st)) {
            plan.rejected.push_back({e.path, Error::make(ErrorKind::UnsupportedEntry,
                "local destination is not a regular file", e.path)});
            continue;
        }
        if (fs::is_regular_file(st) && !e.sha256.empty()
            && static_cast<int64_t>(fs::file_size(item.local_path, ec)) == e.size) {
            auto local_hash = sha256_file(item.local_path);
            if (local_hash.is_ok() && local_hash.value == e.sha256) {
                plan.skipped.push_back(e.path);
                continue;
            }
        }
        plan.items.push_back(item);
    }
    return R::Ok(std::move(plan));
}

std::unique_ptr<TransferRun> SyncEngine::start(const TransferPlan& plan, size_t concurrency,
                                               CancelToken cancel) {
    return std::make_unique<TransferRun>(*this, plan, concurrency, cancel);
}

SyncReport SyncEngine::execute(const TransferPlan& plan, size_t concurrency, CancelToken cancel) {
    SyncReport report;
    report.rejected = plan.rejected;
    report.skipped = plan.skipped.size();

    auto start_time = std::chrono::steady_clock::now();
    auto run = start(plan, concurrency, cancel);
    while (auto result = run->next()) {
        if (result->state == TransferState::Verified) report.verified.push_back(std::move(*result));
        else report.failed.push_back(std::move(*result));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    std::string summary = fmt::format("{} verified, {} failed, {} rejected, {} skipped in {}",
                                      report.verified.size(), report.failed.size(),
                                      report.rejected.size(), report.skipped,
                                      format_elapsed(elapsed));
    neuro_log(fmt::format("{} {}: {}", run->source(), direction_name(plan.direction), summary));
    emit(run->source(), EventKind::SyncFinished, plan.remote_root, summary);
    return report;
}

// ── Per-item transfer ──────────────────────────────────────

static Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(Error::make(ErrorKind::Permanent,
            "cannot open file for reading", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Err(Error::make(ErrorKind::Permanent,
            "read failed", path.string()));
    }
    return Result<std::string>::Ok(ss.str());
}

Result<std::string> SyncEngine::upload_once(const TransferItem& item, const std::string& content,
                                            CancelToken cancel) {
    auto put = storage_.put(item.remote_key, content, cancel);
    if (put.is_err()) return Result<std::string>::Err(put.error);

    auto st = storage_.stat(item.remote_key, cancel);
    if (st.is_err()) return Result<std::string>::Err(st.error);
    return Result<std::string>::Ok(st.value.sha256);
}

Result<std::string> SyncEngine::download_once(const TransferItem& item, const fs::path& part,
                                              CancelToken cancel) {
    auto fail = [&part](Error err) {
        std::error_code ec;
        fs::remove(part, ec);
        return Result<std::string>::Err(std::move(err));
    };

    auto opened = storage_.open(item.remote_key, cancel);
    if (opened.is_err()) return Result<std::string>::Err(opened.error);
    std::unique_ptr<ByteStream> stream = std::move(opened.value);

    std::error_code ec;
    fs::create_directories(part.parent_path(), ec);
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out) {
        stream->close();
        return fail(Error::make(ErrorKind::Permanent, "cannot create file", part.string()));
    }

    std::string chunk;
    while (true) {
        auto r = stream->read(chunk);
        if (r.is_err()) {
            out.close();
            return fail(r.error);
        }
        if (!r.value) break;
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            stream->close();
            out.close();
            return fail(Error::make(ErrorKind::Permanent, "write failed", part.string()));
        }
    }
    out.close();
    if (!out) return fail(Error::make(ErrorKind::Permanent, "write failed", part.string()));

    // Hash what actually landed on disk, not what went through the socket
    auto written = sha256_file(part);
    if (written.is_err()) return fail(written.error);
    return written;
}

TransferResult SyncEngine::transfer(const TransferItem& item, const std::string& source,
                                    CancelToken cancel) {
    TransferResult res;
    res.item = item;
    const std::string& key = item.rel_path;

    auto finish_failed = [&](Error err) {
        if (err.subject.empty()) err.subject = key;
        res.state = TransferState::Failed;
        res.error = err;
        neuro_log(fmt::format("{} {}: {}", source, key, err.describe()));
        emit(source, EventKind::TransferFailed, key, err.describe());
        return res;
    };

    if (cancel.is_cancelled()) {
        return finish_failed(Error::make(ErrorKind::Cancelled, "cancelled before start", key));
    }

    res.state = TransferState::InProgress;
    emit(source, EventKind::TransferStarted, key,
         fmt::format("{} {}", direction_name(item.direction), format_bytes(item.size)));

    Sleeper sleep = sleeper_factory_(cancel);
    RetryState retry;
    auto on_retry = [&](const RetryState& st) {
        emit(source, EventKind::TransferRetry, key,
             fmt::format("attempt {} failed ({}), retrying in {}ms", st.attempts,
                         st.last_error ? st.last_error->message : "", st.next_delay.count()));
    };

    // Upload content is read once; every attempt sends the same bytes. The
    // destination is checked against the plan-time hash, so a file edited
    // after planning cannot verify.
    std::string content;
    if (item.direction == Direction::Upload) {
        auto data = read_file(item.local_path);
        if (data.is_err()) return finish_failed(data.error);
        content = std::move(data.value);
        if (sha256_hex(content) != item.sha256) {
            neuro_log(fmt::format("{} {}: local file changed since planning", source, key));
        }
    }
    fs::path part = item.local_path;
    part += PARTIAL_SUFFIX;

    bool sent = false;
    for (int pass = 0; pass < 2; ++pass) {
        Result<std::string> r = retry_call(policy_, key, [&](int) {
            auto permit = limiter_.acquire(cancel);
            if (!permit) {
                return Result<std::string>::Err(Error::make(ErrorKind::Cancelled, "cancelled", key));
            }
            if (item.direction == Direction::Upload) {
                sent = true;
                return upload_once(item, content, cancel);
            }
            return download_once(item, part, cancel);
        }, sleep, &retry, on_retry);
        res.attempts = retry.attempts;

        if (r.is_err()) {
            Error err = r.error;
            if (err.kind == ErrorKind::Cancelled && item.direction == Direction::Upload && sent) {
                Error amb = Error::make(ErrorKind::AmbiguousState,
                    "upload interrupted; remote content unknown", key);
                amb.attempts = err.attempts;
                amb.cause = err.message;
                err = amb;
            }
            if (item.direction == Direction::Download) {
                std::error_code ec;
                fs::remove(part, ec);
            }
            return finish_failed(err);
        }

        std::string expected = item.sha256;
        if (item.direction == Direction::Download && expected.empty()) {
            auto st = storage_.stat(item.remote_key, cancel);
            if (st.is_ok()) expected = st.value.sha256;
        }

        if (!expected.empty() && r.value == expected) {
            if (item.direction == Direction::Download) {
                std::error_code ec;
                fs::rename(part, item.local_path, ec);
                if (ec) {
                    fs::remove(part, ec);
                    return finish_failed(Error::make(ErrorKind::Permanent,
                        fmt::format("cannot move file into place: {}", ec.message()), key));
                }
            }
            res.state = TransferState::Verified;
            emit(source, EventKind::TransferVerified, key,
                 fmt::format("verified {}", format_bytes(item.size)));
            return res;
        }

        if (item.direction == Direction::Download) {
            std::error_code ec;
            fs::remove(part, ec);
        }
        if (expected.empty()) {
            return finish_failed(Error::make(ErrorKind::Integrity,
                "remote did not report a content hash", key));
        }
        neuro_log(fmt::format("{} {}: hash mismatch (expected {}, got {})",
                              source, key, expected, r.value));
        if (pass == 0) {
            res.integrity_retries++;
            emit(source, EventKind::TransferRetry, key, "hash mismatch, transferring again");
        }
    }

    Error err = Error::make(ErrorKind::Integrity, "content hash mismatch after re-transfer", key);
    err.attempts = res.attempts;
    return finish_failed(err);
}
