#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <core/channel.hpp>
#include "event_reporter.hpp"
#include "retry_policy.hpp"
#include "storage_client.hpp"
#include "worker_pool.hpp"

namespace fs = std::filesystem;

enum class Direction { Upload, Download };

const char* direction_name(Direction d);

enum class TransferState { Planned, InProgress, Verified, Failed };

struct TransferItem {
    fs::path local_path;
    std::string remote_key;      // storage path relative to the service root
    std::string rel_path;        // path below the plan roots, '/'-separated
    int64_t size = 0;
    std::string sha256;          // hash of the source at planning time
    Direction direction = Direction::Upload;
};

struct RejectedEntry {
    std::string path;
    Error error;
};

struct TransferPlan {
    fs::path local_root;
    std::string remote_root;
    Direction direction = Direction::Upload;
    std::vector<TransferItem> items;
    std::vector<std::string> skipped;       // identical at the destination
    std::vector<RejectedEntry> rejected;    // symlinks, special files, unsafe paths

    int64_t total_bytes() const;
};

struct TransferResult {
    TransferItem item;
    TransferState state = TransferState::Planned;
    std::optional<Error> error;
    int attempts = 0;
    int integrity_retries = 0;
};

struct SyncReport {
    std::vector<TransferResult> verified;
    std::vector<TransferResult> failed;
    std::vector<RejectedEntry> rejected;
    size_t skipped = 0;

    bool ok() const { return failed.empty() && rejected.empty(); }
};

class SyncEngine;

// One execution of a plan. Results arrive in completion order; next()
// returns nullopt once every item has reported. Destroying the run cancels
// whatever is still queued and waits for in-flight transfers.
class TransferRun {
public:
    TransferRun(SyncEngine& engine, const TransferPlan& plan, size_t concurrency,
                CancelToken cancel);
    ~TransferRun();

    TransferRun(const TransferRun&) = delete;
    TransferRun& operator=(const TransferRun&) = delete;

    std::optional<TransferResult> next();
    void cancel();

    size_t total() const { return total_; }
    const std::string& source() const { return source_; }

private:
    SyncEngine& engine_;
    CancelToken cancel_;
    CancelRegistration link_;
    BoundedChannel<TransferResult> results_;
    std::atomic<size_t> remaining_;
    size_t total_;
    std::string source_;
    std::unique_ptr<WorkerPool> pool_;

    void finish_one(TransferResult result);
};

// Plans and executes directory transfers against the storage service.
//
// Planning never follows symbolic links: each one (and every special file)
// is rejected with UnsupportedEntry and the rest of the tree proceeds.
// Execution retries each item independently under the shared RetryPolicy;
// an item is verified only when the destination hash equals the hash of the
// bytes sent. One hash mismatch triggers one re-transfer; a second is an
// Integrity error.
class SyncEngine {
public:
    using SleeperFactory = std::function<Sleeper(CancelToken)>;

    SyncEngine(ApiTransport& storage_api, const RetryPolicy& policy,
               ConcurrencyLimiter& limiter, EventReporter* reporter = nullptr);

    void set_sleeper_factory(SleeperFactory factory) { sleeper_factory_ = std::move(factory); }

    Result<TransferPlan> plan(const fs::path& local_root, const std::string& remote_root,
                              Direction direction, CancelToken cancel = {});

    std::unique_ptr<TransferRun> start(const TransferPlan& plan, size_t concurrency,
                                       CancelToken cancel = {});

    // start() and drain into a report.
    SyncReport execute(const TransferPlan& plan, size_t concurrency, CancelToken cancel = {});

private:
    friend class TransferRun;

    StorageClient storage_;
    const RetryPolicy& policy_;
    ConcurrencyLimiter& limiter_;
    EventReporter* reporter_;
    SleeperFactory sleeper_factory_;
    std::atomic<uint64_t> run_counter_{0};

    Result<std::vector<RemoteEntry>> list_remote(const std::string& root, bool missing_ok,
                                                 CancelToken cancel);
    Result<TransferPlan> plan_upload(TransferPlan plan, CancelToken cancel);
    Result<TransferPlan> plan_download(TransferPlan plan, CancelToken cancel);

    TransferResult transfer(const TransferItem& item, const std::string& source,
                            CancelToken cancel);
    // Each returns the hash of the bytes that reached the destination.
    Result<std::string> upload_once(const TransferItem& item, const std::string& content,
                                    CancelToken cancel);
    Result<std::string> download_once(const TransferItem& item, const fs::path& part,
                                      CancelToken cancel);

    void emit(const std::string& source, EventKind kind, const std::string& subject,
              const std::string& message);
};
