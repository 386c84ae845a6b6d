#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

struct JobState {
    std::string job_id;
    std::string job_name;
    std::string status;             // last observed status name
    std::string submit_time;        // ISO timestamp when job was submitted
    std::string start_time;
    std::string end_time;
    int exit_code = -1;
};

// Submission whose outcome is unknown (sent, no confirmed answer).
// The job spec body is kept verbatim so a confirmed-missing job can be resent.
struct PendingSubmission {
    std::string request_id;
    std::string request_body;
    std::string submit_time;
    std::string last_error;
};

struct ClientState {
    std::vector<JobState> jobs;
    std::vector<PendingSubmission> pending;
};

// ~/.neuro/state.yaml. Load/modify/save cycles are serialized so concurrent
// waiters and submitters do not lose each other's updates.
class StateStore {
public:
    explicit StateStore(const fs::path& state_path);

    ClientState load() const;
    void save(const ClientState& state);

    // Insert or update by job id.
    void record_job(const JobState& job);
    void record_pending(const PendingSubmission& pending);
    void drop_pending(const std::string& request_id);
    std::optional<PendingSubmission> find_pending(const std::string& request_id) const;

    const fs::path& path() const { return state_path_; }

    static fs::path default_path();

private:
    fs::path state_path_;
    mutable std::mutex mutex_;

    ClientState load_unlocked() const;
    void save_unlocked(const ClientState& state);
};
