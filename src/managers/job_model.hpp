#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/resource_spec.hpp>

enum class JobStatus { Pending, Running, Succeeded, Failed, Cancelled };

const char* job_status_name(JobStatus status);

// Accepts the server's lowercase names; "unknown" maps to Pending.
std::optional<JobStatus> parse_job_status(const std::string& s);

bool is_terminal(JobStatus status);

// pending -> running -> {succeeded, failed}; cancelled from pending/running.
// Forward skips (pending -> succeeded) are legal, staying put is legal,
// anything out of a terminal state or backwards is a ConsistencyError.
Result<void> check_transition(JobStatus from, JobStatus to);

// Storage volume mounted into the job container:
// "storage://path:/container/path[:ro|:rw]" (default rw)
struct Volume {
    std::string storage_uri;
    std::string container_path;
    bool read_only = false;

    static Result<Volume> parse(const std::string& spec);
};

// Container ports exposed through the platform (submit --http / --ssh).
// 0 leaves the port closed.
struct PortForwarding {
    int http_port = 0;
    int ssh_port = 0;
};

struct JobSpec {
    std::string image;
    std::string command;
    JobResources resources;
    std::map<std::string, std::string> env;
    std::vector<Volume> volumes;
    PortForwarding network;
    bool is_preemptible = false;
    std::string name;
    std::string description;
};

// Local checks before submission: image and command present, resource
// bounds, environment variable names, volume paths, port numbers.
Result<void> validate_job_spec(const JobSpec& spec);

// "KEY=VALUE" entries, later ones winning. A bare "KEY" takes its value from
// the local environment (empty when unset). Blank entries and lines starting
// with '#' are skipped.
Result<std::map<std::string, std::string>> parse_env_entries(const std::vector<std::string>& entries);

// Lines of an env file, in the format parse_env_entries() takes.
Result<std::vector<std::string>> read_env_file(const std::string& path);

// Status names given to `job list`: none means pending + running, "all"
// anywhere means no status filter.
Result<std::vector<JobStatus>> parse_status_filter(const std::vector<std::string>& names);

struct Job {
    std::string id;
    JobSpec spec;
    JobStatus status = JobStatus::Pending;
    std::string owner;
    std::string reason;              // history.reason ("OOMKilled", "Error", ...)
    std::string status_description;  // history.description
    std::string created_at;
    std::string started_at;
    std::string finished_at;
    std::optional<int> exit_code;
    std::string http_url;            // set when an HTTP port is forwarded
    std::string ssh_server;

    // Apply an observed status, enforcing the state machine.
    Result<void> advance(JobStatus next);
};

// ── Wire format (JSON) ─────────────────────────────────────

std::string job_request_body(const JobSpec& spec, const std::string& client_request_id);
Result<Job> parse_job(const std::string& body);
Result<std::vector<Job>> parse_job_list(const std::string& body);
