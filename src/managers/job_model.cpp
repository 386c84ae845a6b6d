#include "job_model.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

// ── Status ─────────────────────────────────────────────────

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

std::optional<JobStatus> parse_job_status(const std::string& s) {
    if (s == "pending" || s == "unknown") return JobStatus::Pending;
    if (s == "running")   return JobStatus::Running;
    if (s == "succeeded") return JobStatus::Succeeded;
    if (s == "failed")    return JobStatus::Failed;
    if (s == "cancelled" || s == "canceled") return JobStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status == JobStatus::Succeeded
        || status == JobStatus::Failed
        || status == JobStatus::Cancelled;
}

static int status_rank(JobStatus status) {
    switch (status) {
        case JobStatus::Pending: return 0;
        case JobStatus::Running: return 1;
        default:                 return 2;
    }
}

Result<void> check_transition(JobStatus from, JobStatus to) {
    if (from == to) return Result<void>::Ok();
    if (is_terminal(from) || status_rank(to) < status_rank(from)) {
        return Result<void>::Err(Error::make(ErrorKind::Consistency,
            fmt::format("illegal status transition {} -> {}",
                        job_status_name(from), job_status_name(to))));
    }
    return Result<void>::Ok();
}

Result<void> Job::advance(JobStatus next) {
    auto r = check_transition(status, next);
    if (r.is_err()) {
        r.error.subject = id;
        return r;
    }
    status = next;
    return Result<void>::Ok();
}

// ── Volumes ────────────────────────────────────────────────

Result<Volume> Volume::parse(const std::string& spec) {
    auto invalid = [&spec] {
        return Result<Volume>::Err(Error::make(ErrorKind::Permanent,
            fmt::format("Invalid volume specification '{}'", spec)));
    };

    const std::string scheme = "storage:";
    if (spec.compare(0, scheme.size(), scheme) != 0) return invalid();

    // Split what follows the scheme; the storage path itself has no ':'
    std::vector<std::string> parts;
    size_t start = scheme.size();
    while (true) {
        size_t colon = spec.find(':', start);
        parts.push_back(spec.substr(start, colon == std::string::npos ? std::string::npos
                                                                       : colon - start));
        if (colon == std::string::npos) break;
        start = colon + 1;
    }
    if (parts.size() < 2 || parts.size() > 3) return invalid();
    if (parts[0].empty() || parts[1].empty() || parts[1][0] != '/') return invalid();

    Volume v;
    v.storage_uri = scheme + parts[0];
    v.container_path = parts[1];
    if (parts.size() == 3) {
        if (parts[2] == "ro") v.read_only = true;
        else if (parts[2] == "rw") v.read_only = false;
        else return invalid();
    }
    return Result<Volume>::Ok(v);
}

// ── Validation ─────────────────────────────────────────────

static bool valid_env_name(const std::string& key) {
    if (key.empty()) return false;
    if (std::isdigit(static_cast<unsigned char>(key[0]))) return false;
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

Result<void> validate_job_spec(const JobSpec& spec) {
    std::string image = spec.image;
    trim(image);
    if (image.empty()) {
        return Result<void>::Err("Job image must not be empty");
    }
    std::string command = spec.command;
    trim(command);
    if (command.empty()) {
        return Result<void>::Err("Job command must not be empty");
    }

    auto res = validate_resources(spec.resources);
    if (res.is_err()) return res;

    for (const auto& [key, value] : spec.env) {
        if (!valid_env_name(key)) {
            return Result<void>::Err(fmt::format("Invalid environment variable name '{}'", key));
        }
    }
    for (const auto& v : spec.volumes) {
        if (v.container_path.empty() || v.container_path[0] != '/') {
            return Result<void>::Err(fmt::format(
                "Volume mount path must be absolute: '{}'", v.container_path));
        }
    }
    for (int port : {spec.network.http_port, spec.network.ssh_port}) {
        if (port < 0 || port > 65535) {
            return Result<void>::Err(fmt::format("Invalid port {}", port));
        }
    }
    return Result<void>::Ok();
}

// ── Environment / filters ──────────────────────────────────

Result<std::map<std::string, std::string>> parse_env_entries(const std::vector<std::string>& entries) {
    std::map<std::string, std::string> env;
    for (const auto& raw : entries) {
        std::string entry = raw;
        trim(entry);
        if (entry.empty() || entry[0] == '#') continue;

        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        trim(key);
        if (!valid_env_name(key)) {
            return Result<std::map<std::string, std::string>>::Err(
                fmt::format("Invalid environment entry '{}'", raw));
        }
        if (eq == std::string::npos) {
            const char* inherited = std::getenv(key.c_str());
            env[key] = inherited ? inherited : "";
        } else {
            env[key] = entry.substr(eq + 1);
        }
    }
    return Result<std::map<std::string, std::string>>::Ok(env);
}

Result<std::vector<std::string>> read_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<std::string>>::Err(
            Error::make(ErrorKind::Permanent, "cannot read env file", path));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return Result<std::vector<std::string>>::Ok(lines);
}

Result<std::vector<JobStatus>> parse_status_filter(const std::vector<std::string>& names) {
    if (names.empty()) {
        return Result<std::vector<JobStatus>>::Ok({JobStatus::Pending, JobStatus::Running});
    }
    std::vector<JobStatus> statuses;
    for (const auto& name : names) {
        if (name == "all") return Result<std::vector<JobStatus>>::Ok({});
        auto status = parse_job_status(name);
        if (!status || name == "unknown") {
            return Result<std::vector<JobStatus>>::Err(fmt::format("Unknown status '{}'", name));
        }
        if (std::find(statuses.begin(), statuses.end(), *status) == statuses.end()) {
            statuses.push_back(*status);
        }
    }
    return Result<std::vector<JobStatus>>::Ok(statuses);
}

// ── JSON ───────────────────────────────────────────────────

std::string job_request_body(const JobSpec& spec, const std::string& client_request_id) {
    json resources = {
        {"cpu", spec.resources.cpu},
        {"memory_mb", spec.resources.memory_mb},
        {"shm", spec.resources.shm},
    };
    if (spec.resources.gpu > 0) {
        resources["gpu"] = spec.resources.gpu;
        if (!spec.resources.gpu_model.empty()) resources["gpu_model"] = spec.resources.gpu_model;
    }

    json volumes = json::array();
    for (const auto& v : spec.volumes) {
        volumes.push_back({
            {"src_storage_uri", v.storage_uri},
            {"dst_path", v.container_path},
            {"read_only", v.read_only},
        });
    }

    json container = {
        {"image", spec.image},
        {"command", spec.command},
        {"resources", resources},
        {"env", spec.env},
        {"volumes", volumes},
    };
    if (spec.network.http_port > 0) container["http"] = {{"port", spec.network.http_port}};
    if (spec.network.ssh_port > 0) container["ssh"] = {{"port", spec.network.ssh_port}};

    json body = {
        {"container", container},
        {"is_preemptible", spec.is_preemptible},
        {"client_request_id", client_request_id},
    };
    if (!spec.name.empty()) body["name"] = spec.name;
    if (!spec.description.empty()) body["description"] = spec.description;
    return body.dump();
}

static std::string str_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Some deployments send numeric resource fields as strings ("4096").
static double num_field(const json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end()) return fallback;
    if (it->is_number()) return it->get<double>();
    if (it->is_string()) {
        try {
            return std::stod(it->get<std::string>());
        } catch (const std::exception&) {
            return fallback;
        }
    }
    return fallback;
}

static Job job_from_json(const json& j) {
    Job job;
    job.id = str_field(j, "id");
    job.owner = str_field(j, "owner");
    job.spec.name = str_field(j, "name");
    job.spec.description = str_field(j, "description");
    job.spec.is_preemptible = j.value("is_preemptible", false);
    job.http_url = str_field(j, "http_url");
    job.ssh_server = str_field(j, "ssh_server");

    std::string status = str_field(j, "status");
    const json history = j.contains("history") && j["history"].is_object() ? j["history"] : json::object();
    if (status.empty()) status = str_field(history, "status");
    job.status = parse_job_status(status).value_or(JobStatus::Pending);

    job.reason = str_field(history, "reason");
    job.status_description = str_field(history, "description");
    job.created_at = str_field(history, "created_at");
    job.started_at = str_field(history, "started_at");
    job.finished_at = str_field(history, "finished_at");
    if (history.contains("exit_code") && history["exit_code"].is_number_integer()) {
        job.exit_code = history["exit_code"].get<int>();
    }

    if (j.contains("container") && j["container"].is_object()) {
        const json& c = j["container"];
        job.spec.image = str_field(c, "image");
        job.spec.command = str_field(c, "command");
        if (c.contains("resources") && c["resources"].is_object()) {
            const json& r = c["resources"];
            job.spec.resources.cpu = num_field(r, "cpu", job.spec.resources.cpu);
            job.spec.resources.memory_mb = static_cast<int>(
                num_field(r, "memory_mb", job.spec.resources.memory_mb));
            job.spec.resources.gpu = static_cast<int>(num_field(r, "gpu", 0));
            job.spec.resources.gpu_model = str_field(r, "gpu_model");
            job.spec.resources.shm = r.value("shm", false);
        }
        if (c.contains("env") && c["env"].is_object()) {
            for (auto it = c["env"].begin(); it != c["env"].end(); ++it) {
                if (it.value().is_string()) job.spec.env[it.key()] = it.value().get<std::string>();
            }
        }
        if (c.contains("http") && c["http"].is_object()) {
            job.spec.network.http_port = static_cast<int>(num_field(c["http"], "port", 0));
        }
        if (c.contains("ssh") && c["ssh"].is_object()) {
            job.spec.network.ssh_port = static_cast<int>(num_field(c["ssh"], "port", 0));
        }
        if (c.contains("volumes") && c["volumes"].is_array()) {
            for (const auto& vj : c["volumes"]) {
                Volume v;
                v.storage_uri = str_field(vj, "src_storage_uri");
                v.container_path = str_field(vj, "dst_path");
                v.read_only = vj.value("read_only", false);
                job.spec.volumes.push_back(v);
            }
        }
    }
    return job;
}

Result<Job> parse_job(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.is_object()) return Result<Job>::Err("Malformed job description: not an object");
        Job job = job_from_json(j);
        if (job.id.empty()) return Result<Job>::Err("Malformed job description: missing id");
        return Result<Job>::Ok(job);
    } catch (const json::exception& e) {
        return Result<Job>::Err(fmt::format("Malformed job description: {}", e.what()));
    }
}

Result<std::vector<Job>> parse_job_list(const std::string& body) {
    try {
        json j = json::parse(body);
        if (!j.contains("jobs") || !j["jobs"].is_array()) {
            return Result<std::vector<Job>>::Err("Malformed job list: missing 'jobs'");
        }
        std::vector<Job> jobs;
        for (const auto& item : j["jobs"]) {
            if (!item.is_object()) continue;
            jobs.push_back(job_from_json(item));
        }
        return Result<std::vector<Job>>::Ok(jobs);
    } catch (const json::exception& e) {
        return Result<std::vector<Job>>::Err(fmt::format("Malformed job list: {}", e.what()));
    }
}
