#include "state_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

StateStore::StateStore(const fs::path& state_path) : state_path_(state_path) {}

fs::path StateStore::default_path() {
    return platform::home_dir() / ".neuro" / "state.yaml";
}

ClientState StateStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked();
}

void StateStore::save(const ClientState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    save_unlocked(state);
}

ClientState StateStore::load_unlocked() const {
    ClientState state;

    if (!fs::exists(state_path_)) {
        return state;
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());

        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& n : root["jobs"]) {
                JobState j;
                j.job_id = n["job_id"].as<std::string>("");
                j.job_name = n["job_name"].as<std::string>("");
                j.status = n["status"].as<std::string>("");
                j.submit_time = n["submit_time"].as<std::string>("");
                j.start_time = n["start_time"].as<std::string>("");
                j.end_time = n["end_time"].as<std::string>("");
                j.exit_code = n["exit_code"].as<int>(-1);
                if (!j.job_id.empty()) state.jobs.push_back(j);
            }
        }

        if (root["pending"] && root["pending"].IsSequence()) {
            for (const auto& n : root["pending"]) {
                PendingSubmission p;
                p.request_id = n["request_id"].as<std::string>("");
                p.request_body = n["request_body"].as<std::string>("");
                p.submit_time = n["submit_time"].as<std::string>("");
                p.last_error = n["last_error"].as<std::string>("");
                if (!p.request_id.empty()) state.pending.push_back(p);
            }
        }
    } catch (const std::exception& e) {
        // Corrupted state file: start fresh
        neuro_log(fmt::format("state file {} unreadable ({}), ignoring",
                              state_path_.string(), e.what()));
        return ClientState{};
    }

    return state;
}

void StateStore::save_unlocked(const ClientState& state) {
    std::error_code ec;
    fs::create_directories(state_path_.parent_path(), ec);

    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : state.jobs) {
        out << YAML::BeginMap;
        out << YAML::Key << "job_id" << YAML::Value << j.job_id;
        out << YAML::Key << "job_name" << YAML::Value << j.job_name;
        out << YAML::Key << "status" << YAML::Value << j.status;
        out << YAML::Key << "submit_time" << YAML::Value << j.submit_time;
        out << YAML::Key << "start_time" << YAML::Value << j.start_time;
        out << YAML::Key << "end_time" << YAML::Value << j.end_time;
        out << YAML::Key << "exit_code" << YAML::Value << j.exit_code;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "pending" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : state.pending) {
        out << YAML::BeginMap;
        out << YAML::Key << "request_id" << YAML::Value << p.request_id;
        out << YAML::Key << "request_body" << YAML::Value << p.request_body;
        out << YAML::Key << "submit_time" << YAML::Value << p.submit_time;
        out << YAML::Key << "last_error" << YAML::Value << p.last_error;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    std::ofstream fout(state_path_.string());
    if (!fout) {
        neuro_log(fmt::format("cannot write state file {}", state_path_.string()));
        return;
    }
    fout << out.c_str();
}

void StateStore::record_job(const JobState& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientState state = load_unlocked();
    auto it = std::find_if(state.jobs.begin(), state.jobs.end(),
                           [&](const JobState& j) { return j.job_id == job.job_id; });
    if (it != state.jobs.end()) {
        JobState merged = job;
        if (merged.submit_time.empty()) merged.submit_time = it->submit_time;
        if (merged.job_name.empty()) merged.job_name = it->job_name;
        *it = merged;
    } else {
        state.jobs.push_back(job);
    }
    save_unlocked(state);
}

void StateStore::record_pending(const PendingSubmission& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientState state = load_unlocked();
    auto it = std::find_if(state.pending.begin(), state.pending.end(),
                           [&](const PendingSubmission& p) { return p.request_id == pending.request_id; });
    if (it != state.pending.end()) *it = pending;
    else state.pending.push_back(pending);
    save_unlocked(state);
}

void StateStore::drop_pending(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientState state = load_unlocked();
    auto before = state.pending.size();
    state.pending.erase(std::remove_if(state.pending.begin(), state.pending.end(),
                                       [&](const PendingSubmission& p) { return p.request_id == request_id; }),
                        state.pending.end());
    if (state.pending.size() != before) save_unlocked(state);
}

std::optional<PendingSubmission> StateStore::find_pending(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ClientState state = load_unlocked();
    for (const auto& p : state.pending) {
        if (p.request_id == request_id) return p;
    }
    return std::nullopt;
}
