#include <gtest/gtest.h>
#include <managers/job_model.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

// ── Status machine ──────────────────────────────────────────

TEST(JobModel, ParseStatusNames) {
    EXPECT_EQ(parse_job_status("pending"), JobStatus::Pending);
    EXPECT_EQ(parse_job_status("unknown"), JobStatus::Pending);
    EXPECT_EQ(parse_job_status("running"), JobStatus::Running);
    EXPECT_EQ(parse_job_status("succeeded"), JobStatus::Succeeded);
    EXPECT_EQ(parse_job_status("failed"), JobStatus::Failed);
    EXPECT_EQ(parse_job_status("cancelled"), JobStatus::Cancelled);
    EXPECT_EQ(parse_job_status("canceled"), JobStatus::Cancelled);
    EXPECT_FALSE(parse_job_status("exploded").has_value());
}

TEST(JobModel, TerminalStates) {
    EXPECT_FALSE(is_terminal(JobStatus::Pending));
    EXPECT_FALSE(is_terminal(JobStatus::Running));
    EXPECT_TRUE(is_terminal(JobStatus::Succeeded));
    EXPECT_TRUE(is_terminal(JobStatus::Failed));
    EXPECT_TRUE(is_terminal(JobStatus::Cancelled));
}

TEST(JobModel, LegalTransitions) {
    EXPECT_TRUE(check_transition(JobStatus::Pending, JobStatus::Running).is_ok());
    EXPECT_TRUE(check_transition(JobStatus::Running, JobStatus::Succeeded).is_ok());
    EXPECT_TRUE(check_transition(JobStatus::Running, JobStatus::Failed).is_ok());
    EXPECT_TRUE(check_transition(JobStatus::Pending, JobStatus::Cancelled).is_ok());
    EXPECT_TRUE(check_transition(JobStatus::Running, JobStatus::Cancelled).is_ok());
    // Fast jobs can finish between two polls
    EXPECT_TRUE(check_transition(JobStatus::Pending, JobStatus::Succeeded).is_ok());
    EXPECT_TRUE(check_transition(JobStatus::Failed, JobStatus::Failed).is_ok());
}

TEST(JobModel, IllegalTransitions) {
    auto r = check_transition(JobStatus::Succeeded, JobStatus::Running);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Consistency);

    EXPECT_TRUE(check_transition(JobStatus::Running, JobStatus::Pending).is_err());
    EXPECT_TRUE(check_transition(JobStatus::Cancelled, JobStatus::Succeeded).is_err());
    EXPECT_TRUE(check_transition(JobStatus::Failed, JobStatus::Succeeded).is_err());
}

TEST(JobModel, AdvanceKeepsStatusOnError) {
    Job job;
    job.id = "job-1";
    ASSERT_TRUE(job.advance(JobStatus::Running).is_ok());
    ASSERT_TRUE(job.advance(JobStatus::Failed).is_ok());

    auto r = job.advance(JobStatus::Running);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.subject, "job-1");
    EXPECT_EQ(job.status, JobStatus::Failed);
}

// ── Volumes ─────────────────────────────────────────────────

TEST(JobModel, VolumeDefaultsToReadWrite) {
    auto r = Volume::parse("storage:datasets/imagenet:/data");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.storage_uri, "storage:datasets/imagenet");
    EXPECT_EQ(r.value.container_path, "/data");
    EXPECT_FALSE(r.value.read_only);
}

TEST(JobModel, VolumeReadOnly) {
    auto r = Volume::parse("storage:models:/var/models:ro");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.read_only);

    auto rw = Volume::parse("storage:models:/var/models:rw");
    ASSERT_TRUE(rw.is_ok());
    EXPECT_FALSE(rw.value.read_only);
}

TEST(JobModel, VolumeRejectsMalformed) {
    EXPECT_TRUE(Volume::parse("/local:/data").is_err());
    EXPECT_TRUE(Volume::parse("storage:data").is_err());
    EXPECT_TRUE(Volume::parse("storage:data:relative").is_err());
    EXPECT_TRUE(Volume::parse("storage:data:/x:rx").is_err());
    EXPECT_TRUE(Volume::parse("storage::/data").is_err());

    auto r = Volume::parse("nfs:data:/x");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.message.find("Invalid volume specification"), std::string::npos);
}

// ── Validation ──────────────────────────────────────────────

static JobSpec make_spec() {
    JobSpec spec;
    spec.image = "ubuntu:22.04";
    spec.command = "python train.py";
    return spec;
}

TEST(JobModel, ValidSpec) {
    EXPECT_TRUE(validate_job_spec(make_spec()).is_ok());
}

TEST(JobModel, EmptyImageOrCommandRejected) {
    auto spec = make_spec();
    spec.image = "   ";
    EXPECT_TRUE(validate_job_spec(spec).is_err());

    spec = make_spec();
    spec.command = "";
    auto r = validate_job_spec(spec);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Permanent);
}

TEST(JobModel, EnvNamesChecked) {
    auto spec = make_spec();
    spec.env["CUDA_VISIBLE_DEVICES"] = "0";
    spec.env["_private"] = "x";
    EXPECT_TRUE(validate_job_spec(spec).is_ok());

    spec.env["1BAD"] = "x";
    EXPECT_TRUE(validate_job_spec(spec).is_err());

    spec = make_spec();
    spec.env["WITH-DASH"] = "x";
    EXPECT_TRUE(validate_job_spec(spec).is_err());
}

TEST(JobModel, ResourcesChecked) {
    auto spec = make_spec();
    spec.resources.cpu = -1;
    EXPECT_TRUE(validate_job_spec(spec).is_err());
}

TEST(JobModel, PortsChecked) {
    auto spec = make_spec();
    spec.network.http_port = 8080;
    spec.network.ssh_port = 22;
    EXPECT_TRUE(validate_job_spec(spec).is_ok());

    spec.network.http_port = 70000;
    auto r = validate_job_spec(spec);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.message.find("70000"), std::string::npos);

    spec = make_spec();
    spec.network.ssh_port = -1;
    EXPECT_TRUE(validate_job_spec(spec).is_err());
}

// ── Environment entries ─────────────────────────────────────

TEST(JobModel, EnvEntriesKeyValue) {
    auto r = parse_env_entries({"SEED=7", "EMPTY=", "URL=http://x/?a=b"});
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    EXPECT_EQ(r.value.at("SEED"), "7");
    EXPECT_EQ(r.value.at("EMPTY"), "");
    EXPECT_EQ(r.value.at("URL"), "http://x/?a=b");
}

TEST(JobModel, BareEnvNameInheritsFromProcess) {
    ::setenv("NEURO_TEST_INHERITED", "from-shell", 1);
    ::unsetenv("NEURO_TEST_NOT_SET");

    auto r = parse_env_entries({"NEURO_TEST_INHERITED", "NEURO_TEST_NOT_SET"});
    ::unsetenv("NEURO_TEST_INHERITED");
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    EXPECT_EQ(r.value.at("NEURO_TEST_INHERITED"), "from-shell");
    ASSERT_EQ(r.value.count("NEURO_TEST_NOT_SET"), 1u);
    EXPECT_EQ(r.value.at("NEURO_TEST_NOT_SET"), "");
}

TEST(JobModel, EnvEntriesSkipCommentsAndBlanks) {
    auto r = parse_env_entries({"# comment", "", "   ", "  A=1  "});
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 1u);
    EXPECT_EQ(r.value.at("A"), "1");
}

TEST(JobModel, LaterEnvEntryWins) {
    auto r = parse_env_entries({"A=file", "B=2", "A=flag"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.at("A"), "flag");
    EXPECT_EQ(r.value.at("B"), "2");
}

TEST(JobModel, InvalidEnvNameRejected) {
    auto r = parse_env_entries({"OK=1", "1BAD=x"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Permanent);
    EXPECT_NE(r.error.message.find("1BAD=x"), std::string::npos);

    EXPECT_TRUE(parse_env_entries({"=value"}).is_err());
}

TEST(JobModel, EnvFileLines) {
    fs::path file = fs::temp_directory_path() / ("neuro_env_test_" + std::to_string(::getpid()));
    {
        std::ofstream out(file);
        out << "# training settings\r\nSEED=7\r\n\nLR=0.01\n";
    }
    auto lines = read_env_file(file.string());
    fs::remove(file);
    ASSERT_TRUE(lines.is_ok()) << lines.error.message;
    ASSERT_EQ(lines.value.size(), 4u);
    EXPECT_EQ(lines.value[1], "SEED=7");

    // Flag entries come after the file so they take precedence
    auto entries = lines.value;
    entries.push_back("SEED=42");
    auto env = parse_env_entries(entries);
    ASSERT_TRUE(env.is_ok());
    EXPECT_EQ(env.value.size(), 2u);
    EXPECT_EQ(env.value.at("SEED"), "42");
    EXPECT_EQ(env.value.at("LR"), "0.01");
}

TEST(JobModel, MissingEnvFile) {
    auto r = read_env_file("/nonexistent/neuro.env");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Permanent);
    EXPECT_EQ(r.error.subject, "/nonexistent/neuro.env");
}

// ── List filter ─────────────────────────────────────────────

TEST(JobModel, StatusFilterDefaultsToActive) {
    auto r = parse_status_filter({});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<JobStatus>{JobStatus::Pending, JobStatus::Running}));
}

TEST(JobModel, StatusFilterAllMeansNoFilter) {
    auto r = parse_status_filter({"running", "all"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(JobModel, StatusFilterExplicitNames) {
    auto r = parse_status_filter({"failed", "succeeded", "failed"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<JobStatus>{JobStatus::Failed, JobStatus::Succeeded}));

    auto bad = parse_status_filter({"runing"});
    ASSERT_TRUE(bad.is_err());
    EXPECT_NE(bad.error.message.find("runing"), std::string::npos);
    EXPECT_TRUE(parse_status_filter({"unknown"}).is_err());
}

// ── Wire format ─────────────────────────────────────────────

TEST(JobModel, RequestBodyCarriesRequestId) {
    auto spec = make_spec();
    spec.env["SEED"] = "7";
    spec.volumes.push_back(Volume::parse("storage:data:/data:ro").value);
    spec.resources.gpu = 1;
    spec.resources.gpu_model = "nvidia-tesla-v100";
    spec.name = "train";

    auto j = nlohmann::json::parse(job_request_body(spec, "abc123"));
    EXPECT_EQ(j["client_request_id"], "abc123");
    EXPECT_EQ(j["name"], "train");
    EXPECT_EQ(j["container"]["image"], "ubuntu:22.04");
    EXPECT_EQ(j["container"]["env"]["SEED"], "7");
    EXPECT_EQ(j["container"]["resources"]["gpu"], 1);
    EXPECT_EQ(j["container"]["resources"]["gpu_model"], "nvidia-tesla-v100");
    EXPECT_EQ(j["container"]["volumes"][0]["dst_path"], "/data");
    EXPECT_EQ(j["container"]["volumes"][0]["read_only"], true);
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j["container"].contains("http"));
    EXPECT_FALSE(j["container"].contains("ssh"));
}

TEST(JobModel, RequestBodyCarriesPorts) {
    auto spec = make_spec();
    spec.network.http_port = 8888;
    spec.network.ssh_port = 22;
    spec.description = "notebook";

    auto j = nlohmann::json::parse(job_request_body(spec, "r1"));
    EXPECT_EQ(j["container"]["http"]["port"], 8888);
    EXPECT_EQ(j["container"]["ssh"]["port"], 22);
    EXPECT_EQ(j["description"], "notebook");
}

TEST(JobModel, ParseJobDescription) {
    const char* body = R"({
        "id": "job-42",
        "owner": "alice",
        "status": "failed",
        "history": {
            "status": "failed",
            "reason": "OOMKilled",
            "description": "out of memory",
            "created_at": "2025-01-15T10:00:00Z",
            "started_at": "2025-01-15T10:00:05Z",
            "finished_at": "2025-01-15T10:05:00Z",
            "exit_code": 137
        },
        "container": {
            "image": "ubuntu",
            "command": "sleep 1",
            "resources": {"cpu": "2", "memory_mb": "4096", "gpu": 1, "gpu_model": "k80"}
        }
    })";
    auto r = parse_job(body);
    ASSERT_TRUE(r.is_ok());
    const Job& job = r.value;
    EXPECT_EQ(job.id, "job-42");
    EXPECT_EQ(job.owner, "alice");
    EXPECT_EQ(job.status, JobStatus::Failed);
    EXPECT_EQ(job.reason, "OOMKilled");
    ASSERT_TRUE(job.exit_code.has_value());
    EXPECT_EQ(*job.exit_code, 137);
    EXPECT_DOUBLE_EQ(job.spec.resources.cpu, 2.0);
    EXPECT_EQ(job.spec.resources.memory_mb, 4096);
    EXPECT_EQ(job.spec.resources.gpu_model, "k80");
}

TEST(JobModel, ParseJobPorts) {
    const char* body = R"({
        "id": "job-7",
        "status": "running",
        "description": "notebook",
        "http_url": "https://job-7.jobs.example.com",
        "ssh_server": "ssh://job-7.jobs.example.com:22",
        "container": {
            "image": "jupyter",
            "command": "start-notebook.sh",
            "http": {"port": 8888},
            "ssh": {"port": "22"}
        }
    })";
    auto r = parse_job(body);
    ASSERT_TRUE(r.is_ok()) << r.error.message;
    EXPECT_EQ(r.value.spec.description, "notebook");
    EXPECT_EQ(r.value.spec.network.http_port, 8888);
    EXPECT_EQ(r.value.spec.network.ssh_port, 22);
    EXPECT_EQ(r.value.http_url, "https://job-7.jobs.example.com");
    EXPECT_EQ(r.value.ssh_server, "ssh://job-7.jobs.example.com:22");

    auto plain = parse_job(R"({"id": "j", "status": "pending"})");
    ASSERT_TRUE(plain.is_ok());
    EXPECT_EQ(plain.value.spec.network.http_port, 0);
    EXPECT_TRUE(plain.value.http_url.empty());
}

TEST(JobModel, StatusFallsBackToHistory) {
    auto r = parse_job(R"({"id": "j", "history": {"status": "running"}})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.status, JobStatus::Running);
}

TEST(JobModel, ParseJobRejectsMissingId) {
    EXPECT_TRUE(parse_job(R"({"status": "running"})").is_err());
    EXPECT_TRUE(parse_job("not json").is_err());
    EXPECT_TRUE(parse_job("[]").is_err());
}

TEST(JobModel, ParseJobList) {
    auto r = parse_job_list(R"({"jobs": [{"id": "a", "status": "pending"}, {"id": "b", "status": "running"}]})");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[1].status, JobStatus::Running);

    EXPECT_TRUE(parse_job_list(R"({"items": []})").is_err());
}
