#include "config.hpp"
#include "constants.hpp"
#include "resource_spec.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <cstdlib>

fs::path get_config_dir() {
    return platform::home_dir() / ".neuro";
}

fs::path get_config_path() {
    const char* env = std::getenv("NEURO_CONFIG");
    if (env && *env) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);

    const char* default_config = R"(# neuro client configuration

api:
  url: ""                          # e.g. https://platform.example.com/api/v1
  token: ""                        # or NEURO_TOKEN
  timeout: 60

storage:
  url: ""                          # defaults to <api.url>/storage
  concurrency: 10

jobs:
  poll_interval: 5
  poll_interval_max: 30

retry:
  max_attempts: 5
  base_delay_ms: 500
  max_delay_ms: 30000
  max_elapsed: 120
  rate_limit_multiplier: 4

log:
  path: ""                         # default: <tmp>/neuro_debug.log

presets:
  cpu-small:
    cpu: 1
    memory_mb: 2048
  gpu-small:
    cpu: 4
    memory_mb: 16384
    gpu: 1
    gpu_model: "nvidia-tesla-k80"
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

// ── Section parsers ──────────────────────────────────────────

static ApiConfig parse_api_config(const YAML::Node& node) {
    ApiConfig api;
    api.url = node["url"].as<std::string>("");
    api.token = node["token"].as<std::string>("");
    api.timeout = node["timeout"].as<int>(DEFAULT_HTTP_TIMEOUT_SECS);
    return api;
}

static StorageConfig parse_storage_config(const YAML::Node& node) {
    StorageConfig storage;
    storage.url = node["url"].as<std::string>("");
    storage.concurrency = node["concurrency"].as<int>(DEFAULT_CONCURRENCY);
    return storage;
}

static JobsConfig parse_jobs_config(const YAML::Node& node) {
    JobsConfig jobs;
    jobs.poll_interval = node["poll_interval"].as<double>(DEFAULT_POLL_INTERVAL_SECS);
    jobs.poll_interval_max = node["poll_interval_max"].as<double>(DEFAULT_POLL_MAX_SECS);
    return jobs;
}

static RetryConfig parse_retry_config(const YAML::Node& node) {
    RetryConfig retry;
    retry.max_attempts = node["max_attempts"].as<int>(RETRY_MAX_ATTEMPTS);
    retry.base_delay_ms = node["base_delay_ms"].as<int>(RETRY_BASE_DELAY_MS);
    retry.max_delay_ms = node["max_delay_ms"].as<int>(RETRY_MAX_DELAY_MS);
    retry.max_elapsed = node["max_elapsed"].as<double>(RETRY_MAX_ELAPSED_SECS);
    retry.rate_limit_multiplier = node["rate_limit_multiplier"].as<double>(RETRY_RATE_LIMIT_FACTOR);
    return retry;
}

// memory may be given as memory_mb: 4096 or memory: "4G"
static Preset parse_preset(const YAML::Node& node) {
    Preset p;
    p.cpu = node["cpu"].as<double>(1.0);
    if (node["memory_mb"]) {
        p.memory_mb = node["memory_mb"].as<int>(1024);
    } else if (node["memory"]) {
        int mb = parse_memory_mb(node["memory"].as<std::string>(""));
        if (mb > 0) p.memory_mb = mb;
    }
    p.gpu = node["gpu"].as<int>(0);
    p.gpu_model = node["gpu_model"].as<std::string>("");
    p.is_preemptible = node["is_preemptible"].as<bool>(false);
    return p;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        if (root.IsNull()) {
            config.derive_storage_url();
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Failed to parse config: top level must be a mapping");
        }

        config.api_ = parse_api_config(root["api"] ? root["api"] : YAML::Node());
        config.storage_ = parse_storage_config(root["storage"] ? root["storage"] : YAML::Node());
        config.jobs_ = parse_jobs_config(root["jobs"] ? root["jobs"] : YAML::Node());
        config.retry_ = parse_retry_config(root["retry"] ? root["retry"] : YAML::Node());
        config.storage_url_explicit_ = !config.storage_.url.empty();

        if (root["log"] && root["log"].IsMap()) {
            config.log_path_ = root["log"]["path"].as<std::string>("");
        }

        if (root["presets"] && root["presets"].IsMap()) {
            for (const auto& kv : root["presets"]) {
                config.presets_[kv.first.as<std::string>()] = parse_preset(kv.second);
            }
        }

        config.derive_storage_url();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto r = parse(text);
    if (r.is_err()) r.error.subject = path.string();
    return r;
}

Result<Config> Config::load() {
    fs::path path = get_config_path();
    Config config;
    if (fs::exists(path)) {
        auto r = load_file(path);
        if (r.is_err()) return r;
        config = r.value;
    } else {
        config.derive_storage_url();
    }
    config.apply_env_overrides();
    return Result<Config>::Ok(config);
}

void Config::set_api_url(const std::string& url) {
    api_.url = url;
    derive_storage_url();
}

void Config::apply_env_overrides() {
    const char* url = std::getenv("NEURO_API_URL");
    if (url && *url) set_api_url(url);
    const char* token = std::getenv("NEURO_TOKEN");
    if (token && *token) api_.token = token;
}

void Config::derive_storage_url() {
    if (storage_url_explicit_) return;
    storage_.url = api_.url.empty() ? "" : api_.url + "/storage";
}

Result<void> Config::validate() const {
    if (api_.url.empty()) {
        return Result<void>::Err(fmt::format(
            "api.url is not set (edit {} or set NEURO_API_URL)", get_config_path().string()));
    }
    if (storage_.concurrency < 1 || storage_.concurrency > MAX_CONCURRENCY) {
        return Result<void>::Err(fmt::format("concurrency must be between 1 and {}", MAX_CONCURRENCY));
    }
    if (jobs_.poll_interval <= 0 || jobs_.poll_interval_max < jobs_.poll_interval) {
        return Result<void>::Err("jobs.poll_interval must be > 0 and <= jobs.poll_interval_max");
    }
    if (retry_.max_attempts < 1 || retry_.base_delay_ms < 0 || retry_.max_delay_ms < retry_.base_delay_ms) {
        return Result<void>::Err("retry settings out of range");
    }
    if (api_.timeout <= 0) {
        return Result<void>::Err("api.timeout must be positive");
    }
    return Result<void>::Ok();
}
