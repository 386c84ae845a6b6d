#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load NEURO_CONFIG, or ~/.neuro/config.yaml. A missing file yields the
    // defaults. NEURO_API_URL / NEURO_TOKEN override the file.
    static Result<Config> load();

    // Parse one config file (must exist). No environment overrides.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text. No environment overrides.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ApiConfig& api() const { return api_; }
    const StorageConfig& storage() const { return storage_; }
    const JobsConfig& jobs() const { return jobs_; }
    const RetryConfig& retry() const { return retry_; }
    const std::string& log_path() const { return log_path_; }
    const std::map<std::string, Preset>& presets() const { return presets_; }

    // Command-line overrides
    void set_concurrency(int n) { storage_.concurrency = n; }
    void set_poll_interval(double secs) {
        jobs_.poll_interval = secs;
        if (jobs_.poll_interval_max < secs) jobs_.poll_interval_max = secs;
    }
    void set_api_url(const std::string& url);

    void apply_env_overrides();

    // Ranges and required fields; run after all overrides.
    Result<void> validate() const;

public:
    Config() = default;

private:
    ApiConfig api_;
    StorageConfig storage_;
    JobsConfig jobs_;
    RetryConfig retry_;
    std::string log_path_;
    std::map<std::string, Preset> presets_;
    bool storage_url_explicit_ = false;

    void derive_storage_url();
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write a commented default config unless one already exists.
Result<void> create_default_config();
