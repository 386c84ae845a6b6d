#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <set>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/cancel_token.hpp>
#include <managers/neuro_client.hpp>
#include "args.hpp"

class NeuroCLI;

// Forward declarations for command registration
void register_job_commands(NeuroCLI& cli);
void register_storage_commands(NeuroCLI& cli);

class NeuroCLI {
public:
    NeuroCLI();
    ~NeuroCLI();

    // Returns the process exit code.
    using CommandHandler = std::function<int(NeuroCLI&, const Args&)>;

    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
        std::set<std::string> boolean_flags;
    };

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help,
                     std::set<std::string> boolean_flags = {});

    // argv without the program name: {"job", "submit", ...}
    int run(const std::vector<std::string>& argv);

    void print_help() const;

    // Load config, apply --api-url / --concurrency / --poll-interval and
    // build the client. Prints the failure and returns false on error.
    bool require_client(const Args& args);

    // Print an error the way every command reports failures.
    static void report(const Error& err);

    std::optional<Config> config;
    std::unique_ptr<NeuroClient> client;

    // Cancelled by SIGINT/SIGTERM while a command runs.
    CancelToken cancel;

private:
    std::map<std::string, Command> commands_;

    // ── Background threads ─────────────────────────────────
    // The renderer drains the client's event stream (emit() blocks once the
    // buffer is full, so somebody must always be reading). The signal
    // watcher turns SIGINT into cancel.cancel().
    std::thread renderer_;
    std::thread signal_watcher_;
    bool verbose_ = false;

    void start_renderer();
    void stop_renderer();
    void start_signal_watcher();
    void stop_signal_watcher();
};
