#include "neuro_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

NeuroCLI::NeuroCLI() {
    // Before any thread exists, so every thread inherits the mask and only
    // the watcher ever sees SIGINT.
    platform::block_termination_signals();
    register_job_commands(*this);
    register_storage_commands(*this);
}

NeuroCLI::~NeuroCLI() {
    stop_renderer();
    stop_signal_watcher();
}

void NeuroCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& usage, const std::string& help,
                           std::set<std::string> boolean_flags) {
    commands_[name] = {std::move(handler), usage, help, std::move(boolean_flags)};
}

void NeuroCLI::report(const Error& err) {
    std::cout << theme::fail(err.describe());
    switch (err.kind) {
        case ErrorKind::AmbiguousState:
            std::cout << theme::step("The remote outcome is unknown; nothing was retried.");
            break;
        case ErrorKind::Timeout:
            std::cout << theme::step("The job keeps running; wait again or cancel it.");
            break;
        case ErrorKind::Cancelled:
            std::cout << theme::step("Interrupted.");
            break;
        default:
            break;
    }
}

bool NeuroCLI::require_client(const Args& args) {
    if (client) return true;

    auto loaded = Config::load();
    if (loaded.is_err()) {
        report(loaded.error);
        return false;
    }
    Config cfg = loaded.value;

    if (args.has("--api-url")) cfg.set_api_url(args.get("--api-url"));
    if (args.has("--concurrency")) {
        int n = safe_stoi(args.get("--concurrency"), -1);
        if (n < 1) {
            std::cout << theme::fail("--concurrency must be a positive integer");
            return false;
        }
        cfg.set_concurrency(n);
    }
    if (args.has("--poll-interval")) {
        double secs = 0;
        try {
            secs = std::stod(args.get("--poll-interval"));
        } catch (const std::exception&) {
            secs = 0;
        }
        if (secs <= 0) {
            std::cout << theme::fail("--poll-interval must be a positive number of seconds");
            return false;
        }
        cfg.set_poll_interval(secs);
    }

    auto created = NeuroClient::create(cfg);
    if (created.is_err()) {
        report(created.error);
        if (!config_exists()) {
            std::cout << theme::step("Created a template config at " + get_config_path().string());
            auto r = create_default_config();
            if (r.is_err()) report(r.error);
        }
        return false;
    }

    config = cfg;
    client = std::move(created.value);
    if (verbose_) std::cerr << theme::log("debug log: " + neuro_log_path());
    start_renderer();
    return true;
}

// ── Background threads ───────────────────────────────────────

void NeuroCLI::start_renderer() {
    if (renderer_.joinable() || !client) return;
    EventReporter* events = &client->events();
    bool verbose = verbose_;
    renderer_ = std::thread([events, verbose] {
        while (auto ev = events->next()) {
            switch (ev->kind) {
                case EventKind::TransferStarted:
                case EventKind::JobSubmitted:
                    if (!verbose) break;
                    [[fallthrough]];
                default:
                    std::cerr << theme::log(fmt::format("{} {} {}", event_kind_name(ev->kind),
                                                        ev->subject, ev->message));
                    break;
            }
        }
    });
}

void NeuroCLI::stop_renderer() {
    if (!renderer_.joinable()) return;
    client->events().close();
    renderer_.join();
}

void NeuroCLI::start_signal_watcher() {
    if (signal_watcher_.joinable()) return;
    CancelToken token = cancel;
    signal_watcher_ = std::thread([token]() mutable {
        int sig = platform::wait_for_termination_signal();
        if (sig != 0) {
            neuro_log(fmt::format("signal {} received, cancelling", sig));
            token.cancel();
        }
    });
}

void NeuroCLI::stop_signal_watcher() {
    if (!signal_watcher_.joinable()) return;
    if (!cancel.is_cancelled()) platform::stop_waiting_for_signal();
    signal_watcher_.join();
}

// ── Dispatch ─────────────────────────────────────────────────

void NeuroCLI::print_help() const {
    std::cout << theme::section(fmt::format("neuro {}", NEURO_VERSION));
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE << fmt::format("    {:<44}", "neuro " + cmd.usage)
                  << theme::color::RESET << theme::color::DIM << cmd.help
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n" << theme::color::DIM
              << "    Global options: --api-url URL, --concurrency N, --poll-interval SECS, --verbose\n"
              << "    neuro --version        Show version\n"
              << "    neuro --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int NeuroCLI::run(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0] == "--help" || argv[0] == "help") {
        print_help();
        return argv.empty() ? 1 : 0;
    }
    if (argv[0] == "--version") {
        std::cout << theme::bold("neuro") << theme::dim(fmt::format(" version {}", NEURO_VERSION)) << "\n";
        return 0;
    }

    std::string name = argv[0];
    size_t consumed = 1;
    if (argv.size() > 1 && commands_.count(argv[0] + " " + argv[1])) {
        name = argv[0] + " " + argv[1];
        consumed = 2;
    }

    auto it = commands_.find(name);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + name);
        std::cout << theme::step("Run 'neuro --help' for available commands.");
        return 1;
    }

    std::set<std::string> flags = it->second.boolean_flags;
    flags.insert("--verbose");
    flags.insert("--help");
    auto parsed = parse_args(std::vector<std::string>(argv.begin() + consumed, argv.end()), flags);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error.message);
        std::cout << theme::step("Usage: neuro " + it->second.usage);
        return 2;
    }
    if (parsed.value.has("--help")) {
        std::cout << theme::step("Usage: neuro " + it->second.usage);
        std::cout << theme::info(it->second.help);
        return 0;
    }
    verbose_ = parsed.value.has("--verbose");

    start_signal_watcher();
    try {
        return it->second.handler(*this, parsed.value);
    } catch (const std::exception& e) {
        neuro_log(fmt::format("command '{}' failed: {}", name, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
