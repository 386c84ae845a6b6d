#include "../neuro_cli.hpp"
#include "../job_view.hpp"
#include "../theme.hpp"
#include <core/resource_spec.hpp>
#include <core/utils.hpp>
#include <managers/job_model.hpp>
#include <managers/state_store.hpp>
#include <algorithm>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static std::optional<std::chrono::milliseconds> parse_timeout(const Args& args) {
    if (!args.has("--timeout")) return std::nullopt;
    try {
        double secs = std::stod(args.get("--timeout"));
        if (secs > 0) return std::chrono::milliseconds(static_cast<long long>(secs * 1000));
    } catch (const std::exception&) {
        // fall through: treated as no timeout
    }
    std::cout << theme::warn("Ignoring invalid --timeout '" + args.get("--timeout") + "'");
    return std::nullopt;
}

static Result<JobSpec> spec_from_args(const NeuroCLI& cli, const Args& args) {
    JobSpec spec;
    if (args.positional.empty()) {
        return Result<JobSpec>::Err("Missing image. Usage: neuro job submit IMAGE [CMD...]");
    }
    spec.image = args.positional[0];
    for (size_t i = 1; i < args.positional.size(); ++i) {
        if (i > 1) spec.command += " ";
        spec.command += args.positional[i];
    }

    if (args.has("--preset")) {
        const auto& presets = cli.config->presets();
        auto res = resources_from_preset(presets, args.get("--preset"));
        if (res.is_err()) return Result<JobSpec>::Err(res.error);
        spec.resources = res.value;
        spec.is_preemptible = presets.at(args.get("--preset")).is_preemptible;
    }

    if (args.has("--cpu")) {
        try {
            spec.resources.cpu = std::stod(args.get("--cpu"));
        } catch (const std::exception&) {
            return Result<JobSpec>::Err("Invalid --cpu value '" + args.get("--cpu") + "'");
        }
    }
    if (args.has("--memory")) {
        int mb = parse_memory_mb(args.get("--memory"));
        if (mb <= 0) return Result<JobSpec>::Err("Invalid --memory value '" + args.get("--memory") + "'");
        spec.resources.memory_mb = mb;
    }
    if (args.has("--gpu")) spec.resources.gpu = safe_stoi(args.get("--gpu"), -1);
    if (args.has("--gpu-model")) spec.resources.gpu_model = args.get("--gpu-model");
    if (args.has("--shm")) spec.resources.shm = true;
    if (args.has("--preemptible")) spec.is_preemptible = true;

    for (const auto& flag : {"--http", "--ssh"}) {
        if (!args.has(flag)) continue;
        int port = safe_stoi(args.get(flag), -1);
        if (port <= 0 || port > 65535) {
            return Result<JobSpec>::Err(fmt::format("Invalid {} port '{}'", flag, args.get(flag)));
        }
        (std::string(flag) == "--http" ? spec.network.http_port : spec.network.ssh_port) = port;
    }

    // Env file entries first so -e overrides them
    std::vector<std::string> entries;
    for (const auto& path : args.all("--env-file")) {
        auto lines = read_env_file(path);
        if (lines.is_err()) return Result<JobSpec>::Err(lines.error);
        entries.insert(entries.end(), lines.value.begin(), lines.value.end());
    }
    for (const auto& kv : args.all("--env")) entries.push_back(kv);
    auto env = parse_env_entries(entries);
    if (env.is_err()) return Result<JobSpec>::Err(env.error);
    spec.env = env.value;
    for (const auto& v : args.all("--volume")) {
        auto vol = Volume::parse(v);
        if (vol.is_err()) return Result<JobSpec>::Err(vol.error);
        spec.volumes.push_back(vol.value);
    }

    spec.name = args.get("--name");
    spec.description = args.get("--description");
    return Result<JobSpec>::Ok(spec);
}

static int wait_and_print(NeuroCLI& cli, const std::string& job_id, const Args& args) {
    WaitOptions opts = cli.client->jobs().default_wait_options();
    opts.timeout = parse_timeout(args);

    auto r = cli.client->jobs().wait(job_id, opts, cli.cancel, [&job_id](const Job& job) {
        std::cout << theme::step(fmt::format("{} {}", job_id, status_label(job.status)));
    });
    if (r.is_err()) {
        NeuroCLI::report(r.error);
        return 1;
    }
    print_job(r.value);
    return r.value.status == JobStatus::Succeeded ? 0 : 1;
}

// ── Commands ─────────────────────────────────────────────────

static int job_submit(NeuroCLI& cli, const Args& args) {
    if (!cli.require_client(args)) return 1;

    auto spec = spec_from_args(cli, args);
    if (spec.is_err()) {
        NeuroCLI::report(spec.error);
        return 2;
    }

    auto r = cli.client->jobs().submit(spec.value, cli.cancel);
    if (r.is_err()) {
        NeuroCLI::report(r.error);
        if (r.error.kind == ErrorKind::AmbiguousState) {
            std::cout << theme::step("Check with: neuro job confirm " + r.error.subject);
        }
        return 1;
    }

    if (args.has("--quiet")) {
        std::cout << r.value.id << "\n";
        if (!args.has("--wait")) return 0;
        WaitOptions opts = cli.client->jobs().default_wait_options();
        opts.timeout = parse_timeout(args);
        auto done = cli.client->jobs().wait(r.value.id, opts, cli.cancel);
        if (done.is_err()) {
            NeuroCLI::report(done.error);
            return 1;
        }
        return done.value.status == JobStatus::Succeeded ? 0 : 1;
    }

    std::cout << theme::ok("Job submitted: " + theme::bold(r.value.id));
    if (args.has("--wait")) return wait_and_print(cli, r.value.id, args);
    print_job(r.value);
    return 0;
}

static int job_status(NeuroCLI& cli, const Args& args) {
    if (args.positional.empty()) {
        std::cout << theme::fail("Missing job id.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;

    int rc = 0;
    for (const auto& id : args.positional) {
        auto r = cli.client->jobs().status(id, cli.cancel);
        if (r.is_err()) {
            NeuroCLI::report(r.error);
            rc = 1;
            continue;
        }
        print_job(r.value);
        if (args.positional.size() > 1) std::cout << "\n";
    }
    return rc;
}

static int job_wait(NeuroCLI& cli, const Args& args) {
    if (args.positional.empty()) {
        std::cout << theme::fail("Missing job id.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;
    if (args.positional.size() == 1) return wait_and_print(cli, args.positional[0], args);

    WaitOptions opts = cli.client->jobs().default_wait_options();
    opts.timeout = parse_timeout(args);
    auto outcomes = cli.client->jobs().wait_all(args.positional, opts, cli.cancel);

    int rc = 0;
    for (const auto& o : outcomes) {
        if (o.result.is_err()) {
            NeuroCLI::report(o.result.error);
            rc = 1;
        } else {
            std::cout << theme::kv(o.job_id, status_label(o.result.value.status));
            if (o.result.value.status != JobStatus::Succeeded) rc = 1;
        }
    }
    return rc;
}

static int job_cancel(NeuroCLI& cli, const Args& args) {
    if (args.positional.empty()) {
        std::cout << theme::fail("Missing job id.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;

    int rc = 0;
    for (const auto& o : cli.client->jobs().cancel_many(args.positional, cli.cancel)) {
        if (o.result.is_ok()) {
            std::cout << theme::ok("Cancelled " + o.job_id);
        } else {
            NeuroCLI::report(o.result.error);
            rc = 1;
        }
    }
    return rc;
}

static int job_logs(NeuroCLI& cli, const Args& args) {
    if (args.positional.size() != 1) {
        std::cout << theme::fail("Expected exactly one job id.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;

    uint64_t since = static_cast<uint64_t>(std::max(0, safe_stoi(args.get("--since", "0"))));
    auto stream = cli.client->jobs().stream_logs(args.positional[0], cli.cancel, since);
    while (true) {
        auto r = stream->next();
        if (r.is_err()) {
            if (r.error.kind == ErrorKind::SequenceGap) {
                std::cerr << theme::warn(r.error.message);
                continue;
            }
            NeuroCLI::report(r.error);
            return 1;
        }
        if (!r.value) break;
        print_log_chunk(*r.value);
    }
    return 0;
}

static int job_list(NeuroCLI& cli, const Args& args) {
    JobFilter filter;
    auto statuses = parse_status_filter(args.all("--status"));
    if (statuses.is_err()) {
        NeuroCLI::report(statuses.error);
        return 2;
    }
    filter.statuses = statuses.value;
    filter.name = args.get("--name");
    filter.description = args.get("--description");
    if (!cli.require_client(args)) return 1;

    auto r = cli.client->jobs().list(filter, cli.cancel);
    if (r.is_err()) {
        NeuroCLI::report(r.error);
        return 1;
    }
    if (args.has("--quiet")) {
        for (const auto& job : r.value) std::cout << job.id << "\n";
        return 0;
    }
    print_job_table(r.value);
    return 0;
}

static int job_confirm(NeuroCLI& cli, const Args& args) {
    if (!cli.require_client(args)) return 1;

    if (args.positional.empty()) {
        // No id: show what is still unconfirmed
        auto state = cli.client->state()->load();
        if (state.pending.empty()) {
            std::cout << theme::info("No unconfirmed submissions.");
            return 0;
        }
        for (const auto& p : state.pending) {
            std::cout << theme::kv(p.request_id, p.submit_time + "  " + theme::dim(p.last_error));
        }
        return 0;
    }

    auto r = cli.client->jobs().confirm_submission(args.positional[0], args.has("--resubmit"),
                                                   cli.cancel);
    if (r.is_err()) {
        NeuroCLI::report(r.error);
        return 1;
    }
    std::cout << theme::ok("Job exists: " + theme::bold(r.value.id));
    print_job(r.value);
    return 0;
}

void register_job_commands(NeuroCLI& cli) {
    cli.add_command("job submit", job_submit,
        "job submit IMAGE [CMD...] [--preset P] [-e K[=V]] [--env-file F] [-v VOL] [--http PORT] [--ssh PORT]",
        "Submit a job (--cpu --memory --gpu --gpu-model --shm --preemptible --name -d --wait -q)",
        {"--shm", "--preemptible", "--wait", "--quiet"});
    cli.add_command("job status", job_status, "job status ID...", "Show job status");
    cli.add_command("job wait", job_wait, "job wait ID... [--timeout SECS]",
        "Wait for jobs to finish");
    cli.add_command("job cancel", job_cancel, "job cancel ID...", "Cancel jobs");
    cli.add_command("job logs", job_logs, "job logs ID [--since N]", "Stream job output");
    cli.add_command("job list", job_list, "job list [--status S|all] [--name N] [-d DESC] [-q]",
        "List jobs (pending and running unless --status is given)", {"--quiet"});
    cli.add_command("job confirm", job_confirm, "job confirm [REQUEST_ID] [--resubmit]",
        "Resolve a submission whose outcome is unknown", {"--resubmit"});
}
