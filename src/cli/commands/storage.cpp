#include "../neuro_cli.hpp"
#include "../job_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

static size_t concurrency_of(const NeuroCLI& cli) {
    return static_cast<size_t>(cli.config->storage().concurrency);
}

// upload LOCAL REMOTE / download REMOTE LOCAL
static int transfer(NeuroCLI& cli, const Args& args, Direction direction) {
    if (args.positional.size() != 2) {
        std::cout << theme::fail("Expected a source and a destination.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;

    std::string local = direction == Direction::Upload ? args.positional[0] : args.positional[1];
    std::string remote = direction == Direction::Upload ? args.positional[1] : args.positional[0];

    auto& sync = cli.client->sync();
    auto plan = sync.plan(local, remote, direction, cli.cancel);
    if (plan.is_err()) {
        NeuroCLI::report(plan.error);
        return 1;
    }

    if (args.has("--dry-run")) {
        print_plan(plan.value);
        return 0;
    }
    if (plan.value.items.empty()) {
        std::cout << theme::ok(fmt::format("Nothing to transfer ({} up to date)",
                                           plan.value.skipped.size()));
        for (const auto& rej : plan.value.rejected) {
            std::cout << theme::warn(fmt::format("{}: {}", rej.path, rej.error.message));
        }
        return plan.value.rejected.empty() ? 0 : 1;
    }

    std::cout << theme::step(fmt::format("{} {} files with concurrency {}",
                                         direction == Direction::Upload ? "Uploading" : "Downloading",
                                         plan.value.items.size(), concurrency_of(cli)));
    auto report = sync.execute(plan.value, concurrency_of(cli), cli.cancel);
    print_sync_report(report);
    return report.ok() ? 0 : 1;
}

static int storage_upload(NeuroCLI& cli, const Args& args) {
    return transfer(cli, args, Direction::Upload);
}

static int storage_download(NeuroCLI& cli, const Args& args) {
    return transfer(cli, args, Direction::Download);
}

static int storage_plan(NeuroCLI& cli, const Args& args) {
    if (args.positional.size() != 2) {
        std::cout << theme::fail("Expected LOCAL and REMOTE.");
        return 2;
    }
    if (!cli.require_client(args)) return 1;

    Direction direction = args.has("--download") ? Direction::Download : Direction::Upload;
    auto plan = cli.client->sync().plan(args.positional[0], args.positional[1], direction, cli.cancel);
    if (plan.is_err()) {
        NeuroCLI::report(plan.error);
        return 1;
    }
    print_plan(plan.value);
    return 0;
}

void register_storage_commands(NeuroCLI& cli) {
    cli.add_command("storage upload", storage_upload,
        "storage upload LOCAL storage://PATH [-c N]", "Upload a file or directory",
        {"--dry-run"});
    cli.add_command("storage download", storage_download,
        "storage download storage://PATH LOCAL [-c N]", "Download a directory",
        {"--dry-run"});
    cli.add_command("storage plan", storage_plan,
        "storage plan LOCAL storage://PATH [--download]", "Show what a transfer would do",
        {"--download"});
}
