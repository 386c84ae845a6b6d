#include "job_view.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <fmt/format.h>

std::string status_label(JobStatus status) {
    std::string name = job_status_name(status);
    switch (status) {
        case JobStatus::Pending:   return theme::yellow(name);
        case JobStatus::Running:   return theme::blue(name);
        case JobStatus::Succeeded: return theme::green(name);
        case JobStatus::Failed:    return theme::red(name);
        case JobStatus::Cancelled: return theme::dim(name);
    }
    return name;
}

void print_job(const Job& job) {
    std::cout << theme::kv("Job", theme::bold(job.id));
    if (!job.spec.name.empty()) std::cout << theme::kv("Name", job.spec.name);
    if (!job.spec.description.empty()) std::cout << theme::kv("Description", job.spec.description);
    if (!job.owner.empty()) std::cout << theme::kv("Owner", job.owner);

    std::string status = status_label(job.status);
    if (!job.reason.empty()) status += theme::dim(" (" + job.reason + ")");
    std::cout << theme::kv("Status", status);
    if (!job.status_description.empty()) std::cout << theme::kv("", theme::dim(job.status_description));

    std::cout << theme::kv("Image", job.spec.image);
    std::cout << theme::kv("Command", job.spec.command);

    const auto& r = job.spec.resources;
    std::string res = fmt::format("{} cpu, {} MB", r.cpu, r.memory_mb);
    if (r.gpu > 0) {
        res += fmt::format(", {} gpu", r.gpu);
        if (!r.gpu_model.empty()) res += " " + r.gpu_model;
    }
    if (r.shm) res += ", shm";
    std::cout << theme::kv("Resources", res);
    if (job.spec.is_preemptible) std::cout << theme::kv("Preemptible", "yes");

    for (const auto& v : job.spec.volumes) {
        std::cout << theme::kv("Volume", fmt::format("{} -> {}{}", v.storage_uri, v.container_path,
                                                     v.read_only ? " (ro)" : ""));
    }

    const auto& net = job.spec.network;
    if (net.http_port > 0) {
        std::string http = fmt::format("port {}", net.http_port);
        if (!job.http_url.empty()) http += "  " + job.http_url;
        std::cout << theme::kv("HTTP", http);
    }
    if (net.ssh_port > 0) {
        std::string ssh = fmt::format("port {}", net.ssh_port);
        if (!job.ssh_server.empty()) ssh += "  " + job.ssh_server;
        std::cout << theme::kv("SSH", ssh);
    }

    std::cout << theme::kv("Created", format_timestamp(job.created_at));
    if (!job.started_at.empty()) {
        std::cout << theme::kv("Started", format_timestamp(job.started_at));
        std::cout << theme::kv("Duration", format_duration(job.started_at, job.finished_at));
    }
    if (!job.finished_at.empty()) std::cout << theme::kv("Finished", format_timestamp(job.finished_at));
    if (job.exit_code) std::cout << theme::kv("Exit code", std::to_string(*job.exit_code));
}

void print_job_table(const std::vector<Job>& jobs) {
    if (jobs.empty()) {
        std::cout << theme::info("No jobs.");
        return;
    }
    std::cout << theme::color::DIM
              << fmt::format("    {:<28} {:<12} {:<10} {:<24} {}", "ID", "STATUS", "STARTED",
                             "IMAGE", "NAME")
              << theme::color::RESET << "\n";
    for (const auto& job : jobs) {
        // Pad before coloring so escape codes don't skew the columns
        std::string status = fmt::format("{:<12}", job_status_name(job.status));
        std::string colored = status_label(job.status);
        colored.replace(colored.find(job_status_name(job.status)),
                        std::string(job_status_name(job.status)).size(), status);
        std::cout << fmt::format("    {:<28} {} {:<10} {:<24} {}\n", job.id, colored,
                                 format_timestamp(job.started_at.empty() ? job.created_at : job.started_at),
                                 job.spec.image, job.spec.name);
    }
}

void print_log_chunk(const LogChunk& chunk) {
    if (chunk.stream == LogStreamKind::Stderr) {
        std::cerr << chunk.data << std::flush;
    } else {
        std::cout << chunk.data << std::flush;
    }
}

void print_plan(const TransferPlan& plan) {
    std::cout << theme::kv("Direction", direction_name(plan.direction));
    std::cout << theme::kv("Local", plan.local_root.string());
    std::cout << theme::kv("Remote", "storage://" + plan.remote_root);
    std::cout << theme::kv("Transfer", fmt::format("{} files, {}", plan.items.size(),
                                                   format_bytes(plan.total_bytes())));
    std::cout << theme::kv("Up to date", std::to_string(plan.skipped.size()));
    for (const auto& item : plan.items) {
        std::cout << theme::log(fmt::format("{} ({})", item.rel_path, format_bytes(item.size)));
    }
    for (const auto& rej : plan.rejected) {
        std::cout << theme::warn(fmt::format("{}: {}", rej.path, rej.error.message));
    }
}

void print_sync_report(const SyncReport& report) {
    for (const auto& r : report.failed) {
        std::cout << theme::fail(r.error ? r.error->describe() : r.item.rel_path);
    }
    for (const auto& rej : report.rejected) {
        std::cout << theme::warn(fmt::format("{}: {}", rej.path, rej.error.message));
    }
    std::string summary = fmt::format("{} verified, {} failed, {} rejected, {} up to date",
                                      report.verified.size(), report.failed.size(),
                                      report.rejected.size(), report.skipped);
    std::cout << (report.ok() ? theme::ok(summary) : theme::fail(summary));
}
