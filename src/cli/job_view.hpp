#pragma once

#include <string>
#include <vector>
#include <managers/job_model.hpp>
#include <managers/log_stream.hpp>
#include <managers/storage_sync.hpp>

// Status name colored by state (green succeeded, red failed, ...)
std::string status_label(JobStatus status);

// Detailed panel for `job status` / `job wait`.
void print_job(const Job& job);

// One row per job for `job list`.
void print_job_table(const std::vector<Job>& jobs);

// Write a log chunk's data to stdout or stderr.
void print_log_chunk(const LogChunk& chunk);

void print_plan(const TransferPlan& plan);
void print_sync_report(const SyncReport& report);
