#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

enum class JobOutcome { Success, Failure, Timeout };

struct JobResult {
    JobOutcome outcome = JobOutcome::Success;
    int exit_code = 0;
    std::string reason;              // empty on success

    static JobResult success() { return {JobOutcome::Success, 0, ""}; }
    static JobResult failure(int code, std::string why) { return {JobOutcome::Failure, code, std::move(why)}; }
    static JobResult timeout() { return {JobOutcome::Timeout, -1, "timed out"}; }

    bool ok() const { return outcome == JobOutcome::Success; }
    bool timed_out() const { return outcome == JobOutcome::Timeout; }
};

const char* outcome_name(JobOutcome outcome);

// Full argv of the sync invocation: sync_command, options, then ".".
std::vector<std::string> build_sync_command(const SyncOptions& options);

// Run the sync tool once with target as working directory. Blocks for at
// most options.timeout seconds; the child is terminated when it overruns.
JobResult run_sync_job(const std::filesystem::path& target, const SyncOptions& options);
