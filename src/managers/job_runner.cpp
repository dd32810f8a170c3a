#include "job_runner.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <climits>

const char* outcome_name(JobOutcome outcome) {
    switch (outcome) {
        case JobOutcome::Success: return "success";
        case JobOutcome::Failure: return "failure";
        case JobOutcome::Timeout: return "timeout";
    }
    return "?";
}

std::vector<std::string> build_sync_command(const SyncOptions& options) {
    std::vector<std::string> cmd = options.sync_command;
    cmd.insert(cmd.end(), options.wandb_options.begin(), options.wandb_options.end());
    cmd.push_back(".");
    return cmd;
}

JobResult run_sync_job(const std::filesystem::path& target, const SyncOptions& options) {
    auto cmd = build_sync_command(options);
    std::string cmd_str = fmt::format("{}", fmt::join(cmd, " "));

    if (options.dry_run) {
        log_debug("Testing mode enabled. Not actually calling wandb.");
        log_info(fmt::format("Command would be: {} in {}", cmd_str, target.string()));
        return JobResult::success();
    }

    log_debug(fmt::format("Running {} in {}", cmd_str, target.string()));

    std::vector<std::string> args(cmd.begin() + 1, cmd.end());
    auto proc = platform::spawn(cmd.front(), args, "", target.string());
    if (!proc.valid()) {
        log_error(fmt::format("Failed to start {} in {}", cmd.front(), target.string()));
        return JobResult::failure(-1, "spawn failed");
    }

    int code;
    if (options.timeout <= 0) {
        code = proc.wait();
    } else {
        double ms = options.timeout * 1000.0;
        int timeout_ms = ms >= INT_MAX ? INT_MAX : static_cast<int>(ms);
        auto status = proc.wait_for(timeout_ms);
        if (!status) {
            proc.terminate();
            return JobResult::timeout();
        }
        code = *status;
    }

    if (code == 127) {
        log_error(fmt::format("{} not found (syncing {})", cmd.front(), target.string()));
        return JobResult::failure(code, "command not found");
    }
    if (code != 0) {
        log_error(fmt::format("'{}' in {} exited with code {}", cmd_str, target.string(), code));
        return JobResult::failure(code, fmt::format("exit code {}", code));
    }
    return JobResult::success();
}
