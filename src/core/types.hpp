#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <stdexcept>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Raised when a scheduler is built from an invalid configuration.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Everything the job runner needs besides the target itself
struct SyncOptions {
    std::vector<std::string> sync_command;       // program + subcommand, e.g. {"wandb", "sync"}
    std::vector<std::string> wandb_options;      // forwarded verbatim before "."
    double timeout = 120;                        // seconds; <= 0 means no timeout
    bool dry_run = false;                        // log the invocation instead of running it
};

struct SyncerConfig {
    std::filesystem::path command_dir;
    double wait = 1;                             // minimum seconds between cycle starts
    int max_workers = 1;
    SyncOptions sync;
    bool single_pass = false;                    // run one cycle, drain, return
    std::string log_level = "info";
    std::string log_file;                        // optional, appended in addition to stderr
};
