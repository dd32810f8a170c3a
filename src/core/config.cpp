#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cmath>
#include <cstdlib>

namespace fs = std::filesystem;

// Accept either a YAML sequence or a single whitespace-separated string.
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsSequence()) {
        for (const auto& item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        std::string s = node.as<std::string>();
        size_t pos = 0;
        while (pos < s.size()) {
            size_t start = s.find_first_not_of(" \t", pos);
            if (start == std::string::npos) break;
            size_t end = s.find_first_of(" \t", start);
            if (end == std::string::npos) end = s.size();
            out.push_back(s.substr(start, end - start));
            pos = end;
        }
    }
    return out;
}

// Strict read: a present key with the wrong type is an error, not a silent default.
template <typename T>
static void read_key(const YAML::Node& root, const char* key, T& out) {
    const YAML::Node node = root[key];
    if (node && !node.IsNull()) {
        out = node.as<T>();
    }
}

fs::path default_command_dir() {
    const char* env = std::getenv(COMMAND_DIR_ENV);
    if (env && *env) {
        return expand_user(env);
    }
    return platform::home_dir() / COMMAND_DIR_NAME;
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

Config Config::defaults() {
    Config config;
    SyncerConfig& s = config.syncer_;
    s.command_dir = default_command_dir();
    s.wait = DEFAULT_POLL_WAIT_SECS;
    s.max_workers = DEFAULT_MAX_WORKERS;
    s.sync.sync_command = {DEFAULT_SYNC_PROGRAM, DEFAULT_SYNC_SUBCOMMAND};
    s.sync.timeout = DEFAULT_JOB_TIMEOUT_SECS;
    return config;
}

Result<Config> Config::load(const fs::path& path) {
    Config config = defaults();

    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: expected a mapping at top level", path.string()));
        }

        SyncerConfig& s = config.syncer_;
        if (root["command_dir"]) {
            s.command_dir = expand_user(root["command_dir"].as<std::string>());
        }
        read_key(root, "wait", s.wait);
        read_key(root, "max_workers", s.max_workers);
        read_key(root, "timeout", s.sync.timeout);
        read_key(root, "dry_run", s.sync.dry_run);
        read_key(root, "log_level", s.log_level);
        if (root["log_file"]) {
            s.log_file = expand_user(root["log_file"].as<std::string>()).string();
        }
        if (root["sync_command"]) {
            s.sync.sync_command = parse_string_list(root["sync_command"]);
        }
        if (root["wandb_options"]) {
            s.sync.wandb_options = parse_string_list(root["wandb_options"]);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<void> validate(const SyncerConfig& config) {
    if (config.max_workers < 1) {
        return Result<void>::Err(fmt::format("max_workers must be >= 1 (got {})", config.max_workers));
    }
    if (!std::isfinite(config.wait) || config.wait < 0) {
        return Result<void>::Err(fmt::format("wait must be >= 0 (got {})", config.wait));
    }
    if (std::isnan(config.sync.timeout)) {
        return Result<void>::Err("timeout must be a number of seconds");
    }
    if (config.sync.sync_command.empty()) {
        return Result<void>::Err("sync_command must name a program");
    }
    if (config.command_dir.empty()) {
        return Result<void>::Err("command_dir must not be empty");
    }
    return Result<void>::Ok();
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# wosh configuration
# Command-line flags override these values.

# Directory watched for *.command files (default: $WANDB_OSH_COMMAND_DIR or ~/.wandb_osh_command_dir)
# command_dir: "~/.wandb_osh_command_dir"

# Minimum seconds between two scans of the command directory
wait: 1

# Seconds before a sync is considered timed out and retried later (<= 0: never)
timeout: 120

# Maximum number of concurrent syncs
max_workers: 1

# Program used for syncing; options and "." are appended
sync_command: ["wandb", "sync"]

# Extra options passed on to the sync command
wandb_options: []

# Log the sync command instead of running it
dry_run: false

log_level: "info"
# log_file: "~/.wosh/wosh.log"
)";

    try {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
