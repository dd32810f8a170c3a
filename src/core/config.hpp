#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

class Config {
public:
    // Load ~/.wosh/config.yaml (or the given file) on top of the defaults.
    // A missing file is not an error.
    static Result<Config> load(const fs::path& path = get_config_path());

    // Defaults only, no file involved
    static Config defaults();

    const SyncerConfig& syncer() const { return syncer_; }
    SyncerConfig& syncer() { return syncer_; }

public:
    Config() = default;

private:
    SyncerConfig syncer_;
};

// $WANDB_OSH_COMMAND_DIR if set, otherwise ~/.wandb_osh_command_dir
fs::path default_command_dir();

// Reject settings the scheduler cannot run with
Result<void> validate(const SyncerConfig& config);

// Create default config (no-op if one already exists)
Result<void> create_default_config(const fs::path& path = get_config_path());
