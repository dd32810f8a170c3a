#pragma once

// ── Scheduler defaults ──────────────────────────────────────
constexpr double DEFAULT_POLL_WAIT_SECS   = 1;     // Minimum time between cycle starts
constexpr double DEFAULT_JOB_TIMEOUT_SECS = 120;   // Per-job timeout for the sync tool
constexpr int    DEFAULT_MAX_WORKERS      = 1;
constexpr int    THROTTLE_SLICE_MS        = 100;   // Sleep granularity, bounds stop latency
constexpr int    PROCESS_POLL_MS          = 100;   // waitpid polling interval

// ── Command files ───────────────────────────────────────────
constexpr const char* COMMAND_FILE_EXT      = ".command";
constexpr const char* COMMAND_DIR_NAME      = ".wandb_osh_command_dir";
constexpr const char* COMMAND_DIR_ENV       = "WANDB_OSH_COMMAND_DIR";
constexpr const char* LOCK_FILE_NAME        = ".wosh.lock";

// ── Sync tool ───────────────────────────────────────────────
constexpr const char* DEFAULT_SYNC_PROGRAM    = "wandb";
constexpr const char* DEFAULT_SYNC_SUBCOMMAND = "sync";

// ── Config ──────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME  = ".wosh";
constexpr const char* CONFIG_FILE_NAME = "config.yaml";

constexpr const char* WOSH_VERSION = "0.4.0";
