#include <cmath>
#include <csignal>
#include <limits>
#include <stdexcept>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "core/utils.hpp"
#include "managers/command_source.hpp"
#include "managers/sync_scheduler.hpp"

namespace {

SyncScheduler* g_scheduler = nullptr;

void handle_signal(int) {
    if (g_scheduler) g_scheduler->stop();
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("wosh", "[flags]", "Watch the command directory and sync runs");
    std::cout << theme::usage_row("wosh watch", "[flags]", "Same as above");
    std::cout << theme::usage_row("wosh trigger", "<dir>", "Request a sync of <dir>");
    std::cout << theme::usage_row("wosh sync", "<dir>", "Sync <dir> once, right now");
    std::cout << theme::usage_row("wosh init", "", "Write a default ~/.wosh/config.yaml");
    std::cout << theme::section("Flags");
    std::cout << theme::usage_row("--command-dir", "<dir>", "Directory watched for *.command files");
    std::cout << theme::usage_row("--wait", "<secs>", "Minimum time between scans (default 1)");
    std::cout << theme::usage_row("--timeout", "<secs>", "Sync timeout, <= 0 disables (default 120)");
    std::cout << theme::usage_row("--max-workers", "<n>", "Concurrent syncs (default 1)");
    std::cout << theme::usage_row("--dry-run", "", "Log the sync command instead of running it");
    std::cout << theme::usage_row("--once", "", "Run a single cycle, wait for its syncs, exit");
    std::cout << theme::usage_row("--log-level", "<level>", "debug, info, warning or error");
    std::cout << theme::usage_row("--log-file", "<path>", "Also append log lines to this file");
    std::cout << theme::usage_row("--config", "<path>", "Config file (default ~/.wosh/config.yaml)");
    std::cout << theme::usage_row("--", "<opts...>", "Everything after -- is passed to wandb sync");
    std::cout << "\n";
}

struct Invocation {
    std::string command = "watch";
    std::string argument;
    std::optional<std::string> config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> wandb_options;
    bool has_wandb_options = false;
};

// Flags that consume the following argument
bool takes_value(const std::string& flag) {
    return flag == "--command-dir" || flag == "--wait" || flag == "--timeout" ||
           flag == "--max-workers" || flag == "--log-level" || flag == "--log-file" ||
           flag == "--config";
}

Invocation parse_args(int argc, char** argv) {
    Invocation inv;
    bool command_seen = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--") {
            inv.has_wandb_options = true;
            for (++i; i < argc; ++i) inv.wandb_options.push_back(argv[i]);
            break;
        }
        if (arg == "--dry-run" || arg == "--once") {
            inv.overrides.emplace_back(arg, "");
        } else if (takes_value(arg)) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--config") inv.config_path = value;
            else inv.overrides.emplace_back(arg, value);
        } else if (arg.rfind("--", 0) == 0) {
            throw std::runtime_error("Unknown flag: " + arg);
        } else if (!command_seen) {
            inv.command = arg;
            command_seen = true;
        } else if (inv.argument.empty()) {
            inv.argument = arg;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
    return inv;
}

void apply_overrides(const Invocation& inv, SyncerConfig& config) {
    for (const auto& [flag, value] : inv.overrides) {
        if (flag == "--command-dir") {
            config.command_dir = expand_user(value);
        } else if (flag == "--wait") {
            config.wait = safe_stod(value, -1);
            if (config.wait < 0) throw ConfigError("--wait expects a non-negative number, got " + value);
        } else if (flag == "--timeout") {
            double t = safe_stod(value, std::numeric_limits<double>::quiet_NaN());
            if (std::isnan(t)) throw ConfigError("--timeout expects a number, got " + value);
            config.sync.timeout = t;
        } else if (flag == "--max-workers") {
            config.max_workers = safe_stoi(value, 0);
        } else if (flag == "--dry-run") {
            config.sync.dry_run = true;
        } else if (flag == "--once") {
            config.single_pass = true;
        } else if (flag == "--log-level") {
            config.log_level = value;
        } else if (flag == "--log-file") {
            config.log_file = expand_user(value).string();
        }
    }
    if (inv.has_wandb_options) {
        config.sync.wandb_options = inv.wandb_options;
    }
}

void setup_logging(const SyncerConfig& config) {
    auto level = parse_log_level(config.log_level);
    if (!level) {
        throw ConfigError("Unknown log level: " + config.log_level);
    }
    set_log_level(*level);
    set_log_file(config.log_file);
}

} // namespace

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string first = argv[1];
            if (first == "--version") {
                std::cout << "wosh version " << WOSH_VERSION << "\n";
                return 0;
            }
            if (first == "--help" || first == "-h") {
                print_usage();
                return 0;
            }
        }

        Invocation inv = parse_args(argc, argv);
        if (inv.command != "watch" && inv.command != "sync" &&
            inv.command != "trigger" && inv.command != "init") {
            std::cout << theme::fail("Unknown command: " + inv.command);
            print_usage();
            return 1;
        }

        if (inv.command == "init") {
            fs::path path = inv.config_path ? fs::path(*inv.config_path) : get_config_path();
            auto r = create_default_config(path);
            if (r.is_err()) {
                std::cout << theme::fail(r.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + path.string());
            return 0;
        }

        auto loaded = inv.config_path ? Config::load(*inv.config_path) : Config::load();
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        SyncerConfig config = loaded.value.syncer();
        apply_overrides(inv, config);
        setup_logging(config);

        if (inv.command == "trigger") {
            if (inv.argument.empty()) {
                std::cout << theme::fail("Missing directory.");
                std::cout << theme::step("Usage: wosh trigger <dir>");
                return 1;
            }
            CommandSource source(config.command_dir);
            source.trigger(inv.argument);
            std::cout << theme::ok("Requested sync of " + normalize_target(inv.argument).string());
            return 0;
        }

        SyncScheduler scheduler(config);

        if (inv.command == "sync") {
            if (inv.argument.empty()) {
                std::cout << theme::fail("Missing directory.");
                std::cout << theme::step("Usage: wosh sync <dir>");
                return 1;
            }
            JobResult r = scheduler.sync(inv.argument);
            if (!r.ok()) {
                std::cout << theme::fail(fmt::format("Sync {}: {}", outcome_name(r.outcome), r.reason));
                return 1;
            }
            return 0;
        }

        g_scheduler = &scheduler;
        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);
        scheduler.loop();
        g_scheduler = nullptr;
        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
