#include "sync_scheduler.hpp"
#include <core/constants.hpp>
#include <core/config.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/singleton.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <stdexcept>

SyncScheduler::SyncScheduler(SyncerConfig config, SyncFunction sync_fn)
    : config_(std::move(config)), sync_fn_(std::move(sync_fn)), source_(config_.command_dir) {
    auto valid = validate(config_);
    if (valid.is_err()) {
        throw ConfigError(valid.error);
    }
    if (!sync_fn_) {
        SyncOptions options = config_.sync;
        sync_fn_ = [options](const fs::path& target) {
            return run_sync_job(target, options);
        };
    }
}

JobResult SyncScheduler::sync(const fs::path& target) const {
    return sync_fn_(target);
}

// ── Main loop ───────────────────────────────────────────────

void SyncScheduler::loop() {
    log_info(fmt::format("wosh v{}, starting to watch {}", WOSH_VERSION, config_.command_dir.string()));

    fs::create_directories(config_.command_dir);
    SingletonLock lock((config_.command_dir / LOCK_FILE_NAME).string());
    if (!lock.held()) {
        throw std::runtime_error(fmt::format(
            "Another wosh instance is already watching {}", config_.command_dir.string()));
    }

    WorkerPool pool(config_.max_workers);

    while (!stop_requested_) {
        auto start = std::chrono::steady_clock::now();

        run_cycle(pool);

        if (config_.single_pass) break;

        // Throttle: each cycle lasts at least `wait` seconds
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        double remaining = config_.wait - elapsed;
        while (remaining > 0 && !stop_requested_) {
            int slice = remaining * 1000 >= THROTTLE_SLICE_MS
                ? THROTTLE_SLICE_MS
                : static_cast<int>(remaining * 1000) + 1;
            platform::sleep_ms(slice);
            remaining -= slice / 1000.0;
        }
    }

    drain(pool);
    pool.shutdown();
    log_info("Stopped watching " + config_.command_dir.string());
}

void SyncScheduler::run_cycle(WorkerPool& pool) {
    collect_done(pool);
    auto command_files = ingest();
    schedule(pool);
    source_.remove(command_files);
}

void SyncScheduler::drain(WorkerPool& pool) {
    if (!in_flight_.empty()) {
        log_info(fmt::format("Waiting for {} running sync(s) to finish", in_flight_.size()));
        std::vector<JobHandle> handles;
        for (const auto& [id, job] : in_flight_) handles.push_back(job.handle);
        pool.wait_all(handles);
        collect_done(pool);
    }

    // Whatever never got a slot must survive the restart
    for (const auto& target : pending_) {
        if (fs::exists(source_.command_file_for(target))) continue;
        log_info(fmt::format("Leaving {} queued for the next run", target.string()));
        try {
            source_.trigger(target);
        } catch (const std::exception& e) {
            log_error(fmt::format("Could not re-signal {}: {}", target.string(), e.what()));
        }
    }
    pending_.clear();
}

// ── Reclaim ─────────────────────────────────────────────────

void SyncScheduler::collect_done(WorkerPool& pool) {
    std::vector<std::uint64_t> done;
    for (const auto& [id, job] : in_flight_) {
        if (pool.is_done(job.handle)) done.push_back(id);
    }
    for (auto id : done) {
        InFlightJob job = std::move(in_flight_.at(id));
        in_flight_.erase(id);
        reclaim(pool, job);
    }
}

void SyncScheduler::reclaim(WorkerPool& pool, const InFlightJob& job) {
    try {
        JobResult r = pool.result(job.handle);
        if (r.timed_out()) {
            log_warn(fmt::format("Syncing {} timed out. Trying later.", job.target.string()));
            requeue(job.target);
        } else {
            log_debug(fmt::format("Syncing {} finished: {}", job.target.string(), outcome_name(r.outcome)));
        }
    } catch (const std::exception& e) {
        log_error(fmt::format("Syncing {} failed: {}", job.target.string(), e.what()));
    } catch (...) {
        log_error(fmt::format("Syncing {} failed: unknown error", job.target.string()));
    }
}

void SyncScheduler::requeue(const fs::path& target) {
    // The command file makes the retry survive a restart; the set entry
    // makes it eligible in this process without waiting for a rescan.
    try {
        source_.trigger(target);
    } catch (const std::exception& e) {
        log_error(fmt::format("Could not re-signal {}: {}", target.string(), e.what()));
    }
    pending_.insert(normalize_target(target));
}

// ── Ingest ──────────────────────────────────────────────────

std::vector<CommandFile> SyncScheduler::ingest() {
    auto command_files = source_.scan();
    for (const auto& cf : command_files) {
        if (cf.target.empty()) continue;  // unreadable; already logged

        std::error_code ec;
        if (!fs::is_directory(cf.target, ec)) {
            log_error(fmt::format("Command file {} points to non-existing directory {}",
                                  cf.path.string(), cf.target.string()));
            continue;
        }

        fs::path target = normalize_target(cf.target);
        if (is_in_flight(target)) {
            log_debug(fmt::format("{} is already syncing; dropping request from {}",
                                  target.string(), cf.path.filename().string()));
            continue;
        }
        pending_.insert(target);
    }
    return command_files;
}

bool SyncScheduler::is_in_flight(const fs::path& target) const {
    for (const auto& [id, job] : in_flight_) {
        if (job.target == target) return true;
    }
    return false;
}

// ── Dispatch ────────────────────────────────────────────────

void SyncScheduler::schedule(WorkerPool& pool) {
    int available = config_.max_workers - static_cast<int>(in_flight_.size());
    while (available > 0 && !pending_.empty()) {
        auto it = pending_.begin();
        fs::path target = *it;
        pending_.erase(it);

        log_info(fmt::format("Syncing {}...", target.string()));
        SyncFunction fn = sync_fn_;
        JobHandle handle = pool.submit([fn, target]() { return fn(target); });
        in_flight_.emplace(handle.id(), InFlightJob{handle, target});
        --available;
    }
}
