#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <set>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "command_source.hpp"
#include "job_runner.hpp"
#include "worker_pool.hpp"

namespace fs = std::filesystem;

// Watches a command directory and runs one sync job per requested target,
// at most max_workers at a time. Targets whose sync times out are requeued,
// both in memory and by rewriting their command file.
//
// pending_ and in_flight_ belong to the thread running loop(); workers only
// report back through their JobHandle.
class SyncScheduler {
public:
    using SyncFunction = std::function<JobResult(const fs::path& target)>;

    // Throws ConfigError on an unusable config. sync_fn replaces the real
    // job runner when given.
    explicit SyncScheduler(SyncerConfig config, SyncFunction sync_fn = {});

    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    // Poll the command directory until stop() is called (or after one cycle
    // in single-pass mode). In-flight jobs are drained before returning.
    void loop();

    // Ask loop() to finish its current cycle and drain. Safe from any thread.
    void stop() { stop_requested_ = true; }
    bool stop_requested() const { return stop_requested_; }

    // Sync one directory right away on the calling thread.
    JobResult sync(const fs::path& target) const;

    // One reclaim/ingest/dispatch/cleanup pass against pool, no throttling.
    // Only valid from the thread that owns the scheduler state.
    void run_cycle(WorkerPool& pool);

    // Wait for every in-flight job and reclaim it; re-signal targets still pending.
    void drain(WorkerPool& pool);

    std::size_t pending_count() const { return pending_.size(); }
    std::size_t in_flight_count() const { return in_flight_.size(); }
    const SyncerConfig& config() const { return config_; }

private:
    struct InFlightJob {
        JobHandle handle;
        fs::path target;
    };

    void collect_done(WorkerPool& pool);
    void reclaim(WorkerPool& pool, const InFlightJob& job);
    std::vector<CommandFile> ingest();
    void schedule(WorkerPool& pool);
    void requeue(const fs::path& target);
    bool is_in_flight(const fs::path& target) const;

    SyncerConfig config_;
    SyncFunction sync_fn_;
    CommandSource source_;
    std::atomic<bool> stop_requested_{false};

    std::set<fs::path> pending_;
    std::map<std::uint64_t, InFlightJob> in_flight_;
};
