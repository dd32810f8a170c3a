#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "job_runner.hpp"

class WorkerPool;

// Opaque ticket for one submitted job. Copyable; all copies observe the
// same completion.
class JobHandle {
public:
    JobHandle() = default;

    std::uint64_t id() const { return id_; }
    bool valid() const { return future_.valid(); }

    bool operator<(const JobHandle& other) const { return id_ < other.id_; }
    bool operator==(const JobHandle& other) const { return id_ == other.id_; }

private:
    friend class WorkerPool;
    JobHandle(std::uint64_t id, std::shared_future<JobResult> future)
        : id_(id), future_(std::move(future)) {}

    std::uint64_t id_ = 0;
    std::shared_future<JobResult> future_;
};

// Fixed set of threads running submitted jobs; at most worker_count() run
// at once, the rest wait in FIFO order.
class WorkerPool {
public:
    using Task = std::function<JobResult()>;

    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. Never blocks on running work.
    JobHandle submit(Task task);

    // True once the task has returned or thrown.
    bool is_done(const JobHandle& handle) const;

    // Block until the task finishes. Rethrows whatever the task threw.
    JobResult result(const JobHandle& handle) const;

    void wait_all(const std::vector<JobHandle>& handles) const;

    // Run everything already queued, then join the threads. Idempotent.
    void shutdown();

    int worker_count() const { return workers_; }
    std::size_t queued() const;

private:
    void worker_loop(int worker_id);

    int workers_;
    std::atomic<bool> stopping_{false};
    std::uint64_t next_id_ = 1;

    mutable std::mutex queue_mutex_;
    std::condition_variable job_available_;
    std::queue<std::packaged_task<JobResult()>> queue_;

    std::vector<std::thread> threads_;
};
