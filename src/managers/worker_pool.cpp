#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>
#include <stdexcept>

WorkerPool::WorkerPool(int workers) : workers_(workers) {
    if (workers < 1) {
        throw std::invalid_argument(fmt::format("worker pool needs at least one thread (got {})", workers));
    }
    threads_.reserve(workers_);
    for (int i = 0; i < workers_; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this, i);
    }
    log_debug(fmt::format("Worker pool started with {} thread(s)", workers_));
}

WorkerPool::~WorkerPool() {
    shutdown();
}

JobHandle WorkerPool::submit(Task task) {
    std::packaged_task<JobResult()> packaged(std::move(task));
    std::shared_future<JobResult> future = packaged.get_future().share();

    std::uint64_t id;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on a worker pool that is shutting down");
        }
        id = next_id_++;
        queue_.push(std::move(packaged));
    }
    job_available_.notify_one();
    return JobHandle(id, std::move(future));
}

bool WorkerPool::is_done(const JobHandle& handle) const {
    if (!handle.valid()) return false;
    return handle.future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

JobResult WorkerPool::result(const JobHandle& handle) const {
    if (!handle.valid()) {
        throw std::invalid_argument("result() on an empty job handle");
    }
    return handle.future_.get();
}

void WorkerPool::wait_all(const std::vector<JobHandle>& handles) const {
    for (const auto& h : handles) {
        if (h.valid()) h.future_.wait();
    }
}

std::size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && threads_.empty()) return;
        stopping_ = true;
    }
    job_available_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    log_debug("Worker pool stopped");
}

void WorkerPool::worker_loop(int worker_id) {
    while (true) {
        std::packaged_task<JobResult()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            job_available_.wait(lock, [this] { return !queue_.empty() || stopping_; });

            // Drain the queue before honoring shutdown so no handle is left
            // without a result.
            if (queue_.empty()) break;

            task = std::move(queue_.front());
            queue_.pop();
        }

        // packaged_task stores anything the job throws in its future
        task();
    }
    log_debug(fmt::format("Worker {} exiting", worker_id));
}
