#include "test_support.hpp"
#include <managers/worker_pool.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

// Blocks tasks until released, counting how many run at once.
struct Gate {
    std::mutex m;
    std::condition_variable cv;
    bool open = false;
    int running = 0;
    int max_running = 0;
    int started = 0;

    JobResult pass() {
        std::unique_lock<std::mutex> lock(m);
        ++running;
        ++started;
        max_running = std::max(max_running, running);
        cv.notify_all();
        cv.wait_for(lock, 5s, [this] { return open; });
        --running;
        return JobResult::success();
    }

    bool wait_started(int n) {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, 5s, [&] { return started >= n; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(m);
        open = true;
        cv.notify_all();
    }
};

TEST(WorkerPool, RejectsZeroWorkers) {
    EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPool, ResultReturnsTaskValue) {
    WorkerPool pool(1);
    auto h = pool.submit([] { return JobResult::timeout(); });
    EXPECT_TRUE(h.valid());
    JobResult r = pool.result(h);
    EXPECT_TRUE(r.timed_out());
    EXPECT_TRUE(pool.is_done(h));
}

TEST(WorkerPool, HandlesAreDistinct) {
    WorkerPool pool(2);
    auto a = pool.submit([] { return JobResult::success(); });
    auto b = pool.submit([] { return JobResult::success(); });
    EXPECT_NE(a.id(), b.id());
    pool.wait_all({a, b});
    EXPECT_TRUE(pool.is_done(a));
    EXPECT_TRUE(pool.is_done(b));
}

TEST(WorkerPool, ExceptionIsRethrownAndPoolSurvives) {
    WorkerPool pool(1);
    auto bad = pool.submit([]() -> JobResult { throw std::runtime_error("wandb exploded"); });
    EXPECT_THROW(pool.result(bad), std::runtime_error);

    auto good = pool.submit([] { return JobResult::success(); });
    EXPECT_TRUE(pool.result(good).ok());
}

TEST(WorkerPool, SubmitDoesNotBlockAndIsDonePolls) {
    Gate gate;
    WorkerPool pool(1);
    auto first = pool.submit([&] { return gate.pass(); });
    ASSERT_TRUE(gate.wait_started(1));

    auto start = std::chrono::steady_clock::now();
    auto second = pool.submit([&] { return gate.pass(); });
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);

    EXPECT_FALSE(pool.is_done(first));
    EXPECT_FALSE(pool.is_done(second));
    EXPECT_EQ(pool.queued(), 1u);

    gate.release();
    pool.wait_all({first, second});
    EXPECT_TRUE(pool.is_done(first));
    EXPECT_TRUE(pool.is_done(second));
}

TEST(WorkerPool, ConcurrencyIsBoundedByWorkerCount) {
    Gate gate;
    WorkerPool pool(2);
    std::vector<JobHandle> handles;
    for (int i = 0; i < 5; ++i) {
        handles.push_back(pool.submit([&] { return gate.pass(); }));
    }
    ASSERT_TRUE(gate.wait_started(2));
    std::this_thread::sleep_for(100ms);
    {
        std::lock_guard<std::mutex> lock(gate.m);
        EXPECT_EQ(gate.started, 2);
    }
    gate.release();
    pool.wait_all(handles);
    EXPECT_EQ(gate.started, 5);
    EXPECT_LE(gate.max_running, 2);
}

TEST(WorkerPool, ShutdownFinishesQueuedWork) {
    std::atomic<int> ran{0};
    std::vector<JobHandle> handles;
    {
        WorkerPool pool(1);
        for (int i = 0; i < 3; ++i) {
            handles.push_back(pool.submit([&] {
                std::this_thread::sleep_for(20ms);
                ++ran;
                return JobResult::success();
            }));
        }
        pool.shutdown();
        pool.shutdown();  // idempotent
        EXPECT_THROW(pool.submit([] { return JobResult::success(); }), std::runtime_error);
    }
    EXPECT_EQ(ran.load(), 3);
}
