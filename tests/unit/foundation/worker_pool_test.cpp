#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "warden/foundation/error_code.hpp"
#include "warden/foundation/worker_pool.hpp"

using namespace warden::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(WorkerPoolTest, CustomThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.workerCount(), 3u);
    EXPECT_TRUE(pool.isRunning());
}

TEST(WorkerPoolTest, ZeroThreadsClampsToOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.workerCount(), 1u);
}

// ---------------------------------------------------------------------------
// submit()
// ---------------------------------------------------------------------------

TEST(WorkerPoolTest, SubmitRunsJob) {
    WorkerPool pool(2);
    std::promise<void> done;
    auto future = done.get_future();

    auto result = pool.submit([&done] { done.set_value(); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST(WorkerPoolTest, AllPriorityLevelsAccepted) {
    WorkerPool pool(2);
    std::atomic<int> counter{0};

    EXPECT_TRUE(pool.submit([&] { counter++; }, JobPriority::High).hasValue());
    EXPECT_TRUE(pool.submit([&] { counter++; }, JobPriority::Normal).hasValue());
    EXPECT_TRUE(pool.submit([&] { counter++; }, JobPriority::Low).hasValue());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (counter.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(counter.load(), 3);
}

TEST(WorkerPoolTest, SubmitAfterShutdownFails) {
    WorkerPool pool(2);
    pool.shutdown();
    EXPECT_FALSE(pool.isRunning());

    auto result = pool.submit([] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::JobScheduleFailed);
}

TEST(WorkerPoolTest, ShutdownIsIdempotent) {
    WorkerPool pool(2);
    pool.shutdown();
    pool.shutdown();
    EXPECT_FALSE(pool.isRunning());
}

// ---------------------------------------------------------------------------
// invoke()
// ---------------------------------------------------------------------------

TEST(WorkerPoolTest, InvokeReturnsValue) {
    WorkerPool pool(2);
    auto result = pool.invoke<int>([] { return SecurityResult<int>::ok(7); }, 0ms);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 7);
}

TEST(WorkerPoolTest, InvokePropagatesError) {
    WorkerPool pool(2);
    auto result = pool.invoke<int>(
        [] { return SecurityResult<int>::err(ErrorCode::StoreUnavailable, "down"); }, 0ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::StoreUnavailable);
}

TEST(WorkerPoolTest, InvokeRunsOnWorkerThread) {
    WorkerPool pool(1);
    auto caller = std::this_thread::get_id();
    auto result = pool.invoke<bool>(
        [caller] { return SecurityResult<bool>::ok(std::this_thread::get_id() != caller); },
        1000ms);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value());
}

TEST(WorkerPoolTest, InvokeTimesOutButJobCompletes) {
    WorkerPool pool(1);
    std::atomic<bool> committed{false};

    auto result = pool.invoke<int>(
        [&committed] {
            std::this_thread::sleep_for(200ms);
            committed.store(true);
            return SecurityResult<int>::ok(1);
        },
        20ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::Timeout);

    // The side effect stands after the caller gave up.
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!committed.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(committed.load());
}

TEST(WorkerPoolTest, InvokeConvertsExceptionToError) {
    WorkerPool pool(1);
    auto result = pool.invoke<int>(
        []() -> SecurityResult<int> { throw std::runtime_error("boom"); }, 1000ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.code(), ErrorCode::Unknown);
    EXPECT_NE(std::string(result.error().message()).find("boom"), std::string::npos);
}

TEST(WorkerPoolTest, ConcurrentInvokers) {
    WorkerPool pool(4);
    constexpr int kCallers = 16;
    std::atomic<int> sum{0};

    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&pool, &sum, i] {
            auto r = pool.invoke<int>([i] { return SecurityResult<int>::ok(i); }, 0ms);
            if (r) {
                sum.fetch_add(r.value());
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }
    EXPECT_EQ(sum.load(), kCallers * (kCallers - 1) / 2);
}
