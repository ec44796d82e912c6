#pragma once

/// @file worker_pool.hpp
/// @brief WorkerPool wrapping kcenon thread_system for bounded-time
///        execution of security operations.

#include "warden/foundation/security_result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace warden::foundation {

/// Priority levels for pool jobs.
///
/// Maps to kcenon::thread::job_priority internally.
enum class JobPriority { High, Normal, Low };

/// Fixed-size worker pool on top of kcenon's thread_pool.
///
/// invoke() runs a result-returning operation on a worker and waits at most
/// the given timeout. A timed-out caller gets ErrorCode::Timeout; the job
/// itself keeps running to completion, so side effects it commits stand.
///
/// Example:
/// @code
///   WorkerPool pool(4);
///   auto r = pool.invoke<bool>([] { return SecurityResult<bool>::ok(true); },
///                              std::chrono::milliseconds(500));
/// @endcode
class WorkerPool {
public:
    using JobFunc = std::function<void()>;

    explicit WorkerPool(std::size_t numThreads = std::thread::hardware_concurrency());

    /// Graceful stop: waits for jobs that are already running.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Enqueue a fire-and-forget job.
    /// @return JobScheduleFailed after shutdown() or when the pool rejects it.
    SecurityResult<void> submit(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Run @p fn on a worker and wait up to @p timeout for its result.
    /// A zero timeout waits indefinitely.
    template <typename T>
    SecurityResult<T> invoke(std::function<SecurityResult<T>()> fn,
                             std::chrono::milliseconds timeout,
                             JobPriority priority = JobPriority::Normal);

    /// Stop accepting work and join the workers.
    void shutdown();

    [[nodiscard]] std::size_t workerCount() const noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// --- Template implementation ---

template <typename T>
SecurityResult<T> WorkerPool::invoke(std::function<SecurityResult<T>()> fn,
                                     std::chrono::milliseconds timeout,
                                     JobPriority priority) {
    auto promise = std::make_shared<std::promise<SecurityResult<T>>>();
    auto future = promise->get_future();

    auto submitted = submit(
        [fn = std::move(fn), promise]() {
            try {
                promise->set_value(fn());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        },
        priority);
    if (!submitted) {
        return SecurityResult<T>::err(submitted.error());
    }

    if (timeout.count() > 0 &&
        future.wait_for(timeout) != std::future_status::ready) {
        return SecurityResult<T>::err(
            ErrorCode::Timeout,
            "operation exceeded " + std::to_string(timeout.count()) + "ms");
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return SecurityResult<T>::err(ErrorCode::Unknown,
                                      std::string("worker job failed: ") + e.what());
    }
}

} // namespace warden::foundation
