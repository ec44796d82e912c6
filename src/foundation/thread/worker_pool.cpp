/// @file worker_pool.cpp
/// @brief WorkerPool implementation wrapping kcenon thread_system.

#include "warden/foundation/worker_pool.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <mutex>
#include <vector>

namespace warden::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: warden -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::High:   return kcenon::thread::job_priority::high;
        case JobPriority::Normal: return kcenon::thread::job_priority::normal;
        case JobPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct WorkerPool::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<bool> running{false};
    std::atomic<uint64_t> nextJobId{1};
    std::mutex stopMutex;
};

// ---------------------------------------------------------------------------
// Construction / Destruction
// ---------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("WardenWorkerPool");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
    impl_->workers = numThreads;
    impl_->running.store(true, std::memory_order_release);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

// ---------------------------------------------------------------------------
// submit()
// ---------------------------------------------------------------------------
SecurityResult<void> WorkerPool::submit(JobFunc job, JobPriority priority) {
    if (!impl_->running.load(std::memory_order_acquire)) {
        return SecurityResult<void>::err(ErrorCode::JobScheduleFailed,
                                         "worker pool is stopped");
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto threadJob = kcenon::thread::job_builder()
        .name("warden_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job)]() -> kcenon::common::VoidResult {
            fn();
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        return SecurityResult<void>::err(ErrorCode::JobScheduleFailed,
                                         "failed to enqueue job");
    }
    return SecurityResult<void>::ok();
}

// ---------------------------------------------------------------------------
// shutdown() / accessors
// ---------------------------------------------------------------------------
void WorkerPool::shutdown() {
    if (!impl_) {
        return;
    }
    std::lock_guard lock(impl_->stopMutex);
    if (!impl_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    impl_->pool->stop(false); // graceful: wait for running jobs
}

std::size_t WorkerPool::workerCount() const noexcept {
    return impl_->workers;
}

bool WorkerPool::isRunning() const noexcept {
    return impl_->running.load(std::memory_order_acquire);
}

} // namespace warden::foundation
