/// @file task_executor.cpp
/// @brief TaskExecutor implementation wrapping kcenon thread_system.

#include "ssg/foundation/task_executor.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <vector>

#include "ssg/foundation/service_logger.hpp"

namespace ssg::foundation {

struct TaskExecutor::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextTaskId{1};
    std::size_t maxQueued = 0;
    // Shared with queued jobs, which may outlive a moved-from executor.
    std::shared_ptr<std::atomic<std::size_t>> queued =
        std::make_shared<std::atomic<std::size_t>>(0);
};

TaskExecutor::TaskExecutor(std::size_t numThreads, std::size_t maxQueued)
    : impl_(std::make_unique<Impl>())
{
    impl_->maxQueued = maxQueued;
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("ssg_task_executor");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    auto count = std::max<std::size_t>(numThreads, 1);
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskExecutor::~TaskExecutor() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: let in-flight calls finish
    }
}

TaskExecutor::TaskExecutor(TaskExecutor&&) noexcept = default;
TaskExecutor& TaskExecutor::operator=(TaskExecutor&&) noexcept = default;

ServiceResult<void> TaskExecutor::submit(std::string_view name, TaskFunc task) {
    auto queued = impl_->queued;

    // Reserve a queue slot before enqueueing so the cap holds under
    // contention. The slot is released as soon as a worker starts the job.
    auto current = queued->load(std::memory_order_relaxed);
    do {
        if (impl_->maxQueued != 0 && current >= impl_->maxQueued) {
            SSG_LOG_WARN(LogCategory::Core,
                         "executor saturated, rejecting task " + std::string(name));
            return ServiceResult<void>::err(ServiceError(
                ErrorCode::TaskScheduleFailed, "executor saturated", impl_->maxQueued));
        }
    } while (!queued->compare_exchange_weak(current, current + 1, std::memory_order_acq_rel));

    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);

    auto threadJob = kcenon::thread::job_builder()
        .name(std::string(name) + "#" + std::to_string(id))
        .work([fn = std::move(task), queued]() -> kcenon::common::VoidResult {
            queued->fetch_sub(1, std::memory_order_acq_rel);
            fn();
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        queued->fetch_sub(1, std::memory_order_acq_rel);
        SSG_LOG_ERROR(LogCategory::Core, "failed to enqueue task " + std::string(name));
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TaskScheduleFailed, "failed to enqueue task"));
    }
    return ServiceResult<void>::ok();
}

std::size_t TaskExecutor::queued() const noexcept {
    return impl_->queued->load(std::memory_order_acquire);
}

}  // namespace ssg::foundation
