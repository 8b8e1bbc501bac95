#pragma once

/// @file task_executor.hpp
/// @brief TaskExecutor wrapping kcenon thread_system for deadline-bounded
/// collaborator calls.

#include "ssg/foundation/service_result.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace ssg::foundation {

/// Worker pool used to put a deadline on calls into external collaborators
/// (identity provider, profile store, audit sink).
///
/// A call that misses its deadline keeps running on its worker; the caller
/// stops waiting and receives ErrorCode::Timeout. Everything the task
/// touches must therefore be owned by the task itself (captured by value
/// or by shared_ptr).
///
/// With a non-zero @c maxQueued, at most that many tasks may wait for a
/// worker. Further submissions fail fast with ErrorCode::TaskScheduleFailed
/// instead of queueing without bound behind hung calls.
///
/// Example:
/// @code
///   TaskExecutor executor(4);
///   auto profile = executor.callWithTimeout<std::optional<SecurityProfile>>(
///       "profile_store.find",
///       [store, id] { return store->find(id); },
///       std::chrono::milliseconds{500});
/// @endcode
class TaskExecutor {
public:
    using TaskFunc = std::function<void()>;

    explicit TaskExecutor(std::size_t numThreads = std::thread::hardware_concurrency(),
                          std::size_t maxQueued = 0);

    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;
    TaskExecutor(TaskExecutor&&) noexcept;
    TaskExecutor& operator=(TaskExecutor&&) noexcept;

    /// Enqueue a task on the pool.
    ///
    /// @return TaskScheduleFailed when the queue cap is reached or the
    ///         pool rejects the job.
    ServiceResult<void> submit(std::string_view name, TaskFunc task);

    /// Tasks submitted but not yet picked up by a worker.
    [[nodiscard]] std::size_t queued() const noexcept;

    /// Run @p fn on the pool and wait at most @p timeout for its result.
    ///
    /// A non-positive timeout is rejected with ErrorCode::InvalidArgument.
    /// An exception escaping @p fn is reported as ErrorCode::SystemError.
    template <typename T, typename Fn>
    ServiceResult<T> callWithTimeout(std::string_view name, Fn fn,
                                     std::chrono::milliseconds timeout);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// --- Template implementation ---

template <typename T, typename Fn>
ServiceResult<T> TaskExecutor::callWithTimeout(std::string_view name, Fn fn,
                                               std::chrono::milliseconds timeout) {
    static_assert(std::is_same_v<std::invoke_result_t<Fn&>, ServiceResult<T>>,
                  "callable must return ServiceResult<T>");

    auto failed = [&](std::string_view what) {
        return ServiceResult<T>::err(ServiceError(
            ErrorCode::SystemError, std::string(name) + ": " + std::string(what)));
    };

    if (timeout.count() <= 0) {
        return ServiceResult<T>::err(ServiceError(
            ErrorCode::InvalidArgument, std::string(name) + ": deadline must be positive"));
    }

    auto promise = std::make_shared<std::promise<ServiceResult<T>>>();
    auto future = promise->get_future();

    auto submitted = submit(name, [promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (submitted.hasError()) {
        return ServiceResult<T>::err(std::move(submitted).error());
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        return ServiceResult<T>::err(ServiceError(
            ErrorCode::Timeout, std::string(name) + ": deadline exceeded", timeout));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return failed(e.what());
    } catch (...) {
        return failed("non-standard exception");
    }
}

}  // namespace ssg::foundation
