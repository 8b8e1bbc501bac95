#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "ssg/foundation/error_code.hpp"
#include "ssg/foundation/task_executor.hpp"

using namespace ssg::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(TaskExecutorTest, DefaultConstruction) {
    TaskExecutor executor;
    // Should not crash; pool is started with hardware_concurrency threads.
}

TEST(TaskExecutorTest, MoveConstruction) {
    TaskExecutor a(2);
    TaskExecutor b(std::move(a));
    auto result = b.callWithTimeout<int>(
        "move", [] { return ServiceResult<int>::ok(1); }, 1000ms);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 1);
}

// ---------------------------------------------------------------------------
// submit
// ---------------------------------------------------------------------------

TEST(TaskExecutorTest, SubmitRunsTask) {
    TaskExecutor executor(2);
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();

    auto result = executor.submit("signal", [done] { done->set_value(); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

// ---------------------------------------------------------------------------
// callWithTimeout
// ---------------------------------------------------------------------------

TEST(TaskExecutorTest, NonPositiveTimeoutIsRejected) {
    TaskExecutor executor(2);
    std::atomic<bool> ran{false};

    auto zero = executor.callWithTimeout<int>(
        "unbounded", [&ran] { ran = true; return ServiceResult<int>::ok(1); }, 0ms);
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidArgument);

    auto negative = executor.callWithTimeout<int>(
        "unbounded", [&ran] { ran = true; return ServiceResult<int>::ok(1); }, -5ms);
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidArgument);

    EXPECT_FALSE(ran.load());
}

TEST(TaskExecutorTest, ReturnsValueWithinDeadline) {
    TaskExecutor executor(2);
    auto result = executor.callWithTimeout<std::string>(
        "fast", [] { return ServiceResult<std::string>::ok("done"); }, 1000ms);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "done");
}

TEST(TaskExecutorTest, PropagatesCallableError) {
    TaskExecutor executor(2);
    auto result = executor.callWithTimeout<int>(
        "rejecting",
        [] { return ServiceResult<int>::err(ServiceError(ErrorCode::CredentialRejected, "no")); },
        1000ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CredentialRejected);
}

TEST(TaskExecutorTest, MissedDeadlineYieldsTimeout) {
    TaskExecutor executor(2);
    auto release = std::make_shared<std::promise<void>>();
    auto gate = release->get_future().share();

    auto result = executor.callWithTimeout<void>(
        "slow",
        [gate] {
            gate.wait();
            return ServiceResult<void>::ok();
        },
        50ms);
    release->set_value();

    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
    EXPECT_TRUE(result.error().isSystemError());
    ASSERT_NE(result.error().context<std::chrono::milliseconds>(), nullptr);
    EXPECT_EQ(*result.error().context<std::chrono::milliseconds>(), 50ms);
}

TEST(TaskExecutorTest, ExceptionBecomesSystemError) {
    TaskExecutor executor(2);
    auto result = executor.callWithTimeout<int>(
        "throwing",
        []() -> ServiceResult<int> { throw std::runtime_error("backend down"); },
        1000ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SystemError);
    EXPECT_NE(result.error().message().find("backend down"), std::string::npos);
}

TEST(TaskExecutorTest, NonStandardExceptionBecomesSystemError) {
    TaskExecutor executor(1);
    auto result = executor.callWithTimeout<int>(
        "throwing_int",
        []() -> ServiceResult<int> { throw 42; },
        1000ms);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SystemError);
}

TEST(TaskExecutorTest, ConcurrentCallsAllComplete) {
    TaskExecutor executor(4);
    std::atomic<int> completed{0};

    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&executor, &completed, i] {
            auto result = executor.callWithTimeout<int>(
                "concurrent", [i] { return ServiceResult<int>::ok(i); }, 2000ms);
            if (result.hasValue() && result.value() == i) {
                completed.fetch_add(1);
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }
    EXPECT_EQ(completed.load(), 8);
}

// ---------------------------------------------------------------------------
// Queue cap
// ---------------------------------------------------------------------------

namespace {

/// Occupies one worker until released; started() resolves once it runs.
struct ParkedTask {
    ParkedTask()
        : startedPromise(std::make_shared<std::promise<void>>()),
          releasePromise(std::make_shared<std::promise<void>>()),
          started(startedPromise->get_future()),
          gate(releasePromise->get_future().share()) {}

    TaskExecutor::TaskFunc task() {
        return [startedPromise = startedPromise, gate = gate] {
            startedPromise->set_value();
            gate.wait();
        };
    }

    void release() { releasePromise->set_value(); }

    std::shared_ptr<std::promise<void>> startedPromise;
    std::shared_ptr<std::promise<void>> releasePromise;
    std::future<void> started;
    std::shared_future<void> gate;
};

bool waitForEmptyQueue(const TaskExecutor& executor, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (executor.queued() != 0) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

}  // namespace

TEST(TaskExecutorTest, FullQueueRejectsWithoutWaiting) {
    TaskExecutor executor(1, 1);
    ParkedTask running;
    ASSERT_TRUE(executor.submit("running", running.task()).hasValue());
    ASSERT_EQ(running.started.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(executor.queued(), 0u);

    ParkedTask waiting;
    ASSERT_TRUE(executor.submit("waiting", waiting.task()).hasValue());
    EXPECT_EQ(executor.queued(), 1u);

    auto started = std::chrono::steady_clock::now();
    auto rejected = executor.callWithTimeout<int>(
        "overflow", [] { return ServiceResult<int>::ok(1); }, 2000ms);
    auto waited = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::TaskScheduleFailed);
    EXPECT_LT(waited, 1000ms);

    running.release();
    ASSERT_EQ(waiting.started.wait_for(2s), std::future_status::ready);
    waiting.release();
    ASSERT_TRUE(waitForEmptyQueue(executor, 2000ms));

    auto accepted = executor.callWithTimeout<int>(
        "after_release", [] { return ServiceResult<int>::ok(7); }, 2000ms);
    ASSERT_TRUE(accepted.hasValue());
    EXPECT_EQ(accepted.value(), 7);
}

TEST(TaskExecutorTest, SequentialCallsNeverTripTheCap) {
    TaskExecutor executor(1, 1);
    for (int i = 0; i < 50; ++i) {
        auto result = executor.callWithTimeout<int>(
            "sequential", [i] { return ServiceResult<int>::ok(i); }, 2000ms);
        ASSERT_TRUE(result.hasValue()) << i;
        EXPECT_EQ(result.value(), i);
    }
}

TEST(TaskExecutorTest, UncappedExecutorQueuesBehindBusyWorker) {
    TaskExecutor executor(1);
    ParkedTask running;
    ASSERT_TRUE(executor.submit("running", running.task()).hasValue());
    ASSERT_EQ(running.started.wait_for(2s), std::future_status::ready);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(executor.submit("behind", [] {}).hasValue());
    }
    EXPECT_EQ(executor.queued(), 3u);

    running.release();
    EXPECT_TRUE(waitForEmptyQueue(executor, 2000ms));
}
