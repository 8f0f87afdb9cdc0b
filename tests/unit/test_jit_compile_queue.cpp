// File: tests/unit/test_jit_compile_queue.cpp
// Purpose: Verify the background and synchronous queue strategies with a
//          runner supplied by the test.
// Key invariants: Shutdown cancels queued tasks and refuses new ones; the
//                 synchronous strategy runs tasks before submit returns.
// Ownership/Lifetime: Each test owns its queue, runner state and tasks; the
//                     queue is shut down before the state it captures dies.
// Links: src/jit/CompileQueue.cpp

#include <gtest/gtest.h>

#include "JitTestBackend.hpp"
#include "jit/CompileQueue.hpp"
#include "jit/Trace.hpp"
#include "support/error.hpp"

#include <memory>
#include <mutex>
#include <vector>

using namespace kiln::jit;
using namespace kiln::jit::test;
using kiln::support::ErrorKind;

namespace
{

TaskPtr makeTask(uint64_t id, bool priority = false)
{
    return std::make_shared<CompilationTask>(
        id, std::weak_ptr<CompilationUnit>{}, CancellationToken{}, priority);
}

/// @brief Runner that records execution order and optionally blocks on a gate.
struct RecordingRunner
{
    std::shared_ptr<Gate> gate;
    InstalledCodeRegistry registry;
    std::mutex mu;
    std::vector<uint64_t> order;

    TaskRunner bind()
    {
        return [this](const TaskPtr &task)
        {
            {
                std::lock_guard<std::mutex> lock(mu);
                order.push_back(task->id());
            }
            if (gate)
                gate->waitFor(5000ms);
            task->commit(
                [&]
                {
                    CompiledArtifact artifact;
                    artifact.name = "task";
                    artifact.code = {0xc3};
                    return registry.install(task->id(), artifact, nullptr);
                });
        };
    }

    std::vector<uint64_t> ran()
    {
        std::lock_guard<std::mutex> lock(mu);
        return order;
    }
};

JitConfig backgroundConfig(unsigned workers, std::size_t capacity = 0)
{
    JitConfig cfg;
    cfg.mode = CompileMode::Background;
    cfg.workerCount = workers;
    cfg.queueCapacity = capacity;
    return cfg;
}

} // namespace

TEST(BackgroundCompileQueue, RunsSubmittedTasks)
{
    RecordingRunner runner;
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(2), runner.bind(), trace);
    EXPECT_EQ(queue->mode(), CompileMode::Background);

    std::vector<TaskPtr> tasks;
    for (uint64_t id = 1; id <= 4; ++id)
    {
        tasks.push_back(makeTask(id));
        ASSERT_TRUE(queue->submit(tasks.back()).hasValue());
    }
    for (const TaskPtr &task : tasks)
    {
        auto result = queue->wait(task, 2000ms);
        ASSERT_TRUE(result.hasValue());
        EXPECT_FALSE(queue->isCompiling(task));
    }
    EXPECT_EQ(runner.registry.size(), 4u);
    queue->shutdown();
}

TEST(BackgroundCompileQueue, ShutdownCancelsQueuedTasksAndLetsRunningFinish)
{
    RecordingRunner runner;
    runner.gate = std::make_shared<Gate>();
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(1), runner.bind(), trace);

    TaskPtr running = makeTask(1);
    ASSERT_TRUE(queue->submit(running).hasValue());
    ASSERT_TRUE(waitUntil([&] { return running->state() == TaskState::Running; }));

    std::vector<TaskPtr> queued = {makeTask(2), makeTask(3), makeTask(4)};
    for (const TaskPtr &task : queued)
        ASSERT_TRUE(queue->submit(task).hasValue());
    EXPECT_EQ(queue->pendingCount(), 3u);

    std::thread opener(
        [&]
        {
            std::this_thread::sleep_for(50ms);
            runner.gate->open();
        });
    queue->shutdown();
    opener.join();

    EXPECT_TRUE(queue->isShutdown());
    EXPECT_EQ(queue->pendingCount(), 0u);
    EXPECT_EQ(running->state(), TaskState::Completed);
    for (const TaskPtr &task : queued)
    {
        EXPECT_EQ(task->state(), TaskState::Cancelled);
        EXPECT_EQ(task->cancelReason(), "compile queue shut down");
    }
    EXPECT_EQ(runner.ran(), std::vector<uint64_t>{1});
}

TEST(BackgroundCompileQueue, RejectsAfterShutdown)
{
    RecordingRunner runner;
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(1), runner.bind(), trace);
    queue->shutdown();
    queue->shutdown();

    TaskPtr task = makeTask(1);
    auto accepted = queue->submit(task);
    ASSERT_FALSE(accepted.hasValue());
    EXPECT_EQ(accepted.error().kind, ErrorKind::QueueClosed);
    EXPECT_EQ(task->state(), TaskState::Pending);
}

TEST(BackgroundCompileQueue, BoundedQueueReportsFull)
{
    RecordingRunner runner;
    runner.gate = std::make_shared<Gate>();
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(1, 2), runner.bind(), trace);

    TaskPtr first = makeTask(1);
    ASSERT_TRUE(queue->submit(first).hasValue());
    ASSERT_TRUE(waitUntil([&] { return first->state() == TaskState::Running; }));

    ASSERT_TRUE(queue->submit(makeTask(2)).hasValue());
    ASSERT_TRUE(queue->submit(makeTask(3)).hasValue());
    auto overflow = queue->submit(makeTask(4));
    ASSERT_FALSE(overflow.hasValue());
    EXPECT_EQ(overflow.error().kind, ErrorKind::QueueFull);

    runner.gate->open();
    queue->shutdown();
}

TEST(BackgroundCompileQueue, CancelRemovesQueuedTask)
{
    RecordingRunner runner;
    runner.gate = std::make_shared<Gate>();
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(1), runner.bind(), trace);

    TaskPtr blocker = makeTask(1);
    ASSERT_TRUE(queue->submit(blocker).hasValue());
    ASSERT_TRUE(waitUntil([&] { return blocker->state() == TaskState::Running; }));

    TaskPtr victim = makeTask(2);
    ASSERT_TRUE(queue->submit(victim).hasValue());
    EXPECT_TRUE(queue->cancel(victim, "no longer hot"));
    EXPECT_EQ(victim->state(), TaskState::Cancelled);
    EXPECT_EQ(queue->pendingCount(), 0u);
    EXPECT_FALSE(queue->cancel(victim, "again"));

    runner.gate->open();
    ASSERT_TRUE(queue->wait(blocker, 2000ms).hasValue());
    queue->shutdown();
    EXPECT_EQ(runner.ran(), std::vector<uint64_t>{1});
}

TEST(BackgroundCompileQueue, PriorityTasksJumpTheQueue)
{
    RecordingRunner runner;
    runner.gate = std::make_shared<Gate>();
    TraceSink trace;
    auto queue = createCompileQueue(backgroundConfig(1), runner.bind(), trace);

    TaskPtr blocker = makeTask(1);
    ASSERT_TRUE(queue->submit(blocker).hasValue());
    ASSERT_TRUE(waitUntil([&] { return blocker->state() == TaskState::Running; }));

    TaskPtr normal = makeTask(2);
    TaskPtr urgent = makeTask(3, true);
    ASSERT_TRUE(queue->submit(normal).hasValue());
    ASSERT_TRUE(queue->submit(urgent).hasValue());

    runner.gate->open();
    ASSERT_TRUE(queue->wait(normal, 2000ms).hasValue());
    ASSERT_TRUE(queue->wait(urgent, 2000ms).hasValue());
    queue->shutdown();

    EXPECT_EQ(runner.ran(), (std::vector<uint64_t>{1, 3, 2}));
}

TEST(SynchronousCompileQueue, RunsTaskBeforeSubmitReturns)
{
    RecordingRunner runner;
    TraceSink trace;
    JitConfig cfg;
    cfg.mode = CompileMode::Synchronous;
    auto queue = createCompileQueue(cfg, runner.bind(), trace);
    EXPECT_EQ(queue->mode(), CompileMode::Synchronous);

    TaskPtr task = makeTask(1);
    ASSERT_TRUE(queue->submit(task).hasValue());
    EXPECT_EQ(task->state(), TaskState::Completed);
    EXPECT_FALSE(queue->isCompiling(task));
    EXPECT_FALSE(queue->cancel(task, "too late"));
    EXPECT_EQ(queue->pendingCount(), 0u);
    EXPECT_TRUE(queue->wait(task, 0ms).hasValue());

    queue->shutdown();
    EXPECT_TRUE(queue->isShutdown());
    auto rejected = queue->submit(makeTask(2));
    ASSERT_FALSE(rejected.hasValue());
    EXPECT_EQ(rejected.error().kind, ErrorKind::QueueClosed);
}
