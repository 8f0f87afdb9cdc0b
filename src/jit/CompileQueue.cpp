//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/CompileQueue.cpp
// Purpose: Implement the background and synchronous compile queues.
//
// This file contains:
//   1. BackgroundCompileQueue - fixed worker pool fed from a shared deque
//   2. SynchronousCompileQueue - runs each task on the submitting thread
//   3. createCompileQueue() - factory selecting a strategy from JitConfig
//
// Key invariants: Workers never block on each other; they only wait for work.
//                 Shutdown cancels queued tasks and joins the pool after the
//                 running ones finish. A shutdown issued on a worker leaves
//                 the join to the destructor.
// Ownership/Lifetime: Queues hold tasks by shared pointer until a worker has
//                     run them or shutdown has cancelled them.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/CompileQueue.hpp"

#include "jit/Trace.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace kiln::jit
{
namespace detail
{

// =============================================================================
// BackgroundCompileQueue
// =============================================================================
// Tasks are appended to a deque (or prepended when boosted) and pulled by a
// fixed number of worker threads. FIFO order is a scheduling hint only:
// whichever worker wakes first takes the head.
// =============================================================================

class BackgroundCompileQueue final : public CompileQueue
{
  public:
    BackgroundCompileQueue(unsigned workers, std::size_t capacity, TaskRunner runner, TraceSink &trace)
        : capacity_(capacity), runner_(std::move(runner)), trace_(trace)
    {
        workers_.reserve(workers);
        for (unsigned i = 0; i < workers; ++i)
        {
            workers_.emplace_back([this] { workerLoop(); });
            workerIds_.push_back(workers_.back().get_id());
        }
    }

    ~BackgroundCompileQueue() override
    {
        closeAndDrain();
        joinWorkers();
    }

    CompileMode mode() const override
    {
        return CompileMode::Background;
    }

    support::Expected<void> submit(const TaskPtr &task) override
    {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_)
                return support::makeError(support::ErrorKind::QueueClosed,
                                          "compile queue is shut down");
            if (capacity_ != 0 && queue_.size() >= capacity_)
                return support::makeError(support::ErrorKind::QueueFull,
                                          "compile queue holds " + std::to_string(queue_.size()) +
                                              " tasks");
            if (task->priority())
                queue_.push_front(task);
            else
                queue_.push_back(task);
            trace_.onQueue("enqueue", task->id(), queue_.size());
        }
        cv_.notify_one();
        return {};
    }

    bool cancel(const TaskPtr &task, std::string reason) override
    {
        if (!task->requestCancel(std::move(reason)))
            return false;
        // A cancelled Pending task is already terminal; drop it so it stops
        // counting against the capacity.
        std::lock_guard<std::mutex> lock(mu_);
        auto it = std::find(queue_.begin(), queue_.end(), task);
        if (it != queue_.end())
        {
            queue_.erase(it);
            trace_.onQueue("remove", task->id(), queue_.size());
        }
        return true;
    }

    support::Expected<InstalledCodePtr> wait(const TaskPtr &task,
                                             std::chrono::milliseconds timeout) override
    {
        return task->waitFor(timeout);
    }

    bool isCompiling(const TaskPtr &task) const override
    {
        return !task->isTerminal();
    }

    void shutdown() override
    {
        closeAndDrain();
        // A worker asking for shutdown (e.g. from inside the backend) cannot
        // join itself; the pool is joined by the destructor instead.
        if (!onWorkerThread())
            joinWorkers();
    }

    bool isShutdown() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    std::size_t pendingCount() const override
    {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

  private:
    /// @brief Refuse new work and cancel every task still queued.
    void closeAndDrain()
    {
        std::deque<TaskPtr> drained;
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
            drained.swap(queue_);
        }
        cv_.notify_all();

        for (const TaskPtr &task : drained)
        {
            if (task->requestCancel("compile queue shut down"))
                trace_.onQueue("drop", task->id(), 0);
        }
    }

    bool onWorkerThread() const
    {
        const auto self = std::this_thread::get_id();
        return std::find(workerIds_.begin(), workerIds_.end(), self) != workerIds_.end();
    }

    /// @brief Wait for every worker, including one that ran shutdown itself.
    void joinWorkers()
    {
        std::lock_guard<std::mutex> joinLock(joinMu_);
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(mu_);
            workers.swap(workers_);
        }
        const auto self = std::this_thread::get_id();
        for (std::thread &worker : workers)
        {
            // Destroying the manager from its own backend is unsupported;
            // detach instead of deadlocking on a self-join.
            if (worker.get_id() == self)
                worker.detach();
            else if (worker.joinable())
                worker.join();
        }
    }

    void workerLoop()
    {
        while (true)
        {
            TaskPtr task;
            {
                std::unique_lock<std::mutex> lock(mu_);
                cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
                if (queue_.empty())
                    return;
                task = std::move(queue_.front());
                queue_.pop_front();
                trace_.onQueue("dequeue", task->id(), queue_.size());
            }
            if (task->tryClaim())
                runner_(task);
        }
    }

    std::size_t capacity_;
    TaskRunner runner_;
    TraceSink &trace_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<TaskPtr> queue_;
    bool closed_ = false;
    std::vector<std::thread> workers_;
    std::vector<std::thread::id> workerIds_; ///< Fixed at construction.
    std::mutex joinMu_;                      ///< Held for the whole join.
};

// =============================================================================
// SynchronousCompileQueue
// =============================================================================
// There are no workers: submit claims the task and runs it on the caller's
// thread. Nothing is ever observable as "compiling" once submit returns and
// nothing can be cancelled, because the only thread that could ask is busy
// inside submit.
// =============================================================================

class SynchronousCompileQueue final : public CompileQueue
{
  public:
    explicit SynchronousCompileQueue(TaskRunner runner) : runner_(std::move(runner)) {}

    CompileMode mode() const override
    {
        return CompileMode::Synchronous;
    }

    support::Expected<void> submit(const TaskPtr &task) override
    {
        if (closed_.load(std::memory_order_acquire))
            return support::makeError(support::ErrorKind::QueueClosed,
                                      "compile queue is shut down");
        if (task->tryClaim())
            runner_(task);
        return {};
    }

    bool cancel(const TaskPtr &, std::string) override
    {
        return false;
    }

    support::Expected<InstalledCodePtr> wait(const TaskPtr &task,
                                             std::chrono::milliseconds timeout) override
    {
        return task->waitFor(timeout);
    }

    bool isCompiling(const TaskPtr &) const override
    {
        return false;
    }

    void shutdown() override
    {
        closed_.store(true, std::memory_order_release);
    }

    bool isShutdown() const override
    {
        return closed_.load(std::memory_order_acquire);
    }

    std::size_t pendingCount() const override
    {
        return 0;
    }

  private:
    TaskRunner runner_;
    std::atomic<bool> closed_{false};
};

} // namespace detail

//===----------------------------------------------------------------------===//
// Factory
//===----------------------------------------------------------------------===//

std::unique_ptr<CompileQueue> createCompileQueue(const JitConfig &cfg,
                                                 TaskRunner runner,
                                                 TraceSink &trace)
{
    switch (cfg.mode)
    {
        case CompileMode::Background:
            return std::make_unique<detail::BackgroundCompileQueue>(
                effectiveWorkerCount(cfg), cfg.queueCapacity, std::move(runner), trace);
        case CompileMode::Synchronous:
            return std::make_unique<detail::SynchronousCompileQueue>(std::move(runner));
    }
    return std::make_unique<detail::SynchronousCompileQueue>(std::move(runner));
}

} // namespace kiln::jit
