//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CompileQueue.hpp
// Purpose: Define the interchangeable scheduling strategies that run
//          compilation tasks.
// Key invariants: The strategy is chosen once when the manager is built.
//                 After shutdown no task is accepted.
// Ownership/Lifetime: Queues are owned by the CompilationManager; the runner
//                     callback and trace sink must outlive the queue.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/CompilationTask.hpp"
#include "jit/JitConfig.hpp"
#include "support/expected.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace kiln::jit
{
class TraceSink;

/// @brief Executes one claimed task to a terminal state.
using TaskRunner = std::function<void(const TaskPtr &)>;

/// @brief Abstract scheduling strategy for compilation tasks.
/// @details Concrete strategies only decide where and when a claimed task
///          runs. Claiming, installation and bookkeeping are shared through
///          CompilationTask and the runner supplied by the manager.
class CompileQueue
{
  public:
    virtual ~CompileQueue() = default;

    /// @brief Strategy identifier.
    virtual CompileMode mode() const = 0;

    /// @brief Accept @p task for execution.
    /// @details Background queues return immediately; the synchronous queue
    ///          returns once the task is terminal.
    /// @return QueueClosed after shutdown, QueueFull when a bounded queue has
    ///         no room.
    virtual support::Expected<void> submit(const TaskPtr &task) = 0;

    /// @brief Request cancellation of @p task.
    /// @return True when a request was registered with a non-terminal task.
    virtual bool cancel(const TaskPtr &task, std::string reason) = 0;

    /// @brief Block the caller until @p task is terminal or @p timeout elapses.
    virtual support::Expected<InstalledCodePtr> wait(const TaskPtr &task,
                                                     std::chrono::milliseconds timeout) = 0;

    /// @brief Whether @p task is still queued or running.
    virtual bool isCompiling(const TaskPtr &task) const = 0;

    /// @brief Stop accepting work and cancel queued tasks.
    /// @details Running tasks finish and install normally. The caller blocks
    ///          until the workers have exited, except when it is itself a
    ///          worker; the destructor then does the joining.
    virtual void shutdown() = 0;

    virtual bool isShutdown() const = 0;

    /// @brief Number of queued tasks not yet claimed by a worker.
    virtual std::size_t pendingCount() const = 0;
};

/// @brief Create the queue strategy selected by @p cfg.mode.
/// @param cfg Configuration (mode, worker count, capacity).
/// @param runner Callback that executes a claimed task.
/// @param trace Sink for queue events.
std::unique_ptr<CompileQueue> createCompileQueue(const JitConfig &cfg,
                                                 TaskRunner runner,
                                                 TraceSink &trace);

} // namespace kiln::jit
