//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CompilationUnit.hpp
// Purpose: Per-routine compilation state observed by the interpreter and the
//          compilation manager.
// Key invariants: At most one non-terminal CompilationTask is attached at any
//                 instant; attachTask enforces this under the unit's mutex.
// Ownership/Lifetime: Units are shared via std::shared_ptr. A unit owns its
//                     speculation log and its most recent task; tasks refer
//                     back to the unit weakly.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/SpeculationLog.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace kiln::jit
{
class CompilationTask;

/// @brief Stable identity of a compilation unit.
using UnitId = uint64_t;

/// @brief One routine that may be promoted from interpretation to compiled code.
class CompilationUnit
{
  public:
    using TaskPtr = std::shared_ptr<CompilationTask>;

    /// @brief Create a unit with a process-unique id.
    /// @param name Routine name used in traces.
    /// @param maxSpeculationFailures Failure limit for the unit's speculation log.
    explicit CompilationUnit(std::string name, uint32_t maxSpeculationFailures = 1);

    CompilationUnit(const CompilationUnit &) = delete;
    CompilationUnit &operator=(const CompilationUnit &) = delete;

    UnitId id() const
    {
        return id_;
    }

    const std::string &name() const
    {
        return name_;
    }

    /// @name Hotness counters
    /// Relaxed atomics: exact counts are not required, only eventual progress.
    /// @{
    uint64_t recordCall();
    uint64_t recordLoopBackEdges(uint64_t count);
    uint64_t callCount() const;
    uint64_t loopCount() const;
    void resetCounters();
    /// @}

    SpeculationLog &speculationLog()
    {
        return speculationLog_;
    }

    const SpeculationLog &speculationLog() const
    {
        return speculationLog_;
    }

    /// @brief Most recent task, terminal or not; nullptr when never submitted.
    TaskPtr task() const;

    /// @brief Attach a new task unless a non-terminal one is already attached.
    /// @param makeTask Factory invoked under the unit lock only when needed; it
    ///        receives the terminal task being replaced (or nullptr).
    /// @return The attached task and true when it was created by @p makeTask,
    ///         or the already active task and false.
    std::pair<TaskPtr, bool> attachTask(const std::function<TaskPtr(const TaskPtr &)> &makeTask);

    /// @brief Undo attachTask: restore @p previous if @p task is still attached.
    void detachTask(const TaskPtr &task, TaskPtr previous);

  private:
    UnitId id_;
    std::string name_;
    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> loops_{0};
    SpeculationLog speculationLog_;

    mutable std::mutex taskMu_;
    TaskPtr task_;
};

using UnitPtr = std::shared_ptr<CompilationUnit>;

} // namespace kiln::jit
