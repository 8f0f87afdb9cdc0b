//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/CompilationUnit.cpp
// Purpose: Implement hotness counting and the single-active-task slot.
// Key invariants: The task slot is only replaced while the current occupant
//                 is terminal (or absent).
// Ownership/Lifetime: The unit keeps its latest task alive for status queries.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/CompilationUnit.hpp"

#include "jit/CompilationTask.hpp"

namespace kiln::jit
{
namespace
{

UnitId nextUnitId()
{
    static std::atomic<UnitId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

} // namespace

CompilationUnit::CompilationUnit(std::string name, uint32_t maxSpeculationFailures)
    : id_(nextUnitId()), name_(std::move(name)), speculationLog_(maxSpeculationFailures)
{
}

uint64_t CompilationUnit::recordCall()
{
    return calls_.fetch_add(1, std::memory_order_relaxed) + 1;
}

uint64_t CompilationUnit::recordLoopBackEdges(uint64_t count)
{
    return loops_.fetch_add(count, std::memory_order_relaxed) + count;
}

uint64_t CompilationUnit::callCount() const
{
    return calls_.load(std::memory_order_relaxed);
}

uint64_t CompilationUnit::loopCount() const
{
    return loops_.load(std::memory_order_relaxed);
}

void CompilationUnit::resetCounters()
{
    calls_.store(0, std::memory_order_relaxed);
    loops_.store(0, std::memory_order_relaxed);
}

CompilationUnit::TaskPtr CompilationUnit::task() const
{
    std::lock_guard<std::mutex> lock(taskMu_);
    return task_;
}

std::pair<CompilationUnit::TaskPtr, bool> CompilationUnit::attachTask(
    const std::function<TaskPtr(const TaskPtr &)> &makeTask)
{
    std::lock_guard<std::mutex> lock(taskMu_);
    if (task_ && !task_->isTerminal())
        return {task_, false};
    task_ = makeTask(task_);
    return {task_, true};
}

void CompilationUnit::detachTask(const TaskPtr &task, TaskPtr previous)
{
    std::lock_guard<std::mutex> lock(taskMu_);
    if (task_ == task)
        task_ = std::move(previous);
}

} // namespace kiln::jit
