//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/CompilationTask.cpp
// Purpose: Implement the compilation task state machine.
// Key invariants: Every transition into a terminal state goes through
//                 finishLocked, which refuses to leave a terminal state.
// Ownership/Lifetime: Results are held by shared pointer and never mutated
//                     after the terminal transition.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Compilation task transitions and waiting.
/// @details The state is mirrored in an atomic so pollers (isCompiling,
///          status) never take the task mutex. Writers always hold the mutex,
///          which is what makes "check cancellation, then install" a single
///          decision relative to requestCancel.

#include "jit/CompilationTask.hpp"

#include <utility>

namespace kiln::jit
{
namespace
{

constexpr std::chrono::hours kUnboundedWait{24 * 365};

} // namespace

std::string_view toString(TaskState state)
{
    switch (state)
    {
        case TaskState::Pending:
            return "pending";
        case TaskState::Running:
            return "running";
        case TaskState::Completed:
            return "completed";
        case TaskState::Cancelled:
            return "cancelled";
        case TaskState::Failed:
            return "failed";
    }
    return "unknown";
}

CompilationTask::CompilationTask(uint64_t id,
                                 std::weak_ptr<CompilationUnit> unit,
                                 CancellationToken token,
                                 bool priority)
    : id_(id), unit_(std::move(unit)), token_(std::move(token)), priority_(priority)
{
}

bool CompilationTask::tryClaim()
{
    if (claimed_.exchange(true, std::memory_order_acq_rel))
        return false;
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.load(std::memory_order_relaxed) != TaskState::Pending)
        return false;
    if (token_.deadlineExpired())
    {
        cancelReason_ = "deadline exceeded before start";
        finishLocked(TaskState::Cancelled);
        return false;
    }
    state_.store(TaskState::Running, std::memory_order_release);
    return true;
}

bool CompilationTask::commit(const std::function<InstalledCodePtr()> &install)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.load(std::memory_order_relaxed) != TaskState::Running)
        return false;
    if (token_.isCancelled())
    {
        if (cancelReason_.empty())
            cancelReason_ = "deadline exceeded";
        finishLocked(TaskState::Cancelled);
        return false;
    }
    code_ = install();
    finishLocked(TaskState::Completed);
    return true;
}

void CompilationTask::fail(support::Error err)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (state_.load(std::memory_order_relaxed) != TaskState::Running)
        return;
    error_ = std::move(err);
    finishLocked(TaskState::Failed);
}

void CompilationTask::abandon(std::string reason)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (jit::isTerminal(state_.load(std::memory_order_relaxed)))
        return;
    if (cancelReason_.empty())
        cancelReason_ = std::move(reason);
    finishLocked(TaskState::Cancelled);
}

bool CompilationTask::requestCancel(std::string reason)
{
    std::lock_guard<std::mutex> lock(mu_);
    const TaskState current = state_.load(std::memory_order_relaxed);
    if (jit::isTerminal(current))
        return false;
    token_.requestCancel();
    if (cancelReason_.empty())
        cancelReason_ = std::move(reason);
    if (current == TaskState::Pending)
        finishLocked(TaskState::Cancelled);
    return true;
}

support::Expected<InstalledCodePtr> CompilationTask::waitFor(std::chrono::milliseconds timeout) const
{
    if (timeout.count() < 0)
        timeout = std::chrono::milliseconds{0};
    // wait_for adds the budget to the clock's now(); anything this large
    // would overflow, so treat it as unbounded.
    if (timeout >= kUnboundedWait)
        return await();
    std::unique_lock<std::mutex> lock(mu_);
    const bool done = cv_.wait_for(
        lock, timeout, [this] { return jit::isTerminal(state_.load(std::memory_order_relaxed)); });
    if (!done)
    {
        return support::makeError(support::ErrorKind::Timeout,
                                  "task #" + std::to_string(id_) + " still " +
                                      std::string(toString(state_.load())) + " after " +
                                      std::to_string(timeout.count()) + "ms");
    }
    return outcomeLocked();
}

support::Expected<InstalledCodePtr> CompilationTask::await() const
{
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return jit::isTerminal(state_.load(std::memory_order_relaxed)); });
    return outcomeLocked();
}

std::optional<support::Expected<InstalledCodePtr>> CompilationTask::outcome() const
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!jit::isTerminal(state_.load(std::memory_order_relaxed)))
        return std::nullopt;
    return outcomeLocked();
}

InstalledCodePtr CompilationTask::installedCode() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return code_;
}

std::optional<support::Error> CompilationTask::error() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return error_;
}

std::string CompilationTask::cancelReason() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return cancelReason_;
}

void CompilationTask::finishLocked(TaskState next)
{
    if (jit::isTerminal(state_.load(std::memory_order_relaxed)))
        return;
    state_.store(next, std::memory_order_release);
    cv_.notify_all();
}

support::Expected<InstalledCodePtr> CompilationTask::outcomeLocked() const
{
    switch (state_.load(std::memory_order_relaxed))
    {
        case TaskState::Completed:
            return code_;
        case TaskState::Failed:
            return error_ ? *error_ : support::makeError(support::ErrorKind::CompileFailed);
        case TaskState::Cancelled:
            return support::makeError(support::ErrorKind::CancelledBeforeInstall, cancelReason_);
        case TaskState::Pending:
        case TaskState::Running:
            break;
    }
    return support::makeError(support::ErrorKind::Timeout, "task still in flight");
}

} // namespace kiln::jit
