//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CompilationTask.hpp
// Purpose: State machine for one compilation attempt of one unit.
// Key invariants:
//   - Pending -> Running -> {Completed, Failed, Cancelled}, or
//     Pending -> Cancelled. No state is re-entered.
//   - At most one worker ever claims the task (CAS on the claim flag).
//   - Terminal state and result are written once, under the task mutex, and
//     are stable for every later reader.
//   - The cancellation check and the installation of a result happen under the
//     same lock acquisition as requestCancel, so a cancelled task never
//     installs.
// Ownership/Lifetime: Shared by the unit, the queue and waiters. The task refers
//                     to its unit weakly.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/CancellationToken.hpp"
#include "jit/InstalledCode.hpp"
#include "support/expected.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kiln::jit
{
class CompilationUnit;

/// @brief Lifecycle of a compilation task.
enum class TaskState : uint8_t
{
    Pending,   ///< Queued, not yet claimed by a worker
    Running,   ///< Claimed; the backend is (or is about to be) compiling
    Completed, ///< Result installed
    Cancelled, ///< Cancelled before start, or result discarded after cancel
    Failed     ///< Backend reported an error
};

/// @brief Printable name of @p state.
std::string_view toString(TaskState state);

/// @brief True for Completed, Cancelled and Failed.
constexpr bool isTerminal(TaskState state)
{
    return state == TaskState::Completed || state == TaskState::Cancelled ||
           state == TaskState::Failed;
}

/// @brief One compilation attempt.
class CompilationTask
{
  public:
    using Clock = CancellationToken::Clock;

    /// @brief Create a Pending task.
    /// @param id Manager-assigned sequence number.
    /// @param unit Unit being compiled; held weakly.
    /// @param token Cancellation token shared with the backend.
    /// @param priority Queue at the head instead of the tail.
    CompilationTask(uint64_t id,
                    std::weak_ptr<CompilationUnit> unit,
                    CancellationToken token,
                    bool priority = false);

    CompilationTask(const CompilationTask &) = delete;
    CompilationTask &operator=(const CompilationTask &) = delete;

    uint64_t id() const
    {
        return id_;
    }

    bool priority() const
    {
        return priority_;
    }

    /// @brief The unit, or nullptr once the embedder released it.
    std::shared_ptr<CompilationUnit> unit() const
    {
        return unit_.lock();
    }

    const CancellationToken &token() const
    {
        return token_;
    }

    TaskState state() const
    {
        return state_.load(std::memory_order_acquire);
    }

    bool isTerminal() const
    {
        return jit::isTerminal(state());
    }

    /// @brief Whether cancellation was requested (the task may still be Running).
    bool cancelRequested() const
    {
        return token_.cancelRequested();
    }

    /// @name Worker-side transitions
    /// @{

    /// @brief Pending -> Running for exactly one caller.
    /// @return True when the caller now owns execution. A task whose deadline
    ///         already passed is moved to Cancelled instead.
    bool tryClaim();

    /// @brief Running -> Completed unless cancellation was requested.
    /// @param install Invoked under the task lock to publish the result; its
    ///        return value becomes the task's installed code.
    /// @return True when installed; false when the result was discarded and the
    ///         task moved to Cancelled.
    bool commit(const std::function<InstalledCodePtr()> &install);

    /// @brief Running -> Failed with @p err.
    void fail(support::Error err);

    /// @brief Running -> Cancelled after the backend stopped early.
    void abandon(std::string reason);

    /// @}

    /// @brief Request cancellation.
    /// @details Pending tasks move straight to Cancelled. Running tasks only get
    ///          the token flag set; the worker decides at commit time.
    /// @return True if the task was not yet terminal.
    bool requestCancel(std::string reason);

    /// @brief Block until terminal or @p timeout elapses.
    /// @details A budget of a year or more (e.g. milliseconds::max()) waits
    ///          without limit.
    /// @return Installed code on Completed; CompileFailed, CancelledBeforeInstall
    ///         or Timeout otherwise. A timeout never changes the task.
    support::Expected<InstalledCodePtr> waitFor(std::chrono::milliseconds timeout) const;

    /// @brief Block until terminal.
    support::Expected<InstalledCodePtr> await() const;

    /// @brief Terminal outcome without blocking; std::nullopt while in flight.
    std::optional<support::Expected<InstalledCodePtr>> outcome() const;

    /// @brief Code installed by this task (nullptr unless Completed).
    InstalledCodePtr installedCode() const;

    /// @brief Recorded error (set only when Failed).
    std::optional<support::Error> error() const;

    /// @brief Reason passed to requestCancel or abandon.
    std::string cancelReason() const;

  private:
    /// @brief Publish terminal @p next; caller holds mu_.
    void finishLocked(TaskState next);

    support::Expected<InstalledCodePtr> outcomeLocked() const;

    uint64_t id_;
    std::weak_ptr<CompilationUnit> unit_;
    CancellationToken token_;
    bool priority_;

    std::atomic<TaskState> state_{TaskState::Pending};
    std::atomic<bool> claimed_{false};

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    InstalledCodePtr code_;
    std::optional<support::Error> error_;
    std::string cancelReason_;
};

using TaskPtr = std::shared_ptr<CompilationTask>;

} // namespace kiln::jit
