//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/kiln/jit/CompilationManager.hpp
// Purpose: Declare the facade the interpreter uses to promote hot units to
//          compiled code and to retire that code again.
// Invariants: One non-terminal task per unit (submit coalesces). A result is
//             installed only if its task was not cancelled, decided atomically
//             with cancellation. Installed code is replaced, never merged.
// Ownership: The manager owns its queue, registry and statistics. The backend
//            and the units are owned by the embedder; the backend must outlive
//            the manager.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/CompilationTask.hpp"
#include "jit/CompilationUnit.hpp"
#include "jit/CompilerBackend.hpp"
#include "jit/InstalledCode.hpp"
#include "jit/JitConfig.hpp"
#include "support/expected.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kiln::jit
{

/// @brief Diagnostic summary of a unit's compilation state.
enum class CompilationStatus
{
    NotCompiled, ///< Interpreted; nothing in flight
    Pending,     ///< Task queued
    Running,     ///< Task being compiled
    Installed,   ///< Compiled code is active
    Failed,      ///< Last compilation failed; unit stays interpreted
    Cancelled    ///< Last compilation was cancelled; unit stays interpreted
};

/// @brief Printable name of @p status.
std::string_view toString(CompilationStatus status);

/// @brief Per-submission options.
struct SubmitOptions
{
    /// @brief Queue at the head instead of the tail.
    bool priority = false;
    /// @brief Deadline relative to submission; zero falls back to
    ///        JitConfig::defaultDeadline.
    std::chrono::milliseconds deadline{0};
};

/// @brief Snapshot of the manager's counters.
struct CompilationStatistics
{
    uint64_t submitted = 0;            ///< Tasks created.
    uint64_t coalesced = 0;            ///< Submits answered with an active task.
    uint64_t rejected = 0;             ///< Submits refused by a closed or full queue.
    uint64_t completed = 0;            ///< Results installed.
    uint64_t failed = 0;               ///< Backend errors and exceptions.
    uint64_t cancelRequests = 0;       ///< Cancellations accepted by cancel().
    uint64_t discardedAfterCancel = 0; ///< Results dropped because of a cancel.
    uint64_t invalidated = 0;          ///< Installed code evicted.
    uint64_t installedUnits = 0;       ///< Units with code installed right now.
};

/// @brief Facade owning scheduling, installation and invalidation.
class CompilationManager
{
  public:
    /// @brief Build a manager whose scheduling mode is fixed by @p config.
    /// @throws std::invalid_argument when @p config fails validate().
    explicit CompilationManager(CompilerBackend &backend, JitConfig config = {});

    /// @brief Shut the queue down and evict all installed code.
    ~CompilationManager();

    CompilationManager(const CompilationManager &) = delete;
    CompilationManager &operator=(const CompilationManager &) = delete;

    /// @brief Create a unit whose speculation log uses the configured failure limit.
    [[nodiscard]] UnitPtr createUnit(std::string name) const;

    /// @brief Request compilation of @p unit.
    /// @return The unit's active task if one exists, otherwise a new task that
    ///         has been queued (background) or already run (synchronous).
    ///         Fails with QueueClosed or QueueFull.
    [[nodiscard]] support::Expected<TaskPtr> submit(const UnitPtr &unit, SubmitOptions options = {});

    /// @brief Optionally block until @p task is terminal.
    /// @details Never blocks in synchronous mode (submit already ran the task)
    ///          or when @p mayBlock is false; poll isCompiling instead.
    /// @return The terminal outcome, or std::nullopt while still in flight.
    std::optional<support::Expected<InstalledCodePtr>> finish(const TaskPtr &task, bool mayBlock);

    /// @brief Request cancellation of @p unit's active task.
    /// @return Whether a task existed and the request was registered. Always
    ///         false in synchronous mode.
    bool cancel(const CompilationUnit &unit, std::string_view reason);

    /// @brief Block until @p unit's task is terminal or @p timeout elapses.
    /// @return Installed code, or CompileFailed / CancelledBeforeInstall /
    ///         Timeout / NotSubmitted. A timeout never cancels the task.
    support::Expected<InstalledCodePtr> wait(const CompilationUnit &unit,
                                             std::chrono::milliseconds timeout);

    /// @brief Whether @p unit has a queued or running task.
    [[nodiscard]] bool isCompiling(const CompilationUnit &unit) const;

    /// @brief Evict whatever code is installed for @p unit.
    /// @details Does not resubmit. The unit's hotness counters restart, so the
    ///          hooks below only promote it again once it is hot again.
    /// @return True when something was evicted.
    bool invalidate(CompilationUnit &unit, std::string_view reason);

    /// @brief Evict @p unit's code only if it is still installation @p code.
    /// @return True when evicted; false (a no-op) when it was already replaced.
    bool invalidate(CompilationUnit &unit, CodeId code, std::string_view reason);

    /// @brief Code to dispatch through, or nullptr to interpret.
    [[nodiscard]] InstalledCodePtr installedCode(const CompilationUnit &unit) const;

    [[nodiscard]] CompilationStatus status(const CompilationUnit &unit) const;

    /// @name Execution-path hooks
    /// @{

    /// @brief Count a call; submit once the call threshold is reached.
    /// @return True when this call caused a submission.
    bool onCall(const UnitPtr &unit);

    /// @brief Count @p count loop back-edges; submit at the loop threshold.
    bool onLoopBackEdges(const UnitPtr &unit, uint64_t count);

    /// @brief Record a failed speculation observed while running @p code.
    /// @details Increments the unit's speculation log, evicts @p code if it is
    ///          still installed, and resets the unit's hotness counters.
    /// @return True when @p code was evicted.
    bool onSpeculationFailed(CompilationUnit &unit, CodeId code, SpeculationId speculation);

    /// @}

    /// @brief Forget @p unit: cancel its active task and evict its code.
    /// @details For embedders unloading a routine. Units dropped without this
    ///          call are pruned from the registry on the next installation.
    /// @return True when installed code was evicted.
    bool release(CompilationUnit &unit);

    /// @brief Refuse new submissions and cancel queued tasks.
    /// @details Blocks until running tasks finish. Called from inside the
    ///          backend it only closes the queue; the workers are joined when
    ///          the manager is destroyed.
    void shutdown();

    [[nodiscard]] bool isShutdown() const;

    [[nodiscard]] CompileMode mode() const;

    [[nodiscard]] const JitConfig &config() const;

    [[nodiscard]] CompilationStatistics statistics() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kiln::jit
