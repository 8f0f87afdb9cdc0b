//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/CompilationManager.cpp
// Purpose: Implement the compilation facade: coalescing submission, the task
//          runner shared by both queue strategies, installation, invalidation
//          and the hotness hooks.
// Key invariants:
//   - The unit's task slot is updated under the unit lock, so two submits of
//     the same unit can never both create a task.
//   - Backend failures of every kind are converted to CompileFailed here and
//     never leave the runner.
//   - Lock order is task -> registry; the registry never calls back out.
// Ownership/Lifetime: Impl owns the queue, which is declared last so its
//                     workers are joined before anything they use is destroyed.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "kiln/jit/CompilationManager.hpp"

#include "jit/CompileQueue.hpp"
#include "jit/Trace.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <stdexcept>
#include <utility>

namespace kiln::jit
{
namespace
{

/// @brief Check once whether KILN_DEBUG_JIT asks for a configuration dump.
bool isJitDebugLoggingEnabled() noexcept
{
    static const bool enabled = []
    {
        if (const char *flag = std::getenv("KILN_DEBUG_JIT"))
            return flag[0] != '\0';
        return false;
    }();
    return enabled;
}

} // namespace

std::string_view toString(CompilationStatus status)
{
    switch (status)
    {
        case CompilationStatus::NotCompiled:
            return "not-compiled";
        case CompilationStatus::Pending:
            return "pending";
        case CompilationStatus::Running:
            return "running";
        case CompilationStatus::Installed:
            return "installed";
        case CompilationStatus::Failed:
            return "failed";
        case CompilationStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

struct CompilationManager::Impl
{
    Impl(CompilerBackend &b, JitConfig c) : backend(b), config(std::move(c)), trace(config.trace)
    {
        queue = createCompileQueue(
            config, [this](const TaskPtr &task) { runTask(task); }, trace);
    }

    ~Impl()
    {
        queue->shutdown();
        registry.clear();
    }

    /// @brief Run a claimed task to a terminal state on the current thread.
    void runTask(const TaskPtr &task)
    {
        UnitPtr unit = task->unit();
        if (!unit)
        {
            task->abandon("compilation unit released");
            return;
        }
        trace.onStart(*unit, task->id());

        SpeculationSnapshotPtr speculations = unit->speculationLog().snapshot();
        support::Expected<CompiledArtifact> result =
            compileGuarded(*unit, *speculations, task->token());

        if (!result)
        {
            if (task->token().isCancelled())
            {
                // The backend honoured the token; this is not a failure.
                task->abandon("backend stopped after cancellation");
                ++counters.discardedAfterCancel;
                trace.onDiscard(*unit, task->id());
                return;
            }
            task->fail(result.error());
            ++counters.failed;
            trace.onFailure(*unit, task->id(), result.error());
            return;
        }

        const bool installed = task->commit(
            [&] { return registry.install(unit->id(), result.value(), speculations, unit); });
        if (installed)
        {
            ++counters.completed;
            trace.onInstall(*unit, task->id(), task->installedCode()->id());
        }
        else
        {
            ++counters.discardedAfterCancel;
            trace.onDiscard(*unit, task->id());
        }
    }

    /// @brief Invoke the backend, converting anything it throws.
    support::Expected<CompiledArtifact> compileGuarded(const CompilationUnit &unit,
                                                       const SpeculationLog::Snapshot &speculations,
                                                       const CancellationToken &token)
    {
        try
        {
            return backend.compile(unit, speculations, token);
        }
        catch (const std::exception &ex)
        {
            return support::makeError(support::ErrorKind::CompileFailed,
                                      std::string(backend.name()) + ": " + ex.what());
        }
        catch (...)
        {
            return support::makeError(support::ErrorKind::CompileFailed,
                                      std::string(backend.name()) + ": unknown exception");
        }
    }

    /// @brief Submit @p unit from a hotness hook when nothing blocks promotion.
    bool promote(CompilationManager &self, const UnitPtr &unit)
    {
        if (queue->isShutdown() || registry.lookup(unit->id()))
            return false;
        if (TaskPtr task = unit->task())
        {
            // Failures are not retried automatically.
            if (!task->isTerminal() || task->state() == TaskState::Failed)
                return false;
        }
        auto submitted = self.submit(unit);
        return submitted.hasValue();
    }

    struct Counters
    {
        std::atomic<uint64_t> submitted{0};
        std::atomic<uint64_t> coalesced{0};
        std::atomic<uint64_t> rejected{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> cancelRequests{0};
        std::atomic<uint64_t> discardedAfterCancel{0};
        std::atomic<uint64_t> invalidated{0};
    };

    CompilerBackend &backend;
    JitConfig config;
    TraceSink trace;
    InstalledCodeRegistry registry;
    Counters counters;
    std::atomic<uint64_t> nextTaskId{1};
    std::unique_ptr<CompileQueue> queue;
};

CompilationManager::CompilationManager(CompilerBackend &backend, JitConfig config)
{
    if (auto ok = validate(config); !ok)
        throw std::invalid_argument(ok.error().message);
    impl_ = std::make_unique<Impl>(backend, std::move(config));

    if (isJitDebugLoggingEnabled())
    {
        const JitConfig &cfg = impl_->config;
        const std::string_view modeName = toString(cfg.mode);
        const std::string_view backendName = backend.name();
        std::fprintf(stderr,
                     "[DEBUG][JIT] mode: %.*s workers: %u capacity: %zu backend: %.*s\n",
                     static_cast<int>(modeName.size()),
                     modeName.data(),
                     effectiveWorkerCount(cfg),
                     cfg.queueCapacity,
                     static_cast<int>(backendName.size()),
                     backendName.data());
    }
}

CompilationManager::~CompilationManager() = default;

UnitPtr CompilationManager::createUnit(std::string name) const
{
    return std::make_shared<CompilationUnit>(std::move(name), impl_->config.maxSpeculationFailures);
}

support::Expected<TaskPtr> CompilationManager::submit(const UnitPtr &unit, SubmitOptions options)
{
    if (!unit)
        throw std::invalid_argument("submit: null compilation unit");
    Impl &impl = *impl_;
    if (impl.queue->isShutdown())
    {
        ++impl.counters.rejected;
        return support::makeError(support::ErrorKind::QueueClosed, "compile queue is shut down");
    }

    const std::chrono::milliseconds deadline =
        options.deadline.count() > 0 ? options.deadline : impl.config.defaultDeadline;
    TaskPtr previous;
    auto attached = unit->attachTask(
        [&](const TaskPtr &prior)
        {
            previous = prior;
            std::optional<CancellationToken::Clock::time_point> expiry;
            if (deadline.count() > 0)
                expiry = CancellationToken::Clock::now() + deadline;
            return std::make_shared<CompilationTask>(
                impl.nextTaskId.fetch_add(1), unit, CancellationToken(expiry), options.priority);
        });
    TaskPtr task = attached.first;
    if (!attached.second)
    {
        ++impl.counters.coalesced;
        impl.trace.onSubmit(*unit, task->id(), true);
        return task;
    }

    impl.trace.onSubmit(*unit, task->id(), false);
    ++impl.counters.submitted;
    auto accepted = impl.queue->submit(task);
    if (!accepted)
    {
        unit->detachTask(task, std::move(previous));
        task->abandon(std::string(support::toString(accepted.error().kind)));
        ++impl.counters.rejected;
        return accepted.error();
    }
    return task;
}

std::optional<support::Expected<InstalledCodePtr>> CompilationManager::finish(const TaskPtr &task,
                                                                              bool mayBlock)
{
    if (!task)
        return std::nullopt;
    if (mayBlock && impl_->queue->mode() == CompileMode::Background)
        return task->await();
    return task->outcome();
}

bool CompilationManager::cancel(const CompilationUnit &unit, std::string_view reason)
{
    TaskPtr task = unit.task();
    if (!task || task->isTerminal())
        return false;
    if (!impl_->queue->cancel(task, std::string(reason)))
        return false;
    ++impl_->counters.cancelRequests;
    impl_->trace.onCancel(unit, task->id(), reason);
    return true;
}

support::Expected<InstalledCodePtr> CompilationManager::wait(const CompilationUnit &unit,
                                                             std::chrono::milliseconds timeout)
{
    TaskPtr task = unit.task();
    if (!task)
    {
        if (InstalledCodePtr code = impl_->registry.lookup(unit.id()))
            return code;
        return support::makeError(support::ErrorKind::NotSubmitted,
                                  "unit '" + unit.name() + "' was never submitted");
    }
    return impl_->queue->wait(task, timeout);
}

bool CompilationManager::isCompiling(const CompilationUnit &unit) const
{
    TaskPtr task = unit.task();
    return task && impl_->queue->isCompiling(task);
}

bool CompilationManager::invalidate(CompilationUnit &unit, std::string_view reason)
{
    InstalledCodePtr code = impl_->registry.evict(unit.id());
    if (!code)
        return false;
    ++impl_->counters.invalidated;
    unit.resetCounters();
    impl_->trace.onInvalidate(unit, code->id(), true, reason);
    return true;
}

bool CompilationManager::invalidate(CompilationUnit &unit, CodeId code, std::string_view reason)
{
    const bool evicted = impl_->registry.invalidate(unit.id(), code);
    if (evicted)
    {
        ++impl_->counters.invalidated;
        unit.resetCounters();
    }
    impl_->trace.onInvalidate(unit, code, evicted, reason);
    return evicted;
}

InstalledCodePtr CompilationManager::installedCode(const CompilationUnit &unit) const
{
    return impl_->registry.lookup(unit.id());
}

CompilationStatus CompilationManager::status(const CompilationUnit &unit) const
{
    TaskPtr task = unit.task();
    if (task)
    {
        switch (task->state())
        {
            case TaskState::Pending:
                return CompilationStatus::Pending;
            case TaskState::Running:
                return CompilationStatus::Running;
            default:
                break;
        }
    }
    if (impl_->registry.lookup(unit.id()))
        return CompilationStatus::Installed;
    if (!task)
        return CompilationStatus::NotCompiled;
    switch (task->state())
    {
        case TaskState::Failed:
            return CompilationStatus::Failed;
        case TaskState::Cancelled:
            return CompilationStatus::Cancelled;
        default:
            return CompilationStatus::NotCompiled;
    }
}

bool CompilationManager::onCall(const UnitPtr &unit)
{
    if (unit->recordCall() < impl_->config.callThreshold)
        return false;
    return impl_->promote(*this, unit);
}

bool CompilationManager::onLoopBackEdges(const UnitPtr &unit, uint64_t count)
{
    if (unit->recordLoopBackEdges(count) < impl_->config.loopThreshold)
        return false;
    return impl_->promote(*this, unit);
}

bool CompilationManager::onSpeculationFailed(CompilationUnit &unit,
                                             CodeId code,
                                             SpeculationId speculation)
{
    const uint64_t failures = unit.speculationLog().recordFailure(speculation);
    impl_->trace.onSpeculationFailed(unit, speculation, failures);
    return invalidate(unit, code, "speculation failed");
}

bool CompilationManager::release(CompilationUnit &unit)
{
    if (TaskPtr task = unit.task(); task && !task->isTerminal())
    {
        if (impl_->queue->cancel(task, "compilation unit released"))
        {
            ++impl_->counters.cancelRequests;
            impl_->trace.onCancel(unit, task->id(), "compilation unit released");
        }
    }
    return invalidate(unit, "compilation unit released");
}

void CompilationManager::shutdown()
{
    impl_->queue->shutdown();
}

bool CompilationManager::isShutdown() const
{
    return impl_->queue->isShutdown();
}

CompileMode CompilationManager::mode() const
{
    return impl_->queue->mode();
}

const JitConfig &CompilationManager::config() const
{
    return impl_->config;
}

CompilationStatistics CompilationManager::statistics() const
{
    const Impl::Counters &c = impl_->counters;
    CompilationStatistics stats;
    stats.submitted = c.submitted.load();
    stats.coalesced = c.coalesced.load();
    stats.rejected = c.rejected.load();
    stats.completed = c.completed.load();
    stats.failed = c.failed.load();
    stats.cancelRequests = c.cancelRequests.load();
    stats.discardedAfterCancel = c.discardedAfterCancel.load();
    stats.invalidated = c.invalidated.load();
    stats.installedUnits = impl_->registry.size();
    return stats;
}

} // namespace kiln::jit
