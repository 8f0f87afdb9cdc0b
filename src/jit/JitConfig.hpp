//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/JitConfig.hpp
// Purpose: Configuration parameters for a CompilationManager instance.
// Key invariants: The mode is fixed for the lifetime of the manager built
//                 from this configuration.
// Ownership/Lifetime: Value type; the trace stream pointer is borrowed.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/Trace.hpp"
#include "support/expected.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace kiln::jit
{

/// @brief How compilation work is scheduled.
enum class CompileMode
{
    Background, ///< Worker pool; submit returns immediately
    Synchronous ///< Compile on the calling thread before submit returns
};

/// @brief Printable name of @p mode ("background" or "sync").
std::string_view toString(CompileMode mode);

/// @brief Configuration for a CompilationManager.
struct JitConfig
{
    CompileMode mode = CompileMode::Background; ///< Scheduling strategy.
    /// @brief Number of compiler worker threads in background mode.
    /// @details Zero selects a default derived from the hardware concurrency.
    unsigned workerCount = 0;
    /// @brief Maximum number of queued (not yet running) tasks; zero is unbounded.
    std::size_t queueCapacity = 0;

    uint64_t callThreshold = 1000; ///< Calls before onCall submits the unit.
    uint64_t loopThreshold = 100000; ///< Loop back-edges before promotion.
    /// @brief Failures after which a speculation must not be relied upon again.
    uint32_t maxSpeculationFailures = 1;

    /// @brief Deadline applied to every task; zero disables it.
    std::chrono::milliseconds defaultDeadline{0};

    TraceConfig trace; ///< Tracing configuration.
};

/// @brief Worker count actually used for @p cfg after defaulting.
unsigned effectiveWorkerCount(const JitConfig &cfg);

/// @brief Apply KILN_* environment variable overrides to @p cfg.
/// @details Malformed values are ignored so the configured default survives.
void applyEnvironmentOverrides(JitConfig &cfg);

/// @brief Reject configurations that cannot produce a working manager.
support::Expected<void> validate(const JitConfig &cfg);

} // namespace kiln::jit
