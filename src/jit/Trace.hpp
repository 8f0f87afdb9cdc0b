//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/Trace.hpp
// Purpose: Declare tracing configuration and sink for compilation events.
// Key invariants: Trace output is line-oriented; lines never interleave.
// Ownership/Lifetime: Sink holds configuration by value; the output stream is
//                     borrowed and must outlive the sink.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string_view>

namespace kiln::support
{
struct Error;
} // namespace kiln::support

namespace kiln::jit
{
class CompilationUnit;

/// @brief Configuration for compilation tracing.
struct TraceConfig
{
    bool compilation = false;  ///< Submit/start/finish/install events.
    bool failures = true;      ///< Backend failures and exceptions.
    bool invalidation = false; ///< Evictions and failed speculations.
    bool queue = false;        ///< Enqueue/dequeue with queue depth.

    /// @brief Destination for trace lines; nullptr selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether any category is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    const TraceConfig &config() const
    {
        return cfg;
    }

    void onSubmit(const CompilationUnit &unit, uint64_t taskId, bool coalesced);
    void onStart(const CompilationUnit &unit, uint64_t taskId);
    void onInstall(const CompilationUnit &unit, uint64_t taskId, uint64_t artifactId);
    void onFailure(const CompilationUnit &unit, uint64_t taskId, const support::Error &err);
    void onCancel(const CompilationUnit &unit, uint64_t taskId, std::string_view reason);
    void onDiscard(const CompilationUnit &unit, uint64_t taskId);
    void onInvalidate(const CompilationUnit &unit,
                      uint64_t artifactId,
                      bool evicted,
                      std::string_view reason);
    void onSpeculationFailed(const CompilationUnit &unit, uint64_t speculationId, uint64_t count);
    void onQueue(std::string_view event, uint64_t taskId, std::size_t depth);

  private:
    /// @brief Write one complete line under the sink mutex.
    void emit(std::string_view line);

    TraceConfig cfg; ///< Active configuration
    std::mutex mu;   ///< Serialises lines from concurrent workers.
};

} // namespace kiln::jit
