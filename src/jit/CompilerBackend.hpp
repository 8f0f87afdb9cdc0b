//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CompilerBackend.hpp
// Purpose: Interface to the code generator driven by the compilation manager.
// Key invariants: Backends must be callable from several worker threads at
//                 once and should poll the cancellation token at safe points.
// Ownership/Lifetime: Backends are owned by the embedder and must outlive the
//                     CompilationManager that uses them.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/CancellationToken.hpp"
#include "jit/CompiledArtifact.hpp"
#include "jit/SpeculationLog.hpp"
#include "support/expected.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace kiln::jit
{
class CompilationUnit;

/// @brief Abstract code generator.
/// @details Failures are reported as ErrorKind::CompileFailed values. Thrown
///          exceptions are tolerated; the manager converts them at the task
///          boundary.
class CompilerBackend
{
  public:
    virtual ~CompilerBackend() = default;

    /// @brief Backend name for diagnostics.
    virtual std::string_view name() const = 0;

    /// @brief Compile @p unit against the speculation state in @p speculations.
    /// @param unit Unit being compiled; read-only for the backend.
    /// @param speculations Snapshot of the unit's speculation log taken when the
    ///        compilation started.
    /// @param token Cancellation predicate to poll at safe points.
    virtual support::Expected<CompiledArtifact> compile(const CompilationUnit &unit,
                                                        const SpeculationLog::Snapshot &speculations,
                                                        const CancellationToken &token) = 0;
};

/// @brief Backend that forwards to a callable, for embedders and tests.
class FunctionBackend final : public CompilerBackend
{
  public:
    using CompileFn = std::function<support::Expected<CompiledArtifact>(
        const CompilationUnit &, const SpeculationLog::Snapshot &, const CancellationToken &)>;

    FunctionBackend(std::string name, CompileFn fn);

    std::string_view name() const override;

    support::Expected<CompiledArtifact> compile(const CompilationUnit &unit,
                                                const SpeculationLog::Snapshot &speculations,
                                                const CancellationToken &token) override;

  private:
    std::string name_;
    CompileFn fn_;
};

} // namespace kiln::jit
