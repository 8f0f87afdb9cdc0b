//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/CompilerBackend.cpp
// Purpose: Callable-backed CompilerBackend adapter.
// Key invariants: An empty callable reports CompileFailed instead of throwing.
// Ownership/Lifetime: The adapter owns its callable.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/CompilerBackend.hpp"

#include <utility>

namespace kiln::jit
{

FunctionBackend::FunctionBackend(std::string name, CompileFn fn)
    : name_(std::move(name)), fn_(std::move(fn))
{
}

std::string_view FunctionBackend::name() const
{
    return name_;
}

support::Expected<CompiledArtifact> FunctionBackend::compile(const CompilationUnit &unit,
                                                             const SpeculationLog::Snapshot &speculations,
                                                             const CancellationToken &token)
{
    if (!fn_)
        return support::makeError(support::ErrorKind::CompileFailed,
                                  "backend '" + name_ + "' has no compile function");
    return fn_(unit, speculations, token);
}

} // namespace kiln::jit
