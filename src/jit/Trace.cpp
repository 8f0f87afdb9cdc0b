//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/Trace.cpp
// Purpose: Render compilation-manager events as deterministic trace lines.
// Key invariants: Each event produces at most one flushed line; categories
//                 disabled in TraceConfig produce nothing and format nothing.
// Ownership/Lifetime: The sink borrows its output stream.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the compilation tracing facilities.
/// @details Every line starts with "[jit]" followed by the event name and a
///          fixed sequence of key=value fields. Lines are assembled in a local
///          buffer first and written under a mutex, so records produced by
///          concurrent compiler workers remain whole.

#include "jit/Trace.hpp"

#include "jit/CompilationUnit.hpp"
#include "support/error.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace kiln::jit
{
namespace
{

/// @brief Append the standard unit identification fields.
void writeUnit(std::ostringstream &os, const CompilationUnit &unit)
{
    os << " unit=#" << unit.id() << " name=" << unit.name();
}

} // namespace

bool TraceConfig::enabled() const
{
    return compilation || failures || invalidation || queue;
}

TraceSink::TraceSink(TraceConfig c) : cfg(std::move(c)) {}

void TraceSink::onSubmit(const CompilationUnit &unit, uint64_t taskId, bool coalesced)
{
    if (!cfg.compilation)
        return;
    std::ostringstream os;
    os << "[jit] submit";
    writeUnit(os, unit);
    os << " task=#" << taskId;
    if (coalesced)
        os << " coalesced";
    emit(os.str());
}

void TraceSink::onStart(const CompilationUnit &unit, uint64_t taskId)
{
    if (!cfg.compilation)
        return;
    std::ostringstream os;
    os << "[jit] start";
    writeUnit(os, unit);
    os << " task=#" << taskId;
    emit(os.str());
}

void TraceSink::onInstall(const CompilationUnit &unit, uint64_t taskId, uint64_t artifactId)
{
    if (!cfg.compilation)
        return;
    std::ostringstream os;
    os << "[jit] install";
    writeUnit(os, unit);
    os << " task=#" << taskId << " code=#" << artifactId;
    emit(os.str());
}

void TraceSink::onFailure(const CompilationUnit &unit, uint64_t taskId, const support::Error &err)
{
    if (!cfg.failures)
        return;
    std::ostringstream os;
    os << "[jit] failed";
    writeUnit(os, unit);
    os << " task=#" << taskId << " kind=" << support::toString(err.kind);
    if (!err.message.empty())
        os << " detail=\"" << err.message << '"';
    emit(os.str());
}

void TraceSink::onCancel(const CompilationUnit &unit, uint64_t taskId, std::string_view reason)
{
    if (!cfg.compilation)
        return;
    std::ostringstream os;
    os << "[jit] cancel";
    writeUnit(os, unit);
    os << " task=#" << taskId;
    if (!reason.empty())
        os << " reason=\"" << reason << '"';
    emit(os.str());
}

void TraceSink::onDiscard(const CompilationUnit &unit, uint64_t taskId)
{
    if (!cfg.compilation)
        return;
    std::ostringstream os;
    os << "[jit] discard";
    writeUnit(os, unit);
    os << " task=#" << taskId;
    emit(os.str());
}

void TraceSink::onInvalidate(const CompilationUnit &unit,
                             uint64_t artifactId,
                             bool evicted,
                             std::string_view reason)
{
    if (!cfg.invalidation)
        return;
    std::ostringstream os;
    os << "[jit] invalidate";
    writeUnit(os, unit);
    os << " code=#" << artifactId << (evicted ? " evicted" : " stale");
    if (!reason.empty())
        os << " reason=\"" << reason << '"';
    emit(os.str());
}

void TraceSink::onSpeculationFailed(const CompilationUnit &unit,
                                    uint64_t speculationId,
                                    uint64_t count)
{
    if (!cfg.invalidation)
        return;
    std::ostringstream os;
    os << "[jit] speculation-failed";
    writeUnit(os, unit);
    os << " speculation=#" << speculationId << " failures=" << count;
    emit(os.str());
}

void TraceSink::onQueue(std::string_view event, uint64_t taskId, std::size_t depth)
{
    if (!cfg.queue)
        return;
    std::ostringstream os;
    os << "[jit] queue " << event << " task=#" << taskId << " depth=" << depth;
    emit(os.str());
}

void TraceSink::emit(std::string_view line)
{
    std::ostream &os = cfg.out ? *cfg.out : std::cerr;
    std::lock_guard<std::mutex> lock(mu);
    os << line << '\n' << std::flush;
}

} // namespace kiln::jit
