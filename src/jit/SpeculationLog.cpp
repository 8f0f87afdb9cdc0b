//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/SpeculationLog.cpp
// Purpose: Implement the per-unit speculation failure log.
// Key invariants: recordFailure is the only mutator and only increments.
// Ownership/Lifetime: Snapshots copy the counters and outlive the log safely.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/SpeculationLog.hpp"

#include <algorithm>

namespace kiln::jit
{

uint64_t SpeculationLog::Snapshot::failureCount(SpeculationId id) const
{
    auto it = counts_.find(id);
    return it == counts_.end() ? 0 : it->second;
}

SpeculationLog::SpeculationLog(uint32_t maxFailures) : maxFailures_(std::max(1u, maxFailures)) {}

uint64_t SpeculationLog::recordFailure(SpeculationId id)
{
    std::lock_guard<std::mutex> lock(mu_);
    ++version_;
    return ++counts_[id];
}

uint64_t SpeculationLog::failureCount(SpeculationId id) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = counts_.find(id);
    return it == counts_.end() ? 0 : it->second;
}

bool SpeculationLog::maySpeculate(SpeculationId id) const
{
    return failureCount(id) < maxFailures_;
}

uint64_t SpeculationLog::version() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
}

std::shared_ptr<const SpeculationLog::Snapshot> SpeculationLog::snapshot() const
{
    auto snap = std::make_shared<Snapshot>();
    snap->maxFailures_ = maxFailures_;
    std::lock_guard<std::mutex> lock(mu_);
    snap->counts_ = counts_;
    snap->version_ = version_;
    return snap;
}

} // namespace kiln::jit
