//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/jit/InstalledCode.cpp
// Purpose: Implement copy-on-install and identity-checked eviction.
// Key invariants: Entries are only touched under the registry mutex.
// Ownership/Lifetime: shared_ptr control blocks keep evicted code readable for
//                     callers that looked it up before eviction.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#include "jit/InstalledCode.hpp"

#include <utility>

namespace kiln::jit
{

InstalledCode::InstalledCode(CodeId id,
                             UnitId unit,
                             CompiledArtifact artifact,
                             SpeculationSnapshotPtr speculations)
    : id_(id), unit_(unit), artifact_(std::move(artifact)), speculations_(std::move(speculations))
{
    if (!speculations_)
        speculations_ = std::make_shared<const SpeculationLog::Snapshot>();
}

InstalledCodePtr InstalledCodeRegistry::install(UnitId unit,
                                                const CompiledArtifact &artifact,
                                                SpeculationSnapshotPtr speculations,
                                                std::weak_ptr<const CompilationUnit> owner)
{
    std::lock_guard<std::mutex> lock(mu_);
    pruneReleasedLocked();
    auto code = std::make_shared<InstalledCode>(nextId_++, unit, artifact, std::move(speculations));
    Entry &slot = entries_[unit];
    if (slot.code)
        slot.code->markInvalid();
    slot.code = code;
    slot.owned = !owner.expired();
    slot.owner = std::move(owner);
    return code;
}

InstalledCodePtr InstalledCodeRegistry::lookup(UnitId unit) const
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(unit);
    if (it == entries_.end())
        return nullptr;
    return it->second.code;
}

bool InstalledCodeRegistry::invalidate(UnitId unit, CodeId code)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(unit);
    if (it == entries_.end() || it->second.code->id() != code)
        return false;
    it->second.code->markInvalid();
    entries_.erase(it);
    return true;
}

InstalledCodePtr InstalledCodeRegistry::evict(UnitId unit)
{
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(unit);
    if (it == entries_.end())
        return nullptr;
    std::shared_ptr<InstalledCode> code = std::move(it->second.code);
    entries_.erase(it);
    code->markInvalid();
    return code;
}

void InstalledCodeRegistry::clear()
{
    std::lock_guard<std::mutex> lock(mu_);
    for (auto &entry : entries_)
        entry.second.code->markInvalid();
    entries_.clear();
}

std::size_t InstalledCodeRegistry::pruneReleased()
{
    std::lock_guard<std::mutex> lock(mu_);
    return pruneReleasedLocked();
}

std::size_t InstalledCodeRegistry::pruneReleasedLocked()
{
    std::size_t evicted = 0;
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (it->second.owned && it->second.owner.expired())
        {
            it->second.code->markInvalid();
            it = entries_.erase(it);
            ++evicted;
        }
        else
        {
            ++it;
        }
    }
    return evicted;
}

std::size_t InstalledCodeRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

} // namespace kiln::jit
