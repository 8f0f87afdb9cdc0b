//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/InstalledCode.hpp
// Purpose: Active compiled code per unit and the registry that swaps it.
// Key invariants:
//   - A registry entry is replaced wholesale; readers see the old or the new
//     InstalledCode, never a mix.
//   - Install and evict on one unit are serialised by the registry mutex.
//   - Evicted or superseded code has its validity flag cleared before the
//     registry lock is released.
// Ownership/Lifetime: The registry exclusively owns the mutable handle to each
//                     InstalledCode; dispatchers and tasks hold shared const
//                     references that stay readable after eviction.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/CompilationUnit.hpp"
#include "jit/CompiledArtifact.hpp"
#include "jit/SpeculationLog.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace kiln::jit
{

/// @brief Identity of one installation of compiled code.
using CodeId = uint64_t;

/// @brief Compiled artifact installed for one unit.
class InstalledCode
{
  public:
    InstalledCode(CodeId id,
                  UnitId unit,
                  CompiledArtifact artifact,
                  SpeculationSnapshotPtr speculations);

    InstalledCode(const InstalledCode &) = delete;
    InstalledCode &operator=(const InstalledCode &) = delete;

    CodeId id() const
    {
        return id_;
    }

    UnitId unitId() const
    {
        return unit_;
    }

    /// @brief Private copy of the backend's artifact.
    const CompiledArtifact &artifact() const
    {
        return artifact_;
    }

    /// @brief Speculation log state the code was compiled against.
    const SpeculationLog::Snapshot &speculations() const
    {
        return *speculations_;
    }

    /// @brief False once evicted or superseded; dispatch must not enter it.
    bool isValid() const
    {
        return valid_.load(std::memory_order_acquire);
    }

  private:
    friend class InstalledCodeRegistry;

    void markInvalid()
    {
        valid_.store(false, std::memory_order_release);
    }

    CodeId id_;
    UnitId unit_;
    CompiledArtifact artifact_;
    SpeculationSnapshotPtr speculations_;
    std::atomic<bool> valid_{true};
};

using InstalledCodePtr = std::shared_ptr<const InstalledCode>;

/// @brief Maps each unit to its currently active InstalledCode.
class InstalledCodeRegistry
{
  public:
    InstalledCodeRegistry() = default;

    InstalledCodeRegistry(const InstalledCodeRegistry &) = delete;
    InstalledCodeRegistry &operator=(const InstalledCodeRegistry &) = delete;

    /// @brief Copy @p artifact into a new InstalledCode and make it current.
    /// @details Any previous entry for @p unit is marked invalid and replaced.
    ///          When @p owner is given, the entry is dropped by a later prune
    ///          once that unit has been released. Every install prunes.
    InstalledCodePtr install(UnitId unit,
                             const CompiledArtifact &artifact,
                             SpeculationSnapshotPtr speculations,
                             std::weak_ptr<const CompilationUnit> owner = {});

    /// @brief Current code for @p unit, or nullptr to interpret.
    InstalledCodePtr lookup(UnitId unit) const;

    /// @brief Evict @p unit's entry only if it is still installation @p code.
    /// @return True when an entry was evicted; false is the benign outcome of
    ///         the entry having already been replaced or removed.
    bool invalidate(UnitId unit, CodeId code);

    /// @brief Evict whatever is installed for @p unit.
    /// @return The evicted code, or nullptr when nothing was installed.
    InstalledCodePtr evict(UnitId unit);

    /// @brief Evict every entry.
    void clear();

    /// @brief Evict entries whose owning unit no longer exists.
    /// @return Number of entries evicted.
    std::size_t pruneReleased();

    std::size_t size() const;

  private:
    struct Entry
    {
        std::shared_ptr<InstalledCode> code;
        std::weak_ptr<const CompilationUnit> owner;
        bool owned = false; ///< An owner was alive at install time.
    };

    std::size_t pruneReleasedLocked();

    mutable std::mutex mu_;
    std::unordered_map<UnitId, Entry> entries_;
    CodeId nextId_ = 1;
};

} // namespace kiln::jit
