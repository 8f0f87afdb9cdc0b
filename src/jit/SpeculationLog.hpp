//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/SpeculationLog.hpp
// Purpose: Append-only record of failed runtime assumptions for one unit.
// Key invariants: Failure counts never decrease. Only the execution path
//                 records failures; compilers read snapshots.
// Ownership/Lifetime: Owned by its CompilationUnit; snapshots are immutable
//                     values shared with tasks and installed code.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace kiln::jit
{

/// @brief Identifier of a runtime assumption made by compiled code.
using SpeculationId = uint64_t;

/// @brief Thread-safe failure counters keyed by speculation id.
class SpeculationLog
{
  public:
    /// @brief Immutable view of the log at one instant.
    class Snapshot
    {
      public:
        Snapshot() = default;

        /// @brief Number of recorded failures for @p id at snapshot time.
        uint64_t failureCount(SpeculationId id) const;

        /// @brief Whether @p id had failed at least once at snapshot time.
        bool hasFailed(SpeculationId id) const
        {
            return failureCount(id) != 0;
        }

        /// @brief Whether compiled code may still rely on @p id.
        bool maySpeculate(SpeculationId id) const
        {
            return failureCount(id) < maxFailures_;
        }

        /// @brief Log version the snapshot was taken at.
        uint64_t version() const
        {
            return version_;
        }

        /// @brief Number of distinct speculations with failures.
        std::size_t size() const
        {
            return counts_.size();
        }

      private:
        friend class SpeculationLog;

        std::unordered_map<SpeculationId, uint64_t> counts_;
        uint64_t version_ = 0;
        uint32_t maxFailures_ = 1;
    };

    /// @brief Create a log; a speculation is abandoned after @p maxFailures failures.
    explicit SpeculationLog(uint32_t maxFailures = 1);

    SpeculationLog(const SpeculationLog &) = delete;
    SpeculationLog &operator=(const SpeculationLog &) = delete;

    /// @brief Record that @p id failed at runtime.
    /// @return Failure count after the increment.
    uint64_t recordFailure(SpeculationId id);

    /// @brief Current failure count for @p id.
    uint64_t failureCount(SpeculationId id) const;

    /// @brief Whether compiled code may still rely on @p id.
    bool maySpeculate(SpeculationId id) const;

    /// @brief Monotonic counter bumped by every recorded failure.
    uint64_t version() const;

    /// @brief Copy the current counters into an immutable snapshot.
    std::shared_ptr<const Snapshot> snapshot() const;

  private:
    mutable std::mutex mu_;
    std::unordered_map<SpeculationId, uint64_t> counts_;
    uint64_t version_ = 0;
    uint32_t maxFailures_;
};

using SpeculationSnapshotPtr = std::shared_ptr<const SpeculationLog::Snapshot>;

} // namespace kiln::jit
