//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CompiledArtifact.hpp
// Purpose: Value produced by a backend for one compilation unit.
// Key invariants: The manager never mutates an artifact after the backend
//                 returns it; installation copies it.
// Ownership/Lifetime: Plain value type.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "jit/SpeculationLog.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace kiln::jit
{

/// @brief Machine code and metadata emitted by the backend.
struct CompiledArtifact
{
    std::string name;                       ///< Symbolic name for diagnostics.
    std::vector<uint8_t> code;              ///< Encoded machine code.
    std::size_t entryOffset = 0;            ///< Entry point offset into @c code.
    std::vector<SpeculationId> speculations; ///< Assumptions the code relies on.
};

} // namespace kiln::jit
