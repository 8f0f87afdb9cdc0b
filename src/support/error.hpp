//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/error.hpp
// Purpose: Declares the error value reported by compilation-manager operations.
// Key invariants: Every Error carries exactly one kind; message may be empty.
// Ownership/Lifetime: Value type; owns its message text.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace kiln::support
{

/// @brief Classification of recoverable failures.
enum class ErrorKind
{
    QueueClosed,            ///< Submission after the queue was shut down.
    QueueFull,              ///< Bounded queue had no room for another task.
    CompileFailed,          ///< Backend reported an error or threw.
    Timeout,                ///< A wait exceeded its budget; the task keeps running.
    CancelledBeforeInstall, ///< Cancellation won the race against installation.
    NotSubmitted,           ///< The unit never had a compilation task.
    InvalidConfig           ///< Configuration rejected by validation.
};

/// @brief Single error with kind and human-readable detail.
struct Error
{
    ErrorKind kind;      ///< Failure classification
    std::string message; ///< Detail text, e.g. the backend's message
};

/// @brief Convenience constructor for an Error value.
Error makeError(ErrorKind kind, std::string message = {});

/// @brief Stable kebab-case name for @p kind, used in logs and tests.
std::string_view toString(ErrorKind kind);

/// @brief Print @p err as `error[<kind>]: <message>` followed by a newline.
void printError(std::ostream &os, const Error &err);

} // namespace kiln::support
