//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the textual helpers for kiln::support::Error. Kind names are
// part of the log format and are relied upon by tooling that scrapes trace
// output, so they must stay stable.
//
//===----------------------------------------------------------------------===//

#include "support/error.hpp"

#include <utility>

namespace kiln::support
{

Error makeError(ErrorKind kind, std::string message)
{
    return Error{kind, std::move(message)};
}

/// @brief Map an ErrorKind to its printable name.
/// @details Out-of-range values map to "unknown".
std::string_view toString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::QueueClosed:
            return "queue-closed";
        case ErrorKind::QueueFull:
            return "queue-full";
        case ErrorKind::CompileFailed:
            return "compile-failed";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::CancelledBeforeInstall:
            return "cancelled-before-install";
        case ErrorKind::NotSubmitted:
            return "not-submitted";
        case ErrorKind::InvalidConfig:
            return "invalid-config";
    }
    return "unknown";
}

void printError(std::ostream &os, const Error &err)
{
    os << "error[" << toString(err.kind) << "]";
    if (!err.message.empty())
        os << ": " << err.message;
    os << '\n';
}

} // namespace kiln::support
