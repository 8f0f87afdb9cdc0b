//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line members of Expected<void>. Operations that only succeed or fail
// (configuration validation, queue admission) report through this type so
// callers branch the same way they do for value-returning operations.
//
//===----------------------------------------------------------------------===//

#include "support/expected.hpp"

namespace kiln::support
{

Expected<void>::Expected(Error err) : error_(std::move(err)) {}

bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

const Error &Expected<void>::error() const &
{
    return *error_;
}

} // namespace kiln::support
