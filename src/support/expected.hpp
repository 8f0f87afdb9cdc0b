//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/expected.hpp
// Purpose: Result type of every fallible compilation-manager operation:
//          submission (a task), waits (installed code), queue admission and
//          configuration validation (no payload).
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Owns the stored value or error.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/error.hpp"

#include <optional>
#include <type_traits>
#include <utility>

namespace kiln::support
{

/// @brief Either the payload of a successful operation or the Error that
///        stopped it.
/// @tparam T Payload, e.g. TaskPtr from submit or InstalledCodePtr from wait.
/// @note Waits fail with Timeout, CompileFailed or CancelledBeforeInstall;
///       submissions with QueueClosed or QueueFull. Inspect error().kind.
template <class T> class Expected
{
  public:
    /// @brief Wrap a successful payload, so `return task;` works directly.
    /// @details Excluded for Error and Expected arguments, which select the
    ///          error and copy constructors.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Error> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Wrap a failure, so `return makeError(...);` works directly.
    Expected(Error err) : error_(std::move(err)) {}

    /// @brief True when the operation produced its payload.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief The payload; requires hasValue().
    T &value()
    {
        return *value_;
    }

    const T &value() const
    {
        return *value_;
    }

    /// @brief Why the operation failed; requires !hasValue().
    const Error &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Error> error_;
};

/// @brief Outcome of operations with no payload, such as validate(JitConfig)
///        and CompileQueue::submit.
template <> class Expected<void>
{
  public:
    /// @brief Success; `return {};`.
    Expected() = default;

    Expected(Error err);

    [[nodiscard]] bool hasValue() const;

    explicit operator bool() const;

    /// @brief Why the operation failed; requires !hasValue().
    const Error &error() const &;

  private:
    std::optional<Error> error_;
};

} // namespace kiln::support
