//===----------------------------------------------------------------------===//
//
// Part of the Kiln project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: jit/CancellationToken.hpp
// Purpose: Cooperative cancellation flag polled by compiler backends.
// Key invariants: Once requested, cancellation stays requested. The deadline
//                 is fixed at construction.
// Ownership/Lifetime: Copies share one state block; the task keeps one copy and
//                     hands another to the backend.
// Links: docs/dev/jit.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace kiln::jit
{

/// @brief Shared, copyable handle to a cancellation flag.
class CancellationToken
{
  public:
    using Clock = std::chrono::steady_clock;

    /// @brief Create a fresh token, optionally expiring at @p deadline.
    explicit CancellationToken(std::optional<Clock::time_point> deadline = std::nullopt)
        : state_(std::make_shared<State>())
    {
        state_->deadline = deadline;
    }

    /// @brief Ask the holder to stop at its next safe point.
    void requestCancel() const
    {
        state_->cancelled.store(true, std::memory_order_release);
    }

    /// @brief True once cancellation was requested explicitly.
    bool cancelRequested() const
    {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /// @brief True when the deadline, if any, has passed.
    bool deadlineExpired() const
    {
        return state_->deadline && Clock::now() >= *state_->deadline;
    }

    /// @brief Predicate backends poll at safe points.
    bool isCancelled() const
    {
        return cancelRequested() || deadlineExpired();
    }

    std::optional<Clock::time_point> deadline() const
    {
        return state_->deadline;
    }

  private:
    struct State
    {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
    };

    std::shared_ptr<State> state_;
};

} // namespace kiln::jit
