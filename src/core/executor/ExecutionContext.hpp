#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

#include "Errors.hpp"

namespace flowgraph {

/**
 * @brief Cancellation and deadline carrier for one execution.
 *
 * @details
 * Cancel() may be called from any thread. Nodes that block on external
 * work should poll IsCancelled() or call ThrowIfCancelled() at their own
 * suspension points; the executor checks it around every node execution,
 * condition scan and checkpoint write.
 *
 * The first cause wins: a run cancelled by request stays "requested" even
 * if its deadline passes afterwards.
 */
class ExecutionContext {
public:
    using SteadyClock = std::chrono::steady_clock;

    // No deadline until ArmDeadline() is called.
    ExecutionContext() = default;

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    void Cancel(CancelCause cause = CancelCause::Requested) noexcept;

    // Deadline is now + timeout. Replaces any earlier deadline.
    void ArmDeadline(SteadyClock::duration timeout) noexcept;

    bool IsCancelled() const noexcept;

    // Empty while the context is live.
    std::optional<CancelCause> Cause() const noexcept;

    // @throws CancelledError carrying Cause().
    void ThrowIfCancelled() const;

    // Shared context that is never cancelled, for direct node invocations.
    static const ExecutionContext& Background();

private:
    enum : int { kLive = 0, kRequested = 1, kDeadline = 2 };

    // Steady clock ticks since epoch, 0 when unarmed.
    std::atomic<std::int64_t> deadline_{0};
    std::atomic<int> cause_{kLive};
};

}  // namespace flowgraph
