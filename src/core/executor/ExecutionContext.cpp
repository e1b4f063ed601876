#include "ExecutionContext.hpp"

#include <algorithm>

namespace flowgraph {

void ExecutionContext::Cancel(CancelCause cause) noexcept {
    int expected = kLive;
    cause_.compare_exchange_strong(expected,
                                   cause == CancelCause::DeadlineExceeded ? kDeadline : kRequested);
}

void ExecutionContext::ArmDeadline(SteadyClock::duration timeout) noexcept {
    const auto at = SteadyClock::now() + timeout;
    deadline_.store(std::max<std::int64_t>(1, at.time_since_epoch().count()),
                    std::memory_order_release);
}

bool ExecutionContext::IsCancelled() const noexcept {
    return Cause().has_value();
}

std::optional<CancelCause> ExecutionContext::Cause() const noexcept {
    switch (cause_.load(std::memory_order_acquire)) {
        case kRequested:
            return CancelCause::Requested;
        case kDeadline:
            return CancelCause::DeadlineExceeded;
        default:
            break;
    }
    const std::int64_t deadline = deadline_.load(std::memory_order_acquire);
    if (deadline != 0 && SteadyClock::now().time_since_epoch().count() >= deadline) {
        return CancelCause::DeadlineExceeded;
    }
    return std::nullopt;
}

void ExecutionContext::ThrowIfCancelled() const {
    if (auto cause = Cause()) {
        throw CancelledError(*cause);
    }
}

const ExecutionContext& ExecutionContext::Background() {
    static const ExecutionContext background;
    return background;
}

}  // namespace flowgraph
