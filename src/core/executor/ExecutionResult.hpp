#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "State.hpp"
#include "types.hpp"

namespace flowgraph {

enum class ExecutionStatus { Running, Completed, Failed, Cancelled };

const char* ToString(ExecutionStatus status) noexcept;

inline bool IsTerminal(ExecutionStatus status) noexcept {
    return status != ExecutionStatus::Running;
}

struct ExecutionOptions {
    int max_iterations = DEFAULT_MAX_ITERATIONS;
    // Zero or negative disables the wall-clock deadline.
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    json::object metadata;
    std::string user_id;
    std::string session_id;
};

/**
 * @brief Outcome of one execution, as kept in the executor's ledger.
 *
 * While status is Running the ledger keeps appending to nodes_visited;
 * after the single terminal transition every field is frozen.
 */
struct ExecutionResult {
    std::string execution_id;
    std::string graph_id;
    std::string state_id;
    ExecutionStatus status = ExecutionStatus::Running;

    TimePoint start_time{};
    std::optional<TimePoint> end_time;
    std::chrono::nanoseconds duration{0};

    std::string error;
    std::optional<ErrorCode> error_code;

    std::vector<std::string> nodes_visited;
    StatePtr final_state;  // set on Completed only
    json::object metadata;

    json::object ToJson() const;
};

struct ExecutionStats {
    std::size_t total = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
    std::chrono::nanoseconds total_duration{0};
    // Mean over terminal executions, 0 when there are none.
    double average_duration_ms = 0.0;

    json::object ToJson() const;
};

}  // namespace flowgraph
