#include "ExecutionResult.hpp"

#include "TimeUtils.hpp"

namespace flowgraph {

namespace {

double to_millis(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

const char* ToString(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Running:
            return "running";
        case ExecutionStatus::Completed:
            return "completed";
        case ExecutionStatus::Failed:
            return "failed";
        case ExecutionStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

json::object ExecutionResult::ToJson() const {
    json::object out;
    out["execution_id"] = execution_id;
    out["graph_id"] = graph_id;
    out["state_id"] = state_id;
    out["status"] = ToString(status);
    out["start_time"] = util::FormatTimestamp(start_time);
    if (end_time) out["end_time"] = util::FormatTimestamp(*end_time);
    out["duration_ms"] = to_millis(duration);
    if (!error.empty()) out["error"] = error;
    if (error_code) out["error_code"] = ToString(*error_code);

    json::array visited;
    for (const auto& id : nodes_visited) visited.emplace_back(id);
    out["nodes_visited"] = std::move(visited);

    if (final_state) out["final_state"] = final_state->ToJson();
    out["metadata"] = metadata;
    return out;
}

json::object ExecutionStats::ToJson() const {
    json::object counts;
    counts["running"] = running;
    counts["completed"] = completed;
    counts["failed"] = failed;
    counts["cancelled"] = cancelled;

    json::object out;
    out["total_executions"] = total;
    out["status_counts"] = std::move(counts);
    out["total_duration_ms"] = to_millis(total_duration);
    out["avg_duration_ms"] = average_duration_ms;
    return out;
}

}  // namespace flowgraph
