#include "GraphExecutor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

#include "Ids.hpp"
#include "TimeUtils.hpp"

namespace flowgraph {

GraphExecutor::GraphExecutor(std::shared_ptr<StateManager> state_manager,
                             unsigned int worker_threads)
    : state_manager_(std::move(state_manager)),
      pool_(std::make_unique<IoContextPool>(std::max(1U, worker_threads))) {
    if (!state_manager_) {
        throw ValidationError("GraphExecutor requires a state manager");
    }
    pool_->run();
}

GraphExecutor::~GraphExecutor() {
    std::vector<ExecutionPtr> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, execution] : executions_) live.push_back(execution);
    }
    for (const auto& execution : live) {
        execution->context->Cancel(CancelCause::Requested);
    }
    pool_->stop();
}

// =========================================================
//  Entry Points
// =========================================================

ExecutionResult GraphExecutor::Execute(const GraphPtr& graph, const json::object& input,
                                       const ExecutionOptions& options) {
    if (!graph) {
        throw ValidationError("cannot execute a null graph");
    }
    auto execution = Register(*graph, options);
    return Run(*graph, input, options, *execution);
}

AsyncExecution GraphExecutor::ExecuteAsync(const GraphPtr& graph, const json::object& input,
                                           const ExecutionOptions& options) {
    if (!graph) {
        throw ValidationError("cannot execute a null graph");
    }
    auto execution = Register(*graph, options);
    auto promise = std::make_shared<std::promise<ExecutionResult>>();

    AsyncExecution handle{execution->result.execution_id, promise->get_future()};

    asio::post(pool_->get_io_context(),
               [this, graph, input, options, execution, promise]() {
                   try {
                       promise->set_value(Run(*graph, input, options, *execution));
                   } catch (const std::exception& e) {
                       spdlog::error("[{}] Async execution aborted: {}",
                                     execution->result.execution_id, e.what());
                       promise->set_exception(std::current_exception());
                   }
               });

    return handle;
}

GraphExecutor::ExecutionPtr GraphExecutor::Register(const Graph& graph,
                                                    const ExecutionOptions& options) {
    auto execution = std::make_shared<Execution>();
    // Deadline is armed by Run(), so queue time does not count against it
    execution->context = std::make_shared<ExecutionContext>();

    auto& result = execution->result;
    result.execution_id = util::NewId();
    result.graph_id = graph.id();
    result.state_id = util::NewId();
    result.status = ExecutionStatus::Running;
    result.start_time = util::Now();
    result.metadata = options.metadata;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        executions_.emplace(result.execution_id, execution);
        order_.push_back(result.execution_id);
    }

    spdlog::debug("[{}] Execution registered for graph {}", result.execution_id, graph.id());
    return execution;
}

// =========================================================
//  Execution Loop
// =========================================================

ExecutionResult GraphExecutor::Run(const Graph& graph, const json::object& input,
                                   const ExecutionOptions& options, Execution& execution) {
    if (options.timeout.count() > 0) {
        execution.context->ArmDeadline(options.timeout);
    }
    const ExecutionContext& ctx = *execution.context;
    // Written once by Register(), read-only afterwards
    const std::string execution_id = execution.result.execution_id;
    const std::string state_id = execution.result.state_id;

    spdlog::info("[{}] Executing graph '{}' ({})", execution_id, graph.name(), graph.id());

    // Context prefixed to any error escaping the current step
    std::string step;
    int iteration = 0;

    try {
        step = "graph validation failed";
        graph.Validate();

        step = "failed to save initial state";
        auto state = std::make_shared<State>(state_id, graph.id());
        state->SetUserId(options.user_id);
        state->SetSessionId(options.session_id);
        if (!input.empty()) {
            state->SetMultiple(input);
        }
        Checkpoint(ctx, *state);

        std::string current = graph.entry_point();

        while (iteration < options.max_iterations) {
            ++iteration;
            step.clear();
            ctx.ThrowIfCancelled();
            RecordVisit(execution, current);

            // The state that reaches an exit point is final; the exit node is not run
            if (graph.IsExitPoint(current)) {
                spdlog::info("[{}] Reached exit point {} after {} steps", execution_id, current,
                             iteration);
                Finish(execution, ExecutionStatus::Completed, state, {}, std::nullopt);
                return Snapshot(execution);
            }

            NodePtr node = graph.GetNode(current);
            if (!node) {
                throw NotFoundError("node " + current + " not found");
            }

            step = "node " + current + " execution failed";
            state = ExecuteNode(*node, ctx, *state);

            step = "failed to save state after node " + current;
            Checkpoint(ctx, *state);

            step = "failed to determine next node from " + current;
            ctx.ThrowIfCancelled();
            auto next = NextNode(graph, current, *state);
            if (!next) {
                spdlog::info("[{}] No outgoing edge matched at {}, execution complete",
                             execution_id, current);
                Finish(execution, ExecutionStatus::Completed, state, {}, std::nullopt);
                return Snapshot(execution);
            }
            current = std::move(*next);
        }

        step.clear();
        throw IterationBudgetExceeded(options.max_iterations);

    } catch (const CancelledError& e) {
        if (e.cause() == CancelCause::DeadlineExceeded) {
            spdlog::warn("[{}] Execution timed out after {} steps", execution_id, iteration);
            Finish(execution, ExecutionStatus::Failed, nullptr, e.what(), e.code());
        } else {
            spdlog::info("[{}] Execution cancelled after {} steps", execution_id, iteration);
            Finish(execution, ExecutionStatus::Cancelled, nullptr, e.what(), e.code());
        }
    } catch (const Error& e) {
        std::string message = step.empty() ? e.what() : step + ": " + e.what();
        spdlog::error("[{}] Execution failed: {}", execution_id, message);
        Finish(execution, ExecutionStatus::Failed, nullptr, std::move(message), e.code());
    } catch (const std::exception& e) {
        std::string message = step.empty() ? e.what() : step + ": " + e.what();
        spdlog::error("[{}] Execution failed: {}", execution_id, message);
        Finish(execution, ExecutionStatus::Failed, nullptr, std::move(message), std::nullopt);
    }

    return Snapshot(execution);
}

StatePtr GraphExecutor::ExecuteNode(const Node& node, const ExecutionContext& ctx,
                                    const State& state) {
    ctx.ThrowIfCancelled();
    spdlog::debug("Executing node {} ({})", node.id(), node.type_name());

    StatePtr next = node.Execute(ctx, state);
    if (!next) {
        throw InvalidStateError("node " + node.id() + " returned no state");
    }

    ctx.ThrowIfCancelled();
    return next;
}

void GraphExecutor::Checkpoint(const ExecutionContext& ctx, const State& state) {
    ctx.ThrowIfCancelled();
    state_manager_->SaveState(state);
    ctx.ThrowIfCancelled();
}

std::optional<std::string> GraphExecutor::NextNode(const Graph& graph, const std::string& current,
                                                   const State& state) const {
    for (const auto& edge : graph.GetEdges(current)) {
        bool matched = false;
        try {
            matched = edge.Matches(state);
        } catch (const Error& e) {
            spdlog::debug("Condition on edge {} -> {} failed: {}", edge.from, edge.to, e.what());
            throw;
        }
        if (matched) {
            spdlog::debug("Edge {} -> {} taken ({})", edge.from, edge.to,
                          edge.label.empty() ? "unconditional" : edge.label);
            return edge.to;
        }
    }
    return std::nullopt;
}

// =========================================================
//  Ledger Entry Helpers
// =========================================================

void GraphExecutor::RecordVisit(Execution& execution, const std::string& node_id) {
    std::lock_guard<std::mutex> lock(execution.mutex);
    if (IsTerminal(execution.result.status)) {
        // Cancelled out-of-band since the last step
        throw CancelledError(CancelCause::Requested);
    }
    execution.result.nodes_visited.push_back(node_id);
}

bool GraphExecutor::Finish(Execution& execution, ExecutionStatus status, StatePtr final_state,
                           std::string error, std::optional<ErrorCode> code) {
    std::lock_guard<std::mutex> lock(execution.mutex);
    auto& result = execution.result;
    if (IsTerminal(result.status)) {
        return false;
    }

    result.status = status;
    result.end_time = util::Now();
    result.duration = *result.end_time - result.start_time;
    result.final_state = std::move(final_state);
    result.error = std::move(error);
    result.error_code = code;

    spdlog::debug("[{}] Execution {} in {} us", result.execution_id, ToString(status),
                  std::chrono::duration_cast<std::chrono::microseconds>(result.duration).count());
    return true;
}

ExecutionResult GraphExecutor::Snapshot(Execution& execution) {
    std::lock_guard<std::mutex> lock(execution.mutex);
    ExecutionResult copy = execution.result;
    if (copy.final_state) {
        copy.final_state = copy.final_state->Clone();
    }
    return copy;
}

// =========================================================
//  Ledger
// =========================================================

std::optional<ExecutionResult> GraphExecutor::GetExecution(const std::string& execution_id) const {
    ExecutionPtr execution;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = executions_.find(execution_id);
        if (it == executions_.end()) return std::nullopt;
        execution = it->second;
    }
    return Snapshot(*execution);
}

std::vector<ExecutionResult> GraphExecutor::ListExecutions() const {
    std::vector<ExecutionPtr> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(order_.size());
        for (const auto& id : order_) {
            entries.push_back(executions_.at(id));
        }
    }

    std::vector<ExecutionResult> out;
    out.reserve(entries.size());
    for (const auto& execution : entries) {
        out.push_back(Snapshot(*execution));
    }
    return out;
}

void GraphExecutor::CancelExecution(const std::string& execution_id) {
    ExecutionPtr execution;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = executions_.find(execution_id);
        if (it == executions_.end()) {
            throw NotFoundError("execution " + execution_id + " not found");
        }
        execution = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(execution->mutex);
        auto status = execution->result.status;
        if (IsTerminal(status)) {
            throw InvalidStateError("execution " + execution_id + " is not running (status: " +
                                    ToString(status) + ")");
        }
    }

    execution->context->Cancel(CancelCause::Requested);
    if (!Finish(*execution, ExecutionStatus::Cancelled, nullptr,
                CancelledError(CancelCause::Requested).what(), ErrorCode::Cancelled)) {
        // The loop reached its own terminal state between the check and here
        throw InvalidStateError("execution " + execution_id + " is not running");
    }
    spdlog::info("[{}] Execution cancelled by request", execution_id);
}

std::size_t GraphExecutor::CleanupExecutions(std::chrono::nanoseconds max_age) {
    const TimePoint cutoff = util::Now() - std::chrono::duration_cast<Clock::duration>(max_age);

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;

    auto evict = [&](const std::string& id) {
        auto& execution = executions_.at(id);
        std::lock_guard<std::mutex> entry_lock(execution->mutex);
        const auto& result = execution->result;
        return IsTerminal(result.status) && result.end_time && *result.end_time <= cutoff;
    };

    auto it = std::remove_if(order_.begin(), order_.end(), [&](const std::string& id) {
        if (!evict(id)) return false;
        executions_.erase(id);
        ++removed;
        return true;
    });
    order_.erase(it, order_.end());

    if (removed > 0) {
        spdlog::debug("Cleaned up {} executions", removed);
    }
    return removed;
}

ExecutionStats GraphExecutor::GetExecutionStats() const {
    ExecutionStats stats;
    std::size_t terminal = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, execution] : executions_) {
        std::lock_guard<std::mutex> entry_lock(execution->mutex);
        const auto& result = execution->result;

        ++stats.total;
        switch (result.status) {
            case ExecutionStatus::Running:
                ++stats.running;
                continue;
            case ExecutionStatus::Completed:
                ++stats.completed;
                break;
            case ExecutionStatus::Failed:
                ++stats.failed;
                break;
            case ExecutionStatus::Cancelled:
                ++stats.cancelled;
                break;
        }
        ++terminal;
        stats.total_duration += result.duration;
    }

    if (terminal > 0) {
        stats.average_duration_ms =
            std::chrono::duration<double, std::milli>(stats.total_duration).count() /
            static_cast<double>(terminal);
    }
    return stats;
}

}  // namespace flowgraph
