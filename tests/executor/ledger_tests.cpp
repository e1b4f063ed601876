#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <set>
#include <thread>

#include "Errors.hpp"
#include "GraphBuilder.hpp"
#include "GraphExecutor.hpp"
#include "MemoryStateManager.hpp"

using namespace flowgraph;
using namespace std::chrono_literals;

namespace {

// Function node that signals when it starts and then waits for either the
// gate to open or the context to be cancelled.
struct Gate {
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
};

GraphPtr gated_graph(const std::shared_ptr<Gate>& gate) {
    return GraphBuilder("gated")
        .AddStartNode("start", "Start")
        .AddFunctionNode("wait", "Wait",
                         [gate](const ExecutionContext& ctx, const State& state) {
                             gate->started.set_value();
                             while (!ctx.IsCancelled() &&
                                    gate->released.wait_for(1ms) != std::future_status::ready) {
                             }
                             return state.Clone();
                         })
        .AddEndNode("end", "End")
        .ConnectTo("wait")
        .ConnectTo("end")
        .Build();
}

GraphPtr simple_graph() {
    return GraphBuilder("simple")
        .AddStartNode("start", "Start")
        .AddEndNode("end", "End")
        .ConnectTo("end")
        .Build();
}

GraphPtr sleeping_graph(std::chrono::milliseconds duration) {
    return GraphBuilder("sleeping")
        .AddStartNode("start", "Start")
        .AddFunctionNode("sleep", "Sleep",
                         [duration](const ExecutionContext&, const State& state) {
                             std::this_thread::sleep_for(duration);
                             return state.Clone();
                         })
        .AddEndNode("end", "End")
        .ConnectTo("sleep")
        .ConnectTo("end")
        .Build();
}

GraphPtr failing_graph() {
    return GraphBuilder("failing")
        .AddStartNode("start", "Start")
        .AddFunctionNode("fail", "Fail",
                         [](const ExecutionContext&, const State&) -> StatePtr {
                             throw ValidationError("bad input");
                         })
        .AddEndNode("end", "End")
        .ConnectTo("fail")
        .ConnectTo("end")
        .Build();
}

class LedgerTests : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStateManager> states_ = std::make_shared<MemoryStateManager>();
    GraphExecutor executor_{states_, 2};
};

}  // namespace

// =============================================================================
// Async Execution
// =============================================================================

TEST_F(LedgerTests, AsyncFutureDeliversResult) {
    auto handle = executor_.ExecuteAsync(simple_graph(), json::object{{"k", "v"}});
    ASSERT_FALSE(handle.execution_id.empty());

    auto result = handle.result.get();

    EXPECT_EQ(result.execution_id, handle.execution_id);
    EXPECT_EQ(result.status, ExecutionStatus::Completed);
    ASSERT_NE(result.final_state, nullptr);
    EXPECT_EQ(result.final_state->GetString("k"), "v");
}

TEST_F(LedgerTests, EntryIsRunningUntilTheRunFinishes) {
    auto gate = std::make_shared<Gate>();
    auto handle = executor_.ExecuteAsync(gated_graph(gate), {});

    auto running = executor_.GetExecution(handle.execution_id);
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->status, ExecutionStatus::Running);
    EXPECT_FALSE(running->end_time.has_value());

    gate->started.get_future().wait();
    gate->release.set_value();

    EXPECT_EQ(handle.result.get().status, ExecutionStatus::Completed);
    EXPECT_EQ(executor_.GetExecution(handle.execution_id)->status, ExecutionStatus::Completed);
}

TEST_F(LedgerTests, ConcurrentRunsAreIndependent) {
    std::vector<AsyncExecution> handles;
    for (int i = 0; i < 8; ++i) {
        handles.push_back(executor_.ExecuteAsync(simple_graph(), json::object{{"i", i}}));
    }

    std::set<std::string> ids;
    std::set<std::string> state_ids;
    for (int i = 0; i < 8; ++i) {
        auto result = handles[i].result.get();
        ASSERT_EQ(result.status, ExecutionStatus::Completed);
        EXPECT_EQ(result.final_state->GetInt("i"), i);
        ids.insert(result.execution_id);
        state_ids.insert(result.state_id);
    }
    EXPECT_EQ(ids.size(), 8u);
    EXPECT_EQ(state_ids.size(), 8u);
    EXPECT_EQ(states_->Size(), 8u);
}

TEST(WorkerPoolTests, QueuedRunTimeoutStartsWhenItRuns) {
    GraphExecutor executor(std::make_shared<MemoryStateManager>(), 1);
    ExecutionOptions options;
    options.timeout = 300ms;

    auto first = executor.ExecuteAsync(sleeping_graph(250ms), {}, options);
    auto second = executor.ExecuteAsync(sleeping_graph(100ms), {}, options);

    EXPECT_EQ(first.result.get().status, ExecutionStatus::Completed);
    auto result = second.result.get();
    EXPECT_EQ(result.status, ExecutionStatus::Completed) << result.error;
}

TEST(WorkerPoolTests, IdleWorkerPicksUpQueuedRun) {
    GraphExecutor executor(std::make_shared<MemoryStateManager>(), 2);

    auto gate = std::make_shared<Gate>();
    auto blocked = executor.ExecuteAsync(gated_graph(gate), {});
    gate->started.get_future().wait();

    // Both runs complete while the gated run holds one worker
    auto a = executor.ExecuteAsync(simple_graph(), {});
    auto b = executor.ExecuteAsync(simple_graph(), {});
    EXPECT_EQ(a.result.get().status, ExecutionStatus::Completed);
    EXPECT_EQ(b.result.get().status, ExecutionStatus::Completed);

    gate->release.set_value();
    EXPECT_EQ(blocked.result.get().status, ExecutionStatus::Completed);
}

TEST(WorkerPoolTests, CancelledWhileQueuedNeverRuns) {
    GraphExecutor executor(std::make_shared<MemoryStateManager>(), 1);

    auto gate = std::make_shared<Gate>();
    auto blocked = executor.ExecuteAsync(gated_graph(gate), {});
    gate->started.get_future().wait();

    auto queued = executor.ExecuteAsync(simple_graph(), {});
    executor.CancelExecution(queued.execution_id);

    gate->release.set_value();
    EXPECT_EQ(blocked.result.get().status, ExecutionStatus::Completed);

    auto result = queued.result.get();
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_TRUE(result.nodes_visited.empty());
}

// =============================================================================
// Cancellation
// =============================================================================

TEST_F(LedgerTests, CancelStopsRunningExecution) {
    auto gate = std::make_shared<Gate>();
    auto handle = executor_.ExecuteAsync(gated_graph(gate), {});
    gate->started.get_future().wait();

    executor_.CancelExecution(handle.execution_id);

    auto entry = executor_.GetExecution(handle.execution_id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, ExecutionStatus::Cancelled);
    EXPECT_EQ(entry->error_code, ErrorCode::Cancelled);

    auto result = handle.result.get();
    EXPECT_EQ(result.status, ExecutionStatus::Cancelled);
    EXPECT_EQ(result.final_state, nullptr);
    EXPECT_EQ(result.nodes_visited.back(), "wait");
}

TEST_F(LedgerTests, CancelRejectsUnknownAndFinishedRuns) {
    EXPECT_THROW(executor_.CancelExecution("no-such-run"), NotFoundError);

    auto done = executor_.Execute(simple_graph(), {});
    EXPECT_THROW(executor_.CancelExecution(done.execution_id), InvalidStateError);
    EXPECT_EQ(executor_.GetExecution(done.execution_id)->status, ExecutionStatus::Completed);
}

TEST_F(LedgerTests, DestructionCancelsRunningExecutions) {
    auto gate = std::make_shared<Gate>();
    std::future<ExecutionResult> future;
    {
        GraphExecutor executor(std::make_shared<MemoryStateManager>(), 1);
        future = executor.ExecuteAsync(gated_graph(gate), {}).result;
        gate->started.get_future().wait();
    }

    ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(future.get().status, ExecutionStatus::Cancelled);
}

// =============================================================================
// Ledger Queries
// =============================================================================

TEST_F(LedgerTests, GetExecutionUnknownIsEmpty) {
    EXPECT_FALSE(executor_.GetExecution("missing").has_value());
}

TEST_F(LedgerTests, ListPreservesRegistrationOrder) {
    auto first = executor_.Execute(simple_graph(), {});
    auto second = executor_.Execute(failing_graph(), {});
    auto third = executor_.Execute(simple_graph(), {});

    auto all = executor_.ListExecutions();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].execution_id, first.execution_id);
    EXPECT_EQ(all[1].execution_id, second.execution_id);
    EXPECT_EQ(all[2].execution_id, third.execution_id);
    EXPECT_EQ(all[1].status, ExecutionStatus::Failed);
}

TEST_F(LedgerTests, CleanupEvictsOnlyFinishedEntries) {
    executor_.Execute(simple_graph(), {});
    executor_.Execute(failing_graph(), {});

    auto gate = std::make_shared<Gate>();
    auto handle = executor_.ExecuteAsync(gated_graph(gate), {});
    gate->started.get_future().wait();

    EXPECT_EQ(executor_.CleanupExecutions(1h), 0u);
    EXPECT_EQ(executor_.CleanupExecutions(0ns), 2u);

    auto remaining = executor_.ListExecutions();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining[0].execution_id, handle.execution_id);

    gate->release.set_value();
    handle.result.get();
    EXPECT_EQ(executor_.CleanupExecutions(0ns), 1u);
    EXPECT_TRUE(executor_.ListExecutions().empty());
}

TEST_F(LedgerTests, StatsCountEveryStatus) {
    executor_.Execute(simple_graph(), {});
    executor_.Execute(simple_graph(), {});
    executor_.Execute(failing_graph(), {});

    auto cancelled_gate = std::make_shared<Gate>();
    auto cancelled = executor_.ExecuteAsync(gated_graph(cancelled_gate), {});
    cancelled_gate->started.get_future().wait();
    executor_.CancelExecution(cancelled.execution_id);
    cancelled.result.get();

    auto running_gate = std::make_shared<Gate>();
    auto running = executor_.ExecuteAsync(gated_graph(running_gate), {});
    running_gate->started.get_future().wait();

    auto stats = executor_.GetExecutionStats();
    EXPECT_EQ(stats.total, 5u);
    EXPECT_EQ(stats.completed, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.cancelled, 1u);
    EXPECT_EQ(stats.running, 1u);
    EXPECT_GE(stats.average_duration_ms, 0.0);

    auto doc = stats.ToJson();
    EXPECT_EQ(doc.at("total_executions").to_number<std::int64_t>(), 5);
    EXPECT_EQ(doc.at("status_counts").as_object().at("completed").to_number<std::int64_t>(), 2);
    EXPECT_TRUE(doc.contains("avg_duration_ms"));

    running_gate->release.set_value();
    running.result.get();
}

TEST_F(LedgerTests, EmptyLedgerHasZeroAverage) {
    auto stats = executor_.GetExecutionStats();
    EXPECT_EQ(stats.total, 0u);
    EXPECT_DOUBLE_EQ(stats.average_duration_ms, 0.0);
}
