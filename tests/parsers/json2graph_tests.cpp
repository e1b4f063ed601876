#include <gtest/gtest.h>

#include <cctype>
#include <cstdio>
#include <fstream>

#include "Errors.hpp"
#include "GraphExecutor.hpp"
#include "Json2Graph.hpp"
#include "MemoryStateManager.hpp"
#include "NodeRegistry.hpp"

using namespace flowgraph;

namespace {

class Json2GraphTests : public ::testing::Test {
protected:
    void SetUp() override {
        RegisterBuiltinNodes();

        bindings_.providers = std::make_shared<ProviderRegistry>();
        bindings_.providers->Register("echo", std::make_shared<EchoTextGenerator>());

        bindings_.tools = std::make_shared<ToolRegistry>();
        bindings_.tools->Register("upper", "upper-cases text", [](const json::object& input) {
            std::string text(input.at("text").as_string());
            for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return json::value(text);
        });

        bindings_.functions["increment"] = [](const ExecutionContext&, const State& state) {
            auto next = state.Clone();
            next->Set("counter", state.GetInt("counter").value_or(0) + 1);
            return next;
        };
        bindings_.predicates["has_text"] = [](const ExecutionContext&, const State& state) {
            return state.Has("text");
        };
        bindings_.finalizers["stamp"] = [](const ExecutionContext&, State& state) {
            state.Set("stamped", true);
        };
    }

    static json::object parse(std::string_view text) { return json::parse(text).as_object(); }

    NodeBindings bindings_;
};

constexpr std::string_view kFullGraph = R"({
  "graph": {
    "id": "pipeline-1",
    "name": "pipeline",
    "description": "every node type",
    "entry_point": "start",
    "exit_points": ["end"],
    "nodes": [
      {"id": "start", "type": "start", "data": {"initial_data": {"counter": 0}}},
      {"id": "count", "type": "function", "name": "Count", "data": {"function": "increment"}},
      {"id": "check", "type": "conditional", "data": {"predicate": "has_text"}},
      {"id": "shout", "type": "tool",
       "data": {"tool_name": "upper", "input_keys": ["text"], "output_key": "loud"}},
      {"id": "ask", "type": "llm",
       "data": {"provider": "echo", "model": "m", "prompt_template": "Say {{loud}}",
                "output_key": "answer", "max_tokens": 32, "tools": ["upper"]}},
      {"id": "wrap", "type": "end", "name": "Wrap up", "data": {"finalizer": "stamp"}},
      {"id": "end", "type": "end"}
    ],
    "edges": [
      {"from": "start", "to": "count"},
      {"from": "count", "to": "check"},
      {"from": "check", "to": "shout", "condition": {"key": "condition_result_true"}},
      {"from": "check", "to": "end", "label": "no text"},
      {"from": "shout", "to": "ask"},
      {"from": "ask", "to": "wrap", "weight": 0.5},
      {"from": "wrap", "to": "end"}
    ]
  }
})";

}  // namespace

// =============================================================================
// Graph Documents
// =============================================================================

TEST_F(Json2GraphTests, ParsesEveryNodeType) {
    auto graph = ParseGraph(parse(kFullGraph), bindings_);

    EXPECT_EQ(graph->id(), "pipeline-1");
    EXPECT_EQ(graph->description(), "every node type");
    EXPECT_EQ(graph->NodeCount(), 7u);
    EXPECT_EQ(graph->EdgeCount(), 7u);
    EXPECT_EQ(graph->GetNode("start")->kind(), NodeKind::Start);
    EXPECT_EQ(graph->GetNode("count")->kind(), NodeKind::Function);
    EXPECT_EQ(graph->GetNode("count")->name(), "Count");
    EXPECT_EQ(graph->GetNode("check")->name(), "check");
    EXPECT_EQ(graph->GetNode("shout")->kind(), NodeKind::Tool);
    EXPECT_EQ(graph->GetNode("ask")->kind(), NodeKind::Llm);
    EXPECT_EQ(graph->GetNode("wrap")->kind(), NodeKind::End);
    EXPECT_FALSE(graph->IsExitPoint("wrap"));
    EXPECT_TRUE(graph->IsExitPoint("end"));
}

TEST_F(Json2GraphTests, EdgeLabelsAndWeights) {
    auto graph = ParseGraph(parse(kFullGraph), bindings_);

    EXPECT_EQ(graph->GetEdges("start")[0].label, "start -> count");
    EXPECT_EQ(graph->GetEdges("check")[0].label, "key 'condition_result_true' exists");
    EXPECT_NE(graph->GetEdges("check")[0].condition, nullptr);
    EXPECT_EQ(graph->GetEdges("check")[1].label, "no text");
    EXPECT_DOUBLE_EQ(graph->GetEdges("ask")[0].weight, 0.5);
}

TEST_F(Json2GraphTests, ParsedGraphExecutes) {
    auto graph = ParseGraph(parse(kFullGraph), bindings_);
    GraphExecutor executor(std::make_shared<MemoryStateManager>(), 1);

    auto result = executor.Execute(graph, json::object{{"text", "hi"}});

    ASSERT_EQ(result.status, ExecutionStatus::Completed) << result.error;
    EXPECT_EQ(result.final_state->GetInt("counter"), 1);
    EXPECT_EQ(result.final_state->GetString("loud"), "HI");
    EXPECT_EQ(result.final_state->GetString("answer"), "LLM response for prompt: Say HI");
    EXPECT_EQ(result.final_state->GetBool("stamped"), true);
    std::vector<std::string> expected{"start", "count", "check", "shout", "ask", "wrap", "end"};
    EXPECT_EQ(result.nodes_visited, expected);
}

TEST_F(Json2GraphTests, MissingKeysAreValidationErrors) {
    EXPECT_THROW(ParseGraph(json::object{}, bindings_), ValidationError);
    EXPECT_THROW(ParseGraph(parse(R"({"graph": {"name": "x", "nodes": []}})"), bindings_),
                 ValidationError);
    EXPECT_THROW(ParseGraph(parse(R"({"graph": {"name": "x", "nodes": [{"id": "a"}],
                                      "entry_point": "a", "exit_points": ["a"]}})"),
                            bindings_),
                 ValidationError);
}

TEST_F(Json2GraphTests, UnknownTypeAndNamesAreReported) {
    auto expect_message = [&](std::string_view doc, const std::string& needle) {
        try {
            ParseGraph(parse(doc), bindings_);
            ADD_FAILURE() << "expected ValidationError containing " << needle;
        } catch (const ValidationError& e) {
            EXPECT_NE(std::string(e.what()).find(needle), std::string::npos) << e.what();
        }
    };

    expect_message(R"({"graph": {"name": "x", "entry_point": "a", "exit_points": ["a"],
                       "nodes": [{"id": "a", "type": "teleport"}]}})",
                   "node a: unknown node type: teleport");
    expect_message(R"({"graph": {"name": "x", "entry_point": "a", "exit_points": ["a"],
                       "nodes": [{"id": "a", "type": "function", "data": {"function": "nope"}}]}})",
                   "unknown function: nope");
    expect_message(R"({"graph": {"name": "x", "entry_point": "a", "exit_points": ["a"],
                       "nodes": [{"id": "a", "type": "end", "data": {"finalizer": "nope"}}]}})",
                   "unknown finalizer: nope");
    expect_message(R"({"graph": {"name": "x", "entry_point": "a", "exit_points": ["a"],
                       "nodes": [{"id": "a", "type": "conditional"}]}})",
                   "needs a 'condition' or a 'predicate'");
}

TEST_F(Json2GraphTests, GraphValidationFailuresArePrefixed) {
    try {
        ParseGraph(parse(R"({"graph": {"name": "x", "entry_point": "a", "exit_points": ["b"],
                               "nodes": [{"id": "a", "type": "start"}]}})"),
                   bindings_);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "graph validation failed: exit point node b does not exist");
    }
}

TEST_F(Json2GraphTests, FactoryKnowsBuiltinTypes) {
    auto& factory = NodeFactory::Instance();
    for (const char* type : {"start", "end", "llm", "tool", "function", "conditional"}) {
        EXPECT_TRUE(factory.Contains(type)) << type;
    }
    EXPECT_FALSE(factory.Contains("teleport"));
}

// =============================================================================
// Conditions
// =============================================================================

TEST(ParseConditionTests, LeafForms) {
    auto state = std::make_shared<State>("s", "g");
    state->SetMultiple(json::object{{"budget", 2000}, {"city", "Rome"}});

    EXPECT_TRUE(ParseCondition(json::parse(R"({"key": "budget"})"))->Evaluate(*state));
    EXPECT_TRUE(ParseCondition(json::parse(R"({"key": "budget", "operator": "greater", "value": 1000})"))
                    ->Evaluate(*state));
    EXPECT_TRUE(ParseCondition(json::parse(R"({"key": "city", "operator": "equals", "value": "Rome"})"))
                    ->Evaluate(*state));
    EXPECT_TRUE(ParseCondition(json::parse(R"({"key": "ghost", "operator": "not_exists"})"))
                    ->Evaluate(*state));
}

TEST(ParseConditionTests, CombinatorForms) {
    auto state = std::make_shared<State>("s", "g");
    state->Set("budget", 50);

    auto cond = ParseCondition(json::parse(R"({"or": [
        {"and": [{"key": "budget"}, {"key": "budget", "operator": "greater", "value": 100}]},
        {"not": {"always": false}}
    ]})"));

    EXPECT_TRUE(cond->Evaluate(*state));
    EXPECT_EQ(cond->description(),
              "((key 'budget' exists AND key 'budget' greater 100) OR NOT (always false))");
}

TEST(ParseConditionTests, MalformedConditions) {
    EXPECT_THROW(ParseCondition(json::parse(R"("budget")")), ValidationError);
    EXPECT_THROW(ParseCondition(json::parse(R"({"operator": "equals", "value": 1})")),
                 ValidationError);
    EXPECT_THROW(ParseCondition(json::parse(R"({"key": "a", "operator": "equals"})")),
                 ValidationError);
    EXPECT_THROW(ParseCondition(json::parse(R"({"key": "a", "operator": "between", "value": 1})")),
                 ValidationError);
    EXPECT_THROW(ParseCondition(json::parse(R"({"and": {"key": "a"}})")), ValidationError);
    EXPECT_THROW(ParseCondition(json::parse(R"({"always": "yes"})")), ValidationError);
}

// =============================================================================
// Files
// =============================================================================

TEST(ReadJsonFileTests, ReadsAndRejects) {
    const std::string path = ::testing::TempDir() + "flowgraph_read_json.json";
    {
        std::ofstream out(path);
        out << R"({"answer": 42})";
    }
    auto doc = ReadJsonFile(path);
    EXPECT_EQ(doc.as_object().at("answer").as_int64(), 42);

    {
        std::ofstream out(path);
        out << "{not json";
    }
    EXPECT_THROW(ReadJsonFile(path), ValidationError);
    std::remove(path.c_str());

    EXPECT_THROW(ReadJsonFile(path + ".missing"), ValidationError);
}
