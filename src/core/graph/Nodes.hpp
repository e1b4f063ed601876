#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "Collaborators.hpp"
#include "Condition.hpp"
#include "ExecutionContext.hpp"
#include "State.hpp"
#include "types.hpp"

namespace flowgraph {

// =========================================================
//  Enums & Keys
// =========================================================

enum class NodeKind {
    Start,
    End,
    Llm,
    Tool,
    Function,
    Conditional
};

const char* ToString(NodeKind kind) noexcept;

// Flags written by ConditionalNode; edges branch by testing them.
inline constexpr std::string_view CONDITION_TRUE_KEY = "condition_result_true";
inline constexpr std::string_view CONDITION_FALSE_KEY = "condition_result_false";

// =========================================================
//  Callbacks
// =========================================================

// Must return a new State (normally input.Clone() plus changes).
using Transform = std::function<StatePtr(const ExecutionContext&, const State&)>;
using NodePredicate = std::function<bool(const ExecutionContext&, const State&)>;
// Runs over the End node's private clone.
using Finalizer = std::function<void(const ExecutionContext&, State&)>;

// =========================================================
//  Base Node
// =========================================================

/**
 * @brief A unit of work transforming a State.
 *
 * @details
 * Nodes are immutable once built. Execute() never touches its input: it
 * returns a fresh State so earlier checkpoints stay valid for audit.
 * Validate() is called by Graph::Validate() before a graph can be built.
 */
class Node {
public:
    Node(std::string id, std::string name, NodeKind kind);
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::string& name() const noexcept { return name_; }
    NodeKind kind() const noexcept { return kind_; }
    const char* type_name() const noexcept { return ToString(kind_); }

    virtual StatePtr Execute(const ExecutionContext& ctx, const State& state) const = 0;

    // @throws ValidationError describing the first missing or malformed field.
    virtual void Validate() const;

private:
    const std::string id_;
    const std::string name_;
    const NodeKind kind_;
};

using NodePtr = std::shared_ptr<Node>;

// =========================================================
//  Concrete Nodes
// =========================================================

// Graph entry: merges fixed initial data into the state.
class StartNode : public Node {
public:
    StartNode(std::string id, std::string name, json::object initial_data = {});

    const json::object& initial_data() const noexcept { return initial_data_; }

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;

private:
    json::object initial_data_;
};

// Graph exit with an optional finalizer.
class EndNode : public Node {
public:
    EndNode(std::string id, std::string name, Finalizer finalizer = nullptr);

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;

private:
    Finalizer finalizer_;
};

struct LlmNodeConfig {
    std::string provider;
    std::string model;
    std::string prompt_template;
    std::string output_key;
    int max_tokens = 1024;
    double temperature = 0.7;
    std::vector<ToolSpec> tools;
};

class LlmNode : public Node {
public:
    LlmNode(std::string id, std::string name, LlmNodeConfig config,
            std::shared_ptr<ProviderRegistry> providers);

    const LlmNodeConfig& config() const noexcept { return config_; }

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;
    void Validate() const override;

private:
    LlmNodeConfig config_;
    std::shared_ptr<ProviderRegistry> providers_;
};

class ToolNode : public Node {
public:
    ToolNode(std::string id, std::string name, std::string tool_name,
             std::vector<std::string> input_keys, std::string output_key,
             std::shared_ptr<ToolRegistry> tools);

    const std::string& tool_name() const noexcept { return tool_name_; }
    const std::vector<std::string>& input_keys() const noexcept { return input_keys_; }
    const std::string& output_key() const noexcept { return output_key_; }

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;
    void Validate() const override;

private:
    std::string tool_name_;
    std::vector<std::string> input_keys_;
    std::string output_key_;
    std::shared_ptr<ToolRegistry> tools_;
};

class FunctionNode : public Node {
public:
    FunctionNode(std::string id, std::string name, Transform fn);

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;
    void Validate() const override;

private:
    Transform fn_;
};

/**
 * @brief Evaluates a predicate and records the outcome as a flag.
 *
 * Writes true under CONDITION_TRUE_KEY (or CONDITION_FALSE_KEY) and clears
 * the opposite flag. It never picks the next hop itself; conditional edges
 * do that by testing the flags.
 */
class ConditionalNode : public Node {
public:
    ConditionalNode(std::string id, std::string name, NodePredicate predicate);
    ConditionalNode(std::string id, std::string name, ConditionPtr condition);

    StatePtr Execute(const ExecutionContext& ctx, const State& state) const override;
    void Validate() const override;

private:
    NodePredicate predicate_;
};

}  // namespace flowgraph
