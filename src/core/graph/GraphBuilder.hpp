#pragma once

#include <memory>
#include <string>
#include <vector>

#include "Collaborators.hpp"
#include "Graph.hpp"

namespace flowgraph {

/**
 * @brief Fluent assembler for Graph instances.
 *
 * @details
 * The builder keeps a "current node" cursor:
 * - AddStartNode() sets the entry point and moves the cursor to it.
 * - ConnectTo(id) adds an unconditional edge and moves the cursor to id.
 * - ConnectToIf(id, cond) adds a conditional edge and leaves the cursor,
 *   so several branches can hang off one source.
 * - From(id) moves the cursor explicitly.
 *
 * Calling ConnectTo/ConnectToIf with no cursor is a programming error and
 * throws std::logic_error. Duplicate node ids are collected and reported by
 * Build() together with the other validation failures.
 *
 * @code
 * auto graph = GraphBuilder("counter")
 *                  .AddStartNode("start", "Start")
 *                  .AddFunctionNode("increment", "Increment", fn)
 *                  .AddEndNode("end", "End")
 *                  .ConnectTo("increment")
 *                  .ConnectTo("end")
 *                  .Build();
 * @endcode
 */
class GraphBuilder {
public:
    explicit GraphBuilder(std::string name,
                          std::shared_ptr<ProviderRegistry> providers = nullptr,
                          std::shared_ptr<ToolRegistry> tools = nullptr);

    GraphBuilder& SetId(std::string id);
    GraphBuilder& SetDescription(std::string description);

    GraphBuilder& AddStartNode(const std::string& id, const std::string& name,
                               json::object initial_data = {});
    GraphBuilder& AddEndNode(const std::string& id, const std::string& name,
                             Finalizer finalizer = nullptr);
    GraphBuilder& AddLlmNode(const std::string& id, const std::string& name, LlmNodeConfig config);
    GraphBuilder& AddToolNode(const std::string& id, const std::string& name,
                              const std::string& tool_name, std::vector<std::string> input_keys,
                              const std::string& output_key);
    GraphBuilder& AddFunctionNode(const std::string& id, const std::string& name, Transform fn);
    GraphBuilder& AddConditionalNode(const std::string& id, const std::string& name,
                                     NodePredicate predicate);
    GraphBuilder& AddConditionalNode(const std::string& id, const std::string& name,
                                     ConditionPtr condition);
    GraphBuilder& AddNode(NodePtr node);

    GraphBuilder& SetEntryPoint(const std::string& id);
    GraphBuilder& AddExitPoint(const std::string& id);

    GraphBuilder& ConnectTo(const std::string& target_id);
    GraphBuilder& ConnectToIf(const std::string& target_id, ConditionPtr condition);
    GraphBuilder& From(const std::string& node_id);
    GraphBuilder& AddEdge(Edge edge);

    /**
     * @brief Validates and hands out the graph.
     * @throws ValidationError prefixed with "graph validation failed: ".
     */
    GraphPtr Build();

private:
    void RequireCursor(const char* method) const;

    std::shared_ptr<Graph> graph_;
    std::shared_ptr<ProviderRegistry> providers_;
    std::shared_ptr<ToolRegistry> tools_;
    std::string current_;
    std::vector<std::string> errors_;
};

}  // namespace flowgraph
