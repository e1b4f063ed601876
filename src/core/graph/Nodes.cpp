#include "Nodes.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "Errors.hpp"
#include "PromptTemplate.hpp"
#include "TimeUtils.hpp"

namespace flowgraph {

namespace {

json::string now_string() {
    return json::string(util::FormatTimestamp(util::Now()));
}

}  // namespace

const char* ToString(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::Start:
            return "start";
        case NodeKind::End:
            return "end";
        case NodeKind::Llm:
            return "llm";
        case NodeKind::Tool:
            return "tool";
        case NodeKind::Function:
            return "function";
        case NodeKind::Conditional:
            return "conditional";
    }
    return "unknown";
}

// =========================================================
//  Node Base
// =========================================================

Node::Node(std::string id, std::string name, NodeKind kind)
    : id_(std::move(id)), name_(std::move(name)), kind_(kind) {}

void Node::Validate() const {
    if (id_.empty()) {
        throw ValidationError("node ID cannot be empty");
    }
    if (name_.empty()) {
        throw ValidationError("node " + id_ + ": name cannot be empty");
    }
}

// =========================================================
//  StartNode & EndNode
// =========================================================

StartNode::StartNode(std::string id, std::string name, json::object initial_data)
    : Node(std::move(id), std::move(name), NodeKind::Start),
      initial_data_(std::move(initial_data)) {}

StatePtr StartNode::Execute(const ExecutionContext&, const State& state) const {
    auto next = state.Clone();
    if (!initial_data_.empty()) {
        next->SetMultiple(initial_data_);
    }
    next->SetMetadata("execution_started", now_string());
    return next;
}

EndNode::EndNode(std::string id, std::string name, Finalizer finalizer)
    : Node(std::move(id), std::move(name), NodeKind::End), finalizer_(std::move(finalizer)) {}

StatePtr EndNode::Execute(const ExecutionContext& ctx, const State& state) const {
    auto next = state.Clone();
    if (finalizer_) {
        finalizer_(ctx, *next);
    }
    next->SetMetadata("execution_completed", now_string());
    return next;
}

// =========================================================
//  LlmNode
// =========================================================

LlmNode::LlmNode(std::string id, std::string name, LlmNodeConfig config,
                 std::shared_ptr<ProviderRegistry> providers)
    : Node(std::move(id), std::move(name), NodeKind::Llm),
      config_(std::move(config)),
      providers_(std::move(providers)) {}

void LlmNode::Validate() const {
    Node::Validate();
    if (config_.provider.empty()) {
        throw ValidationError("node " + id() + ": LLM provider cannot be empty");
    }
    if (config_.model.empty()) {
        throw ValidationError("node " + id() + ": LLM model cannot be empty");
    }
    if (config_.prompt_template.empty()) {
        throw ValidationError("node " + id() + ": prompt template cannot be empty");
    }
    if (config_.output_key.empty()) {
        throw ValidationError("node " + id() + ": output key cannot be empty");
    }
    if (config_.max_tokens <= 0) {
        throw ValidationError("node " + id() + ": max_tokens must be positive");
    }
    try {
        PromptTemplate parsed(config_.prompt_template);
        spdlog::trace("[{}] Prompt template uses {} variables", id(), parsed.Variables().size());
    } catch (const ValidationError& e) {
        throw ValidationError("node " + id() + ": " + e.what());
    }
}

StatePtr LlmNode::Execute(const ExecutionContext& ctx, const State& state) const {
    auto provider = providers_ ? providers_->Find(config_.provider) : nullptr;
    if (!provider) {
        throw NotFoundError("LLM provider not found: " + config_.provider);
    }

    auto next = state.Clone();
    std::string prompt = PromptTemplate(config_.prompt_template).Render(state.Data());

    GenerateRequest request;
    request.prompt = prompt;
    request.model = config_.model;
    request.max_tokens = config_.max_tokens;
    request.temperature = config_.temperature;
    request.tools = config_.tools;

    spdlog::debug("[{}] Calling provider {} (model {})", id(), config_.provider, config_.model);

    ctx.ThrowIfCancelled();
    GenerateResponse response;
    try {
        response = provider->Generate(request);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalCallError("LLM provider '" + config_.provider + "' failed: " + e.what());
    }
    ctx.ThrowIfCancelled();

    next->Set(config_.output_key, json::string(response.text));

    json::object call;
    call["node_id"] = id();
    call["provider"] = config_.provider;
    call["model"] = config_.model;
    call["prompt"] = prompt;
    call["response"] = response.text;
    call["timestamp"] = now_string();
    next->SetMetadata("last_llm_call", std::move(call));
    return next;
}

// =========================================================
//  ToolNode
// =========================================================

ToolNode::ToolNode(std::string id, std::string name, std::string tool_name,
                   std::vector<std::string> input_keys, std::string output_key,
                   std::shared_ptr<ToolRegistry> tools)
    : Node(std::move(id), std::move(name), NodeKind::Tool),
      tool_name_(std::move(tool_name)),
      input_keys_(std::move(input_keys)),
      output_key_(std::move(output_key)),
      tools_(std::move(tools)) {}

void ToolNode::Validate() const {
    Node::Validate();
    if (tool_name_.empty()) {
        throw ValidationError("node " + id() + ": tool name cannot be empty");
    }
    if (output_key_.empty()) {
        throw ValidationError("node " + id() + ": output key cannot be empty");
    }
}

StatePtr ToolNode::Execute(const ExecutionContext& ctx, const State& state) const {
    auto tool = tools_ ? tools_->Find(tool_name_) : nullptr;
    if (!tool) {
        throw NotFoundError("tool not found: " + tool_name_);
    }

    auto next = state.Clone();

    json::object inputs;
    for (const auto& key : input_keys_) {
        if (auto value = state.Get(key)) {
            inputs[key] = std::move(*value);
        }
    }

    spdlog::debug("[{}] Invoking tool {} with {} inputs", id(), tool_name_, inputs.size());

    ctx.ThrowIfCancelled();
    json::value result;
    try {
        result = tool->Invoke(inputs);
    } catch (const CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExternalCallError("tool '" + tool_name_ + "' failed: " + e.what());
    }
    ctx.ThrowIfCancelled();

    next->Set(output_key_, result);

    json::object call;
    call["node_id"] = id();
    call["tool_name"] = tool_name_;
    call["inputs"] = std::move(inputs);
    call["result"] = std::move(result);
    call["timestamp"] = now_string();
    next->SetMetadata("last_tool_call", std::move(call));
    return next;
}

// =========================================================
//  FunctionNode
// =========================================================

FunctionNode::FunctionNode(std::string id, std::string name, Transform fn)
    : Node(std::move(id), std::move(name), NodeKind::Function), fn_(std::move(fn)) {}

void FunctionNode::Validate() const {
    Node::Validate();
    if (!fn_) {
        throw ValidationError("node " + id() + ": function cannot be empty");
    }
}

StatePtr FunctionNode::Execute(const ExecutionContext& ctx, const State& state) const {
    if (!fn_) {
        throw ValidationError("node " + id() + ": function is empty");
    }

    StatePtr next = fn_(ctx, state);
    if (!next) {
        throw ValidationError("node " + id() + ": function returned no state");
    }
    if (next.get() == &state) {
        // The transform handed back its input; keep the input untouched.
        next = state.Clone();
    }

    json::object call;
    call["node_id"] = id();
    call["timestamp"] = now_string();
    next->SetMetadata("last_function_call", std::move(call));
    return next;
}

// =========================================================
//  ConditionalNode
// =========================================================

ConditionalNode::ConditionalNode(std::string id, std::string name, NodePredicate predicate)
    : Node(std::move(id), std::move(name), NodeKind::Conditional),
      predicate_(std::move(predicate)) {}

ConditionalNode::ConditionalNode(std::string id, std::string name, ConditionPtr condition)
    : Node(std::move(id), std::move(name), NodeKind::Conditional) {
    if (condition) {
        predicate_ = [condition = std::move(condition)](const ExecutionContext&, const State& s) {
            return condition->Evaluate(s);
        };
    }
}

void ConditionalNode::Validate() const {
    Node::Validate();
    if (!predicate_) {
        throw ValidationError("node " + id() + ": condition cannot be empty");
    }
}

StatePtr ConditionalNode::Execute(const ExecutionContext& ctx, const State& state) const {
    if (!predicate_) {
        throw ValidationError("node " + id() + ": condition is empty");
    }

    bool result = predicate_(ctx, state);

    auto next = state.Clone();
    if (result) {
        next->Set(CONDITION_TRUE_KEY, true);
        next->Delete(CONDITION_FALSE_KEY);
    } else {
        next->Set(CONDITION_FALSE_KEY, true);
        next->Delete(CONDITION_TRUE_KEY);
    }

    json::object eval;
    eval["node_id"] = id();
    eval["result"] = result;
    eval["timestamp"] = now_string();
    next->SetMetadata("last_condition_eval", std::move(eval));

    spdlog::debug("[{}] Condition evaluated to {}", id(), result);
    return next;
}

}  // namespace flowgraph
