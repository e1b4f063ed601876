#include "NodeRegistry.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

#include "Json2Graph.hpp"
#include "NodeFactory.hpp"
#include "Nodes.hpp"

namespace flowgraph {

namespace {

// --- JSON Helpers ---

template <class T>
T get_or(const json::object& obj, const char* key, T default_val) {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return default_val;
    try {
        return json::value_to<T>(it->value());
    } catch (const std::exception& e) {
        throw ValidationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

template <class T>
T require(const json::object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) throw ValidationError(std::string("missing key: ") + key);
    try {
        return json::value_to<T>(it->value());
    } catch (const std::exception& e) {
        throw ValidationError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

template <class Map>
typename Map::mapped_type lookup(const Map& map, const std::string& name, const char* what) {
    auto it = map.find(name);
    if (it == map.end()) {
        throw ValidationError(std::string("unknown ") + what + ": " + name);
    }
    return it->second;
}

ToolSpec parse_tool_spec(const json::value& v) {
    if (v.is_string()) {
        return ToolSpec{std::string(v.get_string()), {}, {}};
    }
    if (!v.is_object()) {
        throw ValidationError("tool spec must be a string or an object");
    }
    const auto& obj = v.get_object();
    ToolSpec spec;
    spec.name = require<std::string>(obj, "name");
    spec.description = get_or<std::string>(obj, "description", "");
    spec.parameters = get_or<json::object>(obj, "parameters", {});
    return spec;
}

// --- Creation Functions ---

NodePtr CreateStart(const std::string& id, const std::string& name, const json::object& data,
                    const NodeBindings&) {
    return std::make_shared<StartNode>(id, name, get_or<json::object>(data, "initial_data", {}));
}

NodePtr CreateEnd(const std::string& id, const std::string& name, const json::object& data,
                  const NodeBindings& bindings) {
    Finalizer finalizer;
    if (auto fn_name = get_or<std::string>(data, "finalizer", ""); !fn_name.empty()) {
        finalizer = lookup(bindings.finalizers, fn_name, "finalizer");
    }
    return std::make_shared<EndNode>(id, name, std::move(finalizer));
}

NodePtr CreateLlm(const std::string& id, const std::string& name, const json::object& data,
                  const NodeBindings& bindings) {
    LlmNodeConfig config;
    config.provider = require<std::string>(data, "provider");
    config.model = require<std::string>(data, "model");
    config.prompt_template = require<std::string>(data, "prompt_template");
    config.output_key = require<std::string>(data, "output_key");
    config.max_tokens = get_or<int>(data, "max_tokens", config.max_tokens);
    config.temperature = get_or<double>(data, "temperature", config.temperature);

    if (auto it = data.find("tools"); it != data.end() && !it->value().is_null()) {
        if (!it->value().is_array()) throw ValidationError("'tools' must be an array");
        for (const auto& v : it->value().get_array()) {
            config.tools.push_back(parse_tool_spec(v));
        }
    }

    return std::make_shared<LlmNode>(id, name, std::move(config), bindings.providers);
}

NodePtr CreateTool(const std::string& id, const std::string& name, const json::object& data,
                   const NodeBindings& bindings) {
    return std::make_shared<ToolNode>(
        id, name, require<std::string>(data, "tool_name"),
        get_or<std::vector<std::string>>(data, "input_keys", {}),
        require<std::string>(data, "output_key"), bindings.tools);
}

NodePtr CreateFunction(const std::string& id, const std::string& name, const json::object& data,
                       const NodeBindings& bindings) {
    auto fn_name = require<std::string>(data, "function");
    return std::make_shared<FunctionNode>(id, name,
                                          lookup(bindings.functions, fn_name, "function"));
}

NodePtr CreateConditional(const std::string& id, const std::string& name,
                          const json::object& data, const NodeBindings& bindings) {
    if (auto it = data.find("condition"); it != data.end()) {
        return std::make_shared<ConditionalNode>(id, name, ParseCondition(it->value()));
    }
    if (data.contains("predicate")) {
        auto predicate_name = require<std::string>(data, "predicate");
        return std::make_shared<ConditionalNode>(
            id, name, lookup(bindings.predicates, predicate_name, "predicate"));
    }
    throw ValidationError("conditional node " + id + " needs a 'condition' or a 'predicate'");
}

}  // namespace

void RegisterBuiltinNodes() {
    auto& factory = NodeFactory::Instance();

    factory.Register("start", CreateStart);
    factory.Register("end", CreateEnd);
    factory.Register("llm", CreateLlm);
    factory.Register("tool", CreateTool);
    factory.Register("function", CreateFunction);
    factory.Register("conditional", CreateConditional);

    spdlog::debug("Registered built-in node types");
}

}  // namespace flowgraph
