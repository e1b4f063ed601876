#include "Collaborators.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <utility>

#include "Errors.hpp"

namespace flowgraph {

// =========================================================
//  Providers
// =========================================================

GenerateResponse EchoTextGenerator::Generate(const GenerateRequest& request) {
    GenerateResponse response;
    response.text = "LLM response for prompt: " + request.prompt;
    response.model = request.model;
    return response;
}

void ProviderRegistry::Register(const std::string& name, std::shared_ptr<ITextGenerator> provider) {
    if (name.empty() || !provider) {
        throw ValidationError("provider registration requires a name and an instance");
    }
    std::unique_lock lock(mutex_);
    providers_[name] = std::move(provider);
    spdlog::debug("Text generation provider '{}' registered.", name);
}

std::shared_ptr<ITextGenerator> ProviderRegistry::Find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = providers_.find(name);
    return it != providers_.end() ? it->second : nullptr;
}

std::vector<std::string> ProviderRegistry::Names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, provider] : providers_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

// =========================================================
//  Tools
// =========================================================

FunctionTool::FunctionTool(std::string name, std::string description, Fn fn, json::object schema)
    : name_(std::move(name)),
      description_(std::move(description)),
      fn_(std::move(fn)),
      schema_(std::move(schema)) {}

json::value FunctionTool::Invoke(const json::object& input) {
    if (!fn_) {
        throw ExternalCallError("tool '" + name_ + "' has no implementation");
    }
    return fn_(input);
}

void ToolRegistry::Register(std::shared_ptr<ITool> tool) {
    if (!tool || tool->Name().empty()) {
        throw ValidationError("tool registration requires a named tool");
    }
    auto name = tool->Name();
    std::unique_lock lock(mutex_);
    tools_[name] = std::move(tool);
    spdlog::debug("Tool '{}' registered.", name);
}

void ToolRegistry::Register(std::string name, std::string description, FunctionTool::Fn fn) {
    Register(std::make_shared<FunctionTool>(std::move(name), std::move(description), std::move(fn)));
}

std::shared_ptr<ITool> ToolRegistry::Find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second : nullptr;
}

json::value ToolRegistry::Invoke(const std::string& name, const json::object& input) const {
    auto tool = Find(name);
    if (!tool) {
        throw NotFoundError("tool not found: " + name);
    }
    return tool->Invoke(input);
}

std::vector<ToolSpec> ToolRegistry::Specs() const {
    std::shared_lock lock(mutex_);
    std::vector<ToolSpec> specs;
    specs.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        specs.push_back(ToolSpec{name, tool->Description(), tool->Schema()});
    }
    std::sort(specs.begin(), specs.end(),
              [](const ToolSpec& a, const ToolSpec& b) { return a.name < b.name; });
    return specs;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace flowgraph
