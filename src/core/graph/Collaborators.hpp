#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace flowgraph {

// =========================================================
//  Text generation
// =========================================================

struct ToolSpec {
    std::string name;
    std::string description;
    json::object parameters;  // JSON schema of the input bag
};

struct GenerateRequest {
    std::string prompt;
    std::string model;
    int max_tokens = 0;
    double temperature = 0.0;
    std::vector<ToolSpec> tools;
};

struct GenerateResponse {
    std::string text;
    std::string model;
    int prompt_tokens = 0;
    int completion_tokens = 0;
};

/**
 * @brief Contract for text-generation providers (LLM backends).
 *
 * Implementations report quota, auth or validation failures by throwing;
 * LlmNode wraps anything thrown into an ExternalCallError.
 */
struct ITextGenerator {
    virtual ~ITextGenerator() = default;
    virtual GenerateResponse Generate(const GenerateRequest& request) = 0;
};

// Offline provider that answers with the prompt it was given.
class EchoTextGenerator : public ITextGenerator {
public:
    GenerateResponse Generate(const GenerateRequest& request) override;
};

class ProviderRegistry {
public:
    void Register(const std::string& name, std::shared_ptr<ITextGenerator> provider);

    // nullptr when no provider is registered under name.
    std::shared_ptr<ITextGenerator> Find(const std::string& name) const;

    std::vector<std::string> Names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ITextGenerator>> providers_;
};

// =========================================================
//  Tools
// =========================================================

struct ITool {
    virtual ~ITool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual json::object Schema() const { return {}; }
    virtual json::value Invoke(const json::object& input) = 0;
};

// ITool backed by a callable.
class FunctionTool : public ITool {
public:
    using Fn = std::function<json::value(const json::object&)>;

    FunctionTool(std::string name, std::string description, Fn fn, json::object schema = {});

    std::string Name() const override { return name_; }
    std::string Description() const override { return description_; }
    json::object Schema() const override { return schema_; }
    json::value Invoke(const json::object& input) override;

private:
    std::string name_;
    std::string description_;
    Fn fn_;
    json::object schema_;
};

class ToolRegistry {
public:
    // @throws ValidationError on a null tool or an empty name.
    void Register(std::shared_ptr<ITool> tool);
    void Register(std::string name, std::string description, FunctionTool::Fn fn);

    std::shared_ptr<ITool> Find(const std::string& name) const;

    // @throws NotFoundError if name is not registered.
    json::value Invoke(const std::string& name, const json::object& input) const;

    std::vector<ToolSpec> Specs() const;
    std::vector<std::string> Names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ITool>> tools_;
};

}  // namespace flowgraph
