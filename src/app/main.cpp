// 1. Standard Library
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// 2. Third Party
#include <boost/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "GraphExecutor.hpp"
#include "Json2Graph.hpp"
#include "MemoryStateManager.hpp"
#include "NodeRegistry.hpp"
#include "config.hpp"

using namespace flowgraph;

static void setup_logging(const LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink (stderr, stdout carries the result document)
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sinks.push_back(console_sink);

    // B. Rotating File Sink
    if (!cfg.file.empty()) {
        auto parent = std::filesystem::path(cfg.file).parent_path();
        if (!parent.empty()) std::filesystem::create_directories(parent);
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.file, cfg.max_file_size, cfg.max_files);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("flowgraph", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::from_str(cfg.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

// Native code the sample definitions refer to by name.
static NodeBindings demo_bindings() {
    NodeBindings bindings;

    bindings.providers = std::make_shared<ProviderRegistry>();
    bindings.providers->Register("echo", std::make_shared<EchoTextGenerator>());

    bindings.tools = std::make_shared<ToolRegistry>();
    bindings.tools->Register("word_count", "Counts whitespace separated words in 'text'",
                             [](const json::object& input) -> json::value {
                                 auto it = input.find("text");
                                 if (it == input.end() || !it->value().is_string()) {
                                     throw std::invalid_argument("'text' must be a string");
                                 }
                                 std::string_view text = it->value().get_string();
                                 std::int64_t words = 0;
                                 bool in_word = false;
                                 for (char c : text) {
                                     bool space = std::isspace(static_cast<unsigned char>(c)) != 0;
                                     if (!space && !in_word) ++words;
                                     in_word = !space;
                                 }
                                 return words;
                             });

    bindings.functions["increment"] = [](const ExecutionContext&, const State& state) {
        auto next = state.Clone();
        next->Set("counter", state.GetInt("counter").value_or(0) + 1);
        return next;
    };

    bindings.finalizers["summarize"] = [](const ExecutionContext&, State& state) {
        state.Set("summary", json::string("keys: " + std::to_string(state.Size())));
    };

    return bindings;
}

int main(int argc, char* argv[]) {
    // 1. Argument Validation
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: flowgraph_run <graph.json> [input.json] [config.toml]\n"
                  << "Example: flowgraph_run samples/graph.json samples/input.json "
                     "samples/config.toml\n";
        return EXIT_FAILURE;
    }

    try {
        // 2. Configuration & Logging
        AppConfig config = LoadConfig(argc == 4 ? argv[3] : "config.toml");
        setup_logging(config.logging);

        // 3. Initialize Node Types & Load Graph
        RegisterBuiltinNodes();

        json::value definition = ReadJsonFile(argv[1]);
        if (!definition.is_object()) {
            spdlog::critical("Graph definition must be a JSON object");
            return EXIT_FAILURE;
        }
        auto graph = ParseGraph(definition.get_object(), demo_bindings());

        json::object input;
        if (argc >= 3) {
            json::value doc = ReadJsonFile(argv[2]);
            if (!doc.is_object()) {
                spdlog::critical("Input document must be a JSON object");
                return EXIT_FAILURE;
            }
            input = doc.get_object();
        }

        // 4. Execute
        GraphExecutor executor(std::make_shared<MemoryStateManager>(),
                               config.executor.worker_threads);

        ExecutionOptions options;
        options.max_iterations = config.executor.max_iterations;
        options.timeout = config.executor.timeout;

        ExecutionResult result = executor.Execute(graph, input, options);

        // 5. Report
        std::cout << json::serialize(result.ToJson()) << std::endl;
        spdlog::info("Execution {} finished: {}", result.execution_id, ToString(result.status));

        return result.status == ExecutionStatus::Completed ? EXIT_SUCCESS : EXIT_FAILURE;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }
}
