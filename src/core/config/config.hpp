#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "types.hpp"

namespace flowgraph {

struct ExecutorConfig {
    int max_iterations = DEFAULT_MAX_ITERATIONS;
    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;
    unsigned int worker_threads = DEFAULT_WORKER_THREADS;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/flowgraph.log";  // empty disables the file sink
    std::size_t max_file_size = 1024 * 1024 * 5;
    std::size_t max_files = 3;
};

struct AppConfig {
    ExecutorConfig executor;
    LoggingConfig logging;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object. Defaults when the file does not exist.
 * @throws ValidationError if the file cannot be parsed or holds an invalid value.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

// Same as LoadConfig() but from TOML text.
AppConfig ParseConfig(std::string_view toml_text);

}  // namespace flowgraph
