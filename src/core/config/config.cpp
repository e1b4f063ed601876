#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <toml++/toml.hpp>

#include "Errors.hpp"

namespace flowgraph {

namespace {

AppConfig from_table(const toml::table& tbl) {
    AppConfig config;

    // 1. Executor Settings
    if (auto executor = tbl["executor"]) {
        config.executor.max_iterations =
            executor["max_iterations"].value_or(config.executor.max_iterations);
        config.executor.timeout = std::chrono::milliseconds(
            executor["timeout_ms"].value_or<int64_t>(config.executor.timeout.count()));
        config.executor.worker_threads =
            executor["worker_threads"].value_or(config.executor.worker_threads);
    }

    // 2. Logging Settings
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
        config.logging.max_file_size =
            logging["max_file_size"].value_or(config.logging.max_file_size);
        config.logging.max_files = logging["max_files"].value_or(config.logging.max_files);
    }

    if (config.executor.max_iterations <= 0) {
        throw ValidationError("executor.max_iterations must be positive");
    }
    if (config.executor.worker_threads == 0) {
        throw ValidationError("executor.worker_threads must be positive");
    }
    if (spdlog::level::from_str(config.logging.level) == spdlog::level::off &&
        config.logging.level != "off") {
        throw ValidationError("unknown logging.level: " + config.logging.level);
    }
    return config;
}

}  // namespace

AppConfig LoadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return AppConfig{};
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ValidationError("config parse error in " + path + ": " +
                              std::string(err.description()));
    }

    AppConfig config = from_table(tbl);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

AppConfig ParseConfig(std::string_view toml_text) {
    try {
        return from_table(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        throw ValidationError("config parse error: " + std::string(err.description()));
    }
}

}  // namespace flowgraph
