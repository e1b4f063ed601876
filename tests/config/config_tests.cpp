#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

#include "Errors.hpp"
#include "config.hpp"

using namespace flowgraph;
using namespace std::chrono_literals;

TEST(ConfigTests, EmptyDocumentGivesDefaults) {
    auto config = ParseConfig("");

    EXPECT_EQ(config.executor.max_iterations, DEFAULT_MAX_ITERATIONS);
    EXPECT_EQ(config.executor.timeout, DEFAULT_TIMEOUT);
    EXPECT_EQ(config.executor.worker_threads, DEFAULT_WORKER_THREADS);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.file, "logs/flowgraph.log");
    EXPECT_EQ(config.logging.max_files, 3u);
}

TEST(ConfigTests, ReadsEverySection) {
    auto config = ParseConfig(R"(
[executor]
max_iterations = 25
timeout_ms = 1500
worker_threads = 4

[logging]
level = "debug"
file = ""
max_file_size = 1024
max_files = 7
)");

    EXPECT_EQ(config.executor.max_iterations, 25);
    EXPECT_EQ(config.executor.timeout, 1500ms);
    EXPECT_EQ(config.executor.worker_threads, 4u);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_TRUE(config.logging.file.empty());
    EXPECT_EQ(config.logging.max_file_size, 1024u);
    EXPECT_EQ(config.logging.max_files, 7u);
}

TEST(ConfigTests, PartialSectionsKeepDefaults) {
    auto config = ParseConfig("[executor]\nmax_iterations = 3\n");

    EXPECT_EQ(config.executor.max_iterations, 3);
    EXPECT_EQ(config.executor.timeout, DEFAULT_TIMEOUT);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigTests, InvalidValuesAreRejected) {
    EXPECT_THROW(ParseConfig("[executor]\nmax_iterations = 0\n"), ValidationError);
    EXPECT_THROW(ParseConfig("[executor]\nworker_threads = 0\n"), ValidationError);
    EXPECT_THROW(ParseConfig("[logging]\nlevel = \"loud\"\n"), ValidationError);
    EXPECT_THROW(ParseConfig("[executor\n"), ValidationError);
    EXPECT_NO_THROW(ParseConfig("[logging]\nlevel = \"off\"\n"));
}

TEST(ConfigTests, MissingFileFallsBackToDefaults) {
    auto config = LoadConfig(::testing::TempDir() + "flowgraph_no_such_config.toml");
    EXPECT_EQ(config.executor.max_iterations, DEFAULT_MAX_ITERATIONS);
}

TEST(ConfigTests, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "flowgraph_config_test.toml";
    {
        std::ofstream out(path);
        out << "[executor]\nmax_iterations = 9\n";
    }
    EXPECT_EQ(LoadConfig(path).executor.max_iterations, 9);

    {
        std::ofstream out(path);
        out << "[executor\n";
    }
    EXPECT_THROW(LoadConfig(path), ValidationError);
    std::remove(path.c_str());
}
