#pragma once

#include <chrono>

#include <boost/asio.hpp>
#include <boost/json.hpp>

namespace flowgraph {

namespace asio = boost::asio;
namespace json = boost::json;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Engine defaults, overridable through ExecutionOptions and config.toml
static constexpr int DEFAULT_MAX_ITERATIONS = 100;
static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5 * 60 * 1000};
static constexpr unsigned int DEFAULT_WORKER_THREADS = 2;

}  // namespace flowgraph
