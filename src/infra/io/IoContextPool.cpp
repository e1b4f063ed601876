#include "IoContextPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace flowgraph {

IoContextPool::IoContextPool(std::size_t pool_size)
    : pool_size_(pool_size),
      io_context_(static_cast<int>(pool_size == 0 ? 1 : pool_size)),
      work_guard_(asio::make_work_guard(io_context_)) {
    if (pool_size == 0) {
        throw std::invalid_argument("IoContextPool size must be > 0");
    }
}

IoContextPool::~IoContextPool() { stop(); }

void IoContextPool::run() {
    if (!threads_.empty()) {
        return;
    }

    spdlog::debug("Starting executor pool with {} threads.", pool_size_);

    for (std::size_t i = 0; i < pool_size_; ++i) {
        threads_.emplace_back([this]() {
            try {
                io_context_.run();
            } catch (const std::exception& e) {
                spdlog::critical("io_context thread exception: {}", e.what());
            }
        });
    }
}

void IoContextPool::stop() {
    // Without the guard run() returns once the shared queue is empty
    work_guard_.reset();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

}  // namespace flowgraph
