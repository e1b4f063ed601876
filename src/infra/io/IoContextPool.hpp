#pragma once

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

#include "types.hpp"

namespace flowgraph {

/**
 * @brief One shared `io_context` driven by N threads.
 *
 * @details
 * Every posted handler goes to the same queue and is picked up by whichever
 * thread is idle first, so a long handler never holds back work that another
 * thread could run.
 *
 * stop() is graceful: the work guard is released and the threads drain the
 * handlers already queued before they are joined. Never call stop() (or
 * destroy the pool) from one of the pool's own threads.
 */
class IoContextPool {
public:
    explicit IoContextPool(std::size_t pool_size);

    // Stops and joins all threads.
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void run();

    void stop();

    asio::io_context& get_io_context() noexcept { return io_context_; }

    std::size_t size() const noexcept { return pool_size_; }

private:
    std::size_t pool_size_;
    asio::io_context io_context_;

    using work_guard_type = asio::executor_work_guard<asio::io_context::executor_type>;
    std::optional<work_guard_type> work_guard_;

    std::vector<std::jthread> threads_;
};

}  // namespace flowgraph
