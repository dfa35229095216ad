// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace xferq::daemon {

/**
 * @brief io_context plus the threads that run it.
 *
 * JobManager creates one strand per job on executor(); cancel-grace and
 * progress-flush timers are bound to those strands as well. A handler that
 * throws is logged and its thread resumes running the context.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor executor() { return io_.get_executor(); }

    /// Stops accepting new work, runs what is already queued, then joins.
    void drain();

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    void runLoop(std::size_t index);
    void joinAll();

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> keepAlive_;
    std::vector<std::thread> threads_;
};

} // namespace xferq::daemon
