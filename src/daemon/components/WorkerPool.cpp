// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#include <xferq/daemon/components/WorkerPool.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace xferq::daemon {

WorkerPool::WorkerPool(std::size_t threadCount)
    : io_(static_cast<int>(std::max<std::size_t>(threadCount, 1))),
      keepAlive_(boost::asio::make_work_guard(io_)) {
    const std::size_t count = std::max<std::size_t>(threadCount, 1);
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        threads_.emplace_back([this, i] { runLoop(i); });
    spdlog::debug("[WorkerPool] {} io threads", count);
}

WorkerPool::~WorkerPool() {
    keepAlive_.reset();
    io_.stop();
    joinAll();
}

void WorkerPool::drain() {
    keepAlive_.reset();
    joinAll();
}

void WorkerPool::joinAll() {
    const auto self = std::this_thread::get_id();
    for (auto& t : threads_) {
        if (!t.joinable())
            continue;
        // A handler that ends up destroying the pool cannot join itself.
        if (t.get_id() == self)
            t.detach();
        else
            t.join();
    }
    threads_.clear();
}

void WorkerPool::runLoop(std::size_t index) {
    while (true) {
        try {
            io_.run();
            return;
        } catch (const std::exception& e) {
            spdlog::error("[WorkerPool] io thread {} handler failed: {}", index, e.what());
        }
    }
}

} // namespace xferq::daemon
