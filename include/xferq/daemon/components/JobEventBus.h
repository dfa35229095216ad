// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <xferq/jobs/job.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace xferq::daemon {

// Bounded ring buffer guarded by a small mutex (MPMC-safe).
// Capacity must be > 0 (not required to be power-of-two).
template <typename T> class BoundedRing {
public:
    explicit BoundedRing(std::size_t capacity)
        : buf_((capacity ? capacity : 1) + 1), cap_((capacity ? capacity : 1) + 1) {}

    bool try_push(const T& v) {
        std::lock_guard<std::mutex> lk(mu_);
        auto next = inc(head_);
        if (next == tail_)
            return false; // full
        buf_[head_] = v;
        head_ = next;
        return true;
    }
    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lk(mu_);
        if (tail_ == head_)
            return false; // empty
        out = std::move(buf_[tail_]);
        tail_ = inc(tail_);
        return true;
    }
    bool empty() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ == tail_;
    }
    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return head_ >= tail_ ? head_ - tail_ : cap_ - tail_ + head_;
    }
    std::size_t capacity() const noexcept { return cap_ - 1; }

private:
    std::size_t inc(std::size_t i) const noexcept { return (++i == cap_) ? 0 : i; }
    mutable std::mutex mu_;
    std::vector<T> buf_;
    const std::size_t cap_;
    std::size_t head_{0};
    std::size_t tail_{0};
};

/**
 * @brief A job state change: the full job snapshot after the change.
 */
struct JobEvent {
    std::string type{"progress"};
    uint64_t sequence{0}; ///< Bus-wide publication order
    jobs::Job job;
};

/**
 * @brief One subscriber's view of the bus.
 *
 * Holds a bounded buffer of pending events. When the buffer overflows the bus closes
 * the stream instead of blocking the publisher; events already buffered can still be
 * read, after which next() returns std::nullopt.
 */
class JobEventStream {
public:
    JobEventStream(uint64_t id, std::size_t capacity, std::optional<jobs::JobKind> kind);

    JobEventStream(const JobEventStream&) = delete;
    JobEventStream& operator=(const JobEventStream&) = delete;

    /**
     * @brief Wait up to timeout for the next event.
     * @return std::nullopt on timeout or once the stream is closed and drained
     */
    std::optional<JobEvent> next(std::chrono::milliseconds timeout);

    /**
     * @brief Non-blocking read.
     */
    std::optional<JobEvent> tryNext();

    bool closed() const;

    /**
     * @brief True when the stream was closed because the subscriber fell behind.
     */
    bool overflowed() const;

    uint64_t id() const noexcept { return id_; }
    const std::optional<jobs::JobKind>& kindFilter() const noexcept { return kind_; }
    std::size_t pending() const { return ring_.size(); }

private:
    friend class JobEventBus;

    bool offer(const JobEvent& event);
    void close(bool overflow);

    const uint64_t id_;
    const std::optional<jobs::JobKind> kind_;
    BoundedRing<JobEvent> ring_;
    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool closed_{false};
    bool overflowed_{false};
};

/**
 * @brief In-memory fan-out of job state changes to any number of subscribers.
 *
 * No durability and no replay: a subscriber sees only events published after it
 * subscribed. publish() never blocks on a subscriber; a subscriber whose buffer is
 * full is disconnected (its stream closes). Publication is serialized, so every
 * subscriber observes events in publication order.
 */
class JobEventBus {
public:
    struct Config {
        std::size_t subscriberCapacity = 256; ///< Buffered events per subscriber
    };

    struct Stats {
        uint64_t published{0};
        uint64_t delivered{0};
        uint64_t disconnected{0};
        std::size_t subscribers{0};
    };

    JobEventBus();
    explicit JobEventBus(Config config);
    ~JobEventBus();

    JobEventBus(const JobEventBus&) = delete;
    JobEventBus& operator=(const JobEventBus&) = delete;

    /**
     * @brief Open a new independent stream, optionally restricted to one job kind.
     */
    std::shared_ptr<JobEventStream> subscribe(std::optional<jobs::JobKind> kind = std::nullopt);

    /**
     * @brief Deliver a snapshot to every current subscriber.
     * @return the sequence number assigned to the event
     */
    uint64_t publish(const jobs::Job& snapshot);

    /**
     * @brief Close and forget a stream. Idempotent.
     */
    void unsubscribe(const std::shared_ptr<JobEventStream>& stream);

    /**
     * @brief Close every stream (shutdown).
     */
    void closeAll();

    std::size_t subscriberCount() const;
    Stats stats() const;

private:
    Config config_;
    mutable std::mutex mutex_;
    std::mutex publishMutex_;
    std::vector<std::shared_ptr<JobEventStream>> subscribers_;
    uint64_t nextStreamId_{1};
    uint64_t nextSequence_{1};

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> disconnected_{0};
};

} // namespace xferq::daemon
