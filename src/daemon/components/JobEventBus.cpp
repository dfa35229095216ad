// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#include <xferq/daemon/components/JobEventBus.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace xferq::daemon {

JobEventStream::JobEventStream(uint64_t id, std::size_t capacity,
                               std::optional<jobs::JobKind> kind)
    : id_(id), kind_(kind), ring_(capacity) {}

std::optional<JobEvent> JobEventStream::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return closed_ || !ring_.empty(); });
    JobEvent event;
    if (ring_.try_pop(event))
        return event;
    return std::nullopt;
}

std::optional<JobEvent> JobEventStream::tryNext() {
    JobEvent event;
    if (ring_.try_pop(event))
        return event;
    return std::nullopt;
}

bool JobEventStream::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

bool JobEventStream::overflowed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return overflowed_;
}

bool JobEventStream::offer(const JobEvent& event) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_)
            return false;
        if (!ring_.try_push(event))
            return false;
    }
    cv_.notify_all();
    return true;
}

void JobEventStream::close(bool overflow) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_)
            return;
        closed_ = true;
        overflowed_ = overflow;
    }
    cv_.notify_all();
}

JobEventBus::JobEventBus() : JobEventBus(Config{}) {}

JobEventBus::JobEventBus(Config config) : config_(config) {}

JobEventBus::~JobEventBus() {
    closeAll();
}

std::shared_ptr<JobEventStream> JobEventBus::subscribe(std::optional<jobs::JobKind> kind) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto stream =
        std::make_shared<JobEventStream>(nextStreamId_++, config_.subscriberCapacity, kind);
    subscribers_.push_back(stream);
    spdlog::debug("[JobEventBus] Subscriber {} attached ({} total)", stream->id(),
                  subscribers_.size());
    return stream;
}

uint64_t JobEventBus::publish(const jobs::Job& snapshot) {
    std::lock_guard<std::mutex> publishLock(publishMutex_);

    std::vector<std::shared_ptr<JobEventStream>> targets;
    JobEvent event;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        targets = subscribers_;
        event.sequence = nextSequence_++;
    }
    event.job = snapshot;
    published_.fetch_add(1, std::memory_order_relaxed);

    std::vector<std::shared_ptr<JobEventStream>> slow;
    for (const auto& stream : targets) {
        if (stream->kindFilter() && *stream->kindFilter() != snapshot.kind)
            continue;
        if (stream->offer(event)) {
            delivered_.fetch_add(1, std::memory_order_relaxed);
        } else if (!stream->closed()) {
            slow.push_back(stream);
        }
    }

    for (const auto& stream : slow) {
        spdlog::warn("[JobEventBus] Subscriber {} fell behind ({} buffered); disconnecting",
                     stream->id(), stream->pending());
        stream->close(true);
        disconnected_.fetch_add(1, std::memory_order_relaxed);
        unsubscribe(stream);
    }
    return event.sequence;
}

void JobEventBus::unsubscribe(const std::shared_ptr<JobEventStream>& stream) {
    if (!stream)
        return;
    stream->close(false);
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = std::find(subscribers_.begin(), subscribers_.end(), stream);
    if (it != subscribers_.end()) {
        subscribers_.erase(it);
        spdlog::debug("[JobEventBus] Subscriber {} detached", stream->id());
    }
}

void JobEventBus::closeAll() {
    std::vector<std::shared_ptr<JobEventStream>> streams;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        streams.swap(subscribers_);
    }
    for (const auto& s : streams)
        s->close(false);
}

std::size_t JobEventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return subscribers_.size();
}

JobEventBus::Stats JobEventBus::stats() const {
    Stats s;
    s.published = published_.load(std::memory_order_relaxed);
    s.delivered = delivered_.load(std::memory_order_relaxed);
    s.disconnected = disconnected_.load(std::memory_order_relaxed);
    s.subscribers = subscriberCount();
    return s;
}

} // namespace xferq::daemon
