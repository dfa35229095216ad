// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#include <xferq/daemon/components/JobManager.h>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <variant>

namespace xferq::daemon {

using jobs::Job;
using jobs::JobPatch;
using jobs::JobStatus;
using transfer::TransferOutcome;

/**
 * @brief Live state of one active job. Mutated only on its strand.
 */
struct JobManager::LiveJob {
    LiveJob(Job initial, const boost::asio::any_io_executor& ex)
        : id(initial.id), strand(boost::asio::make_strand(ex)), graceTimer(strand),
          flushTimer(strand), retryTimer(strand), job(std::move(initial)) {}

    Job snapshot() const {
        std::lock_guard<std::mutex> lk(snapshotMutex);
        return job;
    }

    const JobId id;
    boost::asio::strand<boost::asio::any_io_executor> strand;
    boost::asio::steady_timer graceTimer;
    boost::asio::steady_timer flushTimer;
    boost::asio::steady_timer retryTimer;

    mutable std::mutex snapshotMutex; // readers vs the strand
    Job job;

    // strand only
    transfer::TransferHandle handle;
    bool progressDirty{false};
    bool flushScheduled{false};
    std::chrono::steady_clock::time_point lastFlush{};

    // guarded by JobManager::mutex_
    bool queued{false};
    bool holdsSlot{false};
    bool cancelRequested{false};

    std::atomic<bool> finalized{false};
    std::atomic<bool> persisted{true};
};

namespace {

std::string trimmed(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::size_t JobManager::clampConcurrency(std::size_t n) noexcept {
    return std::clamp(n, kMinConcurrent, kMaxConcurrent);
}

JobManager::JobManager(std::shared_ptr<jobs::IJobStore> store, std::shared_ptr<JobEventBus> bus,
                       std::shared_ptr<transfer::TransferRunner> runner, JobManagerConfig config)
    : store_(std::move(store)), bus_(std::move(bus)), runner_(std::move(runner)),
      config_(std::move(config)) {
    maxConcurrent_ = clampConcurrency(config_.maxConcurrent);
    if (maxConcurrent_ != config_.maxConcurrent) {
        spdlog::warn("[JobManager] maxConcurrent {} out of range, using {}", config_.maxConcurrent,
                     maxConcurrent_);
    }
}

JobManager::~JobManager() {
    stop();
}

Result<void> JobManager::start() {
    if (!store_ || !bus_ || !runner_) {
        return Error{ErrorCode::InvalidArgument, "job manager requires a store, bus and runner"};
    }
    std::lock_guard<std::mutex> lk(mutex_);
    if (started_.load(std::memory_order_acquire))
        return {};

    stopping_.store(false, std::memory_order_release);
    pool_ = std::make_unique<WorkerPool>(std::max<std::size_t>(1, config_.ioThreads));
    started_.store(true, std::memory_order_release);
    spdlog::info("[JobManager] Started (maxConcurrent={}, grace={}ms, progressInterval={}ms)",
                 maxConcurrent_, config_.cancelGracePeriod.count(),
                 config_.progressInterval.count());
    pumpLocked();
    return {};
}

void JobManager::stop() {
    std::vector<LivePtr> active;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!started_.load(std::memory_order_acquire))
            return;
        started_.store(false, std::memory_order_release);
        stopping_.store(true, std::memory_order_release);
        pending_.clear();
        for (auto& [id, live] : live_)
            active.push_back(live);
    }

    spdlog::info("[JobManager] Stopping; {} active jobs left for recovery", active.size());
    for (auto& live : active) {
        boost::asio::post(live->strand, [this, live] {
            live->graceTimer.cancel();
            live->flushTimer.cancel();
            live->retryTimer.cancel();
            // Detach first so the stop's outcome does not finalize the job.
            if (live->handle) {
                runner_->detach(live->handle);
                runner_->cancel(live->handle);
            }
        });
    }
    active.clear();

    pool_->drain();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        live_.clear();
        running_ = 0;
    }
    pool_.reset();
    spdlog::info("[JobManager] Stopped");
}

Result<JobId> JobManager::submit(jobs::JobKind kind, jobs::JobTarget target,
                                 jobs::JobOptions options) {
    if (!isRunning())
        return Error{ErrorCode::NotInitialized, "job manager is not running"};

    if (options.destdir) {
        auto dest = trimmed(*options.destdir);
        if (dest.empty())
            options.destdir.reset();
        else
            options.destdir = std::move(dest);
    }
    auto valid = jobs::validateSubmission(kind, target, options, config_.downloadRoot);
    if (!valid) {
        spdlog::debug("[JobManager] Rejected {} submission for '{}': {}", jobs::toString(kind),
                      target.identifier, valid.error().message);
        return valid.error();
    }

    Job job;
    job.id = jobs::newJobId();
    job.kind = kind;
    job.target = std::move(target);
    job.options = std::move(options);
    job.status = JobStatus::Pending;
    job.createdAt = jobs::nowMillis();
    job.updatedAt = job.createdAt;

    auto created = store_->create(job);
    if (!created) {
        spdlog::error("[JobManager] Failed to persist {} job for '{}': {}", jobs::toString(kind),
                      job.target.identifier, created.error().message);
        return Error{ErrorCode::DatabaseError, "failed to persist job: " + created.error().message};
    }
    metrics_.submitted.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!started_.load(std::memory_order_acquire)) {
            return Error{ErrorCode::SystemShutdown, "job manager stopped during submission"};
        }
        auto live = std::make_shared<LiveJob>(job, pool_->executor());
        live->queued = true;
        live_.emplace(job.id, live);
        pending_.push_back(live);
        boost::asio::post(live->strand, [this, live] { publishSnapshot(live); });
        pumpLocked();
    }

    spdlog::info("[JobManager] Queued {} job {} for '{}' ({} files)", jobs::toString(kind), job.id,
                 job.target.identifier, job.target.files.size());
    return job.id;
}

Result<void> JobManager::cancel(const JobId& id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = live_.find(id);
        if (it != live_.end()) {
            auto live = it->second;
            if (live->finalized.load(std::memory_order_acquire)) {
                const auto status = live->snapshot().status;
                if (!jobs::isTerminal(status)) {
                    return Error{ErrorCode::InvalidTransition,
                                 "job " + id + " is already finishing"};
                }
                return Error{ErrorCode::InvalidTransition,
                             "job " + id + " is already " + jobs::toString(status)};
            }
            if (live->cancelRequested) {
                return Error{ErrorCode::InvalidTransition, "job " + id + " is already cancelling"};
            }
            live->cancelRequested = true;

            if (live->queued) {
                pending_.erase(std::remove(pending_.begin(), pending_.end(), live), pending_.end());
                live->queued = false;
                spdlog::info("[JobManager] Cancelling pending job {}", id);
                boost::asio::post(live->strand,
                                  [this, live] { finalize(live, TransferOutcome::cancelled()); });
            } else {
                boost::asio::post(live->strand, [this, live] { beginCancel(live); });
            }
            return {};
        }
    }

    auto stored = store_->get(id);
    if (!stored) {
        if (stored.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "job not found: " + id};
        return stored.error();
    }
    return Error{ErrorCode::InvalidTransition,
                 "job " + id + " is already " + jobs::toString(stored.value().status)};
}

Result<Job> JobManager::get(const JobId& id) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = live_.find(id);
        if (it != live_.end())
            return it->second->snapshot();
    }
    return store_->get(id);
}

Result<std::vector<Job>> JobManager::list(const jobs::JobQuery& query) {
    // Status filtering happens after the merge because live state may differ from the row.
    jobs::JobQuery storeQuery;
    storeQuery.kind = query.kind;
    auto rows = store_->list(storeQuery);
    if (!rows)
        return rows.error();

    std::unordered_map<JobId, Job> liveSnapshots;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [id, live] : live_)
            liveSnapshots.emplace(id, live->snapshot());
    }

    std::vector<Job> merged = std::move(rows).value();
    for (auto& job : merged) {
        auto it = liveSnapshots.find(job.id);
        if (it != liveSnapshots.end()) {
            job = std::move(it->second);
            liveSnapshots.erase(it);
        }
    }
    for (auto& [id, job] : liveSnapshots) {
        if (!query.kind || job.kind == *query.kind)
            merged.push_back(std::move(job));
    }

    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [&](const Job& j) { return !query.matches(j); }),
                 merged.end());
    std::stable_sort(merged.begin(), merged.end(),
                     [](const Job& a, const Job& b) { return a.createdAt > b.createdAt; });
    if (query.limit && merged.size() > *query.limit)
        merged.resize(*query.limit);
    return merged;
}

Result<std::size_t> JobManager::clearHistory() {
    std::vector<LivePtr> unpersisted;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& [id, live] : live_) {
            if (live->finalized.load(std::memory_order_acquire) &&
                !live->persisted.load(std::memory_order_acquire))
                unpersisted.push_back(live);
        }
    }

    // The stored row of such a job still shows it active; write the reported state first.
    for (const auto& live : unpersisted) {
        const auto job = live->snapshot();
        if (!jobs::isTerminal(job.status))
            continue;
        JobPatch patch;
        patch.status = job.status;
        patch.error = job.error;
        patch.progress = job.progress;
        patch.clearTelemetry = true;
        patch.updatedAt = jobs::nowMillis();
        patch.completedAt = job.completedAt.value_or(patch.updatedAt);
        if (auto written = store_->update(live->id, patch); !written) {
            spdlog::warn("[JobManager] Final state of {} still not persisted: {}", live->id,
                         written.error().message);
            continue;
        }
        live->persisted.store(true, std::memory_order_release);
        spdlog::info("[JobManager] Persisted final state of {} on history clear", live->id);
    }

    auto removed = store_->clearTerminal();
    if (!removed)
        return removed;

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (const auto& live : unpersisted) {
            if (!live->persisted.load(std::memory_order_acquire))
                continue;
            auto it = live_.find(live->id);
            if (it != live_.end() && it->second == live) {
                live_.erase(it);
                ++dropped;
            }
        }
    }
    if (dropped < unpersisted.size()) {
        spdlog::warn("[JobManager] Keeping {} terminal jobs in memory until their state is stored",
                     unpersisted.size() - dropped);
    }
    return removed;
}

void JobManager::setMaxConcurrent(std::size_t n) {
    std::lock_guard<std::mutex> lk(mutex_);
    maxConcurrent_ = clampConcurrency(n);
    spdlog::info("[JobManager] maxConcurrent set to {}", maxConcurrent_);
    pumpLocked();
}

std::size_t JobManager::maxConcurrent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return maxConcurrent_;
}

std::size_t JobManager::runningCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_;
}

std::size_t JobManager::pendingCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

void JobManager::pumpLocked() {
    if (!started_.load(std::memory_order_acquire) || stopping_.load(std::memory_order_acquire))
        return;
    while (running_ < maxConcurrent_ && !pending_.empty()) {
        auto live = pending_.front();
        pending_.pop_front();
        live->queued = false;
        live->holdsSlot = true;
        ++running_;
        metrics_.dispatched.fetch_add(1, std::memory_order_relaxed);
        boost::asio::post(live->strand, [this, live] { beginJob(live); });
    }
}

void JobManager::beginJob(const LivePtr& live) {
    if (stopping_.load(std::memory_order_acquire))
        return;

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancelled = live->cancelRequested;
    }
    if (cancelled) {
        finalize(live, TransferOutcome::cancelled());
        return;
    }

    JobPatch patch;
    patch.status = JobStatus::Running;
    patch.progress = 0.0;
    patch.startedAt = jobs::nowMillis();
    patch.updatedAt = *patch.startedAt;
    auto snapshot = applyLocal(live, patch);

    if (auto written = store_->update(live->id, patch); !written) {
        spdlog::warn("[JobManager] Failed to record dispatch of {}: {}", live->id,
                     written.error().message);
    }
    bus_->publish(snapshot);
    live->lastFlush = std::chrono::steady_clock::now();

    spdlog::info("[JobManager] Job {} running", live->id);
    live->handle = runner_->start(snapshot, makeSink(live));
}

void JobManager::beginCancel(const LivePtr& live) {
    if (live->finalized.load(std::memory_order_acquire) || !live->handle)
        return;

    runner_->cancel(live->handle);
    spdlog::info("[JobManager] Cancelling running job {} (grace {}ms)", live->id,
                 config_.cancelGracePeriod.count());

    live->graceTimer.expires_after(config_.cancelGracePeriod);
    live->graceTimer.async_wait(boost::asio::bind_executor(
        live->strand, [this, live](const boost::system::error_code& ec) {
            if (ec || live->finalized.load(std::memory_order_acquire))
                return;
            metrics_.forcedCancels.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[JobManager] Job {} did not stop within {}ms; abandoning its transfer",
                         live->id, config_.cancelGracePeriod.count());
            finalize(live, TransferOutcome::cancelled());
        }));
}

transfer::RunnerSink JobManager::makeSink(const LivePtr& live) {
    std::weak_ptr<LiveJob> weak = live;
    return [this, weak](transfer::RunnerMessage msg) {
        auto target = weak.lock();
        if (!target)
            return;
        boost::asio::post(target->strand, [this, target, msg = std::move(msg)]() mutable {
            onRunnerMessage(target, std::move(msg));
        });
    };
}

void JobManager::onRunnerMessage(const LivePtr& live, transfer::RunnerMessage msg) {
    if (auto* progress = std::get_if<transfer::RunnerProgress>(&msg)) {
        onProgress(live, *progress);
        return;
    }
    auto& finished = std::get<transfer::RunnerFinished>(msg);
    if (stopping_.load(std::memory_order_acquire))
        return;
    if (live->finalized.load(std::memory_order_acquire)) {
        metrics_.lateCallbacksIgnored.fetch_add(1, std::memory_order_relaxed);
        spdlog::debug("[JobManager] Ignoring late {} outcome for {}",
                      transfer::toString(finished.outcome.kind), live->id);
        return;
    }
    finalize(live, finished.outcome);
}

void JobManager::onProgress(const LivePtr& live, const transfer::RunnerProgress& progress) {
    if (stopping_.load(std::memory_order_acquire))
        return;
    if (live->finalized.load(std::memory_order_acquire)) {
        metrics_.lateCallbacksIgnored.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    JobPatch patch;
    {
        std::lock_guard<std::mutex> lk(live->snapshotMutex);
        if (live->job.status != JobStatus::Running) {
            metrics_.lateCallbacksIgnored.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        patch.progress = std::max(live->job.progress, progress.progress);
        patch.transferredBytes = progress.transferredBytes;
        patch.totalBytes = progress.totalBytes;
        patch.rate = progress.rate;
        patch.updatedAt = jobs::nowMillis();
        jobs::applyPatch(live->job, patch);
    }
    live->progressDirty = true;

    const auto now = std::chrono::steady_clock::now();
    if (now - live->lastFlush >= config_.progressInterval) {
        flushProgress(live);
        return;
    }

    metrics_.coalescedUpdates.fetch_add(1, std::memory_order_relaxed);
    if (live->flushScheduled)
        return;
    live->flushScheduled = true;
    live->flushTimer.expires_at(live->lastFlush + config_.progressInterval);
    live->flushTimer.async_wait(boost::asio::bind_executor(
        live->strand, [this, live](const boost::system::error_code& ec) {
            live->flushScheduled = false;
            if (ec || live->finalized.load(std::memory_order_acquire))
                return;
            flushProgress(live);
        }));
}

void JobManager::flushProgress(const LivePtr& live) {
    if (!live->progressDirty)
        return;
    live->progressDirty = false;
    live->lastFlush = std::chrono::steady_clock::now();

    auto snapshot = live->snapshot();
    JobPatch patch;
    patch.progress = snapshot.progress;
    patch.transferredBytes = snapshot.transferredBytes;
    patch.totalBytes = snapshot.totalBytes;
    patch.rate = snapshot.rate;
    patch.updatedAt = snapshot.updatedAt;

    metrics_.progressWrites.fetch_add(1, std::memory_order_relaxed);
    if (auto written = store_->update(live->id, patch); !written) {
        metrics_.progressWriteFailures.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[JobManager] Progress write for {} failed: {}", live->id,
                     written.error().message);
    }
    spdlog::trace("[JobManager] Job {} at {:.1f}%", live->id, snapshot.progress);
    bus_->publish(snapshot);
}

void JobManager::finalize(const LivePtr& live, const TransferOutcome& outcome) {
    if (live->finalized.exchange(true, std::memory_order_acq_rel))
        return;

    live->graceTimer.cancel();
    live->flushTimer.cancel();
    live->progressDirty = false;
    if (live->handle)
        runner_->detach(live->handle);

    bool cancelRequested = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancelRequested = live->cancelRequested;
    }

    const auto current = live->snapshot();
    JobPatch patch;
    patch.updatedAt = jobs::nowMillis();
    patch.completedAt = patch.updatedAt;
    if (cancelRequested) {
        patch.status = JobStatus::Cancelled;
        patch.clearTelemetry = true;
    } else {
        switch (outcome.kind) {
            case TransferOutcome::Kind::Success:
                patch.status = JobStatus::Completed;
                patch.progress = 100.0;
                if (current.totalBytes)
                    patch.transferredBytes = current.totalBytes;
                break;
            case TransferOutcome::Kind::Failure:
                patch.status = JobStatus::Failed;
                patch.error = outcome.reason.empty() ? std::string("transfer failed")
                                                     : outcome.reason;
                patch.clearTelemetry = true;
                break;
            case TransferOutcome::Kind::Cancelled:
                patch.status = JobStatus::Failed;
                patch.error = "transfer stopped unexpectedly";
                patch.clearTelemetry = true;
                break;
        }
    }
    if (!jobs::isValidTransition(current.status, *patch.status)) {
        spdlog::error("[JobManager] Unexpected transition {} -> {} for {}",
                      jobs::toString(current.status), jobs::toString(*patch.status), live->id);
    }

    persistTerminal(live, std::move(patch), 1, config_.terminalWriteBackoff);
}

void JobManager::persistTerminal(const LivePtr& live, JobPatch patch, int attempt,
                                 std::chrono::milliseconds backoff) {
    const int attempts = std::max(1, config_.terminalWriteAttempts);
    auto written = store_->update(live->id, patch);
    if (written) {
        completeFinalize(live, std::move(patch), std::nullopt);
        return;
    }

    auto error = written.error();
    if (error.code == ErrorCode::NotFound || attempt >= attempts ||
        stopping_.load(std::memory_order_acquire)) {
        completeFinalize(live, std::move(patch), std::move(error));
        return;
    }

    metrics_.terminalWriteRetries.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("[JobManager] Final write for {} failed (attempt {}/{}): {}", live->id, attempt,
                 attempts, error.message);
    // The slot stays held until the last attempt; other strands keep running meanwhile.
    live->retryTimer.expires_after(backoff);
    live->retryTimer.async_wait(boost::asio::bind_executor(
        live->strand, [this, live, patch = std::move(patch), attempt,
                       backoff](const boost::system::error_code& ec) mutable {
            if (ec || stopping_.load(std::memory_order_acquire))
                return;
            persistTerminal(live, std::move(patch), attempt + 1, backoff * 2);
        }));
}

void JobManager::completeFinalize(const LivePtr& live, JobPatch patch,
                                  std::optional<Error> writeError) {
    if (writeError) {
        metrics_.unpersistedTerminals.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[JobManager] Could not persist final state of {}: {}", live->id,
                      writeError->message);
        patch.status = JobStatus::Failed;
        patch.progress.reset();
        patch.transferredBytes.reset();
        patch.clearTelemetry = true;
        patch.error = "final state could not be persisted: " + writeError->message;
    }

    auto snapshot = applyLocal(live, patch);
    if (writeError)
        live->persisted.store(false, std::memory_order_release);
    bus_->publish(snapshot);

    switch (snapshot.status) {
        case JobStatus::Completed:
            metrics_.completed.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("[JobManager] Job {} completed", live->id);
            break;
        case JobStatus::Cancelled:
            metrics_.cancelled.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("[JobManager] Job {} cancelled", live->id);
            break;
        default:
            metrics_.failed.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("[JobManager] Job {} failed: {}", live->id, snapshot.error.value_or(""));
            break;
    }

    live->handle = {};
    std::lock_guard<std::mutex> lk(mutex_);
    if (live->holdsSlot) {
        live->holdsSlot = false;
        --running_;
    }
    if (live->persisted.load(std::memory_order_acquire))
        live_.erase(live->id);
    pumpLocked();
}

void JobManager::publishSnapshot(const LivePtr& live) {
    bus_->publish(live->snapshot());
}

Job JobManager::applyLocal(const LivePtr& live, const JobPatch& patch) {
    std::lock_guard<std::mutex> lk(live->snapshotMutex);
    jobs::applyPatch(live->job, patch);
    return live->job;
}

} // namespace xferq::daemon
