// Copyright 2025 The xferq Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <xferq/core/types.h>
#include <xferq/daemon/components/JobEventBus.h>
#include <xferq/daemon/components/WorkerPool.h>
#include <xferq/jobs/job.h>
#include <xferq/jobs/job_store.h>
#include <xferq/transfer/transfer_runner.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace xferq::daemon {

/**
 * @brief Configuration for JobManager.
 */
struct JobManagerConfig {
    std::size_t maxConcurrent = 3;                    ///< Dispatch slots (N), clamped to [1, 10]
    std::chrono::milliseconds cancelGracePeriod{5000}; ///< Hard deadline after a cancel request
    std::chrono::milliseconds progressInterval{500};  ///< Minimum gap between progress writes
    int terminalWriteAttempts = 5;                    ///< Store attempts for the final state
    std::chrono::milliseconds terminalWriteBackoff{100}; ///< Doubled after each failed attempt
    std::size_t ioThreads = 2;                        ///< Worker threads for job strands
    std::filesystem::path downloadRoot{"."};          ///< destdir must resolve inside this
    jobs::JobOptions defaults;                        ///< Defaults for unset download options
};

/**
 * @brief Orchestrates transfer jobs: validation, bounded dispatch, cancellation, and the
 * single write path for job state.
 *
 * ## State machine
 * ```
 * pending  --dispatch-->        running
 * pending  --cancel---->        cancelled
 * running  --runner success-->  completed
 * running  --runner failure-->  failed
 * running  --cancel---->        cancelled   (runner is asked to stop)
 * ```
 * Any other transition is rejected with ErrorCode::InvalidTransition.
 *
 * ## Threading
 * - Every active job owns a strand on the worker pool. All mutations of that job
 *   (dispatch, progress, cancellation, finalization) run on its strand, so the store
 *   and the event bus see one job's updates in the same order.
 * - Runners report through a RunnerSink that only posts onto the job's strand.
 * - The pending FIFO, the running counter and the live-job table are guarded by one
 *   mutex, so concurrent dispatch never exceeds maxConcurrent.
 * - submit() and cancel() never wait for a transfer.
 *
 * ## Persistence policy
 * - Progress writes are coalesced to at most one per progressInterval and are
 *   best-effort: a failed write is logged and the in-memory state still advances.
 * - The terminal write is retried up to terminalWriteAttempts times before the slot is
 *   released. Retries wait on a timer bound to the job's strand, never on a pool
 *   thread. If every attempt fails the job is marked failed in memory, published,
 *   and kept readable until clearHistory() manages to store that state.
 *
 * ## Usage
 * ```cpp
 * auto manager = std::make_shared<JobManager>(store, bus, runner, cfg);
 * manager->start();
 * auto id = manager->submit(jobs::JobKind::Download, {"item", {"a.txt"}}, {});
 * auto stream = bus->subscribe();
 * ```
 */
class JobManager {
public:
    static constexpr std::size_t kMinConcurrent = 1;
    static constexpr std::size_t kMaxConcurrent = 10;

    /**
     * @brief Counters exposed for status output and tests.
     */
    struct Metrics {
        std::atomic<uint64_t> submitted{0};
        std::atomic<uint64_t> dispatched{0};
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
        std::atomic<uint64_t> cancelled{0};
        std::atomic<uint64_t> forcedCancels{0};        ///< Grace period expired
        std::atomic<uint64_t> progressWrites{0};
        std::atomic<uint64_t> progressWriteFailures{0};
        std::atomic<uint64_t> coalescedUpdates{0};     ///< Samples folded into a later write
        std::atomic<uint64_t> lateCallbacksIgnored{0};
        std::atomic<uint64_t> terminalWriteRetries{0};
        std::atomic<uint64_t> unpersistedTerminals{0};
    };

    JobManager(std::shared_ptr<jobs::IJobStore> store, std::shared_ptr<JobEventBus> bus,
               std::shared_ptr<transfer::TransferRunner> runner, JobManagerConfig config = {});
    ~JobManager();

    JobManager(const JobManager&) = delete;
    JobManager& operator=(const JobManager&) = delete;

    /**
     * @brief Start the worker pool and begin accepting submissions.
     *
     * Startup recovery must have completed before this is called.
     */
    Result<void> start();

    /**
     * @brief Stop accepting work, ask running transfers to stop and join the pool.
     *
     * Jobs still pending or running keep their stored state; the next start's recovery
     * marks them failed.
     */
    void stop();

    bool isRunning() const noexcept { return started_.load(std::memory_order_acquire); }

    /**
     * @brief Validate, persist as pending and queue for dispatch.
     * @return the new job id; ValidationError, DatabaseError or NotInitialized
     */
    Result<JobId> submit(jobs::JobKind kind, jobs::JobTarget target, jobs::JobOptions options);

    /**
     * @brief Cancel a pending or running job.
     *
     * A pending job becomes cancelled immediately. A running job's runner is asked to
     * stop; the job becomes cancelled once the runner acknowledges or the grace period
     * expires, whichever is first.
     * @return NotFound for unknown ids, InvalidTransition if terminal or already cancelling
     */
    Result<void> cancel(const JobId& id);

    /**
     * @brief Snapshot of one job; live state wins over the stored row.
     */
    Result<jobs::Job> get(const JobId& id);

    /**
     * @brief Jobs newest first, live state merged over stored rows.
     */
    Result<std::vector<jobs::Job>> list(const jobs::JobQuery& query = {});

    /**
     * @brief Remove terminal jobs from the store. Active jobs are never touched.
     *
     * Jobs whose final state never reached the store get one more write first. Only
     * those whose write succeeds leave memory; the rest stay readable as before.
     * @return number of stored rows removed
     */
    Result<std::size_t> clearHistory();

    /**
     * @brief Change N at runtime (clamped). Raising N dispatches immediately; lowering it
     * never preempts running jobs.
     */
    void setMaxConcurrent(std::size_t n);
    std::size_t maxConcurrent() const;

    /**
     * @brief Jobs currently holding a dispatch slot.
     */
    std::size_t runningCount() const;
    std::size_t pendingCount() const;

    const Metrics& metrics() const noexcept { return metrics_; }
    const JobManagerConfig& config() const noexcept { return config_; }

    static std::size_t clampConcurrency(std::size_t n) noexcept;

private:
    struct LiveJob;
    using LivePtr = std::shared_ptr<LiveJob>;

    void pumpLocked();

    // Strand-only
    void beginJob(const LivePtr& live);
    void beginCancel(const LivePtr& live);
    void onRunnerMessage(const LivePtr& live, transfer::RunnerMessage msg);
    void onProgress(const LivePtr& live, const transfer::RunnerProgress& progress);
    void flushProgress(const LivePtr& live);
    void finalize(const LivePtr& live, const transfer::TransferOutcome& outcome);
    void publishSnapshot(const LivePtr& live);

    jobs::Job applyLocal(const LivePtr& live, const jobs::JobPatch& patch);
    void persistTerminal(const LivePtr& live, jobs::JobPatch patch, int attempt,
                         std::chrono::milliseconds backoff);
    void completeFinalize(const LivePtr& live, jobs::JobPatch patch,
                          std::optional<Error> writeError);
    transfer::RunnerSink makeSink(const LivePtr& live);

    std::shared_ptr<jobs::IJobStore> store_;
    std::shared_ptr<JobEventBus> bus_;
    std::shared_ptr<transfer::TransferRunner> runner_;
    JobManagerConfig config_;

    std::unique_ptr<WorkerPool> pool_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::unordered_map<JobId, LivePtr> live_;
    std::deque<LivePtr> pending_;
    std::size_t running_{0};
    std::size_t maxConcurrent_{3};

    Metrics metrics_;
};

} // namespace xferq::daemon
