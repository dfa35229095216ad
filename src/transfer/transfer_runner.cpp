#include <xferq/transfer/download_staging.h>
#include <xferq/transfer/transfer_runner.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <utility>

namespace xferq::transfer {

const char* toString(TransferOutcome::Kind kind) noexcept {
    switch (kind) {
        case TransferOutcome::Kind::Success:
            return "success";
        case TransferOutcome::Kind::Failure:
            return "failure";
        case TransferOutcome::Kind::Cancelled:
            return "cancelled";
    }
    return "failure";
}

namespace detail {

class ActiveTransfer {
public:
    using Clock = std::chrono::steady_clock;

    ActiveTransfer(JobId id, RunnerSink sink, const TransferRunner::Config& config)
        : id_(std::move(id)), config_(config), sink_(std::move(sink)) {}

    const JobId& jobId() const noexcept { return id_; }

    void setStaging(std::shared_ptr<DownloadStaging> staging) { staging_ = std::move(staging); }

    void attach(std::unique_ptr<ITransferSession> session) {
        ITransferSession* raw = nullptr;
        {
            std::lock_guard<std::mutex> lk(stateMutex_);
            session_ = std::move(session);
            raw = session_.get();
        }
        // A stop requested while launching is forwarded now.
        if (raw && stopRequested_.load(std::memory_order_acquire))
            raw->requestStop();
    }

    bool requestStop() noexcept {
        if (stopRequested_.exchange(true, std::memory_order_acq_rel))
            return false;
        ITransferSession* raw = nullptr;
        {
            std::lock_guard<std::mutex> lk(stateMutex_);
            raw = session_.get();
        }
        if (raw)
            raw->requestStop();
        return true;
    }

    void detach() noexcept {
        std::lock_guard<std::mutex> lk(sinkMutex_);
        sink_ = nullptr;
    }

    void onSample(const TransferSample& sample) {
        if (finished_.load(std::memory_order_acquire))
            return;

        RunnerProgress msg;
        msg.jobId = id_;
        msg.transferredBytes = sample.transferredBytes;
        msg.totalBytes = sample.totalBytes;
        {
            std::lock_guard<std::mutex> lk(stateMutex_);
            const auto now = Clock::now();
            window_.emplace_back(now, sample.transferredBytes);
            while (window_.size() > std::max<std::size_t>(config_.rateWindow, 2))
                window_.pop_front();
            if (window_.size() >= 2) {
                const double secs =
                    std::chrono::duration<double>(window_.back().first - window_.front().first)
                        .count();
                if (secs > 0.0) {
                    const double delta =
                        static_cast<double>(window_.back().second - window_.front().second);
                    msg.rate = std::max(0.0, delta / secs);
                }
            }

            double pct = progress_;
            if (sample.totalBytes && *sample.totalBytes > 0) {
                pct = std::min(config_.runningCap, 100.0 * static_cast<double>(sample.transferredBytes) /
                                                       static_cast<double>(*sample.totalBytes));
            } else if (!lastBump_ || now - *lastBump_ >= config_.indeterminateStep) {
                pct = std::min(config_.indeterminateCap, progress_ + config_.indeterminateIncrement);
                lastBump_ = now;
            }
            progress_ = std::max(progress_, pct);
            msg.progress = progress_;
        }
        deliver(std::move(msg));
    }

    void onFinished(const TransferOutcome& outcome) {
        if (finished_.exchange(true, std::memory_order_acq_rel)) {
            spdlog::debug("[TransferRunner] Duplicate terminal signal for {} ignored", id_);
            return;
        }
        TransferOutcome reported = outcome;
        if (reported.kind == TransferOutcome::Kind::Failure &&
            stopRequested_.load(std::memory_order_acquire)) {
            // A tool killed on request usually exits non-zero.
            reported = TransferOutcome::cancelled();
        }
        if (staging_) {
            if (reported.kind == TransferOutcome::Kind::Success) {
                if (auto moved = staging_->commit(); !moved) {
                    spdlog::warn("[TransferRunner] Finalizing download {} failed: {}", id_,
                                 moved.error().message);
                    reported = TransferOutcome::failure("failed to finalize download: " +
                                                        moved.error().message);
                }
            } else {
                staging_->discard();
            }
        }
        spdlog::debug("[TransferRunner] {} finished: {}", id_, toString(reported.kind));
        deliver(RunnerFinished{id_, std::move(reported)});
    }

private:
    void deliver(RunnerMessage msg) {
        std::lock_guard<std::mutex> lk(sinkMutex_);
        if (sink_)
            sink_(std::move(msg));
    }

    const JobId id_;
    const TransferRunner::Config config_;

    std::mutex sinkMutex_;
    RunnerSink sink_;

    std::mutex stateMutex_;
    std::unique_ptr<ITransferSession> session_;
    std::shared_ptr<DownloadStaging> staging_;
    double progress_{0.0};
    std::optional<Clock::time_point> lastBump_;
    std::deque<std::pair<Clock::time_point, int64_t>> window_;

    std::atomic<bool> finished_{false};
    std::atomic<bool> stopRequested_{false};
};

} // namespace detail

const JobId& TransferHandle::jobId() const {
    static const JobId empty;
    return state_ ? state_->jobId() : empty;
}

TransferRunner::TransferRunner(std::shared_ptr<ITransferTool> tool, Config config)
    : tool_(std::move(tool)), config_(std::move(config)) {}

TransferRunner::TransferRunner(std::shared_ptr<ITransferTool> tool)
    : TransferRunner(std::move(tool), Config{}) {}

std::filesystem::path TransferRunner::destinationFor(const jobs::Job& job) const {
    std::filesystem::path dest = config_.downloadRoot;
    if (job.options.destdir) {
        std::string rel = *job.options.destdir;
        rel.erase(0, rel.find_first_not_of(" \t"));
        rel.erase(rel.find_last_not_of(" \t") + 1);
        if (!rel.empty())
            dest /= rel;
    }
    return dest.lexically_normal();
}

TransferHandle TransferRunner::start(const jobs::Job& job, RunnerSink sink) {
    auto state = std::make_shared<detail::ActiveTransfer>(job.id, std::move(sink), config_);

    TransferRequest request;
    request.jobId = job.id;
    request.kind = job.kind;
    request.target = job.target;
    request.options = job.options;

    // Downloads land in a staging directory and are moved into place on success.
    std::shared_ptr<DownloadStaging> staging;
    if (job.kind == jobs::JobKind::Download) {
        auto prepared = DownloadStaging::prepare(destinationFor(job), job.id, job.target,
                                                 job.options);
        if (!prepared) {
            spdlog::warn("[TransferRunner] Cannot stage download {}: {}", job.id,
                         prepared.error().message);
            state->onFinished(TransferOutcome::failure(prepared.error().message));
            return TransferHandle(state);
        }
        staging = std::move(prepared).value();
        state->setStaging(staging);
        request.destination = staging->directory();
    }

    std::weak_ptr<detail::ActiveTransfer> weak = state;
    TransferCallbacks callbacks;
    callbacks.onSample = [weak](const TransferSample& sample) {
        if (auto s = weak.lock())
            s->onSample(sample);
    };
    callbacks.onFinished = [weak, staging](const TransferOutcome& outcome) {
        if (auto s = weak.lock())
            s->onFinished(outcome);
        else if (staging)
            staging->discard(); // abandoned by its owner
    };

    auto launched = tool_->launch(request, std::move(callbacks));
    if (!launched) {
        spdlog::warn("[TransferRunner] Failed to start transfer for {}: {}", job.id,
                     launched.error().message);
        state->onFinished(TransferOutcome::failure(launched.error().message));
        return TransferHandle(state);
    }
    state->attach(std::move(launched).value());
    spdlog::debug("[TransferRunner] Started {} transfer {} for '{}'", jobs::toString(job.kind),
                  job.id, job.target.identifier);
    return TransferHandle(state);
}

bool TransferRunner::cancel(const TransferHandle& handle) noexcept {
    if (!handle.state_)
        return false;
    return handle.state_->requestStop();
}

void TransferRunner::detach(const TransferHandle& handle) noexcept {
    if (handle.state_)
        handle.state_->detach();
}

} // namespace xferq::transfer
