#pragma once

#include <xferq/transfer/transfer_tool.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace xferq::transfer {

/**
 * @brief Progress message from a runner to its owner.
 */
struct RunnerProgress {
    JobId jobId;
    double progress{0.0}; ///< Percent, non-decreasing, below 100 while running
    int64_t transferredBytes{0};
    std::optional<int64_t> totalBytes;
    std::optional<double> rate; ///< bytes per second over the sample window
};

/**
 * @brief The single terminal message from a runner.
 */
struct RunnerFinished {
    JobId jobId;
    TransferOutcome outcome;
};

using RunnerMessage = std::variant<RunnerProgress, RunnerFinished>;

/**
 * @brief Channel the runner delivers messages into. Messages for one job arrive in order
 * and RunnerFinished is always last. The sink must not block.
 */
using RunnerSink = std::function<void(RunnerMessage)>;

namespace detail {
class ActiveTransfer;
}

/**
 * @brief Opaque handle on one started transfer.
 */
class TransferHandle {
public:
    TransferHandle() = default;

    explicit operator bool() const noexcept { return static_cast<bool>(state_); }
    const JobId& jobId() const;

private:
    friend class TransferRunner;
    explicit TransferHandle(std::shared_ptr<detail::ActiveTransfer> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::ActiveTransfer> state_;
};

/**
 * @brief Drives external transfers and translates their samples into RunnerMessages.
 *
 * Each started transfer reports exactly one RunnerFinished. Progress is derived as
 * follows: with a known total it is min(99, 100 * transferred / total); with an
 * unknown total it advances by indeterminateIncrement at most once per
 * indeterminateStep and stops at indeterminateCap. 100 is reserved for completion.
 *
 * A download runs against a DownloadStaging directory under its destination. Its files
 * are moved into place before a success is reported, and a move failure turns the
 * outcome into a failure. Any other outcome deletes the staged files, as does a tool
 * that finishes after its handle was released.
 */
class TransferRunner {
public:
    struct Config {
        std::filesystem::path downloadRoot{"."};
        std::size_t rateWindow = 5;                          ///< Samples used for rate
        std::chrono::milliseconds indeterminateStep{1000};   ///< Min time between bumps
        double indeterminateIncrement = 2.0;
        double indeterminateCap = 95.0;
        double runningCap = 99.0;
    };

    TransferRunner(std::shared_ptr<ITransferTool> tool, Config config);
    explicit TransferRunner(std::shared_ptr<ITransferTool> tool);

    /**
     * @brief Begin the transfer asynchronously. A launch failure is reported as a
     * failure outcome through the sink, so the returned handle is always valid.
     */
    TransferHandle start(const jobs::Job& job, RunnerSink sink);

    /**
     * @brief Ask the transfer to stop. Only the first call has an effect. Returns once the
     * request has been issued, without waiting for the transfer to end.
     * @return true if this call issued the stop request
     */
    bool cancel(const TransferHandle& handle) noexcept;

    /**
     * @brief Stop delivering messages for this transfer. Later tool callbacks are dropped.
     */
    void detach(const TransferHandle& handle) noexcept;

    /**
     * @brief Resolve where a download job's files end up. The tool itself writes into
     * a staging directory below it.
     */
    std::filesystem::path destinationFor(const jobs::Job& job) const;

    const Config& config() const noexcept { return config_; }

private:
    std::shared_ptr<ITransferTool> tool_;
    Config config_;
};

} // namespace xferq::transfer
