#pragma once

#include <xferq/core/types.h>
#include <xferq/jobs/job.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace xferq::transfer {

/**
 * @brief Parameters for one external transfer invocation.
 */
struct TransferRequest {
    JobId jobId;
    jobs::JobKind kind{jobs::JobKind::Download};
    jobs::JobTarget target;
    jobs::JobOptions options;
    std::filesystem::path destination; ///< Resolved download directory (downloads only)
};

/**
 * @brief One progress sample reported by the tool.
 */
struct TransferSample {
    int64_t transferredBytes{0};
    std::optional<int64_t> totalBytes;
};

/**
 * @brief Terminal outcome of a transfer.
 */
struct TransferOutcome {
    enum class Kind { Success, Failure, Cancelled };

    Kind kind{Kind::Success};
    std::string reason; ///< Set for Failure

    static TransferOutcome success() { return {Kind::Success, {}}; }
    static TransferOutcome failure(std::string why) { return {Kind::Failure, std::move(why)}; }
    static TransferOutcome cancelled() { return {Kind::Cancelled, {}}; }
};

const char* toString(TransferOutcome::Kind kind) noexcept;

/**
 * @brief Callbacks the tool invokes from its own threads.
 *
 * onSample may be called any number of times, onFinished at most once and never
 * followed by onSample.
 */
struct TransferCallbacks {
    std::function<void(const TransferSample&)> onSample;
    std::function<void(const TransferOutcome&)> onFinished;
};

/**
 * @brief Handle on a launched transfer.
 */
class ITransferSession {
public:
    virtual ~ITransferSession() = default;

    /**
     * @brief Ask the transfer to stop. Must return promptly; completion is reported
     * through onFinished.
     */
    virtual void requestStop() noexcept = 0;
};

/**
 * @brief External collaborator performing the actual network transfer.
 */
class ITransferTool {
public:
    virtual ~ITransferTool() = default;

    /**
     * @brief Start a transfer. Returns an error only if nothing could be started; in that
     * case no callback is ever invoked.
     */
    virtual Result<std::unique_ptr<ITransferSession>> launch(const TransferRequest& request,
                                                             TransferCallbacks callbacks) = 0;
};

} // namespace xferq::transfer
