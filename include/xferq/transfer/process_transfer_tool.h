#pragma once

#include <xferq/transfer/transfer_tool.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace xferq::transfer {

struct ProcessToolConfig {
    std::string executable{"ia"};                 ///< Resolved through PATH
    std::vector<std::string> baseArgs;            ///< Inserted before the generated arguments
    std::chrono::milliseconds killGrace{2000};    ///< SIGTERM to SIGKILL delay after a stop request
    std::chrono::milliseconds pollInterval{1000}; ///< Destination size polling period
    bool pollDestination{true}; ///< Derive download progress from disk when the tool is silent
};

/**
 * @brief Runs the archive command-line client as a child process per transfer.
 *
 * Stdout and stderr are merged. A line holding a JSON object with a numeric
 * "transferred" member (and optionally "total") is a progress sample; any other
 * non-empty line is a diagnostic, and the last one becomes the failure reason.
 * Exit status 0 is success. A stop request sends SIGTERM to the child's process
 * group and SIGKILL once killGrace has elapsed.
 */
class ProcessTransferTool : public ITransferTool {
public:
    explicit ProcessTransferTool(ProcessToolConfig config = {});
    ~ProcessTransferTool() override;

    ProcessTransferTool(const ProcessTransferTool&) = delete;
    ProcessTransferTool& operator=(const ProcessTransferTool&) = delete;

    Result<std::unique_ptr<ITransferSession>> launch(const TransferRequest& request,
                                                     TransferCallbacks callbacks) override;

    /**
     * @brief Command-line arguments (excluding executable and baseArgs) for a request.
     */
    static std::vector<std::string> buildArguments(const TransferRequest& request);

    /**
     * @brief Parse one output line as a progress sample.
     */
    static std::optional<TransferSample> parseProgressLine(std::string_view line);

    /**
     * @brief Number of child processes that have not been reaped yet.
     */
    std::size_t activeCount() const;

    struct Child;

private:
    void reapFinished();

    ProcessToolConfig config_;
    mutable std::mutex mutex_;
    struct Monitor {
        std::shared_ptr<Child> child;
        std::jthread thread;
    };
    std::vector<Monitor> monitors_;
};

} // namespace xferq::transfer
