#pragma once

#include <xferq/core/types.h>
#include <xferq/jobs/job.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>

namespace xferq::transfer {

/**
 * @brief Per-job scratch directory a download is written into before it is moved
 * into its destination.
 *
 * The directory is `<destination>/.tmp/job-<id>`. When ignoreExisting is set and the
 * job names its files, every file already present in the destination gets an empty
 * placeholder in the staging tree, so the tool skips it and commit() never moves it.
 *
 * commit() and discard() are called once, from whichever thread reports the
 * transfer's outcome. Both remove the staging directory, and `.tmp` with it once empty.
 */
class DownloadStaging {
public:
    static constexpr const char* kStagingDirName = ".tmp";

    static Result<std::shared_ptr<DownloadStaging>>
    prepare(const std::filesystem::path& destination, const JobId& id,
            const jobs::JobTarget& target, const jobs::JobOptions& options);

    const std::filesystem::path& directory() const noexcept { return staging_; }
    const std::filesystem::path& destination() const noexcept { return destination_; }
    std::size_t placeholderCount() const noexcept { return placeholders_.size(); }

    /**
     * @brief Move staged files into the destination, keeping their relative paths.
     *
     * With ignoreExisting an existing destination file is left untouched; otherwise
     * it is replaced. Symlinks and placeholders are never moved.
     * @return number of files moved, or TransferFailed if any file could not be moved
     */
    Result<std::size_t> commit();

    /// Delete everything staged.
    void discard() noexcept;

private:
    DownloadStaging(std::filesystem::path destination, std::filesystem::path staging,
                    bool ignoreExisting);

    void populatePlaceholders(const jobs::JobTarget& target, const jobs::JobOptions& options);
    void removeStaging() noexcept;

    std::filesystem::path destination_;
    std::filesystem::path staging_;
    bool ignoreExisting_;
    std::set<std::filesystem::path> placeholders_; ///< Relative to staging_
    bool done_{false};
};

} // namespace xferq::transfer
