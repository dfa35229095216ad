#include <xferq/transfer/download_staging.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace xferq::transfer {

namespace fs = std::filesystem;

DownloadStaging::DownloadStaging(fs::path destination, fs::path staging, bool ignoreExisting)
    : destination_(std::move(destination)), staging_(std::move(staging)),
      ignoreExisting_(ignoreExisting) {}

Result<std::shared_ptr<DownloadStaging>>
DownloadStaging::prepare(const fs::path& destination, const JobId& id,
                         const jobs::JobTarget& target, const jobs::JobOptions& options) {
    auto staging = (destination / kStagingDirName / ("job-" + id)).lexically_normal();

    std::error_code ec;
    // A directory left by an earlier crash holds nothing worth keeping.
    fs::remove_all(staging, ec);
    // A concurrent commit may remove an empty .tmp between the two mkdirs; retry once.
    for (int attempt = 0; attempt < 2; ++attempt) {
        ec.clear();
        fs::create_directories(staging, ec);
        if (!ec)
            break;
    }
    if (ec) {
        return Error{ErrorCode::TransferFailed,
                     "cannot prepare staging directory " + staging.string() + ": " + ec.message()};
    }

    std::shared_ptr<DownloadStaging> result(
        new DownloadStaging(destination, staging, options.ignoreExisting));
    if (options.ignoreExisting)
        result->populatePlaceholders(target, options);
    spdlog::debug("[DownloadStaging] {} staged in {} ({} placeholders)", id, staging.string(),
                  result->placeholders_.size());
    return result;
}

void DownloadStaging::populatePlaceholders(const jobs::JobTarget& target,
                                           const jobs::JobOptions& options) {
    // Without a file list the item's contents are unknown here; commit() still keeps
    // existing files.
    const fs::path itemDir = options.noDirectories ? fs::path{} : fs::path(target.identifier);
    for (const auto& file : target.files) {
        fs::path name(file);
        const fs::path rel = (itemDir / (options.noDirectories ? name.filename() : name))
                                 .lexically_normal();
        if (rel.empty() || rel.is_absolute() || *rel.begin() == "..")
            continue;

        std::error_code ec;
        const auto existing = fs::symlink_status(destination_ / rel, ec);
        if (ec || !(fs::is_regular_file(existing) || fs::is_symlink(existing)))
            continue;

        const auto placeholder = staging_ / rel;
        fs::create_directories(placeholder.parent_path(), ec);
        if (ec) {
            spdlog::debug("[DownloadStaging] No placeholder for {}: {}", rel.string(),
                          ec.message());
            continue;
        }
        std::ofstream touch(placeholder, std::ios::binary | std::ios::app);
        if (!touch) {
            spdlog::debug("[DownloadStaging] No placeholder for {}", rel.string());
            continue;
        }
        placeholders_.insert(rel);
    }
}

Result<std::size_t> DownloadStaging::commit() {
    if (done_)
        return Error{ErrorCode::InvalidState, "staging already finished"};

    std::vector<fs::path> staged;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(staging_, ec), end; !ec && it != end;
         it.increment(ec)) {
        std::error_code se;
        const auto st = it->symlink_status(se);
        if (se || !fs::is_regular_file(st))
            continue;
        auto rel = it->path().lexically_relative(staging_);
        if (placeholders_.count(rel) == 0)
            staged.push_back(std::move(rel));
    }
    if (ec) {
        auto message = "cannot read staging directory " + staging_.string() + ": " + ec.message();
        removeStaging();
        return Error{ErrorCode::TransferFailed, std::move(message)};
    }

    std::size_t moved = 0;
    std::size_t failed = 0;
    std::string firstFailure;
    for (const auto& rel : staged) {
        const auto target = destination_ / rel;
        std::error_code fe;
        fs::create_directories(target.parent_path(), fe);
        if (!fe && ignoreExisting_ && fs::exists(target, fe))
            continue;
        if (!fe)
            fs::rename(staging_ / rel, target, fe);
        if (fe) {
            spdlog::warn("[DownloadStaging] Could not move {} into {}: {}", rel.string(),
                         destination_.string(), fe.message());
            if (failed++ == 0)
                firstFailure = rel.string() + ": " + fe.message();
            continue;
        }
        ++moved;
    }

    removeStaging();
    if (failed > 0) {
        return Error{ErrorCode::TransferFailed,
                     std::to_string(failed) + " files could not be moved into place (" +
                         firstFailure + ")"};
    }
    spdlog::debug("[DownloadStaging] Moved {} files into {}", moved, destination_.string());
    return moved;
}

void DownloadStaging::discard() noexcept {
    if (done_)
        return;
    removeStaging();
}

void DownloadStaging::removeStaging() noexcept {
    done_ = true;
    std::error_code ec;
    fs::remove_all(staging_, ec);
    if (ec) {
        spdlog::warn("[DownloadStaging] Could not remove {}: {}", staging_.string(), ec.message());
        return;
    }
    // Only removes .tmp when no other job is staging there.
    const auto tmpRoot = staging_.parent_path();
    if (fs::is_empty(tmpRoot, ec) && !ec)
        fs::remove(tmpRoot, ec);
}

} // namespace xferq::transfer
