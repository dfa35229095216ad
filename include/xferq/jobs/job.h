#pragma once

#include <xferq/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xferq::jobs {

enum class JobKind { Download, Upload };

enum class JobStatus { Pending, Running, Completed, Failed, Cancelled };

const char* toString(JobKind kind) noexcept;
const char* toString(JobStatus status) noexcept;
std::optional<JobKind> parseJobKind(std::string_view s) noexcept;
std::optional<JobStatus> parseJobStatus(std::string_view s) noexcept;

/**
 * @brief True for completed, failed and cancelled.
 */
constexpr bool isTerminal(JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed ||
           status == JobStatus::Cancelled;
}

/**
 * @brief Transition table enforced by the job manager.
 *
 * pending -> running | cancelled
 * running -> completed | failed | cancelled
 *
 * The restart reconciliation (pending|running -> failed) is not part of this table;
 * the store applies it directly through failNonTerminal().
 */
constexpr bool isValidTransition(JobStatus from, JobStatus to) noexcept {
    switch (from) {
        case JobStatus::Pending:
            return to == JobStatus::Running || to == JobStatus::Cancelled;
        case JobStatus::Running:
            return to == JobStatus::Completed || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Completed:
        case JobStatus::Failed:
        case JobStatus::Cancelled:
            return false;
    }
    return false;
}

/**
 * @brief Remote item plus the ordered file set. An empty set means "all files" for a
 * download; for an upload it is the list of local files to send.
 */
struct JobTarget {
    std::string identifier;
    std::vector<std::string> files;
};

/**
 * @brief Options snapshot captured at submission. Never mutated afterwards.
 */
struct JobOptions {
    // download
    std::optional<std::string> destdir;     ///< Relative to the configured download root
    bool ignoreExisting{true};              ///< Skip files already present
    bool checksum{false};                   ///< Verify checksums after transfer
    int retries{5};                         ///< Tool-level retries per file
    std::optional<int> timeoutSeconds;      ///< Per-request network timeout
    bool noDirectories{true};               ///< Flatten into destdir
    bool noChangeTimestamp{false};          ///< Keep local mtime
    bool onTheFly{false};                   ///< Include derivative formats
    std::optional<std::string> glob;        ///< Only files matching this glob
    std::optional<std::string> format;      ///< Only files of this format
    std::optional<std::string> exclude;     ///< Skip files matching this glob
    std::vector<std::string> source;        ///< original | derivative | metadata
    std::vector<std::string> excludeSource; ///< original | derivative | metadata
    // upload
    std::map<std::string, std::string> metadata; ///< Item metadata (mediatype, title, ...)
};

struct Job {
    JobId id;
    JobKind kind{JobKind::Download};
    JobTarget target;
    JobOptions options;

    JobStatus status{JobStatus::Pending};
    double progress{0.0};
    std::optional<int64_t> transferredBytes;
    std::optional<int64_t> totalBytes;
    std::optional<double> rate; ///< bytes per second
    std::optional<std::string> error;

    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
};

/**
 * @brief Partial update applied atomically to one job record.
 *
 * Unset fields are left untouched. clearTelemetry drops transferred/total/rate and is
 * applied before any telemetry value set in the same patch.
 */
struct JobPatch {
    std::optional<JobStatus> status;
    std::optional<double> progress;
    std::optional<int64_t> transferredBytes;
    std::optional<int64_t> totalBytes;
    std::optional<double> rate;
    bool clearTelemetry{false};
    std::optional<std::string> error;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    TimePoint updatedAt{};

    bool touchesTelemetry() const noexcept {
        return clearTelemetry || transferredBytes || totalBytes || rate;
    }
};

void applyPatch(Job& job, const JobPatch& patch);

/**
 * @brief Filter for list queries. Results are always newest first.
 */
struct JobQuery {
    enum class Scope { All, NonTerminal, Terminal };

    Scope scope{Scope::All};
    std::optional<JobStatus> status; ///< Exact status, combined with scope
    std::optional<JobKind> kind;
    std::optional<std::size_t> limit;

    bool matches(const Job& job) const noexcept;
};

/// Fresh random (version 4) UUID in canonical lowercase form.
JobId newJobId();

// Time helpers (storage uses milliseconds since the Unix epoch)
int64_t toEpochMillis(TimePoint tp) noexcept;
TimePoint fromEpochMillis(int64_t ms) noexcept;
std::string formatTimestamp(TimePoint tp);
TimePoint nowMillis() noexcept;

// JSON
nlohmann::json optionsToJson(const JobOptions& options);

/**
 * @brief Parse an options object over the given defaults. Unknown keys are ignored;
 * a key with the wrong type is a ValidationError.
 */
Result<JobOptions> optionsFromJson(const nlohmann::json& j, const JobOptions& defaults = {});

/**
 * @brief Full job snapshot in the persisted record schema (plus started_at/completed_at).
 */
nlohmann::json toJson(const Job& job);

/**
 * @brief Validate a submission before anything is persisted.
 *
 * @param downloadRoot base directory that destdir must resolve inside of
 */
Result<void> validateSubmission(JobKind kind, const JobTarget& target, const JobOptions& options,
                                const std::filesystem::path& downloadRoot);

} // namespace xferq::jobs
