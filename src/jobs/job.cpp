#include <xferq/jobs/job.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <random>
#include <set>
#include <sstream>

namespace xferq::jobs {

namespace {

constexpr std::size_t kMaxIdentifierLength = 100;
constexpr int kMaxRetries = 100;

bool isIdentifierChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '_' || c == '-';
}

bool hasParentComponent(const std::filesystem::path& p) {
    for (const auto& part : p) {
        if (part == "..")
            return true;
    }
    return false;
}

bool isValidSource(const std::string& s) {
    return s == "original" || s == "derivative" || s == "metadata";
}

Error invalid(std::string msg) {
    return Error{ErrorCode::ValidationError, std::move(msg)};
}

Result<void> readBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (!it->is_boolean())
        return invalid(std::string("option '") + key + "' must be a boolean");
    out = it->get<bool>();
    return {};
}

Result<void> readInt(const nlohmann::json& j, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (!it->is_number_integer())
        return invalid(std::string("option '") + key + "' must be an integer");
    out = it->get<int>();
    return {};
}

Result<void> readOptionalString(const nlohmann::json& j, const char* key,
                                std::optional<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (!it->is_string())
        return invalid(std::string("option '") + key + "' must be a string");
    out = it->get<std::string>();
    return {};
}

Result<void> readStringList(const nlohmann::json& j, const char* key,
                            std::vector<std::string>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return {};
    if (it->is_string()) {
        out = {it->get<std::string>()};
        return {};
    }
    if (!it->is_array())
        return invalid(std::string("option '") + key + "' must be a list of strings");
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string())
            return invalid(std::string("option '") + key + "' must be a list of strings");
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return {};
}

} // namespace

const char* toString(JobKind kind) noexcept {
    switch (kind) {
        case JobKind::Download:
            return "download";
        case JobKind::Upload:
            return "upload";
    }
    return "download";
}

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending:
            return "pending";
        case JobStatus::Running:
            return "running";
        case JobStatus::Completed:
            return "completed";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Cancelled:
            return "cancelled";
    }
    return "pending";
}

std::optional<JobKind> parseJobKind(std::string_view s) noexcept {
    if (s == "download")
        return JobKind::Download;
    if (s == "upload")
        return JobKind::Upload;
    return std::nullopt;
}

std::optional<JobStatus> parseJobStatus(std::string_view s) noexcept {
    if (s == "pending")
        return JobStatus::Pending;
    if (s == "running")
        return JobStatus::Running;
    if (s == "completed")
        return JobStatus::Completed;
    if (s == "failed")
        return JobStatus::Failed;
    if (s == "cancelled")
        return JobStatus::Cancelled;
    return std::nullopt;
}

void applyPatch(Job& job, const JobPatch& patch) {
    if (patch.status)
        job.status = *patch.status;
    if (patch.progress)
        job.progress = *patch.progress;
    if (patch.clearTelemetry) {
        job.transferredBytes.reset();
        job.totalBytes.reset();
        job.rate.reset();
    }
    if (patch.transferredBytes)
        job.transferredBytes = patch.transferredBytes;
    if (patch.totalBytes)
        job.totalBytes = patch.totalBytes;
    if (patch.rate)
        job.rate = patch.rate;
    if (patch.error)
        job.error = patch.error;
    if (patch.startedAt)
        job.startedAt = patch.startedAt;
    if (patch.completedAt)
        job.completedAt = patch.completedAt;
    job.updatedAt = patch.updatedAt;
}

bool JobQuery::matches(const Job& job) const noexcept {
    if (kind && job.kind != *kind)
        return false;
    if (status && job.status != *status)
        return false;
    switch (scope) {
        case Scope::All:
            return true;
        case Scope::NonTerminal:
            return !isTerminal(job.status);
        case Scope::Terminal:
            return isTerminal(job.status);
    }
    return true;
}

JobId newJobId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    const uint64_t hi = (engine() & ~0xF000ull) | 0x4000ull;                           // version 4
    const uint64_t lo = (engine() & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull; // RFC 4122 variant
    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                       hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFull);
}

int64_t toEpochMillis(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t ms) noexcept {
    return TimePoint{std::chrono::milliseconds{ms}};
}

TimePoint nowMillis() noexcept {
    return fromEpochMillis(toEpochMillis(std::chrono::system_clock::now()));
}

std::string formatTimestamp(TimePoint tp) {
    const int64_t ms = toEpochMillis(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << (ms % 1000) << 'Z';
    return oss.str();
}

nlohmann::json optionsToJson(const JobOptions& options) {
    nlohmann::json j = nlohmann::json::object();
    j["destdir"] = options.destdir ? nlohmann::json(*options.destdir) : nlohmann::json(nullptr);
    j["ignore_existing"] = options.ignoreExisting;
    j["checksum"] = options.checksum;
    j["retries"] = options.retries;
    j["timeout"] = options.timeoutSeconds ? nlohmann::json(*options.timeoutSeconds)
                                          : nlohmann::json(nullptr);
    j["no_directories"] = options.noDirectories;
    j["no_change_timestamp"] = options.noChangeTimestamp;
    j["on_the_fly"] = options.onTheFly;
    if (options.glob)
        j["glob"] = *options.glob;
    if (options.format)
        j["format"] = *options.format;
    if (options.exclude)
        j["exclude"] = *options.exclude;
    if (!options.source.empty())
        j["source"] = options.source;
    if (!options.excludeSource.empty())
        j["exclude_source"] = options.excludeSource;
    if (!options.metadata.empty())
        j["metadata"] = options.metadata;
    return j;
}

Result<JobOptions> optionsFromJson(const nlohmann::json& j, const JobOptions& defaults) {
    JobOptions out = defaults;
    if (j.is_null())
        return out;
    if (!j.is_object())
        return invalid("options must be an object");

    Result<void> r;
    if (!(r = readOptionalString(j, "destdir", out.destdir)))
        return r.error();
    if (!(r = readBool(j, "ignore_existing", out.ignoreExisting)))
        return r.error();
    if (!(r = readBool(j, "checksum", out.checksum)))
        return r.error();
    if (!(r = readInt(j, "retries", out.retries)))
        return r.error();
    if (!(r = readBool(j, "no_directories", out.noDirectories)))
        return r.error();
    if (!(r = readBool(j, "no_change_timestamp", out.noChangeTimestamp)))
        return r.error();
    if (!(r = readBool(j, "on_the_fly", out.onTheFly)))
        return r.error();
    if (!(r = readOptionalString(j, "glob", out.glob)))
        return r.error();
    if (!(r = readOptionalString(j, "format", out.format)))
        return r.error();
    if (!(r = readOptionalString(j, "exclude", out.exclude)))
        return r.error();
    if (!(r = readStringList(j, "source", out.source)))
        return r.error();
    if (!(r = readStringList(j, "exclude_source", out.excludeSource)))
        return r.error();

    if (auto it = j.find("timeout"); it != j.end() && !it->is_null()) {
        int seconds = 0;
        if (!(r = readInt(j, "timeout", seconds)))
            return r.error();
        out.timeoutSeconds = seconds;
    }

    if (auto it = j.find("metadata"); it != j.end() && !it->is_null()) {
        if (!it->is_object())
            return invalid("option 'metadata' must be an object");
        for (const auto& [key, value] : it->items()) {
            if (value.is_string()) {
                out.metadata[key] = value.get<std::string>();
            } else if (!value.is_null()) {
                out.metadata[key] = value.dump();
            }
        }
    }
    return out;
}

nlohmann::json toJson(const Job& job) {
    auto optOrNull = [](const auto& v) -> nlohmann::json {
        if (v)
            return nlohmann::json(*v);
        return nlohmann::json(nullptr);
    };
    auto timeOrNull = [](const std::optional<TimePoint>& tp) -> nlohmann::json {
        if (tp)
            return formatTimestamp(*tp);
        return nlohmann::json(nullptr);
    };

    nlohmann::json j;
    j["id"] = job.id;
    j["kind"] = toString(job.kind);
    j["identifier"] = job.target.identifier;
    j["files"] = job.target.files.empty() ? nlohmann::json(nullptr)
                                          : nlohmann::json(job.target.files);
    j["options"] = optionsToJson(job.options);
    j["status"] = toString(job.status);
    j["progress"] = job.progress;
    j["transferred_bytes"] = optOrNull(job.transferredBytes);
    j["total_bytes"] = optOrNull(job.totalBytes);
    j["rate"] = optOrNull(job.rate);
    j["error"] = optOrNull(job.error);
    j["created_at"] = formatTimestamp(job.createdAt);
    j["updated_at"] = formatTimestamp(job.updatedAt);
    j["started_at"] = timeOrNull(job.startedAt);
    j["completed_at"] = timeOrNull(job.completedAt);
    return j;
}

Result<void> validateSubmission(JobKind kind, const JobTarget& target, const JobOptions& options,
                                const std::filesystem::path& downloadRoot) {
    const auto& id = target.identifier;
    if (id.empty())
        return invalid("identifier must not be empty");
    if (id.size() > kMaxIdentifierLength)
        return invalid("identifier is too long");
    if (!std::all_of(id.begin(), id.end(), isIdentifierChar))
        return invalid("identifier contains invalid characters: " + id);

    if (kind == JobKind::Upload && target.files.empty())
        return invalid("upload requires at least one file");

    std::set<std::string> seen;
    for (const auto& file : target.files) {
        if (file.empty())
            return invalid("file names must not be empty");
        std::filesystem::path p(file);
        // Upload sources are local paths and may be absolute; download names are item-relative.
        if (kind == JobKind::Download && p.is_absolute())
            return invalid("file name must be relative: " + file);
        if (hasParentComponent(p))
            return invalid("file name must not contain '..': " + file);
        if (!seen.insert(file).second)
            return invalid("duplicate file name: " + file);
    }

    if (options.retries < 0 || options.retries > kMaxRetries)
        return invalid("retries must be between 0 and 100");
    if (options.timeoutSeconds && *options.timeoutSeconds <= 0)
        return invalid("timeout must be positive");

    for (const auto& s : options.source) {
        if (!isValidSource(s))
            return invalid("unknown source value: " + s);
    }
    for (const auto& s : options.excludeSource) {
        if (!isValidSource(s))
            return invalid("unknown exclude_source value: " + s);
    }

    if (options.destdir) {
        std::string dest = *options.destdir;
        dest.erase(0, dest.find_first_not_of(" \t"));
        dest.erase(dest.find_last_not_of(" \t") + 1);
        if (dest.empty())
            return {};
        std::filesystem::path rel(dest);
        if (rel.is_absolute())
            return invalid("destdir must be a relative path");
        if (hasParentComponent(rel))
            return invalid("destdir must not contain '..'");
        auto root = downloadRoot.lexically_normal();
        auto resolved = (root / rel).lexically_normal();
        auto [rootEnd, _] = std::mismatch(root.begin(), root.end(), resolved.begin(),
                                          resolved.end());
        if (rootEnd != root.end() && !rootEnd->empty())
            return invalid("destdir escapes the download directory");
    }
    return {};
}

} // namespace xferq::jobs
