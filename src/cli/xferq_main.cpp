#include <xferq/api/job_request_handler.h>
#include <xferq/daemon/components/ConfigResolver.h>
#include <xferq/daemon/job_service.h>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace xferq;

std::atomic<int> g_interrupts{0};

void interrupt_handler(int) {
    g_interrupts.fetch_add(1, std::memory_order_relaxed);
}

void setup_signal_handlers() {
    std::signal(SIGINT, interrupt_handler);
    std::signal(SIGTERM, interrupt_handler);
    // Writes to a child that already exited must not kill us
    std::signal(SIGPIPE, SIG_IGN);
    std::set_terminate([]() noexcept {
        std::fprintf(stderr, "FATAL: std::terminate called\n");
        spdlog::shutdown();
        std::_Exit(1);
    });
}

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "warn")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    return spdlog::level::info;
}

void setup_logging(const daemon::ServiceConfig& config, bool verbose) {
    const auto level = parse_level(config.logLevel);
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(verbose ? level : spdlog::level::warn);
    console->set_pattern("[%^%l%$] %v");
    sinks.push_back(console);

    const auto logFile = config.resolvedLogFile();
    std::error_code ec;
    std::filesystem::create_directories(logFile.parent_path(), ec);
    try {
        const size_t max_size = 10 * 1024 * 1024; // 10MB per file
        const size_t max_files = 5;
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile.string(),
                                                                               max_size, max_files);
        rotating->set_level(level);
        sinks.push_back(rotating);
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "warning: file logging disabled (%s)\n", e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("xferq", sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::info);
}

std::string format_bytes(int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

void print_job_line(const jobs::Job& job) {
    fmt::print("{}  {:<8} {:<9} {:>5.1f}%  {}", job.id, jobs::toString(job.kind),
               jobs::toString(job.status), job.progress, job.target.identifier);
    if (job.error)
        fmt::print("  ({})", *job.error);
    fmt::print("\n");
}

void print_progress(const jobs::Job& job) {
    std::string detail;
    if (job.transferredBytes) {
        detail = format_bytes(*job.transferredBytes);
        if (job.totalBytes)
            detail += " / " + format_bytes(*job.totalBytes);
        if (job.rate)
            detail += " at " + format_bytes(static_cast<int64_t>(*job.rate)) + "/s";
    }
    fmt::print("\r{:<9} {:>5.1f}%  {:<40}", jobs::toString(job.status), job.progress, detail);
    std::fflush(stdout);
}

int exit_code_for(jobs::JobStatus status) {
    switch (status) {
        case jobs::JobStatus::Completed:
            return 0;
        case jobs::JobStatus::Cancelled:
            return 130;
        default:
            return 1;
    }
}

// Submit through the event stream and follow the job until it is terminal. The first
// interrupt cancels the job; a second one stops waiting.
int run_and_follow(daemon::JobService& service, jobs::JobKind kind, jobs::JobTarget target,
                   jobs::JobOptions options) {
    auto stream = service.bus().subscribe(kind);
    auto id = service.manager().submit(kind, std::move(target), std::move(options));
    if (!id) {
        service.bus().unsubscribe(stream);
        fmt::print(stderr, "error: {}\n", id.error().message);
        return id.error().code == ErrorCode::ValidationError ? 2 : 1;
    }
    fmt::print("job {}\n", id.value());

    bool cancelSent = false;
    std::optional<jobs::Job> last;
    while (true) {
        const int interrupts = g_interrupts.load(std::memory_order_relaxed);
        if (interrupts > 0 && !cancelSent) {
            cancelSent = true;
            fmt::print("\ncancelling...\n");
            if (auto cancelled = service.manager().cancel(id.value()); !cancelled)
                spdlog::warn("Cancel of {} failed: {}", id.value(), cancelled.error().message);
        } else if (interrupts > 1) {
            fmt::print(stderr, "\ninterrupted; job {} left to recovery\n", id.value());
            break;
        }

        auto event = stream->next(std::chrono::milliseconds(250));
        if (event && event->job.id == id.value()) {
            last = std::move(event->job);
        } else if (!event) {
            // Timeout or the stream was dropped: read the job directly
            auto current = service.manager().get(id.value());
            if (!current) {
                spdlog::error("Lost track of job {}: {}", id.value(), current.error().message);
                break;
            }
            last = current.value();
            if (stream->closed()) {
                service.bus().unsubscribe(stream);
                stream = service.bus().subscribe(kind);
            }
        } else {
            continue;
        }

        print_progress(*last);
        if (jobs::isTerminal(last->status))
            break;
    }
    service.bus().unsubscribe(stream);
    fmt::print("\n");

    if (!last || !jobs::isTerminal(last->status))
        return 130;
    if (last->error)
        fmt::print(stderr, "{}: {}\n", jobs::toString(last->status), *last->error);
    return exit_code_for(last->status);
}

} // namespace

int main(int argc, char* argv[]) {
    setup_signal_handlers();

    CLI::App app{"xferq - bulk archive.org download and upload jobs"};
    app.require_subcommand(1);

    std::string configPath;
    std::filesystem::path dataDir;
    std::filesystem::path logFile;
    std::string logLevel;
    std::size_t maxConcurrent = 0;
    bool verbose = false;

    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("--data-dir", dataDir, "Directory holding the job database and logs");
    app.add_option("--log-file", logFile, "Log file path");
    app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("-j,--max-concurrent", maxConcurrent, "Transfers running at once (1-10)");
    app.add_flag("-v,--verbose", verbose, "Echo log output to stderr");

    // download
    auto* download = app.add_subcommand("download", "Download files from an item");
    std::string dlIdentifier;
    std::vector<std::string> dlFiles;
    jobs::JobOptions dlOptions;
    std::string dlDestdir, dlGlob, dlFormat, dlExclude;
    int dlRetries = -1;
    int dlTimeout = 0;
    bool dlChecksum = false, dlNoIgnoreExisting = false, dlKeepDirs = false;
    bool dlNoChangeTimestamp = false, dlOnTheFly = false;
    download->add_option("identifier", dlIdentifier, "Item identifier")->required();
    download->add_option("files", dlFiles, "Files to fetch (default: all)");
    download->add_option("--destdir", dlDestdir, "Directory under the download root");
    download->add_option("--glob", dlGlob, "Only files matching this glob");
    download->add_option("--format", dlFormat, "Only files of this format");
    download->add_option("--exclude", dlExclude, "Skip files matching this glob");
    download->add_option("--source", dlOptions.source, "original, derivative or metadata");
    download->add_option("--exclude-source", dlOptions.excludeSource,
                         "original, derivative or metadata");
    download->add_option("--retries", dlRetries, "Retries per file");
    download->add_option("--timeout", dlTimeout, "Network timeout in seconds");
    download->add_flag("--checksum", dlChecksum, "Verify checksums");
    download->add_flag("--no-ignore-existing", dlNoIgnoreExisting, "Fetch files already present");
    download->add_flag("--keep-directories", dlKeepDirs, "Keep the item's directory layout");
    download->add_flag("--no-change-timestamp", dlNoChangeTimestamp, "Keep local mtimes");
    download->add_flag("--on-the-fly", dlOnTheFly, "Include on-the-fly derivatives");

    // upload
    auto* upload = app.add_subcommand("upload", "Upload local files to an item");
    std::string upIdentifier;
    std::vector<std::string> upFiles;
    std::vector<std::string> upMetaPairs;
    upload->add_option("identifier", upIdentifier, "Item identifier")->required();
    upload->add_option("files", upFiles, "Local files to send")->required()->check(
        CLI::ExistingFile);
    upload->add_option("-m,--metadata", upMetaPairs, "Item metadata as key=value");

    // list
    auto* list = app.add_subcommand("list", "List jobs, newest first");
    std::string listKind, listStatus;
    std::size_t listLimit = xferq::api::JobRequestHandler::kDefaultListLimit;
    bool listJson = false;
    list->add_option("--kind", listKind, "download or upload")
        ->check(CLI::IsMember({"download", "upload"}));
    list->add_option("--status", listStatus, "pending, running, completed, failed or cancelled");
    list->add_option("-n,--limit", listLimit, "Maximum number of jobs");
    list->add_flag("--json", listJson, "Print JSON");

    // show
    auto* show = app.add_subcommand("show", "Show one job as JSON");
    std::string showId;
    show->add_option("id", showId, "Job id")->required();

    auto* clear = app.add_subcommand("clear-history", "Delete finished jobs");
    auto* recover = app.add_subcommand("recover", "Fail jobs interrupted by a previous run");

    CLI11_PARSE(app, argc, argv);

    auto config = daemon::ConfigResolver::resolve(configPath);
    if (!dataDir.empty())
        config.dataDir = dataDir;
    if (!logFile.empty())
        config.logFile = logFile;
    if (!logLevel.empty())
        config.logLevel = logLevel;
    if (maxConcurrent > 0)
        config.jobs.maxConcurrent = daemon::JobManager::clampConcurrency(maxConcurrent);

    setup_logging(config, verbose);
    spdlog::info("xferq starting (data dir {})", config.dataDir.string());

    daemon::JobService service(config);

    if (recover->parsed()) {
        auto report = service.recoverOnly();
        if (!report) {
            fmt::print(stderr, "error: {}\n", report.error().message);
            return 1;
        }
        fmt::print("recovered {} interrupted jobs\n", report.value().recovered);
        for (const auto& id : report.value().ids)
            fmt::print("  {}\n", id);
        return 0;
    }

    // Only commands that run transfers own the database and reconcile it
    const bool transfers = download->parsed() || upload->parsed();
    auto ready = transfers ? service.start() : service.open();
    if (!ready) {
        fmt::print(stderr, "error: {}\n", ready.error().message);
        return 1;
    }
    if (service.lastRecovery().recovered > 0) {
        fmt::print(stderr, "note: marked {} interrupted jobs as failed\n",
                   service.lastRecovery().recovered);
    }

    int rc = 0;
    if (download->parsed()) {
        auto options = config.jobs.defaults;
        options.source = dlOptions.source;
        options.excludeSource = dlOptions.excludeSource;
        if (!dlDestdir.empty())
            options.destdir = dlDestdir;
        if (!dlGlob.empty())
            options.glob = dlGlob;
        if (!dlFormat.empty())
            options.format = dlFormat;
        if (!dlExclude.empty())
            options.exclude = dlExclude;
        if (dlRetries >= 0)
            options.retries = dlRetries;
        if (dlTimeout != 0)
            options.timeoutSeconds = dlTimeout;
        if (dlChecksum)
            options.checksum = true;
        if (dlNoIgnoreExisting)
            options.ignoreExisting = false;
        if (dlKeepDirs)
            options.noDirectories = false;
        if (dlNoChangeTimestamp)
            options.noChangeTimestamp = true;
        if (dlOnTheFly)
            options.onTheFly = true;
        rc = run_and_follow(service, jobs::JobKind::Download, {dlIdentifier, dlFiles},
                            std::move(options));
    } else if (upload->parsed()) {
        jobs::JobOptions options;
        for (const auto& pair : upMetaPairs) {
            auto eq = pair.find('=');
            if (eq == std::string::npos || eq == 0) {
                fmt::print(stderr, "error: metadata '{}' is not key=value\n", pair);
                return 2;
            }
            options.metadata[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        std::vector<std::string> absolute;
        for (const auto& f : upFiles)
            absolute.push_back(std::filesystem::absolute(f).lexically_normal().string());
        rc = run_and_follow(service, jobs::JobKind::Upload, {upIdentifier, absolute},
                            std::move(options));
    } else if (list->parsed()) {
        jobs::JobQuery query;
        query.limit = listLimit;
        if (!listKind.empty())
            query.kind = jobs::parseJobKind(listKind);
        if (!listStatus.empty()) {
            query.status = jobs::parseJobStatus(listStatus);
            if (!query.status) {
                fmt::print(stderr, "error: unknown status '{}'\n", listStatus);
                return 2;
            }
        }
        auto found = service.manager().list(query);
        if (!found) {
            fmt::print(stderr, "error: {}\n", found.error().message);
            return 1;
        }
        if (listJson) {
            auto out = nlohmann::json::array();
            for (const auto& job : found.value())
                out.push_back(jobs::toJson(job));
            fmt::print("{}\n", out.dump(2));
        } else {
            for (const auto& job : found.value())
                print_job_line(job);
        }
    } else if (show->parsed()) {
        auto job = service.manager().get(showId);
        if (!job) {
            fmt::print(stderr, "error: {}\n", job.error().message);
            return job.error().code == ErrorCode::NotFound ? 3 : 1;
        }
        fmt::print("{}\n", jobs::toJson(job.value()).dump(2));
    } else if (clear->parsed()) {
        auto removed = service.manager().clearHistory();
        if (!removed) {
            fmt::print(stderr, "error: {}\n", removed.error().message);
            return 1;
        }
        fmt::print("removed {} finished jobs\n", removed.value());
    }

    service.stop();
    spdlog::shutdown();
    return rc;
}
