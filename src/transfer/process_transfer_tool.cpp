#include <xferq/transfer/process_transfer_tool.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace xferq::transfer {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxDiagnosticLength = 500;
constexpr auto kReadPollTimeout = std::chrono::milliseconds(50);

std::string trimLine(std::string_view line) {
    auto begin = line.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = line.find_last_not_of(" \t\r\n");
    return std::string(line.substr(begin, end - begin + 1));
}

int64_t sizeOnDisk(const fs::path& p) {
    std::error_code ec;
    if (fs::is_regular_file(p, ec))
        return static_cast<int64_t>(fs::file_size(p, ec));
    if (!fs::is_directory(p, ec))
        return 0;
    int64_t total = 0;
    for (fs::recursive_directory_iterator it(p, fs::directory_options::skip_permission_denied, ec),
         end;
         !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            auto size = it->file_size(fec);
            if (!fec)
                total += static_cast<int64_t>(size);
        }
    }
    return total;
}

} // namespace

/**
 * Shared between the session handed to the runner and the monitor thread.
 */
struct ProcessTransferTool::Child {
    JobId jobId;
    pid_t pid{-1};
    int outFd{-1};
    TransferCallbacks callbacks;
    std::chrono::milliseconds killGrace{2000};
    std::vector<fs::path> pollTargets; ///< Empty when destination polling is disabled
    std::chrono::milliseconds pollInterval{1000};

    std::atomic<bool> stopRequested{false};
    std::atomic<bool> done{false};
    std::atomic<int64_t> killDeadlineNs{0};

    void requestStop() noexcept {
        if (stopRequested.exchange(true, std::memory_order_acq_rel))
            return;
        auto deadline = std::chrono::steady_clock::now() + killGrace;
        killDeadlineNs.store(deadline.time_since_epoch().count(), std::memory_order_release);
        if (!done.load(std::memory_order_acquire) && pid > 0) {
            spdlog::info("[ProcessTransferTool] Stopping transfer {} (pid={})", jobId, pid);
            if (::kill(-pid, SIGTERM) != 0 && errno != ESRCH)
                spdlog::warn("[ProcessTransferTool] SIGTERM to {} failed: {}", pid,
                             std::strerror(errno));
        }
    }

    void kill() noexcept {
        if (!done.load(std::memory_order_acquire) && pid > 0)
            ::kill(-pid, SIGKILL);
    }

    void run();

private:
    int64_t measure() const {
        int64_t total = 0;
        for (const auto& p : pollTargets)
            total += sizeOnDisk(p);
        return total;
    }
};

void ProcessTransferTool::Child::run() {
    using Clock = std::chrono::steady_clock;

    std::string pending;
    std::string lastDiagnostic;
    bool sawProgressLine = false;
    bool killed = false;
    bool exited = false;
    int status = 0;

    const int64_t baseline = pollTargets.empty() ? 0 : measure();
    auto nextPoll = Clock::now() + pollInterval;
    std::array<char, 4096> buf;

    auto handleLine = [&](std::string_view raw) {
        auto line = trimLine(raw);
        if (line.empty())
            return;
        if (auto sample = parseProgressLine(line)) {
            sawProgressLine = true;
            if (callbacks.onSample)
                callbacks.onSample(*sample);
            return;
        }
        spdlog::debug("[ProcessTransferTool] {}: {}", jobId, line);
        if (line.size() > kMaxDiagnosticLength)
            line.resize(kMaxDiagnosticLength);
        lastDiagnostic = std::move(line);
    };
    auto consume = [&](const char* data, std::size_t n) {
        pending.append(data, n);
        std::size_t pos;
        while ((pos = pending.find('\n')) != std::string::npos) {
            handleLine(std::string_view(pending).substr(0, pos));
            pending.erase(0, pos + 1);
        }
    };
    auto closeOut = [&]() {
        if (outFd >= 0) {
            ::close(outFd);
            outFd = -1;
        }
    };

    while (!exited) {
        if (outFd >= 0) {
            pollfd pfd{outFd, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(kReadPollTimeout.count()));
            if (rc > 0) {
                ssize_t n = ::read(outFd, buf.data(), buf.size());
                if (n > 0) {
                    consume(buf.data(), static_cast<std::size_t>(n));
                } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    closeOut();
                }
            } else if (rc < 0 && errno != EINTR) {
                closeOut();
            }
        } else {
            std::this_thread::sleep_for(kReadPollTimeout);
        }

        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            exited = true;
        } else if (r < 0 && errno != EINTR) {
            spdlog::warn("[ProcessTransferTool] waitpid({}) failed: {}", pid, std::strerror(errno));
            status = -1;
            exited = true;
        }

        const auto now = Clock::now();
        if (!exited && !killed && stopRequested.load(std::memory_order_acquire)) {
            const auto deadlineTicks = killDeadlineNs.load(std::memory_order_acquire);
            if (deadlineTicks != 0 && now >= Clock::time_point(Clock::duration(deadlineTicks))) {
                spdlog::warn("[ProcessTransferTool] Transfer {} ignored SIGTERM, killing pid {}",
                             jobId, pid);
                ::kill(-pid, SIGKILL);
                killed = true;
            }
        }

        if (!exited && !pollTargets.empty() && !sawProgressLine && now >= nextPoll) {
            nextPoll = now + pollInterval;
            if (callbacks.onSample)
                callbacks.onSample(TransferSample{std::max<int64_t>(0, measure() - baseline), {}});
        }
    }

    done.store(true, std::memory_order_release);

    // Drain whatever the child wrote before exiting.
    while (outFd >= 0) {
        pollfd pfd{outFd, POLLIN, 0};
        if (::poll(&pfd, 1, 0) <= 0)
            break;
        ssize_t n = ::read(outFd, buf.data(), buf.size());
        if (n <= 0)
            break;
        consume(buf.data(), static_cast<std::size_t>(n));
    }
    closeOut();
    if (!pending.empty()) {
        handleLine(pending);
        pending.clear();
    }

    TransferOutcome outcome;
    if (status >= 0 && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        outcome = TransferOutcome::success();
    } else if (stopRequested.load(std::memory_order_acquire)) {
        outcome = TransferOutcome::cancelled();
    } else if (!lastDiagnostic.empty()) {
        outcome = TransferOutcome::failure(lastDiagnostic);
    } else if (status >= 0 && WIFEXITED(status) && WEXITSTATUS(status) == 127) {
        outcome = TransferOutcome::failure("transfer tool could not be started");
    } else if (status >= 0 && WIFEXITED(status)) {
        outcome = TransferOutcome::failure("transfer tool exited with code " +
                                           std::to_string(WEXITSTATUS(status)));
    } else if (status >= 0 && WIFSIGNALED(status)) {
        outcome = TransferOutcome::failure("transfer tool terminated by signal " +
                                           std::to_string(WTERMSIG(status)));
    } else {
        outcome = TransferOutcome::failure("transfer tool exit status unavailable");
    }

    spdlog::info("[ProcessTransferTool] Transfer {} (pid={}) ended: {}", jobId, pid,
                 toString(outcome.kind));
    if (callbacks.onFinished)
        callbacks.onFinished(outcome);
    callbacks = {};
}

namespace {

class ProcessSession : public ITransferSession {
public:
    explicit ProcessSession(std::shared_ptr<ProcessTransferTool::Child> child)
        : child_(std::move(child)) {}

    void requestStop() noexcept override { child_->requestStop(); }

private:
    std::shared_ptr<ProcessTransferTool::Child> child_;
};

} // namespace

ProcessTransferTool::ProcessTransferTool(ProcessToolConfig config) : config_(std::move(config)) {}

ProcessTransferTool::~ProcessTransferTool() {
    std::vector<Monitor> monitors;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        monitors.swap(monitors_);
    }
    for (auto& m : monitors) {
        if (!m.child->done.load(std::memory_order_acquire)) {
            spdlog::warn("[ProcessTransferTool] Killing transfer {} on shutdown", m.child->jobId);
            m.child->stopRequested.store(true, std::memory_order_release);
            m.child->kill();
        }
    }
    monitors.clear(); // joins
}

std::vector<std::string> ProcessTransferTool::buildArguments(const TransferRequest& request) {
    const auto& opts = request.options;
    std::vector<std::string> args;

    if (request.kind == jobs::JobKind::Upload) {
        args.emplace_back("upload");
        args.push_back(request.target.identifier);
        for (const auto& f : request.target.files)
            args.push_back(f);
        for (const auto& [key, value] : opts.metadata)
            args.push_back("--metadata=" + key + ":" + value);
        if (opts.checksum)
            args.emplace_back("--checksum");
        args.push_back("--retries=" + std::to_string(opts.retries));
        return args;
    }

    args.emplace_back("download");
    args.push_back(request.target.identifier);
    for (const auto& f : request.target.files)
        args.push_back(f);
    if (!request.destination.empty())
        args.push_back("--destdir=" + request.destination.string());
    if (opts.ignoreExisting)
        args.emplace_back("--ignore-existing");
    if (opts.checksum)
        args.emplace_back("--checksum");
    args.push_back("--retries=" + std::to_string(opts.retries));
    if (opts.timeoutSeconds)
        args.push_back("--timeout=" + std::to_string(*opts.timeoutSeconds));
    if (opts.noDirectories)
        args.emplace_back("--no-directories");
    if (opts.noChangeTimestamp)
        args.emplace_back("--no-change-timestamp");
    if (opts.onTheFly)
        args.emplace_back("--on-the-fly");

    // Selection filters only apply to whole-item downloads.
    if (request.target.files.empty()) {
        if (opts.glob)
            args.push_back("--glob=" + *opts.glob);
        if (opts.format)
            args.push_back("--format=" + *opts.format);
        if (opts.exclude)
            args.push_back("--exclude=" + *opts.exclude);
        for (const auto& s : opts.source)
            args.push_back("--source=" + s);
        for (const auto& s : opts.excludeSource)
            args.push_back("--exclude-source=" + s);
    }
    return args;
}

std::optional<TransferSample> ProcessTransferTool::parseProgressLine(std::string_view line) {
    if (line.empty() || line.front() != '{')
        return std::nullopt;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    auto it = j.find("transferred");
    if (it == j.end() || !it->is_number())
        return std::nullopt;

    TransferSample sample;
    sample.transferredBytes = std::max<int64_t>(0, it->get<int64_t>());
    if (auto total = j.find("total"); total != j.end() && total->is_number()) {
        auto value = total->get<int64_t>();
        if (value > 0)
            sample.totalBytes = value;
    }
    return sample;
}

std::size_t ProcessTransferTool::activeCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return static_cast<std::size_t>(
        std::count_if(monitors_.begin(), monitors_.end(), [](const Monitor& m) {
            return !m.child->done.load(std::memory_order_acquire);
        }));
}

void ProcessTransferTool::reapFinished() {
    std::vector<Monitor> finished;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = std::stable_partition(monitors_.begin(), monitors_.end(), [](const Monitor& m) {
            return !m.child->done.load(std::memory_order_acquire);
        });
        std::move(it, monitors_.end(), std::back_inserter(finished));
        monitors_.erase(it, monitors_.end());
    }
    // Joined outside the lock.
}

Result<std::unique_ptr<ITransferSession>>
ProcessTransferTool::launch(const TransferRequest& request, TransferCallbacks callbacks) {
    reapFinished();

    auto child = std::make_shared<Child>();
    child->jobId = request.jobId;
    child->callbacks = std::move(callbacks);
    child->killGrace = config_.killGrace;
    child->pollInterval = config_.pollInterval;

    if (request.kind == jobs::JobKind::Download && !request.destination.empty()) {
        std::error_code ec;
        fs::create_directories(request.destination, ec);
        if (ec) {
            return Error{ErrorCode::TransferFailed, "cannot create destination " +
                                                        request.destination.string() + ": " +
                                                        ec.message()};
        }
        if (config_.pollDestination) {
            auto dir = request.options.noDirectories
                           ? request.destination
                           : request.destination / request.target.identifier;
            if (request.target.files.empty()) {
                child->pollTargets.push_back(dir);
            } else {
                for (const auto& f : request.target.files) {
                    fs::path name(f);
                    child->pollTargets.push_back(request.options.noDirectories ? dir / name.filename()
                                                                               : dir / name);
                }
            }
        }
    }

    // argv is fully built before fork; the child only calls async-signal-safe functions.
    std::vector<std::string> args;
    args.push_back(config_.executable);
    args.insert(args.end(), config_.baseArgs.begin(), config_.baseArgs.end());
    auto generated = buildArguments(request);
    args.insert(args.end(), generated.begin(), generated.end());
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorCode::TransferFailed,
                     std::string("failed to create pipe: ") + std::strerror(errno)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return Error{ErrorCode::TransferFailed, std::string("fork() failed: ") + std::strerror(err)};
    }

    if (pid == 0) {
        // Child process
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        _exit(127);
    }

    // Parent process
    ::setpgid(pid, pid);
    ::close(fds[1]);
    child->pid = pid;
    child->outFd = fds[0];

    spdlog::info("[ProcessTransferTool] Spawned {} for {} transfer {} (pid={})",
                 config_.executable, jobs::toString(request.kind), request.jobId, pid);

    {
        std::lock_guard<std::mutex> lk(mutex_);
        monitors_.push_back(Monitor{child, std::jthread([child]() { child->run(); })});
    }
    return std::unique_ptr<ITransferSession>(std::make_unique<ProcessSession>(child));
}

} // namespace xferq::transfer
