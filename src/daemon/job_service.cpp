#include <xferq/daemon/job_service.h>

#include <spdlog/spdlog.h>

#include <system_error>

namespace xferq::daemon {

namespace fs = std::filesystem;

fs::path ServiceConfig::resolvedDatabasePath() const {
    return databasePath.empty() ? dataDir / "xferq.db" : databasePath;
}

fs::path ServiceConfig::resolvedLogFile() const {
    return logFile.empty() ? dataDir / "logs" / "xferq.log" : logFile;
}

fs::path ServiceConfig::resolvedDownloadRoot() const {
    return jobs.downloadRoot.empty() ? dataDir / "downloads" : jobs.downloadRoot;
}

JobService::JobService(ServiceConfig config)
    : JobService(config, std::make_shared<transfer::ProcessTransferTool>(config.transfer)) {}

JobService::JobService(ServiceConfig config, std::shared_ptr<transfer::ITransferTool> tool)
    : config_(std::move(config)), tool_(std::move(tool)) {
    config_.jobs.downloadRoot = config_.resolvedDownloadRoot();

    store_ = std::make_shared<jobs::SqliteJobStore>();

    JobEventBus::Config busConfig;
    busConfig.subscriberCapacity = config_.subscriberCapacity;
    bus_ = std::make_shared<JobEventBus>(busConfig);

    transfer::TransferRunner::Config runnerConfig;
    runnerConfig.downloadRoot = config_.jobs.downloadRoot;
    runner_ = std::make_shared<transfer::TransferRunner>(tool_, runnerConfig);

    manager_ = std::make_shared<JobManager>(store_, bus_, runner_, config_.jobs);
}

JobService::~JobService() {
    stop();
}

Result<void> JobService::open() {
    if (store_->isOpen())
        return {};

    auto dbPath = config_.resolvedDatabasePath();
    if (dbPath != ":memory:" && dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::DatabaseError, "cannot create database directory " +
                                                       dbPath.parent_path().string() + ": " +
                                                       ec.message()};
        }
    }
    auto opened = store_->open(dbPath.string());
    if (!opened) {
        spdlog::error("[JobService] Failed to open job store at {}: {}", dbPath.string(),
                      opened.error().message);
        return opened;
    }
    spdlog::info("[JobService] Job store open at {}", dbPath.string());
    return {};
}

Result<RecoveryService::Report> JobService::recoverOnly() {
    if (auto opened = open(); !opened)
        return opened.error();
    RecoveryService recovery(store_);
    auto report = recovery.run();
    if (report)
        recovery_ = report.value();
    return report;
}

Result<void> JobService::start() {
    if (manager_->isRunning())
        return {};

    auto recovered = recoverOnly();
    if (!recovered)
        return recovered.error();

    std::error_code ec;
    fs::create_directories(config_.jobs.downloadRoot, ec);
    if (ec) {
        spdlog::warn("[JobService] Cannot create download root {}: {}",
                     config_.jobs.downloadRoot.string(), ec.message());
    }

    if (auto started = manager_->start(); !started)
        return started;
    spdlog::info("[JobService] Ready (recovered {} interrupted jobs)", recovery_.recovered);
    return {};
}

void JobService::stop() {
    if (manager_)
        manager_->stop();
    if (bus_)
        bus_->closeAll();
    if (store_ && store_->isOpen())
        store_->close();
}

} // namespace xferq::daemon
