#pragma once

#include <xferq/core/types.h>
#include <xferq/daemon/components/JobEventBus.h>
#include <xferq/daemon/components/JobManager.h>
#include <xferq/daemon/components/RecoveryService.h>
#include <xferq/jobs/job_store.h>
#include <xferq/transfer/process_transfer_tool.h>
#include <xferq/transfer/transfer_runner.h>

#include <filesystem>
#include <memory>
#include <string>

namespace xferq::daemon {

// Every tunable of the job service. Resolved by ConfigResolver.
struct ServiceConfig {
    std::filesystem::path dataDir;      // database and logs
    std::filesystem::path databasePath; // empty: <dataDir>/xferq.db
    std::filesystem::path logFile;      // empty: <dataDir>/logs/xferq.log
    std::string logLevel{"info"};
    std::filesystem::path configFilePath; // file the values were read from, if any

    JobManagerConfig jobs;            // jobs.downloadRoot empty: <dataDir>/downloads
    std::size_t subscriberCapacity{256};
    transfer::ProcessToolConfig transfer;

    std::filesystem::path resolvedDatabasePath() const;
    std::filesystem::path resolvedLogFile() const;
    std::filesystem::path resolvedDownloadRoot() const;
};

// Owns and wires the job subsystem: store, recovery, event bus, runner and manager.
// start() opens the store, runs recovery, then starts the manager; submissions are
// only accepted after recovery has finished.
class JobService {
public:
    explicit JobService(ServiceConfig config);
    // Use a caller-supplied transfer tool instead of the process-backed one.
    JobService(ServiceConfig config, std::shared_ptr<transfer::ITransferTool> tool);
    ~JobService();

    JobService(const JobService&) = delete;
    JobService& operator=(const JobService&) = delete;

    Result<void> start();
    void stop();
    bool isRunning() const noexcept { return manager_ && manager_->isRunning(); }

    // Open the store only. Enough for reads and clearHistory; no recovery runs.
    Result<void> open();

    // Open the store and run recovery without starting the manager.
    Result<RecoveryService::Report> recoverOnly();

    JobManager& manager() { return *manager_; }
    JobEventBus& bus() { return *bus_; }
    jobs::IJobStore& store() { return *store_; }
    const ServiceConfig& config() const noexcept { return config_; }
    const RecoveryService::Report& lastRecovery() const noexcept { return recovery_; }

private:
    ServiceConfig config_;
    // Declared first so it outlives the runner and manager that call into it.
    std::shared_ptr<transfer::ITransferTool> tool_;
    std::shared_ptr<jobs::SqliteJobStore> store_;
    std::shared_ptr<JobEventBus> bus_;
    std::shared_ptr<transfer::TransferRunner> runner_;
    std::shared_ptr<JobManager> manager_;
    RecoveryService::Report recovery_;
};

} // namespace xferq::daemon
