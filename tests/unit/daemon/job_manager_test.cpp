#include <gtest/gtest.h>

#include <xferq/daemon/components/JobEventBus.h>
#include <xferq/daemon/components/JobManager.h>
#include <xferq/jobs/job_store.h>
#include <xferq/transfer/transfer_runner.h>

#include "../../support/fake_transfer_tool.hpp"
#include "../../support/temp_dir_scope.hpp"
#include "../../support/wait_for.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace xferq;
using namespace xferq::daemon;
using namespace std::chrono_literals;
using jobs::JobKind;
using jobs::JobStatus;
using test_support::FakeTransferTool;
using test_support::waitUntil;
using transfer::TransferOutcome;

namespace {

// Delegates to a real store; terminal writes (those carrying completedAt) can be made to fail.
class FlakyJobStore : public jobs::IJobStore {
public:
    explicit FlakyJobStore(std::shared_ptr<jobs::IJobStore> inner) : inner_(std::move(inner)) {}

    Result<void> create(const jobs::Job& job) override {
        if (failCreates.load())
            return Error{ErrorCode::DatabaseError, "disk I/O error"};
        return inner_->create(job);
    }
    Result<void> update(const JobId& id, const jobs::JobPatch& patch) override {
        if (patch.completedAt && failTerminalWrites.load()) {
            terminalAttempts.fetch_add(1);
            return Error{ErrorCode::DatabaseError, "database is locked"};
        }
        if (!patch.completedAt && failProgressWrites.load())
            return Error{ErrorCode::DatabaseError, "database is locked"};
        return inner_->update(id, patch);
    }
    Result<jobs::Job> get(const JobId& id) override { return inner_->get(id); }
    Result<std::vector<jobs::Job>> list(const jobs::JobQuery& query) override {
        return inner_->list(query);
    }
    Result<std::size_t> clearTerminal() override { return inner_->clearTerminal(); }
    Result<std::vector<jobs::Job>> findNonTerminal() override { return inner_->findNonTerminal(); }
    Result<std::size_t> failNonTerminal(const std::string& reason) override {
        return inner_->failNonTerminal(reason);
    }

    std::atomic<bool> failCreates{false};
    std::atomic<bool> failTerminalWrites{false};
    std::atomic<bool> failProgressWrites{false};
    std::atomic<int> terminalAttempts{0};

private:
    std::shared_ptr<jobs::IJobStore> inner_;
};

class JobManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sqlite = std::make_shared<jobs::SqliteJobStore>();
        ASSERT_TRUE(sqlite->open(":memory:"));
        rawStore_ = sqlite;
        store_ = std::make_shared<FlakyJobStore>(sqlite);
        bus_ = std::make_shared<JobEventBus>();
        tool_ = std::make_shared<FakeTransferTool>();

        config_.maxConcurrent = 2;
        config_.cancelGracePeriod = 200ms;
        config_.progressInterval = 0ms;
        config_.terminalWriteAttempts = 3;
        config_.terminalWriteBackoff = 1ms;
        config_.ioThreads = 2;
        config_.downloadRoot = tmp_.path();
    }

    void TearDown() override {
        if (manager_)
            manager_->stop();
    }

    void startManager() {
        transfer::TransferRunner::Config rc;
        rc.downloadRoot = config_.downloadRoot;
        runner_ = std::make_shared<transfer::TransferRunner>(tool_, rc);
        manager_ = std::make_unique<JobManager>(store_, bus_, runner_, config_);
        ASSERT_TRUE(manager_->start());
    }

    JobId submitDownload(const std::string& identifier, std::vector<std::string> files = {}) {
        auto id = manager_->submit(JobKind::Download, {identifier, std::move(files)}, {});
        EXPECT_TRUE(id) << (id ? "" : id.error().message);
        return id ? id.value() : JobId{};
    }

    bool waitStatus(const JobId& id, JobStatus status,
                    std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return waitUntil(
            [&] {
                auto job = manager_->get(id);
                return job && job.value().status == status;
            },
            timeout);
    }

    bool waitStoredStatus(const JobId& id, JobStatus status) {
        return waitUntil([&] {
            auto job = rawStore_->get(id);
            return job && job.value().status == status;
        });
    }

    jobs::Job getJob(const JobId& id) {
        auto job = manager_->get(id);
        EXPECT_TRUE(job);
        return job ? job.value() : jobs::Job{};
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("xferq-manager");
    std::shared_ptr<jobs::SqliteJobStore> rawStore_;
    std::shared_ptr<FlakyJobStore> store_;
    std::shared_ptr<JobEventBus> bus_;
    std::shared_ptr<FakeTransferTool> tool_;
    std::shared_ptr<transfer::TransferRunner> runner_;
    JobManagerConfig config_;
    std::unique_ptr<JobManager> manager_;
};

} // namespace

TEST_F(JobManagerTest, DownloadRunsToCompletion) {
    startManager();
    auto stream = bus_->subscribe();

    auto id = submitDownload("X", {"a.txt", "b.txt", "c.txt"});
    ASSERT_TRUE(tool_->waitForLaunches(1));
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    auto launch = tool_->launchFor(id);
    ASSERT_NE(launch, nullptr);
    EXPECT_EQ(launch->request.target.files, (std::vector<std::string>{"a.txt", "b.txt", "c.txt"}));

    tool_->sample(id, 50, 100);
    ASSERT_TRUE(waitUntil([&] { return getJob(id).progress >= 50.0; }));
    tool_->finish(id, TransferOutcome::success());
    ASSERT_TRUE(waitStatus(id, JobStatus::Completed));

    auto done = getJob(id);
    EXPECT_DOUBLE_EQ(done.progress, 100.0);
    EXPECT_EQ(done.transferredBytes, std::optional<int64_t>(100));
    EXPECT_TRUE(done.startedAt.has_value());
    EXPECT_TRUE(done.completedAt.has_value());
    EXPECT_FALSE(done.error.has_value());

    auto stored = rawStore_->get(id);
    ASSERT_TRUE(stored);
    EXPECT_EQ(stored.value().status, JobStatus::Completed);

    // Events for one job arrive in order and end with the terminal snapshot.
    std::vector<JobStatus> seen;
    double lastProgress = 0.0;
    while (auto ev = stream->next(1s)) {
        EXPECT_EQ(ev->job.id, id);
        EXPECT_GE(ev->job.progress, lastProgress);
        lastProgress = ev->job.progress;
        seen.push_back(ev->job.status);
        if (jobs::isTerminal(ev->job.status))
            break;
    }
    ASSERT_GE(seen.size(), 3u);
    EXPECT_EQ(seen.front(), JobStatus::Pending);
    EXPECT_EQ(seen[1], JobStatus::Running);
    EXPECT_EQ(seen.back(), JobStatus::Completed);
    EXPECT_DOUBLE_EQ(lastProgress, 100.0);
}

TEST_F(JobManagerTest, BoundsConcurrencyAndDispatchesInSubmissionOrder) {
    startManager();
    std::vector<JobId> ids;
    for (int i = 0; i < 5; ++i)
        ids.push_back(submitDownload("item" + std::to_string(i)));

    ASSERT_TRUE(tool_->waitForLaunches(2));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(tool_->launchCount(), 2u);
    EXPECT_EQ(manager_->runningCount(), 2u);
    EXPECT_EQ(manager_->pendingCount(), 3u);
    EXPECT_EQ(getJob(ids[4]).status, JobStatus::Pending);

    for (std::size_t done = 0; done < ids.size(); ++done) {
        ASSERT_TRUE(tool_->waitForLaunches(std::min<std::size_t>(done + 2, ids.size())));
        EXPECT_LE(manager_->runningCount(), 2u);
        tool_->finish(ids[done], TransferOutcome::success());
        ASSERT_TRUE(waitStatus(ids[done], JobStatus::Completed));
    }

    EXPECT_EQ(tool_->launchOrder(), ids);
    EXPECT_EQ(manager_->metrics().completed.load(), 5u);
    EXPECT_EQ(manager_->runningCount(), 0u);
}

TEST_F(JobManagerTest, CancelRunningJobAcknowledged) {
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->sample(id, 10, 100);

    ASSERT_TRUE(manager_->cancel(id));
    ASSERT_TRUE(waitStatus(id, JobStatus::Cancelled, 1s));
    EXPECT_TRUE(tool_->stopRequested(id));
    EXPECT_EQ(manager_->metrics().forcedCancels.load(), 0u);

    auto job = getJob(id);
    EXPECT_FALSE(job.transferredBytes.has_value());
    EXPECT_FALSE(job.error.has_value());
    EXPECT_TRUE(waitStoredStatus(id, JobStatus::Cancelled));
}

TEST_F(JobManagerTest, CancelIgnoredByRunnerIsForcedAfterGrace) {
    tool_->stopBehavior = FakeTransferTool::StopBehavior::Ignore;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(manager_->cancel(id));
    ASSERT_TRUE(waitStatus(id, JobStatus::Cancelled, 2s));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
    EXPECT_EQ(manager_->metrics().forcedCancels.load(), 1u);

    // The abandoned transfer keeps talking; nothing changes.
    tool_->sample(id, 90, 100);
    tool_->finish(id, TransferOutcome::success());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(getJob(id).status, JobStatus::Cancelled);
    EXPECT_EQ(rawStore_->get(id).value().status, JobStatus::Cancelled);
    EXPECT_EQ(manager_->runningCount(), 0u);
}

TEST_F(JobManagerTest, CancelPendingJobNeverStartsIt) {
    config_.maxConcurrent = 1;
    startManager();
    auto first = submitDownload("first");
    auto second = submitDownload("second");
    ASSERT_TRUE(tool_->waitForLaunches(1));

    ASSERT_TRUE(manager_->cancel(second));
    ASSERT_TRUE(waitStatus(second, JobStatus::Cancelled));
    EXPECT_EQ(manager_->pendingCount(), 0u);

    tool_->finish(first, TransferOutcome::success());
    ASSERT_TRUE(waitStatus(first, JobStatus::Completed));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(tool_->launchCount(), 1u);
    EXPECT_EQ(tool_->launchFor(second), nullptr);
}

TEST_F(JobManagerTest, CancelRejectsTerminalAndUnknownJobs) {
    tool_->stopBehavior = FakeTransferTool::StopBehavior::Ignore;
    config_.cancelGracePeriod = 5s;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    ASSERT_TRUE(manager_->cancel(id));
    auto again = manager_->cancel(id);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::InvalidTransition);

    tool_->finish(id, TransferOutcome::failure("terminated by signal 15"));
    ASSERT_TRUE(waitStatus(id, JobStatus::Cancelled));

    auto terminal = manager_->cancel(id);
    ASSERT_FALSE(terminal);
    EXPECT_EQ(terminal.error().code, ErrorCode::InvalidTransition);

    auto unknown = manager_->cancel("no-such-job");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(JobManagerTest, RunnerFailureKeepsReason) {
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->sample(id, 10, 100);
    tool_->finish(id, TransferOutcome::failure("item X is dark"));

    ASSERT_TRUE(waitStatus(id, JobStatus::Failed));
    auto job = getJob(id);
    EXPECT_EQ(job.error, std::optional<std::string>("item X is dark"));
    EXPECT_FALSE(job.totalBytes.has_value());
    EXPECT_FALSE(job.rate.has_value());
}

TEST_F(JobManagerTest, UnrequestedRunnerCancelIsAFailure) {
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->finish(id, TransferOutcome::cancelled());

    ASSERT_TRUE(waitStatus(id, JobStatus::Failed));
    EXPECT_EQ(getJob(id).error, std::optional<std::string>("transfer stopped unexpectedly"));
}

TEST_F(JobManagerTest, LaunchFailureFailsJobAndFreesSlot) {
    config_.maxConcurrent = 1;
    tool_->failLaunch = true;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Failed));
    EXPECT_EQ(getJob(id).error, std::optional<std::string>("transfer tool could not be started"));

    tool_->failLaunch = false;
    auto next = submitDownload("Y");
    ASSERT_TRUE(tool_->waitForLaunches(1));
    EXPECT_EQ(tool_->launchOrder().front(), next);
}

TEST_F(JobManagerTest, ProgressWritesAreCoalesced) {
    config_.progressInterval = 100ms;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    for (int i = 1; i <= 9; ++i)
        tool_->sample(id, i * 10, 100);

    ASSERT_TRUE(waitUntil([&] {
        auto stored = rawStore_->get(id);
        return stored && stored.value().progress >= 90.0;
    }));
    EXPECT_LT(manager_->metrics().progressWrites.load(), 9u);
    EXPECT_GT(manager_->metrics().coalescedUpdates.load(), 0u);
    EXPECT_EQ(rawStore_->get(id).value().transferredBytes, std::optional<int64_t>(90));
}

TEST_F(JobManagerTest, FailedProgressWriteDoesNotStopTheJob) {
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    store_->failProgressWrites = true;
    tool_->sample(id, 40, 100);
    ASSERT_TRUE(waitUntil([&] { return manager_->metrics().progressWriteFailures.load() > 0; }));
    EXPECT_DOUBLE_EQ(getJob(id).progress, 40.0);

    tool_->finish(id, TransferOutcome::success());
    ASSERT_TRUE(waitStatus(id, JobStatus::Completed));
    EXPECT_TRUE(waitStoredStatus(id, JobStatus::Completed));
}

TEST_F(JobManagerTest, UnpersistableTerminalStateIsReportedAsFailure) {
    config_.maxConcurrent = 1;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    store_->failTerminalWrites = true;
    tool_->finish(id, TransferOutcome::success());
    ASSERT_TRUE(waitStatus(id, JobStatus::Failed));

    auto job = getJob(id);
    ASSERT_TRUE(job.error.has_value());
    EXPECT_EQ(job.error->rfind("final state could not be persisted", 0), 0u);
    EXPECT_EQ(store_->terminalAttempts.load(), 3);
    EXPECT_EQ(manager_->metrics().terminalWriteRetries.load(), 2u);
    EXPECT_EQ(manager_->metrics().unpersistedTerminals.load(), 1u);

    // The slot was released.
    store_->failTerminalWrites = false;
    auto next = submitDownload("Y");
    ASSERT_TRUE(tool_->waitForLaunches(2));
    EXPECT_EQ(tool_->launchOrder().back(), next);
}

TEST_F(JobManagerTest, ClearHistoryStoresUnpersistedFinalStateBeforeDropping) {
    config_.maxConcurrent = 1;
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    store_->failTerminalWrites = true;
    tool_->finish(id, TransferOutcome::success());
    ASSERT_TRUE(waitStatus(id, JobStatus::Failed));
    EXPECT_EQ(rawStore_->get(id).value().status, JobStatus::Running);

    // Still unwritable: the job stays in memory with the state already reported.
    auto kept = manager_->clearHistory();
    ASSERT_TRUE(kept);
    EXPECT_EQ(kept.value(), 0u);
    EXPECT_EQ(getJob(id).status, JobStatus::Failed);
    auto cancelled = manager_->cancel(id);
    ASSERT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, ErrorCode::InvalidTransition);
    EXPECT_NE(cancelled.error().message.find("failed"), std::string::npos);

    store_->failTerminalWrites = false;
    auto cleared = manager_->clearHistory();
    ASSERT_TRUE(cleared);
    EXPECT_EQ(cleared.value(), 1u);

    auto gone = manager_->get(id);
    ASSERT_FALSE(gone);
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
    auto cancelGone = manager_->cancel(id);
    ASSERT_FALSE(cancelGone);
    EXPECT_EQ(cancelGone.error().code, ErrorCode::NotFound);
    EXPECT_TRUE(manager_->list().value().empty());
}

TEST_F(JobManagerTest, TerminalWriteRetryDoesNotBlockOtherJobs) {
    config_.ioThreads = 1;
    config_.terminalWriteBackoff = 400ms;
    startManager();
    auto x = submitDownload("X");
    auto y = submitDownload("Y");
    ASSERT_TRUE(waitStatus(x, JobStatus::Running));
    ASSERT_TRUE(waitStatus(y, JobStatus::Running));

    store_->failTerminalWrites = true;
    tool_->finish(x, TransferOutcome::success());
    ASSERT_TRUE(waitUntil([&] { return store_->terminalAttempts.load() >= 1; }));

    // X is between attempts; the only io thread must still serve Y.
    tool_->sample(y, 50, 100);
    ASSERT_TRUE(waitUntil([&] { return getJob(y).progress >= 50.0; }, 200ms));
    EXPECT_EQ(getJob(x).status, JobStatus::Running);
    EXPECT_EQ(manager_->runningCount(), 2u);

    ASSERT_TRUE(waitStatus(x, JobStatus::Failed));
    EXPECT_EQ(store_->terminalAttempts.load(), 3);
    EXPECT_EQ(manager_->runningCount(), 1u);
    EXPECT_EQ(getJob(y).status, JobStatus::Running);
}

TEST_F(JobManagerTest, SubmitRejectsInvalidRequestsWithoutPersisting) {
    startManager();
    auto empty = manager_->submit(JobKind::Download, {"", {}}, {});
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::ValidationError);

    jobs::JobOptions escaping;
    escaping.destdir = "../../etc";
    auto escaped = manager_->submit(JobKind::Download, {"X", {}}, escaping);
    ASSERT_FALSE(escaped);
    EXPECT_EQ(escaped.error().code, ErrorCode::ValidationError);

    auto upload = manager_->submit(JobKind::Upload, {"X", {}}, {});
    ASSERT_FALSE(upload);

    store_->failCreates = true;
    auto unstored = manager_->submit(JobKind::Download, {"X", {}}, {});
    ASSERT_FALSE(unstored);
    EXPECT_EQ(unstored.error().code, ErrorCode::DatabaseError);

    EXPECT_TRUE(rawStore_->list().value().empty());
    EXPECT_EQ(tool_->launchCount(), 0u);
}

TEST_F(JobManagerTest, SubmitBeforeStartIsRejected) {
    transfer::TransferRunner::Config rc;
    runner_ = std::make_shared<transfer::TransferRunner>(tool_, rc);
    manager_ = std::make_unique<JobManager>(store_, bus_, runner_, config_);
    auto id = manager_->submit(JobKind::Download, {"X", {}}, {});
    ASSERT_FALSE(id);
    EXPECT_EQ(id.error().code, ErrorCode::NotInitialized);
}

TEST_F(JobManagerTest, DestdirIsTrimmedAndResolvedUnderRoot) {
    startManager();
    jobs::JobOptions opts;
    opts.destdir = "  music  ";
    auto id = manager_->submit(JobKind::Download, {"X", {}}, opts);
    ASSERT_TRUE(id);
    ASSERT_TRUE(tool_->waitForLaunches(1));

    EXPECT_EQ(getJob(id.value()).options.destdir, std::optional<std::string>("music"));
    EXPECT_EQ(runner_->destinationFor(getJob(id.value())),
              (tmp_.path() / "music").lexically_normal());
    EXPECT_EQ(tool_->launchFor(id.value())->request.destination,
              (tmp_.path() / "music" / ".tmp" / ("job-" + id.value())).lexically_normal());
}

TEST_F(JobManagerTest, RaisingConcurrencyDispatchesImmediately) {
    config_.maxConcurrent = 1;
    startManager();
    std::vector<JobId> ids;
    for (int i = 0; i < 3; ++i)
        ids.push_back(submitDownload("item" + std::to_string(i)));
    ASSERT_TRUE(tool_->waitForLaunches(1));
    EXPECT_EQ(manager_->pendingCount(), 2u);

    manager_->setMaxConcurrent(3);
    ASSERT_TRUE(tool_->waitForLaunches(3));
    EXPECT_EQ(manager_->runningCount(), 3u);

    // Lowering never preempts.
    manager_->setMaxConcurrent(1);
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(manager_->runningCount(), 3u);

    manager_->setMaxConcurrent(0);
    EXPECT_EQ(manager_->maxConcurrent(), JobManager::kMinConcurrent);
    manager_->setMaxConcurrent(50);
    EXPECT_EQ(manager_->maxConcurrent(), JobManager::kMaxConcurrent);
}

TEST_F(JobManagerTest, GetAndListPreferLiveState) {
    config_.progressInterval = std::chrono::hours(1);
    startManager();
    auto id = submitDownload("X");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->sample(id, 30, 100);
    ASSERT_TRUE(waitUntil([&] { return getJob(id).progress >= 30.0; }));

    // The row still holds the dispatch-time progress.
    EXPECT_DOUBLE_EQ(rawStore_->get(id).value().progress, 0.0);

    jobs::JobQuery running;
    running.status = JobStatus::Running;
    auto listed = manager_->list(running);
    ASSERT_TRUE(listed);
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_DOUBLE_EQ(listed.value()[0].progress, 30.0);

    jobs::JobQuery uploads;
    uploads.kind = JobKind::Upload;
    EXPECT_TRUE(manager_->list(uploads).value().empty());
}

TEST_F(JobManagerTest, ClearHistoryLeavesActiveJobsAlone) {
    config_.maxConcurrent = 4;
    startManager();
    auto a = submitDownload("a");
    auto b = submitDownload("b");
    auto c = submitDownload("c");
    auto d = submitDownload("d");
    ASSERT_TRUE(tool_->waitForLaunches(4));

    tool_->finish(a, TransferOutcome::success());
    tool_->finish(b, TransferOutcome::success());
    tool_->finish(c, TransferOutcome::failure("boom"));
    ASSERT_TRUE(waitStoredStatus(a, JobStatus::Completed));
    ASSERT_TRUE(waitStoredStatus(b, JobStatus::Completed));
    ASSERT_TRUE(waitStoredStatus(c, JobStatus::Failed));
    ASSERT_TRUE(waitStatus(d, JobStatus::Running));

    auto removed = manager_->clearHistory();
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 3u);

    EXPECT_EQ(getJob(d).status, JobStatus::Running);
    EXPECT_FALSE(manager_->get(a));
    auto all = manager_->list();
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 1u);
    EXPECT_EQ(all.value()[0].id, d);
}

TEST_F(JobManagerTest, StopLeavesActiveRowsForRecovery) {
    tool_->stopBehavior = FakeTransferTool::StopBehavior::Ignore;
    config_.maxConcurrent = 1;
    startManager();
    auto running = submitDownload("a");
    auto pending = submitDownload("b");
    ASSERT_TRUE(waitStatus(running, JobStatus::Running));

    manager_->stop();
    EXPECT_FALSE(manager_->isRunning());
    EXPECT_TRUE(tool_->stopRequested(running));
    EXPECT_EQ(rawStore_->get(running).value().status, JobStatus::Running);
    EXPECT_EQ(rawStore_->get(pending).value().status, JobStatus::Pending);

    auto late = manager_->submit(JobKind::Download, {"c", {}}, {});
    ASSERT_FALSE(late);
    EXPECT_EQ(late.error().code, ErrorCode::NotInitialized);
}
