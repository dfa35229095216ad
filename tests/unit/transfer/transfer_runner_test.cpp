#include <gtest/gtest.h>

#include <xferq/transfer/transfer_runner.h>

#include "../../support/fake_transfer_tool.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace xferq;
using namespace xferq::transfer;
using namespace std::chrono_literals;
using test_support::FakeTransferTool;

namespace {

class MessageLog {
public:
    RunnerSink sink() {
        return [this](RunnerMessage msg) {
            std::lock_guard<std::mutex> lk(mutex_);
            messages_.push_back(std::move(msg));
        };
    }

    std::vector<RunnerProgress> progress() const {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<RunnerProgress> out;
        for (const auto& m : messages_)
            if (auto* p = std::get_if<RunnerProgress>(&m))
                out.push_back(*p);
        return out;
    }

    std::vector<RunnerFinished> finished() const {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<RunnerFinished> out;
        for (const auto& m : messages_)
            if (auto* f = std::get_if<RunnerFinished>(&m))
                out.push_back(*f);
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return messages_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<RunnerMessage> messages_;
};

jobs::Job makeJob(const std::string& id) {
    jobs::Job job;
    job.id = id;
    job.kind = jobs::JobKind::Download;
    job.target = {"some_item", {"a.txt"}};
    return job;
}

class TransferRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tool_ = std::make_shared<FakeTransferTool>();
        TransferRunner::Config cfg;
        cfg.downloadRoot = tmp_.path();
        cfg.indeterminateStep = 0ms;
        runner_ = std::make_unique<TransferRunner>(tool_, cfg);
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("xferq-runner");
    std::shared_ptr<FakeTransferTool> tool_;
    std::unique_ptr<TransferRunner> runner_;
    MessageLog log_;
};

} // namespace

TEST_F(TransferRunnerTest, KnownTotalProgressStopsBelowCompletion) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    ASSERT_TRUE(handle);
    EXPECT_EQ(handle.jobId(), "j1");

    tool_->sample("j1", 250, 1000);
    tool_->sample("j1", 1000, 1000);

    auto progress = log_.progress();
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_DOUBLE_EQ(progress[0].progress, 25.0);
    EXPECT_EQ(progress[0].transferredBytes, 250);
    EXPECT_EQ(progress[0].totalBytes, std::optional<int64_t>(1000));
    EXPECT_DOUBLE_EQ(progress[1].progress, 99.0);
    EXPECT_TRUE(log_.finished().empty());
}

TEST_F(TransferRunnerTest, ProgressNeverMovesBackwards) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    tool_->sample("j1", 600, 1000);
    tool_->sample("j1", 100, 1000);

    auto progress = log_.progress();
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_DOUBLE_EQ(progress[1].progress, 60.0);
    EXPECT_EQ(progress[1].transferredBytes, 100);
}

TEST_F(TransferRunnerTest, UnknownTotalAdvancesInStepsUpToCap) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    for (int i = 0; i < 60; ++i)
        tool_->sample("j1", i * 10);

    auto progress = log_.progress();
    ASSERT_EQ(progress.size(), 60u);
    EXPECT_DOUBLE_EQ(progress[0].progress, 2.0);
    EXPECT_DOUBLE_EQ(progress[1].progress, 4.0);
    EXPECT_DOUBLE_EQ(progress.back().progress, 95.0);
    EXPECT_FALSE(progress.back().totalBytes.has_value());
}

TEST(TransferRunnerStepTest, UnknownTotalBumpsAtMostOncePerStep) {
    auto tool = std::make_shared<FakeTransferTool>();
    auto tmp = test_support::TempDirScope::unique_under("xferq-runner");
    TransferRunner::Config cfg;
    cfg.downloadRoot = tmp.path();
    cfg.indeterminateStep = std::chrono::hours(1);
    TransferRunner runner(tool, cfg);
    MessageLog log;

    auto handle = runner.start(makeJob("j1"), log.sink());
    tool->sample("j1", 10);
    tool->sample("j1", 20);
    tool->sample("j1", 30);

    auto progress = log.progress();
    ASSERT_EQ(progress.size(), 3u);
    EXPECT_DOUBLE_EQ(progress[0].progress, 2.0);
    EXPECT_DOUBLE_EQ(progress[2].progress, 2.0);
}

TEST_F(TransferRunnerTest, RateIsDerivedFromSampleWindow) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    tool_->sample("j1", 0, 10000);
    std::this_thread::sleep_for(50ms);
    tool_->sample("j1", 5000, 10000);

    auto progress = log_.progress();
    ASSERT_EQ(progress.size(), 2u);
    EXPECT_FALSE(progress[0].rate.has_value());
    ASSERT_TRUE(progress[1].rate.has_value());
    EXPECT_GT(*progress[1].rate, 0.0);
}

TEST_F(TransferRunnerTest, FinishedIsDeliveredExactlyOnce) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    auto launch = tool_->launchFor("j1");
    ASSERT_NE(launch, nullptr);

    // Bypass the fake's own guard to simulate a tool reporting twice.
    launch->callbacks.onFinished(TransferOutcome::success());
    launch->callbacks.onFinished(TransferOutcome::failure("late"));
    tool_->sample("j1", 5, 10);

    auto finished = log_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].jobId, "j1");
    EXPECT_EQ(finished[0].outcome.kind, TransferOutcome::Kind::Success);
    EXPECT_TRUE(log_.progress().empty());
}

TEST_F(TransferRunnerTest, LaunchFailureArrivesAsFailureOutcome) {
    tool_->failLaunch = true;
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    EXPECT_TRUE(handle);

    auto finished = log_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].outcome.kind, TransferOutcome::Kind::Failure);
    EXPECT_EQ(finished[0].outcome.reason, "transfer tool could not be started");
    EXPECT_EQ(tool_->launchCount(), 0u);
}

TEST_F(TransferRunnerTest, FailureReportedAfterStopBecomesCancelled) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());

    EXPECT_TRUE(runner_->cancel(handle));
    EXPECT_FALSE(runner_->cancel(handle));
    EXPECT_TRUE(tool_->stopRequested("j1"));

    auto finished = log_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].outcome.kind, TransferOutcome::Kind::Cancelled);
}

TEST_F(TransferRunnerTest, FailureWithoutStopKeepsReason) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    tool_->finish("j1", TransferOutcome::failure("item is dark"));

    auto finished = log_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].outcome.kind, TransferOutcome::Kind::Failure);
    EXPECT_EQ(finished[0].outcome.reason, "item is dark");
}

TEST_F(TransferRunnerTest, SuccessAfterStopStaysSuccess) {
    tool_->stopBehavior = FakeTransferTool::StopBehavior::Ignore;
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    EXPECT_TRUE(runner_->cancel(handle));
    tool_->finish("j1", TransferOutcome::success());

    auto finished = log_.finished();
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0].outcome.kind, TransferOutcome::Kind::Success);
}

TEST_F(TransferRunnerTest, DetachDropsLaterMessages) {
    auto handle = runner_->start(makeJob("j1"), log_.sink());
    tool_->sample("j1", 1, 10);
    runner_->detach(handle);
    tool_->sample("j1", 2, 10);
    tool_->finish("j1", TransferOutcome::success());

    EXPECT_EQ(log_.size(), 1u);
}

TEST_F(TransferRunnerTest, CallbacksAfterHandleReleaseAreDropped) {
    {
        auto handle = runner_->start(makeJob("j1"), log_.sink());
    }
    tool_->sample("j1", 2, 10);
    tool_->finish("j1", TransferOutcome::success());
    EXPECT_EQ(log_.size(), 0u);
}

TEST_F(TransferRunnerTest, ResolvesDownloadDestination) {
    auto job = makeJob("j1");
    EXPECT_EQ(runner_->destinationFor(job), tmp_.path().lexically_normal());

    job.options.destdir = "  music/live ";
    const auto dest = (tmp_.path() / "music/live").lexically_normal();
    EXPECT_EQ(runner_->destinationFor(job), dest);

    auto handle = runner_->start(job, log_.sink());
    auto launch = tool_->launchFor("j1");
    ASSERT_NE(launch, nullptr);
    EXPECT_EQ(launch->request.destination, dest / ".tmp" / "job-j1");
    EXPECT_TRUE(std::filesystem::is_directory(launch->request.destination));
    EXPECT_EQ(launch->request.target.identifier, "some_item");
}

TEST_F(TransferRunnerTest, UploadsHaveNoDestination) {
    auto job = makeJob("u1");
    job.kind = jobs::JobKind::Upload;
    job.target.files = {"/tmp/a.flac"};
    auto handle = runner_->start(job, log_.sink());

    auto launch = tool_->launchFor("u1");
    ASSERT_NE(launch, nullptr);
    EXPECT_TRUE(launch->request.destination.empty());
    EXPECT_EQ(launch->request.kind, jobs::JobKind::Upload);
}
