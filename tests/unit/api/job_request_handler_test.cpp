#include <gtest/gtest.h>

#include <xferq/api/job_request_handler.h>
#include <xferq/daemon/components/JobEventBus.h>
#include <xferq/daemon/components/JobManager.h>
#include <xferq/jobs/job_store.h>
#include <xferq/transfer/transfer_runner.h>

#include "../../support/fake_transfer_tool.hpp"
#include "../../support/temp_dir_scope.hpp"
#include "../../support/wait_for.hpp"

#include <chrono>
#include <memory>

using namespace xferq;
using namespace xferq::api;
using namespace std::chrono_literals;
using jobs::JobKind;
using jobs::JobStatus;

namespace {

class JobRequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<jobs::SqliteJobStore>();
        ASSERT_TRUE(store_->open(":memory:"));
        bus_ = std::make_shared<daemon::JobEventBus>();
        tool_ = std::make_shared<test_support::FakeTransferTool>();
        tool_->stopBehavior = test_support::FakeTransferTool::StopBehavior::Ignore;

        daemon::JobManagerConfig cfg;
        cfg.maxConcurrent = 1;
        cfg.cancelGracePeriod = 10s;
        cfg.progressInterval = 0ms;
        cfg.downloadRoot = tmp_.path();
        transfer::TransferRunner::Config rc;
        rc.downloadRoot = tmp_.path();
        runner_ = std::make_shared<transfer::TransferRunner>(tool_, rc);
        manager_ = std::make_unique<daemon::JobManager>(store_, bus_, runner_, cfg);
        ASSERT_TRUE(manager_->start());
        handler_ = std::make_unique<JobRequestHandler>(*manager_, *bus_);
    }

    void TearDown() override { manager_->stop(); }

    ApiResponse call(std::string method, std::string path, std::string body = {},
                     std::map<std::string, std::string> query = {}) {
        ApiRequest req;
        req.method = std::move(method);
        req.path = std::move(path);
        req.body = std::move(body);
        req.query = std::move(query);
        return handler_->handle(req);
    }

    std::string submitDownload(const std::string& identifier) {
        auto resp = call("POST", "/downloads", R"({"identifier": ")" + identifier + R"("})");
        EXPECT_EQ(resp.status, 201) << resp.body.dump();
        return resp.body.value("id", "");
    }

    bool waitStatus(const std::string& id, JobStatus status) {
        return test_support::waitUntil([&] {
            auto job = manager_->get(id);
            return job && job.value().status == status;
        });
    }

    test_support::TempDirScope tmp_ = test_support::TempDirScope::unique_under("xferq-api");
    std::shared_ptr<jobs::SqliteJobStore> store_;
    std::shared_ptr<daemon::JobEventBus> bus_;
    std::shared_ptr<test_support::FakeTransferTool> tool_;
    std::shared_ptr<transfer::TransferRunner> runner_;
    std::unique_ptr<daemon::JobManager> manager_;
    std::unique_ptr<JobRequestHandler> handler_;
};

} // namespace

TEST_F(JobRequestHandlerTest, SubmitReturnsCreatedJob) {
    auto resp = call("POST", "/downloads",
                     R"({"identifier": "nasa_images", "files": ["a.jpg", "b.jpg"],
                         "destdir": "nasa", "checksum": true, "retries": 2})");
    ASSERT_EQ(resp.status, 201) << resp.body.dump();
    EXPECT_EQ(resp.body["status"], "pending");
    const std::string id = resp.body["id"];
    ASSERT_FALSE(id.empty());

    auto job = manager_->get(id);
    ASSERT_TRUE(job);
    EXPECT_EQ(job.value().kind, JobKind::Download);
    EXPECT_EQ(job.value().target.files.size(), 2u);
    EXPECT_EQ(job.value().options.destdir, std::optional<std::string>("nasa"));
    EXPECT_TRUE(job.value().options.checksum);
    EXPECT_EQ(job.value().options.retries, 2);
}

TEST_F(JobRequestHandlerTest, SubmitRejectsMalformedBodies) {
    EXPECT_EQ(call("POST", "/downloads", "{not json").status, 400);
    EXPECT_EQ(call("POST", "/downloads", "[1, 2]").status, 400);
    EXPECT_EQ(call("POST", "/downloads", R"({"files": ["a"]})").status, 400);
    EXPECT_EQ(call("POST", "/downloads", R"({"identifier": "x", "files": "a"})").status, 400);
    EXPECT_EQ(call("POST", "/downloads", R"({"identifier": "x", "files": [1]})").status, 400);
    EXPECT_EQ(call("POST", "/downloads", R"({"identifier": "x", "retries": "many"})").status, 400);
    EXPECT_EQ(call("POST", "/downloads", R"({"identifier": "x", "destdir": "/etc"})").status, 400);
    EXPECT_EQ(call("POST", "/uploads", R"({"identifier": "x"})").status, 400);

    auto resp = call("POST", "/downloads", R"({"identifier": "bad id!"})");
    EXPECT_EQ(resp.status, 400);
    EXPECT_TRUE(resp.body.contains("detail"));
    EXPECT_EQ(resp.body["code"], "validation_error");
    EXPECT_TRUE(store_->list().value().empty());
}

TEST_F(JobRequestHandlerTest, GetUnknownJobIs404) {
    auto resp = call("GET", "/downloads/does-not-exist");
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body["detail"], "Job not found");
}

TEST_F(JobRequestHandlerTest, GetReturnsJobSnapshot) {
    auto id = submitDownload("item1");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->sample(id, 25, 100);
    ASSERT_TRUE(test_support::waitUntil([&] { return manager_->get(id).value().progress >= 25.0; }));

    auto resp = call("GET", "/downloads/" + id);
    ASSERT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body["id"], id);
    EXPECT_EQ(resp.body["status"], "running");
    EXPECT_EQ(resp.body["identifier"], "item1");
    EXPECT_DOUBLE_EQ(resp.body["progress"].get<double>(), 25.0);
    EXPECT_EQ(resp.body["total_bytes"], 100);
}

TEST_F(JobRequestHandlerTest, CancelTwiceConflicts) {
    auto id = submitDownload("item1");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    auto first = call("DELETE", "/downloads/" + id);
    ASSERT_EQ(first.status, 200);
    EXPECT_EQ(first.body["success"], true);
    EXPECT_EQ(first.body["message"], "Cancellation requested");

    EXPECT_EQ(call("DELETE", "/downloads/" + id).status, 409);
    EXPECT_EQ(call("DELETE", "/downloads/unknown").status, 404);
}

TEST_F(JobRequestHandlerTest, JobIsOnlyAddressableUnderItsOwnCollection) {
    auto id = submitDownload("item1");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));

    auto wrongGet = call("GET", "/uploads/" + id);
    EXPECT_EQ(wrongGet.status, 404);
    EXPECT_EQ(wrongGet.body["detail"], "Job not found");
    EXPECT_EQ(wrongGet.body["code"], "not_found");

    EXPECT_EQ(call("DELETE", "/uploads/" + id).status, 404);
    EXPECT_EQ(manager_->get(id).value().status, JobStatus::Running);
    EXPECT_FALSE(tool_->stopRequested(id));

    EXPECT_EQ(call("GET", "/downloads/" + id).status, 200);
    EXPECT_EQ(call("DELETE", "/downloads/" + id).status, 200);
}

TEST_F(JobRequestHandlerTest, ListFiltersByKindAndStatus) {
    auto running = submitDownload("first");
    auto queued = submitDownload("second");
    ASSERT_TRUE(waitStatus(running, JobStatus::Running));

    auto all = call("GET", "/downloads");
    ASSERT_EQ(all.status, 200);
    ASSERT_TRUE(all.body.is_array());
    ASSERT_EQ(all.body.size(), 2u);
    EXPECT_EQ(all.body[0]["id"], queued); // newest first

    auto pending = call("GET", "/downloads", {}, {{"status", "pending"}});
    ASSERT_EQ(pending.body.size(), 1u);
    EXPECT_EQ(pending.body[0]["id"], queued);

    EXPECT_EQ(call("GET", "/downloads", {}, {{"status", "active"}}).body.size(), 2u);
    EXPECT_EQ(call("GET", "/downloads", {}, {{"status", "finished"}}).body.size(), 0u);
    EXPECT_EQ(call("GET", "/downloads", {}, {{"limit", "1"}}).body.size(), 1u);
    EXPECT_EQ(call("GET", "/uploads").body.size(), 0u);

    EXPECT_EQ(call("GET", "/downloads", {}, {{"status", "paused"}}).status, 400);
    EXPECT_EQ(call("GET", "/downloads", {}, {{"limit", "0"}}).status, 400);
}

TEST_F(JobRequestHandlerTest, ClearHistoryReportsRemovedCount) {
    auto id = submitDownload("item1");
    ASSERT_TRUE(waitStatus(id, JobStatus::Running));
    tool_->finish(id, transfer::TransferOutcome::success());
    ASSERT_TRUE(waitStatus(id, JobStatus::Completed));
    ASSERT_TRUE(test_support::waitUntil(
        [&] { return store_->get(id).value().status == JobStatus::Completed; }));

    auto resp = call("DELETE", "/downloads");
    ASSERT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body["success"], true);
    EXPECT_EQ(resp.body["removed"], 1);
    EXPECT_EQ(call("GET", "/downloads/" + id).status, 404);
}

TEST_F(JobRequestHandlerTest, UnknownRoutesAndMethods) {
    EXPECT_EQ(call("GET", "/jobs").status, 404);
    EXPECT_EQ(call("GET", "/").status, 404);
    EXPECT_EQ(call("GET", "/downloads/a/b").status, 404);
    EXPECT_EQ(call("PUT", "/downloads").status, 405);
    EXPECT_EQ(call("POST", "/downloads/abc").status, 405);
}

TEST_F(JobRequestHandlerTest, EventStreamCarriesOneKind) {
    auto uploads = handler_->openEventStream(JobKind::Upload);
    auto downloads = handler_->openEventStream(JobKind::Download);
    auto id = submitDownload("item1");

    auto ev = downloads->next(2s);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->job.id, id);
    EXPECT_FALSE(uploads->tryNext().has_value());

    auto frame = JobRequestHandler::formatSse(*ev);
    EXPECT_EQ(frame.rfind("event: progress\ndata: {", 0), 0u);
    EXPECT_EQ(frame.substr(frame.size() - 2), "\n\n");
    auto payload = nlohmann::json::parse(frame.substr(std::string("event: progress\ndata: ").size()));
    EXPECT_EQ(payload["id"], id);
    EXPECT_EQ(payload["kind"], "download");

    bus_->unsubscribe(uploads);
    bus_->unsubscribe(downloads);
}

TEST(JobRequestHandlerStatusTest, MapsErrorCodesToHttpStatus) {
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::ValidationError), 400);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::InvalidArgument), 400);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::NotFound), 404);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::InvalidTransition), 409);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::DatabaseError), 503);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::SystemShutdown), 503);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::TransferFailed), 500);
    EXPECT_EQ(JobRequestHandler::statusFor(ErrorCode::InternalError), 500);

    auto resp = JobRequestHandler::errorResponse(Error{ErrorCode::NotFound, "gone"});
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.body["detail"], "gone");
    EXPECT_EQ(resp.body["code"], "not_found");
}
