#pragma once

#include <xferq/core/types.h>
#include <xferq/daemon/components/JobEventBus.h>
#include <xferq/daemon/components/JobManager.h>
#include <xferq/jobs/job.h>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace xferq::api {

struct ApiRequest {
    std::string method; // GET, POST, DELETE
    std::string path;   // "/downloads", "/uploads/<id>", ...
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    nlohmann::json body;
};

/**
 * @brief Maps the /downloads and /uploads routes onto JobManager operations.
 *
 * Transport neutral: an HTTP layer hands over method, path, query and body, and writes
 * back the status and JSON body. The event stream routes are served by
 * openEventStream() plus formatSse(), since they outlive a single response.
 *
 * Status codes: 201 submit, 200 reads/cancel/clear, 400 validation, 404 unknown id,
 * 409 invalid transition, 503 store failure, 500 anything else. A failed transfer is
 * reported as a job state, never as a 5xx.
 */
class JobRequestHandler {
public:
    static constexpr std::size_t kDefaultListLimit = 50;

    JobRequestHandler(daemon::JobManager& manager, daemon::JobEventBus& bus);

    ApiResponse handle(const ApiRequest& request);

    ApiResponse submit(jobs::JobKind kind, const nlohmann::json& body);
    ApiResponse list(jobs::JobKind kind, const std::map<std::string, std::string>& query);
    /// A job of the other kind is reported as not found.
    ApiResponse get(jobs::JobKind kind, const JobId& id);
    ApiResponse cancel(jobs::JobKind kind, const JobId& id);
    ApiResponse clearHistory();

    /**
     * @brief Subscribe to snapshots of one kind. The caller unsubscribes through the bus
     * when its connection goes away.
     */
    std::shared_ptr<daemon::JobEventStream> openEventStream(jobs::JobKind kind);

    // "event: progress\ndata: <job json>\n\n"
    static std::string formatSse(const daemon::JobEvent& event);

    static int statusFor(ErrorCode code) noexcept;
    static ApiResponse errorResponse(const Error& error);

private:
    Result<jobs::Job> findOfKind(jobs::JobKind kind, const JobId& id);

    daemon::JobManager& manager_;
    daemon::JobEventBus& bus_;
};

} // namespace xferq::api
