#include <xferq/api/job_request_handler.h>
#include <xferq/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

namespace xferq::api {

namespace {

// "/downloads/abc" -> {"downloads", "abc"}
std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty())
                parts.push_back(std::move(current));
            current.clear();
        } else if (c == '?') {
            break;
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty())
        parts.push_back(std::move(current));
    return parts;
}

std::optional<jobs::JobKind> kindForCollection(const std::string& name) {
    if (name == "downloads")
        return jobs::JobKind::Download;
    if (name == "uploads")
        return jobs::JobKind::Upload;
    return std::nullopt;
}

ApiResponse badRequest(std::string message) {
    return JobRequestHandler::errorResponse(Error{ErrorCode::ValidationError, std::move(message)});
}

} // namespace

JobRequestHandler::JobRequestHandler(daemon::JobManager& manager, daemon::JobEventBus& bus)
    : manager_(manager), bus_(bus) {}

int JobRequestHandler::statusFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return 200;
        case ErrorCode::InvalidArgument:
        case ErrorCode::ValidationError:
        case ErrorCode::InvalidData:
            return 400;
        case ErrorCode::NotFound:
            return 404;
        case ErrorCode::InvalidTransition:
        case ErrorCode::InvalidState:
            return 409;
        case ErrorCode::DatabaseError:
        case ErrorCode::NotInitialized:
        case ErrorCode::SystemShutdown:
            return 503;
        default:
            return 500;
    }
}

ApiResponse JobRequestHandler::errorResponse(const Error& error) {
    ApiResponse response;
    response.status = statusFor(error.code);
    response.body = {{"detail", error.message}, {"code", std::string(errorCodeName(error.code))}};
    return response;
}

ApiResponse JobRequestHandler::handle(const ApiRequest& request) {
    auto parts = splitPath(request.path);
    if (parts.empty() || parts.size() > 2)
        return errorResponse(Error{ErrorCode::NotFound, "no route for " + request.path});
    auto kind = kindForCollection(parts[0]);
    if (!kind)
        return errorResponse(Error{ErrorCode::NotFound, "no route for " + request.path});

    if (parts.size() == 1) {
        if (request.method == "POST") {
            auto body = nlohmann::json::parse(request.body, nullptr, false);
            if (body.is_discarded())
                return badRequest("request body is not valid JSON");
            return submit(*kind, body);
        }
        if (request.method == "GET")
            return list(*kind, request.query);
        if (request.method == "DELETE")
            return clearHistory();
    } else {
        if (parts[1] == "events") {
            return errorResponse(
                Error{ErrorCode::NotSupported, "event streams are served by openEventStream"});
        }
        if (request.method == "GET")
            return get(*kind, parts[1]);
        if (request.method == "DELETE")
            return cancel(*kind, parts[1]);
    }
    ApiResponse response;
    response.status = 405;
    response.body = {{"detail", "method " + request.method + " not allowed on " + request.path}};
    return response;
}

ApiResponse JobRequestHandler::submit(jobs::JobKind kind, const nlohmann::json& body) {
    if (!body.is_object())
        return badRequest("request body must be a JSON object");

    jobs::JobTarget target;
    auto id = body.find("identifier");
    if (id == body.end() || !id->is_string())
        return badRequest("identifier is required");
    target.identifier = id->get<std::string>();

    if (auto files = body.find("files"); files != body.end() && !files->is_null()) {
        if (!files->is_array())
            return badRequest("files must be an array of strings");
        for (const auto& f : *files) {
            if (!f.is_string())
                return badRequest("files must be an array of strings");
            target.files.push_back(f.get<std::string>());
        }
    }

    auto options = jobs::optionsFromJson(body, manager_.config().defaults);
    if (!options)
        return errorResponse(options.error());

    auto submitted = manager_.submit(kind, std::move(target), std::move(options).value());
    if (!submitted)
        return errorResponse(submitted.error());

    ApiResponse response;
    response.status = 201;
    response.body = {{"id", submitted.value()}, {"status", jobs::toString(jobs::JobStatus::Pending)}};
    return response;
}

ApiResponse JobRequestHandler::list(jobs::JobKind kind,
                                    const std::map<std::string, std::string>& query) {
    jobs::JobQuery q;
    q.kind = kind;
    q.limit = kDefaultListLimit;

    if (auto it = query.find("status"); it != query.end() && !it->second.empty()) {
        if (it->second == "active") {
            q.scope = jobs::JobQuery::Scope::NonTerminal;
        } else if (it->second == "finished") {
            q.scope = jobs::JobQuery::Scope::Terminal;
        } else if (auto status = jobs::parseJobStatus(it->second)) {
            q.status = status;
        } else {
            return badRequest("unknown status '" + it->second + "'");
        }
    }
    if (auto it = query.find("limit"); it != query.end()) {
        auto n = config::parse_int(it->second);
        if (!n || *n <= 0)
            return badRequest("limit must be a positive integer");
        q.limit = static_cast<std::size_t>(*n);
    }

    auto found = manager_.list(q);
    if (!found)
        return errorResponse(found.error());

    ApiResponse response;
    response.body = nlohmann::json::array();
    for (const auto& job : found.value())
        response.body.push_back(jobs::toJson(job));
    return response;
}

Result<jobs::Job> JobRequestHandler::findOfKind(jobs::JobKind kind, const JobId& id) {
    auto job = manager_.get(id);
    if (!job) {
        if (job.error().code == ErrorCode::NotFound)
            return Error{ErrorCode::NotFound, "Job not found"};
        return job.error();
    }
    if (job.value().kind != kind)
        return Error{ErrorCode::NotFound, "Job not found"};
    return job;
}

ApiResponse JobRequestHandler::get(jobs::JobKind kind, const JobId& id) {
    auto job = findOfKind(kind, id);
    if (!job)
        return errorResponse(job.error());
    ApiResponse response;
    response.body = jobs::toJson(job.value());
    return response;
}

ApiResponse JobRequestHandler::cancel(jobs::JobKind kind, const JobId& id) {
    if (auto job = findOfKind(kind, id); !job)
        return errorResponse(job.error());
    auto cancelled = manager_.cancel(id);
    if (!cancelled) {
        spdlog::debug("[JobRequestHandler] cancel {}: {}", id, cancelled.error().message);
        return errorResponse(cancelled.error());
    }
    ApiResponse response;
    response.body = {{"success", true}, {"message", "Cancellation requested"}};
    return response;
}

ApiResponse JobRequestHandler::clearHistory() {
    auto removed = manager_.clearHistory();
    if (!removed)
        return errorResponse(removed.error());
    ApiResponse response;
    response.body = {{"success", true}, {"removed", removed.value()}};
    return response;
}

std::shared_ptr<daemon::JobEventStream> JobRequestHandler::openEventStream(jobs::JobKind kind) {
    return bus_.subscribe(kind);
}

std::string JobRequestHandler::formatSse(const daemon::JobEvent& event) {
    return "event: " + event.type + "\ndata: " + jobs::toJson(event.job).dump() + "\n\n";
}

} // namespace xferq::api
