#include "api/handlers.hpp"
#include "api/http_server.hpp"
#include "api/sse.hpp"
#include "runner/runner_error.h"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

nlohmann::json error_body(const std::string& error, const std::string& details = {})
{
    nlohmann::json j;
    j["error"] = error;
    if (!details.empty()) j["details"] = details;
    return j;
}

std::string describe_ttl(std::chrono::milliseconds ttl)
{
    using namespace std::chrono;
    if (ttl.count() % 60000 == 0) {
        auto m = duration_cast<minutes>(ttl).count();
        return fmt::format("{} minute{}", m, m == 1 ? "" : "s");
    }
    auto s = duration_cast<seconds>(ttl).count();
    return fmt::format("{} second{}", s, s == 1 ? "" : "s");
}

// 作用域结束时取消订阅
class SubscriptionGuard {
public:
    explicit SubscriptionGuard(Job::Subscription& sub) : sub_(sub) {}
    ~SubscriptionGuard() { sub_.unsubscribe(); }

    SubscriptionGuard(const SubscriptionGuard&)            = delete;
    SubscriptionGuard& operator=(const SubscriptionGuard&) = delete;

private:
    Job::Subscription& sub_;
};

} // namespace

ApiHandlers::ApiHandlers(JobRegistry& registry, Spawner& spawner,
                         ConnectorRegistry& connectors, Options opt)
    : registry_(registry), spawner_(spawner), connectors_(connectors), opt_(opt)
{
}

HttpHandler ApiHandlers::withLogging(HttpHandler handler)
{
    return [handler = std::move(handler)](const HttpRequest& req, HttpResponder& resp) {
        auto start = std::chrono::steady_clock::now();
        handler(req, resp);
        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
        spdlog::info("Handlers: {} {} {} from {} in {:.3f}ms",
                     req.method, req.path, resp.status(), req.remoteAddr, elapsed.count());
    };
}

void ApiHandlers::registerRoutes(HttpServer& server)
{
    auto bind = [this](void (ApiHandlers::*fn)(const HttpRequest&, HttpResponder&)) {
        return [this, fn](const HttpRequest& req, HttpResponder& resp) { (this->*fn)(req, resp); };
    };

    server.route("POST",   API_PREFIX "/run",             withLogging(bind(&ApiHandlers::run)));
    server.route("GET",    API_PREFIX "/stream/:id",      bind(&ApiHandlers::stream));
    server.route("GET",    API_PREFIX "/process/:id",     withLogging(bind(&ApiHandlers::getProcess)));
    server.route("DELETE", API_PREFIX "/process/:id",     withLogging(bind(&ApiHandlers::deleteProcess)));
    server.route("GET",    API_PREFIX "/result/:id",      withLogging(bind(&ApiHandlers::getResult)));
    server.route("GET",    API_PREFIX "/result-data/:id", withLogging(bind(&ApiHandlers::getResultData)));
    server.route("GET",    API_PREFIX "/processes",       withLogging(bind(&ApiHandlers::listProcesses)));
    server.route("GET",    API_PREFIX "/connectors",      withLogging(bind(&ApiHandlers::listConnectors)));
    server.route("GET",    "/health",                     withLogging(bind(&ApiHandlers::health)));
    server.route("GET",    "/ready",                      withLogging(bind(&ApiHandlers::ready)));
}

nlohmann::json ApiHandlers::statusJson(const Job::Snapshot& snap)
{
    nlohmann::json j;
    j["id"]        = snap.id;
    j["connector"] = snap.connector;
    j["prompt"]    = snap.prompt;
    if (!snap.workDir.empty()) j["workDir"] = snap.workDir;
    j["status"]    = to_string(snap.status);
    j["startedAt"] = format_time(snap.startedAt);
    if (snap.completedAt) j["completedAt"] = format_time(*snap.completedAt);
    if (snap.result)      j["result"]      = to_json(*snap.result);
    return j;
}

void ApiHandlers::run(const HttpRequest& req, HttpResponder& resp)
{
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        resp.json(400, error_body("Invalid request body", "body must be a JSON object"));
        return;
    }

    auto str_field = [&body](const char* key) -> std::optional<std::string> {
        auto it = body.find(key);
        if (it == body.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };

    auto connectorName = str_field("connector");
    auto prompt        = str_field("prompt");
    if (!connectorName || connectorName->empty() || !prompt || prompt->empty()) {
        resp.json(400, error_body("Invalid request body", "connector and prompt are required strings"));
        return;
    }
    std::string workDir;
    if (auto it = body.find("workDir"); it != body.end() && !it->is_null()) {
        if (!it->is_string()) {
            resp.json(400, error_body("Invalid request body", "workDir must be a string"));
            return;
        }
        workDir = it->get<std::string>();
    }

    std::shared_ptr<IConnector> connector;
    try {
        connector = connectors_.get(*connectorName);
    } catch (const ConnectorError& e) {
        spdlog::warn("Handlers: {}", e.what());
        resp.json(400, error_body(fmt::format("Connector '{}' not found or unavailable", *connectorName)));
        return;
    }

    std::shared_ptr<Job> job;
    try {
        job = registry_.create(*connectorName, *prompt, workDir);
    } catch (const AdmissionError& e) {
        resp.json(429, error_body("Maximum concurrent processes reached", e.what()));
        return;
    }

    try {
        spawner_.spawn(job, connector);
    } catch (const std::exception& e) {
        spdlog::error("Handlers: failed to spawn job {}: {}", job->id(), e.what());
        job->finish(JobStatus::Failed,
                    Result{1, std::nullopt, fmt::format("failed to start process: {}", e.what())});
        job->close();
        resp.json(500, error_body("Failed to spawn process", e.what()));
        return;
    }

    resp.json(202, {{"processId", job->id()}});
}

void ApiHandlers::stream(const HttpRequest& req, HttpResponder& resp)
{
    const auto id = req.param("id");

    std::shared_ptr<Job> job;
    try {
        job = registry_.get(id);
    } catch (const NotFoundError&) {
        spdlog::warn("Handlers: stream requested for unknown process {}", id);
        resp.json(404, error_body("Process not found"));
        return;
    }

    // 先订阅再回放历史：交界处的事件可能重复，但不会丢
    auto subscriberId = fmt::format("{}#{}", req.remoteAddr, ++subscriberSeq_);
    auto sub          = job->subscribe(subscriberId);
    SubscriptionGuard guard(sub);

    if (!resp.beginEventStream()) return;
    spdlog::info("Handlers: stream {} opened by {}", id, req.remoteAddr);

    std::string reason;
    bool        done = false;
    for (const auto& ev : job->history()) {
        if (!resp.write(sse::format_event(ev))) {
            reason = "client disconnected";
            break;
        }
        if (ev.kind == EventKind::Done) {
            done = true;
            break;
        }
    }

    auto lastWrite = std::chrono::steady_clock::now();
    while (!done && reason.empty()) {
        Event ev;
        auto st = sub.channel->popFor(ev, opt_.pollInterval);

        if (st == Job::EventChannel::PopStatus::Ok) {
            if (!resp.write(sse::format_event(ev))) {
                reason = "client disconnected";
                break;
            }
            lastWrite = std::chrono::steady_clock::now();
            done      = ev.kind == EventKind::Done;
            continue;
        }

        if (st == Job::EventChannel::PopStatus::Closed) {
            // 通道被替换或作业在订阅前已关闭：从历史里补发 done
            auto history = job->history();
            if (!history.empty() && history.back().kind == EventKind::Done) {
                resp.write(sse::format_event(history.back()));
                done = true;
            } else {
                reason = "channel closed";
            }
            break;
        }

        if (resp.serverStopping()) {
            reason = "server shutting down";
        } else if (resp.peerClosed()) {
            reason = "client disconnected";
        } else if (std::chrono::steady_clock::now() - lastWrite >= opt_.keepaliveInterval) {
            if (!resp.write(sse::format_comment("keepalive"))) reason = "client disconnected";
            lastWrite = std::chrono::steady_clock::now();
        }
    }

    spdlog::info("Handlers: stream {} for {} closed ({})", id, req.remoteAddr,
                 done ? "done" : reason);
}

void ApiHandlers::getProcess(const HttpRequest& req, HttpResponder& resp)
{
    try {
        auto job = registry_.get(req.param("id"));
        resp.json(200, statusJson(job->snapshot()));
    } catch (const NotFoundError&) {
        resp.json(404, error_body("Process not found"));
    }
}

void ApiHandlers::getResult(const HttpRequest& req, HttpResponder& resp)
{
    std::shared_ptr<Job> job;
    try {
        job = registry_.get(req.param("id"));
    } catch (const NotFoundError&) {
        resp.json(404, error_body("Process not found"));
        return;
    }

    auto snap = job->snapshot();
    if (!is_terminal(snap.status) || !snap.result) {
        resp.json(202, {{"status", to_string(snap.status)},
                        {"message", "Process is still running"}});
        return;
    }
    resp.json(200, to_json(*snap.result));
}

void ApiHandlers::getResultData(const HttpRequest& req, HttpResponder& resp)
{
    const auto id = req.param("id");
    auto payload = registry_.cachedResult(id);
    if (!payload) {
        spdlog::debug("Handlers: result data for {} not found or expired", id);
        nlohmann::json body;
        body["error"]   = "Result data not found or expired";
        body["message"] = fmt::format("Result data is only cached for {}", describe_ttl(opt_.resultCacheTtl));
        resp.json(404, body);
        return;
    }
    resp.json(200, payload_to_json(*payload));
}

void ApiHandlers::deleteProcess(const HttpRequest& req, HttpResponder& resp)
{
    const auto id = req.param("id");
    try {
        registry_.stop(id);
        registry_.remove(id);
    } catch (const NotFoundError&) {
        resp.json(404, error_body("Process not found"));
        return;
    } catch (const ConflictError& e) {
        resp.json(400, error_body(e.what()));
        return;
    }
    resp.json(200, {{"message", "Process deleted successfully"}, {"processId", id}});
}

void ApiHandlers::listProcesses(const HttpRequest&, HttpResponder& resp)
{
    auto processes = nlohmann::json::array();
    for (const auto& job : registry_.list()) {
        processes.push_back(statusJson(job->snapshot()));
    }
    nlohmann::json body;
    body["count"]     = processes.size();
    body["processes"] = std::move(processes);
    resp.json(200, body);
}

void ApiHandlers::listConnectors(const HttpRequest&, HttpResponder& resp)
{
    auto names = connectors_.available();
    nlohmann::json body;
    body["connectors"] = names;
    body["count"]      = names.size();
    resp.json(200, body);
}

void ApiHandlers::health(const HttpRequest&, HttpResponder& resp)
{
    resp.json(200, {{"status", "healthy"}});
}

void ApiHandlers::ready(const HttpRequest&, HttpResponder& resp)
{
    resp.json(200, {{"status", "ready"}});
}
