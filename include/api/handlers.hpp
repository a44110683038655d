#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "api/http_types.h"
#include "connector/connector_registry.hpp"
#include "runner/job_registry.hpp"
#include "runner/spawner.hpp"

class HttpServer;

#define API_PREFIX "/api/v1"

class ApiHandlers {
public:
    struct Options {
        std::chrono::milliseconds keepaliveInterval = std::chrono::seconds(15);
        std::chrono::milliseconds pollInterval      = std::chrono::milliseconds(500);
        std::chrono::milliseconds resultCacheTtl    = std::chrono::minutes(10);
    };

    ApiHandlers(JobRegistry& registry, Spawner& spawner,
                ConnectorRegistry& connectors, Options opt);

    ApiHandlers(const ApiHandlers&)            = delete;
    ApiHandlers& operator=(const ApiHandlers&) = delete;

    // 除事件流以外的路由都套上请求日志
    void registerRoutes(HttpServer& server);

    void run           (const HttpRequest& req, HttpResponder& resp);
    void stream        (const HttpRequest& req, HttpResponder& resp);
    void getProcess    (const HttpRequest& req, HttpResponder& resp);
    void getResult     (const HttpRequest& req, HttpResponder& resp);
    void getResultData (const HttpRequest& req, HttpResponder& resp);
    void deleteProcess (const HttpRequest& req, HttpResponder& resp);
    void listProcesses (const HttpRequest& req, HttpResponder& resp);
    void listConnectors(const HttpRequest& req, HttpResponder& resp);
    void health        (const HttpRequest& req, HttpResponder& resp);
    void ready         (const HttpRequest& req, HttpResponder& resp);

    // {id, connector, prompt, workDir?, status, startedAt, completedAt?, result?}
    static nlohmann::json statusJson(const Job::Snapshot& snap);

    // 请求日志中间件：method / path / status / peer / 耗时
    static HttpHandler withLogging(HttpHandler handler);

private:
    JobRegistry&       registry_;
    Spawner&           spawner_;
    ConnectorRegistry& connectors_;
    const Options      opt_;

    std::atomic<std::uint64_t> subscriberSeq_{0};
};
