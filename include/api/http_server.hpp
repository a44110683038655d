#pragma once
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE

#include <chrono>
#include <memory>
#include <string>

#include "api/http_types.h"

// 极简 HTTP/1.1 服务：epoll 监听 + 每连接一个线程，应答一律 Connection: close
class HttpServer {
public:
    struct Options {
        std::string               host         = "localhost";   // "*" / "0.0.0.0" 监听所有地址
        int                       port         = 8080;          // 0 = 由内核分配
        std::chrono::milliseconds readTimeout  = std::chrono::seconds(30);
        std::chrono::milliseconds writeTimeout = std::chrono::seconds(30);
        std::size_t               maxBodyBytes = 1024 * 1024;
    };

    explicit HttpServer(Options opt);
    ~HttpServer();

    HttpServer(const HttpServer&)            = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // pattern 形如 /api/v1/process/:id
    void route(const std::string& method, const std::string& pattern, HttpHandler handler);

    // 绑定端口并启动事件循环（内部线程）；绑定失败抛 std::runtime_error
    void start();
    // 停止接受新连接，通知事件流结束并等待所有连接线程退出
    void stop();

    // 实际监听的端口（port = 0 时由内核分配）
    int port() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};
