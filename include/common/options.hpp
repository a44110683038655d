#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "common/config.hpp"

// 启动时由 Config 生成一次，之后以构造参数的方式传给各个组件
struct ServerOptions {
    std::string               host          = "localhost";
    int                       port          = 8080;
    std::chrono::milliseconds readTimeout   = std::chrono::seconds(30);
    std::chrono::milliseconds writeTimeout  = std::chrono::seconds(30);
    std::size_t               maxBodyBytes  = 1024 * 1024;
};

struct ProcessOptions {
    std::chrono::milliseconds defaultTimeout   = std::chrono::minutes(30);
    std::size_t               maxConcurrent    = 10;
    std::chrono::milliseconds cleanupDelay     = std::chrono::minutes(5);
    std::size_t               bufferSize       = 8192;
    std::size_t               subscriberBuffer = 100;
    std::chrono::milliseconds resultCacheTtl   = std::chrono::minutes(10);
};

struct LoggingOptions {
    std::string level  = "info";
    std::string format = "console";
};

struct ConnectorEntry {
    std::string name;
    std::string type;
    std::string config;      // 指向具体配置段的名字，例如 claude_config
};

struct AppOptions {
    ServerOptions               server;
    ProcessOptions              process;
    LoggingOptions              logging;
    std::vector<ConnectorEntry> connectors;

    static AppOptions load(const Config& config);
};
