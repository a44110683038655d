#define SPDLOG_ACTIVE_LEVEL SPDLOG_LOGGER_TRACE
#include <iostream>
#include <memory>
#include <optional>
#include <signal.h>
#include <sys/stat.h>

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>

#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/options.hpp"
#include "common/timer_scheduler.hpp"

#include "connector/connector_registry.hpp"
#include "runner/job_registry.hpp"
#include "runner/spawner.hpp"

#include "api/handlers.hpp"
#include "api/http_server.hpp"

void print_logo(){
    std::cout<< R"(   _____ _ _ _____
  / ____| (_)  __ \
 | |    | |_| |__) |   _ _ __  _ __   ___ _ __
 | |    | | |  _  / | | | '_ \| '_ \ / _ \ '__|
 | |____| | | | \ \ |_| | | | | | | |  __/ |
  \_____|_|_|_|  \_\__,_|_| |_|_| |_|\___|_|
)" << std::endl;
}

bool file_exists(const std::string& path)
{
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

// 阻塞直到收到 SIGINT / SIGTERM；信号在所有线程创建之前就已屏蔽
int wait_for_signal(const sigset_t& set)
{
    int sig = 0;
    while (sigwait(&set, &sig) != 0) {}
    return sig;
}

int main(int argc, char* argv[]) {
    cxxopts::Options options("cli_runner", "Run command-line AI tools as HTTP-managed, streamable jobs");
    options.add_options()
        ("h,help", "Show help")
        ("c,config", "Configuration file path", cxxopts::value<std::string>()->default_value("config.yaml"))
        ("host", "Listen address (overrides server.host)", cxxopts::value<std::string>())
        ("p,port", "Listen port (overrides server.port)", cxxopts::value<int>())
        ("l,log-level", "Log level (overrides logging.level)", cxxopts::value<std::string>());

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << options.help() << std::endl;
        return 2;
    }
    auto& result = *parsed;
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    print_logo();

    // 显式指定的配置文件必须可用；默认的 config.yaml 不存在时使用内置默认值
    auto configPath = result["config"].as<std::string>();
    std::optional<Config> config;
    AppOptions app;
    bool usingDefaults = false;
    try {
        if (result.count("config") || file_exists(configPath)) {
            config.emplace(configPath);
        } else {
            config.emplace(Config::empty());
            usingDefaults = true;
        }
        app = AppOptions::load(*config);
    } catch (const std::exception& e) {
        spdlog::critical("Main: failed to load configuration '{}': {}", configPath, e.what());
        return 1;
    }

    if (result.count("host"))      app.server.host   = result["host"].as<std::string>();
    if (result.count("port"))      app.server.port   = result["port"].as<int>();
    if (result.count("log-level")) app.logging.level = result["log-level"].as<std::string>();

    logger::init(app.logging.level, app.logging.format);
    if (usingDefaults) {
        spdlog::info("Main: no configuration file at '{}', using defaults", configPath);
    }

    // 工作线程继承屏蔽字，信号只由主线程的 sigwait 处理
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    ::signal(SIGPIPE, SIG_IGN);

    ConnectorRegistry connectors;
    connectors.setupFromConfig(*config, app.connectors);

    JobRegistry registry(JobRegistry::Options{
        .maxConcurrent = app.process.maxConcurrent,
        .cleanupDelay  = app.process.cleanupDelay,
        .job = {
            .bufferSize       = app.process.bufferSize,
            .subscriberBuffer = app.process.subscriberBuffer,
            .resultCacheTtl   = app.process.resultCacheTtl,
        },
    });

    Spawner spawner(Spawner::Options{.defaultTimeout = app.process.defaultTimeout});

    TimerScheduler scheduler(1);
    registry.startCleanup(scheduler);

    ApiHandlers handlers(registry, spawner, connectors, ApiHandlers::Options{
        .resultCacheTtl = app.process.resultCacheTtl,
    });

    HttpServer server(HttpServer::Options{
        .host         = app.server.host,
        .port         = app.server.port,
        .readTimeout  = app.server.readTimeout,
        .writeTimeout = app.server.writeTimeout,
        .maxBodyBytes = app.server.maxBodyBytes,
    });
    handlers.registerRoutes(server);

    try {
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Main: {}", e.what());
        registry.stopCleanup();
        scheduler.shutdown();
        return 1;
    }

    auto available = connectors.available();
    spdlog::info("Main: CliRunner started on {}:{}, {} connector(s) available",
                 app.server.host, server.port(), available.size());

    int sig = wait_for_signal(signals);
    spdlog::info("Main: received {}, shutting down", sig == SIGINT ? "SIGINT" : "SIGTERM");

    server.stop();
    spawner.shutdown();
    registry.stopCleanup();
    scheduler.shutdown();

    spdlog::info("Main: shutdown complete");
    return 0;
}
